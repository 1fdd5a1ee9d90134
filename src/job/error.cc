/* -*-mode:c++; tab-width: 2; indent-tabs-mode: nil; c-basic-offset: 2 -*- */

#include "job/error.hh"

#include <iomanip>
#include <sstream>

using namespace std;

namespace xferd {

namespace {

string describe( const ErrorKind kind,
                 const string_view operation,
                 const string_view message,
                 const optional<JobId>& job_id,
                 const optional<int32_t> native_code )
{
  ostringstream oss;
  oss << operation << ": " << message;

  if ( job_id.has_value() ) {
    oss << " [job " << *job_id << "]";
  }

  oss << " (" << to_string( kind );

  if ( native_code.has_value() ) {
    oss << ", native code 0x" << hex << setw( 8 ) << setfill( '0' )
        << static_cast<uint32_t>( *native_code );
  }

  oss << ")";
  return oss.str();
}

}

const char* to_string( const ErrorKind kind )
{
  switch ( kind ) {
    case ErrorKind::InvalidArgument: return "invalid argument";
    case ErrorKind::InvalidState: return "invalid state";
    case ErrorKind::NotFound: return "not found";
    case ErrorKind::PermissionDenied: return "permission denied";
    case ErrorKind::ServiceUnavailable: return "service unavailable";
    case ErrorKind::AgentUnreachable: return "agent unreachable";
    case ErrorKind::ProtocolError: return "protocol error";
    case ErrorKind::TransportError: return "transport error";
    case ErrorKind::Unknown: return "unknown error";
  }

  return "invalid";
}

JobError::JobError( const ErrorKind kind,
                    const string_view operation,
                    const string_view message,
                    const optional<JobId>& job_id,
                    const optional<int32_t> native_code )
  : runtime_error( describe( kind, operation, message, job_id, native_code ) )
  , kind_( kind )
  , operation_( operation )
  , message_( message )
  , job_id_( job_id )
  , native_code_( native_code )
{}

} // namespace xferd
