#include "utils.hh"

#include <chrono>
#include <limits>

#include "util/util.hh"

using namespace std;
using namespace std::chrono;

namespace xferd {

namespace {

JobError malformed( const string& what )
{
  return JobError( ErrorKind::ProtocolError, "decode", what );
}

int64_t to_epoch_ms( const JobTimes::time_point tp )
{
  return duration_cast<milliseconds>( tp.time_since_epoch() ).count();
}

JobTimes::time_point from_epoch_ms( const int64_t ms )
{
  return JobTimes::time_point { duration_cast<JobTimes::time_point::duration>( milliseconds { ms } ) };
}

template<class E>
E checked_enum( const uint32_t raw, const E last, const char* name )
{
  if ( raw > to_underlying( last ) ) {
    throw malformed( string( name ) + " out of range: " + std::to_string( raw ) );
  }

  return static_cast<E>( raw );
}

template<class E>
E enum_or( const uint32_t raw, const E last, const E fallback )
{
  return ( raw > to_underlying( last ) ) ? fallback : static_cast<E>( raw );
}

JobId parse_job_id( const string& text )
{
  if ( text.empty() ) {
    return {};
  }

  auto id = JobId::parse( text );
  if ( not id.has_value() ) {
    throw malformed( "malformed job id: " + text );
  }

  return *id;
}

}

protobuf::FileSpec to_protobuf( const FileSpec& spec )
{
  protobuf::FileSpec proto;
  proto.set_source( spec.source );
  proto.set_destination( spec.destination );
  return proto;
}

protobuf::Credential to_protobuf( const Credential& credential )
{
  protobuf::Credential proto;
  proto.set_target( to_underlying( credential.target ) );
  proto.set_scheme( to_underlying( credential.scheme ) );
  proto.set_blob( credential.blob );
  return proto;
}

protobuf::JobSnapshot to_protobuf( const JobSnapshot& snapshot )
{
  protobuf::JobSnapshot proto;
  proto.set_id( snapshot.id.str() );
  proto.set_display_name( snapshot.display_name );
  proto.set_direction( to_underlying( snapshot.direction ) );
  proto.set_state( to_underlying( snapshot.state ) );
  proto.set_priority( to_underlying( snapshot.priority ) );
  proto.set_proxy_usage( to_underlying( snapshot.proxy_usage ) );

  for ( const auto& file : snapshot.files ) {
    auto& entry = *proto.add_files();
    entry.set_source( file.source );
    entry.set_destination( file.destination );
    entry.set_bytes_transferred( file.bytes_transferred );
    if ( file.bytes_total.has_value() ) {
      entry.set_bytes_total( *file.bytes_total );
    }
  }

  proto.set_bytes_transferred( snapshot.progress.bytes_transferred );
  if ( snapshot.progress.bytes_total.has_value() ) {
    proto.set_bytes_total( *snapshot.progress.bytes_total );
  }
  proto.set_files_transferred( snapshot.progress.files_transferred );
  proto.set_files_total( snapshot.progress.files_total );
  proto.set_error_count( snapshot.error_count );

  if ( snapshot.error.has_value() ) {
    auto& error = *proto.mutable_error();
    error.set_code( snapshot.error->code );
    error.set_context( to_underlying( snapshot.error->context ) );
    error.set_message( snapshot.error->message );
    error.set_context_message( snapshot.error->context_message );
  }

  proto.set_creation_time( to_epoch_ms( snapshot.times.creation ) );
  proto.set_modification_time( to_epoch_ms( snapshot.times.modification ) );
  if ( snapshot.times.transfer_completion.has_value() ) {
    proto.set_transfer_completion_time( to_epoch_ms( *snapshot.times.transfer_completion ) );
  }

  return proto;
}

protobuf::Error to_protobuf( const RemoteError& error )
{
  protobuf::Error proto;
  proto.set_kind( to_underlying( error.kind ) );
  proto.set_message( error.message );
  proto.set_operation( error.operation );
  if ( error.job_id.has_value() ) {
    proto.set_job_id( error.job_id->str() );
  }
  if ( error.native_code.has_value() ) {
    proto.set_native_code( *error.native_code );
  }
  return proto;
}

protobuf::Request to_protobuf( const Request& request )
{
  protobuf::Request proto;
  proto.set_operation( static_cast<protobuf::Operation>( to_underlying( request.operation ) + 1 ) );
  proto.set_job_id( request.job_id );
  proto.set_display_name( request.display_name );
  proto.set_direction( to_underlying( request.direction ) );

  for ( const auto& file : request.files ) {
    *proto.add_files() = to_protobuf( file );
  }

  if ( request.credential.has_value() ) {
    *proto.mutable_credential() = to_protobuf( *request.credential );
  }

  proto.set_priority( to_underlying( request.priority ) );
  proto.set_proxy_usage( to_underlying( request.proxy_usage ) );
  return proto;
}

protobuf::Response to_protobuf( const Response& response )
{
  protobuf::Response proto;

  if ( response.error.has_value() ) {
    *proto.mutable_error() = to_protobuf( *response.error );
  }

  if ( response.job_id.has_value() ) {
    proto.set_job_id( response.job_id->str() );
  }

  for ( const auto& id : response.job_ids ) {
    proto.add_job_ids( id.str() );
  }

  if ( response.snapshot.has_value() ) {
    *proto.mutable_snapshot() = to_protobuf( *response.snapshot );
  }

  return proto;
}

FileSpec from_protobuf( const protobuf::FileSpec& proto )
{
  return { proto.source(), proto.destination() };
}

Credential from_protobuf( const protobuf::Credential& proto )
{
  /* out-of-range values survive decoding and are rejected by
     Credential::well_formed() at the backend */
  constexpr uint32_t MAX_RAW = numeric_limits<uint8_t>::max();

  Credential credential;
  credential.target = static_cast<CredentialTarget>( min( proto.target(), MAX_RAW ) );
  credential.scheme = static_cast<CredentialScheme>( min( proto.scheme(), MAX_RAW ) );
  credential.blob = proto.blob();
  return credential;
}

JobSnapshot from_protobuf( const protobuf::JobSnapshot& proto )
{
  JobSnapshot snapshot;
  snapshot.id = parse_job_id( proto.id() );
  snapshot.display_name = proto.display_name();
  snapshot.direction = checked_enum( proto.direction(), Direction::Upload, "direction" );
  snapshot.state = enum_or( proto.state(), JobState::Unknown, JobState::Unknown );
  snapshot.priority = checked_enum( proto.priority(), JobPriority::Low, "priority" );
  snapshot.proxy_usage = checked_enum( proto.proxy_usage(), ProxyUsage::AutoDetect, "proxy usage" );

  for ( const auto& file : proto.files() ) {
    FileEntry entry;
    entry.source = file.source();
    entry.destination = file.destination();
    entry.bytes_transferred = file.bytes_transferred();
    if ( file.has_bytes_total() ) {
      entry.bytes_total = file.bytes_total();
    }
    snapshot.files.push_back( move( entry ) );
  }

  snapshot.progress.bytes_transferred = proto.bytes_transferred();
  if ( proto.has_bytes_total() ) {
    snapshot.progress.bytes_total = proto.bytes_total();
  }
  snapshot.progress.files_transferred = proto.files_transferred();
  snapshot.progress.files_total = proto.files_total();
  snapshot.error_count = proto.error_count();

  if ( proto.has_error() ) {
    ErrorInfo info;
    info.code = proto.error().code();
    info.context = enum_or( proto.error().context(), ErrorContext::RemoteApplication, ErrorContext::Unknown );
    info.message = proto.error().message();
    info.context_message = proto.error().context_message();
    snapshot.error = move( info );
  }

  snapshot.times.creation = from_epoch_ms( proto.creation_time() );
  snapshot.times.modification = from_epoch_ms( proto.modification_time() );
  if ( proto.has_transfer_completion_time() ) {
    snapshot.times.transfer_completion = from_epoch_ms( proto.transfer_completion_time() );
  }

  return snapshot;
}

RemoteError from_protobuf( const protobuf::Error& proto )
{
  RemoteError error;
  error.kind = enum_or( proto.kind(), ErrorKind::Unknown, ErrorKind::Unknown );
  error.message = proto.message();
  error.operation = proto.operation();
  if ( proto.has_job_id() ) {
    error.job_id = parse_job_id( proto.job_id() );
  }
  if ( proto.has_native_code() ) {
    error.native_code = proto.native_code();
  }
  return error;
}

Request from_protobuf( const protobuf::Request& proto )
{
  const int raw_operation = proto.operation();
  if ( raw_operation < protobuf::CREATE_JOB or raw_operation > protobuf::SET_PROXY_USAGE ) {
    throw malformed( "unknown operation " + std::to_string( raw_operation ) );
  }

  Request request;
  request.operation = static_cast<Operation>( raw_operation - 1 );
  request.job_id = proto.job_id();
  request.display_name = proto.display_name();
  request.direction = checked_enum( proto.direction(), Direction::Upload, "direction" );

  for ( const auto& file : proto.files() ) {
    request.files.push_back( from_protobuf( file ) );
  }

  if ( proto.has_credential() ) {
    request.credential = from_protobuf( proto.credential() );
  }

  request.priority = checked_enum( proto.priority(), JobPriority::Low, "priority" );
  request.proxy_usage = checked_enum( proto.proxy_usage(), ProxyUsage::AutoDetect, "proxy usage" );
  return request;
}

Response from_protobuf( const protobuf::Response& proto )
{
  Response response;

  if ( proto.has_error() ) {
    response.error = from_protobuf( proto.error() );
  }

  if ( proto.has_job_id() ) {
    response.job_id = parse_job_id( proto.job_id() );
  }

  for ( const auto& id : proto.job_ids() ) {
    response.job_ids.push_back( parse_job_id( id ) );
  }

  if ( proto.has_snapshot() ) {
    response.snapshot = from_protobuf( proto.snapshot() );
  }

  return response;
}

} // namespace xferd
