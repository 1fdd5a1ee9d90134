/* -*-mode:c++; tab-width: 2; indent-tabs-mode: nil; c-basic-offset: 2 -*- */

#include "messages/protocol.hh"

#include "messages/utils.hh"

using namespace std;

using OpCode = xferd::Message::OpCode;

namespace xferd {

const char* to_string( const Operation op )
{
  switch ( op ) {
    case Operation::CreateJob: return "create_job";
    case Operation::AddFiles: return "add_files";
    case Operation::Start: return "start";
    case Operation::Suspend: return "suspend";
    case Operation::Resume: return "resume";
    case Operation::Cancel: return "cancel";
    case Operation::Complete: return "complete";
    case Operation::GetStatus: return "get_status";
    case Operation::SetCredentials: return "set_credentials";
    case Operation::SetPriority: return "set_priority";
    case Operation::OpenJob: return "open_job";
    case Operation::ListJobs: return "list_jobs";
    case Operation::SetProxyUsage: return "set_proxy_usage";
  }

  return "invalid";
}

bool is_read_only( const Operation op )
{
  return op == Operation::GetStatus or op == Operation::OpenJob
         or op == Operation::ListJobs;
}

bool Request::operator==( const Request& other ) const
{
  return correlation_id == other.correlation_id
         and operation == other.operation and job_id == other.job_id
         and display_name == other.display_name
         and direction == other.direction and files == other.files
         and credential == other.credential and priority == other.priority
         and proxy_usage == other.proxy_usage;
}

RemoteError RemoteError::from_exception( const JobError& e )
{
  return { e.kind(), e.message(), e.operation(), e.job_id(), e.native_code() };
}

JobError RemoteError::to_exception() const
{
  return JobError( kind, operation, message, job_id, native_code );
}

bool RemoteError::operator==( const RemoteError& other ) const
{
  return kind == other.kind and message == other.message
         and operation == other.operation and job_id == other.job_id
         and native_code == other.native_code;
}

bool Response::operator==( const Response& other ) const
{
  return correlation_id == other.correlation_id and error == other.error
         and job_id == other.job_id and job_ids == other.job_ids
         and snapshot == other.snapshot;
}

Message encode( const Request& request )
{
  return { request.correlation_id,
           OpCode::Request,
           protoutil::to_string( to_protobuf( request ) ) };
}

Message encode( const Response& response )
{
  return { response.correlation_id,
           OpCode::Response,
           protoutil::to_string( to_protobuf( response ) ) };
}

Message encode_hello( const uint32_t version )
{
  protobuf::Hello hello;
  hello.set_version( version );
  return { 0, OpCode::Hey, protoutil::to_string( hello ) };
}

namespace {

void expect_opcode( const Message& message, const OpCode expected )
{
  if ( message.opcode() != expected ) {
    throw JobError( ErrorKind::ProtocolError,
                    "decode",
                    string( "expected " ) + to_string( expected ) + " frame, got "
                      + to_string( message.opcode() ) );
  }
}

template<class ProtobufType>
ProtobufType parse_payload( const Message& message )
{
  ProtobufType proto;
  if ( not protoutil::from_string( message.payload(), proto ) ) {
    throw JobError( ErrorKind::ProtocolError,
                    "decode",
                    string( "unparsable " ) + to_string( message.opcode() ) + " payload" );
  }

  return proto;
}

}

Request decode_request( const Message& message )
{
  expect_opcode( message, OpCode::Request );

  Request request = from_protobuf( parse_payload<protobuf::Request>( message ) );
  request.correlation_id = message.correlation_id();
  return request;
}

Response decode_response( const Message& message )
{
  expect_opcode( message, OpCode::Response );

  Response response = from_protobuf( parse_payload<protobuf::Response>( message ) );
  response.correlation_id = message.correlation_id();
  return response;
}

uint32_t decode_hello( const Message& message )
{
  expect_opcode( message, OpCode::Hey );
  return parse_payload<protobuf::Hello>( message ).version();
}

} // namespace xferd
