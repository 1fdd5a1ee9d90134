#include <gtest/gtest.h>

#include <chrono>

#include "messages/protocol.hh"

using namespace std;
using namespace std::chrono;
using namespace xferd;

using OpCode = Message::OpCode;

namespace {

const char* ID_A = "6f9619ff-8b86-d011-b42d-00c04fc964ff";
const char* ID_B = "a3bb189e-8bf9-3888-9912-ace4e6543002";

Request round_trip( const Request& request )
{
  return decode_request( encode( request ) );
}

Response round_trip( const Response& response )
{
  return decode_response( encode( response ) );
}

}

TEST( RequestCodec, EveryOperation )
{
  const Operation operations[] = {
    Operation::CreateJob,  Operation::AddFiles,       Operation::Start,
    Operation::Suspend,    Operation::Resume,         Operation::Cancel,
    Operation::Complete,   Operation::GetStatus,      Operation::SetCredentials,
    Operation::SetPriority, Operation::OpenJob,       Operation::ListJobs,
    Operation::SetProxyUsage,
  };

  uint64_t correlation_id = 1;
  for ( const auto operation : operations ) {
    Request request;
    request.correlation_id = correlation_id++;
    request.operation = operation;
    request.job_id = ID_A;

    EXPECT_EQ( round_trip( request ), request ) << to_string( operation );
  }
}

TEST( RequestCodec, FileLists )
{
  Request request;
  request.correlation_id = 99;
  request.operation = Operation::AddFiles;
  request.job_id = ID_A;

  /* empty */
  EXPECT_EQ( round_trip( request ), request );

  /* single */
  request.files = { { "http://example/test.bin", "/tmp/test.bin" } };
  EXPECT_EQ( round_trip( request ), request );

  /* multiple */
  request.files.push_back( { "https://example/b", "/tmp/b" } );
  request.files.push_back( { "file:///srv/c", "/tmp/\xc3\xa9t\xc3\xa9" } );
  EXPECT_EQ( round_trip( request ), request );

  /* validation happens in the backend, not in the codec */
  request.files = { { "not a url", "relative/path" } };
  EXPECT_EQ( round_trip( request ), request );
}

TEST( RequestCodec, CreateAndCredentials )
{
  Request request;
  request.operation = Operation::CreateJob;
  request.display_name = "T1";
  request.direction = Direction::Upload;
  EXPECT_EQ( round_trip( request ), request );

  request = {};
  request.operation = Operation::SetCredentials;
  request.job_id = ID_B;
  request.credential = Credential { CredentialTarget::Proxy,
                                    CredentialScheme::Ntlm,
                                    string( "user\0secret", 11 ) };
  EXPECT_EQ( round_trip( request ), request );

  request = {};
  request.operation = Operation::SetPriority;
  request.job_id = ID_B;
  request.priority = JobPriority::Foreground;
  EXPECT_EQ( round_trip( request ), request );

  request = {};
  request.operation = Operation::SetProxyUsage;
  request.job_id = ID_B;
  request.proxy_usage = ProxyUsage::AutoDetect;
  const Request decoded = round_trip( request );
  EXPECT_EQ( decoded, request );
  EXPECT_FALSE( is_read_only( decoded.operation ) );
}

TEST( RequestCodec, MalformedPayloads )
{
  EXPECT_THROW( decode_request( Message { 1, OpCode::Request, "\xff\xff\xff" } ), JobError );
  EXPECT_THROW( decode_request( Message { 1, OpCode::Response, "" } ), JobError );

  /* operation tag out of range */
  EXPECT_THROW( decode_request( Message { 1, OpCode::Request, string( "\x08\x63", 2 ) } ),
                JobError );
}

TEST( ResponseCodec, Payloads )
{
  Response response;
  response.correlation_id = 5;
  EXPECT_EQ( round_trip( response ), response );

  response.job_id = JobId::parse( ID_A );
  EXPECT_EQ( round_trip( response ), response );

  response = {};
  response.correlation_id = 6;
  response.job_ids = { *JobId::parse( ID_A ), *JobId::parse( ID_B ) };
  EXPECT_EQ( round_trip( response ), response );

  JobSnapshot snapshot;
  snapshot.id = *JobId::parse( ID_A );
  snapshot.display_name = "T1";
  snapshot.state = JobState::Error;
  snapshot.priority = JobPriority::High;
  snapshot.proxy_usage = ProxyUsage::NoProxy;
  snapshot.files = { { "http://example/test.bin", "/tmp/test.bin", 10, 100 },
                     { "http://example/other.bin", "/tmp/other.bin", 0, nullopt } };
  snapshot.progress = { 10, nullopt, 0, 2 };
  snapshot.error_count = 1;
  snapshot.error = ErrorInfo { -2145844844, ErrorContext::RemoteFile, "not found", "GET failed" };
  snapshot.times.creation = JobTimes::time_point { milliseconds { 1'700'000'000'000 } };
  snapshot.times.modification = JobTimes::time_point { milliseconds { 1'700'000'000'500 } };
  snapshot.times.transfer_completion = JobTimes::time_point { milliseconds { 1'700'000'001'000 } };

  response = {};
  response.correlation_id = 7;
  response.snapshot = snapshot;
  EXPECT_EQ( round_trip( response ), response );
}

TEST( ResponseCodec, Errors )
{
  const JobError error { ErrorKind::NotFound,
                         "get_status",
                         "the requested job was not found",
                         JobId::parse( ID_B ),
                         static_cast<int32_t>( 0x80200001 ) };

  Response response;
  response.correlation_id = 11;
  response.error = RemoteError::from_exception( error );

  const Response decoded = round_trip( response );
  EXPECT_EQ( decoded, response );

  const JobError rebuilt = decoded.error->to_exception();
  EXPECT_EQ( rebuilt.kind(), ErrorKind::NotFound );
  EXPECT_EQ( rebuilt.operation(), "get_status" );
  EXPECT_EQ( rebuilt.job_id(), JobId::parse( ID_B ) );
  EXPECT_EQ( rebuilt.native_code(), static_cast<int32_t>( 0x80200001 ) );
  EXPECT_STREQ( rebuilt.what(), error.what() );
}
