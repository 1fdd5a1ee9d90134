#include <gtest/gtest.h>

#include <sys/stat.h>
#include <unistd.h>

#include <filesystem>
#include <fstream>

#include "backend/remote.hh"
#include "net/channel.hh"
#include "tests/test_agent.hh"

using namespace std;
using namespace std::chrono;
using namespace xferd;
using namespace xferd::test;

using OpCode = Message::OpCode;

namespace {

RemoteOptions quick_options( const TestAgent& agent )
{
  RemoteOptions options;
  options.socket_path = agent.socket_path();
  options.bootstrap = { 5ms, 2.0, 20ms, 5, 500ms };
  options.request_timeout = 2000ms;
  return options;
}

Channel connect_raw( const TestAgent& agent )
{
  IPCSocket socket;
  socket.connect( agent.socket_path() );
  socket.set_read_timeout( 2000ms );
  return Channel { move( socket ) };
}

/* the principal a connection from this test process runs as */
native::Principal self()
{
  return AgentServer::caller_principal( { getpid(), geteuid(), getegid() } );
}

/* performs the handshake on a raw channel */
void say_hello( Channel& channel )
{
  channel.send( encode_hello() );
  const auto reply = channel.receive();
  ASSERT_TRUE( reply.has_value() );
  ASSERT_EQ( decode_hello( *reply ), PROTOCOL_VERSION );
}

}

TEST( AgentServer, ServesRequests )
{
  TestAgent agent;
  agent.start();

  RemoteBackend backend { quick_options( agent ) };
  const auto handle = backend.create_job( "T1", Direction::Download );
  backend.add_file( handle, "http://example/test.bin", "/tmp/test.bin" );

  const auto snapshot = backend.get_status( handle );
  EXPECT_EQ( snapshot.state, JobState::Queued );
  ASSERT_EQ( snapshot.files.size(), 1 );
  EXPECT_EQ( snapshot.files[0].source, "http://example/test.bin" );

  /* the job belongs to the connected caller */
  native::JobStatus status;
  ASSERT_EQ( agent.service().get_status( { 0, true }, handle.id().str(), status ), native::OK );
  EXPECT_EQ( status.owner_uid, geteuid() );
}

TEST( AgentServer, SocketIsWorldConnectable )
{
  TestAgent agent;
  agent.start();

  struct stat st;
  ASSERT_EQ( stat( agent.socket_path().c_str(), &st ), 0 );
  EXPECT_TRUE( S_ISSOCK( st.st_mode ) );
  EXPECT_EQ( st.st_mode & 0777, 0666 );
}

TEST( AgentServer, RefusesUnlistedCallers )
{
  TestAgent agent;
  agent.config().allowed_uids = { geteuid() + 1 };
  agent.start();

  RemoteBackend backend { quick_options( agent ) };

  try {
    backend.create_job( "T1", Direction::Download );
    FAIL() << "expected PermissionDenied";
  } catch ( const JobError& e ) {
    EXPECT_EQ( e.kind(), ErrorKind::PermissionDenied );
  }

  EXPECT_FALSE( backend.connected() );
  vector<string> ids;
  ASSERT_EQ( agent.service().enum_jobs( { 0, true }, ids ), native::OK );
  EXPECT_TRUE( ids.empty() );
}

TEST( AgentServer, AcceptsListedCallers )
{
  TestAgent agent;
  agent.config().allowed_uids = { geteuid() + 1, geteuid() };
  agent.start();

  RemoteBackend backend { quick_options( agent ) };
  EXPECT_NO_THROW( backend.list_jobs() );
}

TEST( AgentServer, DefaultAdmitsOnlyOwnUid )
{
  TestAgent agent;
  agent.start();

  EXPECT_TRUE( agent.server().authorized( { getpid(), geteuid(), getegid() } ) );
  EXPECT_FALSE( agent.server().authorized( { getpid(), geteuid() + 1, getegid() } ) );

  RemoteBackend backend { quick_options( agent ) };
  EXPECT_NO_THROW( backend.list_jobs() );
}

TEST( AgentServer, CallerPrincipal )
{
  const auto user = AgentServer::caller_principal( { 1, 1000, 1000 } );
  EXPECT_EQ( user.uid, 1000u );
  EXPECT_FALSE( user.privileged );

  const auto root = AgentServer::caller_principal( { 1, 0, 0 } );
  EXPECT_EQ( root.uid, 0u );
  EXPECT_TRUE( root.privileged );
}

TEST( AgentServer, ForeignCallerCannotTouchJob )
{
  TestAgent agent;
  agent.config().allowed_uids = { geteuid(), geteuid() + 1 };
  agent.start();

  const native::Principal owner = self();
  const native::Principal stranger { static_cast<uint32_t>( geteuid() + 1 ), false };

  Request request;
  request.operation = Operation::CreateJob;
  request.display_name = "T1";
  Response response = agent.server().dispatch( owner, request );
  ASSERT_FALSE( response.error.has_value() );
  ASSERT_TRUE( response.job_id.has_value() );
  const JobId id = *response.job_id;

  native::JobStatus status;
  ASSERT_EQ( agent.service().get_status( { 0, true }, id.str(), status ), native::OK );
  EXPECT_EQ( status.owner_uid, owner.uid );

  request = {};
  request.operation = Operation::Cancel;
  request.job_id = id.str();
  response = agent.server().dispatch( stranger, request );
  ASSERT_TRUE( response.error.has_value() );
  EXPECT_EQ( response.error->kind, ErrorKind::PermissionDenied );

  request.operation = Operation::OpenJob;
  response = agent.server().dispatch( stranger, request );
  ASSERT_TRUE( response.error.has_value() );
  EXPECT_EQ( response.error->kind, ErrorKind::NotFound );

  request = {};
  request.operation = Operation::ListJobs;
  response = agent.server().dispatch( stranger, request );
  EXPECT_FALSE( response.error.has_value() );
  EXPECT_TRUE( response.job_ids.empty() );

  /* the job survived and its owner still sees it */
  ASSERT_EQ( agent.service().get_status( { 0, true }, id.str(), status ), native::OK );
  EXPECT_EQ( status.state, native::JOB_STATE_QUEUED );

  response = agent.server().dispatch( owner, request );
  ASSERT_EQ( response.job_ids.size(), 1u );
  EXPECT_EQ( response.job_ids[0], id );
}

TEST( AgentServer, VersionMismatch )
{
  TestAgent agent;
  agent.start();

  Channel channel = connect_raw( agent );
  channel.send( encode_hello( PROTOCOL_VERSION + 1 ) );

  const auto reply = channel.receive();
  ASSERT_TRUE( reply.has_value() );
  const Response response = decode_response( *reply );
  ASSERT_TRUE( response.error.has_value() );
  EXPECT_EQ( response.error->kind, ErrorKind::ProtocolError );

  EXPECT_FALSE( channel.receive().has_value() );
}

TEST( AgentServer, MalformedRequestClosesConnection )
{
  TestAgent agent;
  agent.start();

  Channel channel = connect_raw( agent );
  say_hello( channel );

  channel.send( { 77, OpCode::Request, "\xff\xff\xff" } );

  const auto reply = channel.receive();
  ASSERT_TRUE( reply.has_value() );
  const Response response = decode_response( *reply );
  EXPECT_EQ( response.correlation_id, 77 );
  ASSERT_TRUE( response.error.has_value() );
  EXPECT_EQ( response.error->kind, ErrorKind::ProtocolError );

  EXPECT_FALSE( channel.receive().has_value() );
}

TEST( AgentServer, UnknownOpcodeClosesConnection )
{
  TestAgent agent;
  agent.start();

  Channel channel = connect_raw( agent );
  say_hello( channel );

  string header = Message { 5, OpCode::Request, "" }.serialize_header();
  header[12] = 0x42;
  channel.socket().send_all( { header } );

  const auto reply = channel.receive();
  ASSERT_TRUE( reply.has_value() );
  const Response response = decode_response( *reply );
  ASSERT_TRUE( response.error.has_value() );
  EXPECT_EQ( response.error->kind, ErrorKind::ProtocolError );

  EXPECT_FALSE( channel.receive().has_value() );
}

TEST( AgentServer, RequestBeforeHandshake )
{
  TestAgent agent;
  agent.start();

  Channel channel = connect_raw( agent );

  Request request;
  request.operation = Operation::ListJobs;
  channel.send( encode( request ) );

  const auto reply = channel.receive();
  ASSERT_TRUE( reply.has_value() );
  const Response response = decode_response( *reply );
  ASSERT_TRUE( response.error.has_value() );
  EXPECT_EQ( response.error->kind, ErrorKind::ProtocolError );
}

TEST( AgentServer, DispatchReportsErrors )
{
  TestAgent agent;
  agent.start();

  Request request;
  request.correlation_id = 3;
  request.operation = Operation::GetStatus;
  request.job_id = "definitely not a job id";

  Response response = agent.server().dispatch( self(), request );
  EXPECT_EQ( response.correlation_id, 3 );
  ASSERT_TRUE( response.error.has_value() );
  EXPECT_EQ( response.error->kind, ErrorKind::InvalidArgument );

  request.job_id = "0f1e2d3c-4b5a-6978-8796-a5b4c3d2e1f0";
  response = agent.server().dispatch( self(), request );
  ASSERT_TRUE( response.error.has_value() );
  EXPECT_EQ( response.error->kind, ErrorKind::NotFound );
  EXPECT_EQ( response.error->job_id, JobId::parse( request.job_id ) );
  EXPECT_EQ( response.error->native_code, native::E_NOT_FOUND );

  request = {};
  request.operation = Operation::CreateJob;
  request.display_name = "T1";
  response = agent.server().dispatch( self(), request );
  EXPECT_FALSE( response.error.has_value() );
  ASSERT_TRUE( response.job_id.has_value() );

  request = {};
  request.operation = Operation::SetCredentials;
  request.job_id = response.job_id->str();
  response = agent.server().dispatch( self(), request );
  ASSERT_TRUE( response.error.has_value() );
  EXPECT_EQ( response.error->kind, ErrorKind::InvalidArgument );
}

TEST( AgentServer, ReplacesStaleSocketOnly )
{
  TestAgent agent;

  /* a leftover file from a dead agent */
  {
    ofstream stale { agent.socket_path() };
  }

  agent.start();
  EXPECT_NO_THROW( RemoteBackend { quick_options( agent ) }.list_jobs() );

  /* a live agent is never displaced */
  AgentConfiguration config;
  config.socket_path = agent.socket_path();
  EXPECT_THROW( AgentServer( config, make_shared<native::SimulatedTransferService>() ),
                runtime_error );
}

TEST( AgentServer, IdleTimeout )
{
  TempDirectory directory { "/tmp/xferd-test" };

  AgentConfiguration config;
  config.socket_path = directory.name() + "/agent.sock";
  config.idle_timeout = 50ms;
  config.poll_interval = 5ms;

  {
    AgentServer server { config, make_shared<native::SimulatedTransferService>() };

    const auto start = steady_clock::now();
    server.run();
    EXPECT_GE( steady_clock::now() - start, 50ms );
  }

  EXPECT_FALSE( filesystem::exists( config.socket_path ) );
}

TEST( AgentServer, StopUnblocksConnections )
{
  TestAgent agent;
  agent.start();

  Channel idle = connect_raw( agent );
  say_hello( idle );

  agent.stop();

  EXPECT_FALSE( idle.receive().has_value() );
  EXPECT_FALSE( filesystem::exists( agent.socket_path() ) );
}
