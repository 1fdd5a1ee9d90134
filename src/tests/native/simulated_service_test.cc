#include <gtest/gtest.h>

#include <fstream>
#include <sstream>
#include <string>
#include <thread>

#include "native/simulated_service.hh"
#include "util/fileutils.hh"
#include "util/temp_dir.hh"

using namespace std;
using namespace std::chrono;
using namespace xferd::native;

namespace {

const Principal ALICE { 1000, false };
const Principal BOB { 1001, false };
const Principal SERVICE { 0, true };

string create_download( TransferService& service,
                        const Principal& principal,
                        const vector<pair<string, string>>& files = {
                          { "http://example/test.bin", "/tmp/test.bin" } } )
{
  string id;
  EXPECT_EQ( service.create_job( principal, "T1", JOB_TYPE_DOWNLOAD, id ), OK );

  if ( not files.empty() ) {
    EXPECT_EQ( service.add_files( principal, id, files ), OK );
  }

  return id;
}

uint32_t state_of( TransferService& service, const Principal& principal, const string& id )
{
  JobStatus status;
  EXPECT_EQ( service.get_status( principal, id, status ), OK );
  return status.state;
}

}

TEST( SimulatedTransferService, StepsToTransferred )
{
  SimulatedTransferService::Options options;
  options.bytes_per_step = 100 * 1024;
  options.default_file_size = 256 * 1024;

  SimulatedTransferService service { options };
  const string id = create_download( service, ALICE );

  EXPECT_EQ( state_of( service, ALICE, id ), JOB_STATE_QUEUED );
  EXPECT_EQ( service.start( ALICE, id ), OK );
  EXPECT_EQ( state_of( service, ALICE, id ), JOB_STATE_CONNECTING );

  service.advance();
  EXPECT_EQ( state_of( service, ALICE, id ), JOB_STATE_TRANSFERRING );

  service.advance( 2 );
  JobStatus status;
  ASSERT_EQ( service.get_status( ALICE, id, status ), OK );
  EXPECT_EQ( status.state, JOB_STATE_TRANSFERRING );
  EXPECT_EQ( status.files[0].bytes_transferred, 200 * 1024 );

  service.advance();
  ASSERT_EQ( service.get_status( ALICE, id, status ), OK );
  EXPECT_EQ( status.state, JOB_STATE_TRANSFERRED );
  EXPECT_TRUE( status.files[0].completed );
  EXPECT_NE( status.transfer_completion_time, 0 );

  EXPECT_EQ( service.complete( ALICE, id ), OK );
  EXPECT_EQ( service.get_status( ALICE, id, status ), E_NOT_FOUND );
  EXPECT_EQ( service.complete( ALICE, id ), E_NOT_FOUND );
}

TEST( SimulatedTransferService, StartNeedsFiles )
{
  SimulatedTransferService service;
  const string id = create_download( service, ALICE, {} );

  EXPECT_EQ( service.start( ALICE, id ), E_EMPTY );
  EXPECT_EQ( service.suspend( ALICE, id ), E_INVALID_STATE );
  EXPECT_EQ( service.cancel( ALICE, id ), OK );
  EXPECT_EQ( service.cancel( ALICE, id ), E_NOT_FOUND );
}

TEST( SimulatedTransferService, AddFilesIsAllOrNothing )
{
  SimulatedTransferService service;
  const string id = create_download( service, ALICE, {} );

  EXPECT_EQ( service.add_files( ALICE, id, { { "http://example/a", "/tmp/a" }, { "http://example/b", "tmp/b" } } ),
             E_INVALID_ARG );

  JobStatus status;
  ASSERT_EQ( service.get_status( ALICE, id, status ), OK );
  EXPECT_TRUE( status.files.empty() );

  ASSERT_EQ( service.add_files( ALICE, id, { { "http://example/a", "/tmp/a" } } ), OK );
  ASSERT_EQ( service.start( ALICE, id ), OK );
  EXPECT_EQ( service.add_files( ALICE, id, { { "http://example/b", "/tmp/b" } } ), E_INVALID_STATE );
}

TEST( SimulatedTransferService, Ownership )
{
  SimulatedTransferService service;
  const string id = create_download( service, ALICE );

  JobStatus status;
  EXPECT_EQ( service.get_status( BOB, id, status ), E_ACCESS_DENIED );
  EXPECT_EQ( service.cancel( BOB, id ), E_ACCESS_DENIED );
  EXPECT_EQ( service.get_status( SERVICE, id, status ), OK );
  EXPECT_EQ( status.owner_uid, ALICE.uid );

  vector<string> ids;
  ASSERT_EQ( service.enum_jobs( BOB, ids ), OK );
  EXPECT_TRUE( ids.empty() );
  ASSERT_EQ( service.enum_jobs( ALICE, ids ), OK );
  EXPECT_EQ( ids, vector<string> { id } );
}

TEST( SimulatedTransferService, SuspendAndResume )
{
  SimulatedTransferService service;
  const string id = create_download( service, ALICE );

  ASSERT_EQ( service.start( ALICE, id ), OK );
  service.advance();
  ASSERT_EQ( service.suspend( ALICE, id ), OK );

  service.advance( 10 );
  EXPECT_EQ( state_of( service, ALICE, id ), JOB_STATE_SUSPENDED );

  ASSERT_EQ( service.resume( ALICE, id ), OK );
  EXPECT_EQ( state_of( service, ALICE, id ), JOB_STATE_CONNECTING );
  EXPECT_EQ( service.resume( ALICE, id ), E_INVALID_STATE );
}

TEST( SimulatedTransferService, TransientFailureRetries )
{
  SimulatedTransferService service;
  const string id = create_download( service, ALICE );

  ASSERT_EQ( service.start( ALICE, id ), OK );
  service.advance();
  ASSERT_EQ( service.inject_transient_failure( id ), OK );

  JobStatus status;
  ASSERT_EQ( service.get_status( ALICE, id, status ), OK );
  EXPECT_EQ( status.state, JOB_STATE_TRANSIENT_ERROR );
  ASSERT_TRUE( status.error.has_value() );
  EXPECT_EQ( status.error->code, E_TRANSIENT_NETWORK );
  EXPECT_EQ( status.error_count, 1 );

  service.advance();
  ASSERT_EQ( service.get_status( ALICE, id, status ), OK );
  EXPECT_EQ( status.state, JOB_STATE_TRANSFERRING );
  EXPECT_FALSE( status.error.has_value() );
}

TEST( SimulatedTransferService, FatalFailureIsSticky )
{
  SimulatedTransferService service;
  const string id = create_download( service, ALICE );

  ASSERT_EQ( service.start( ALICE, id ), OK );
  ASSERT_EQ( service.inject_fatal_failure( id, E_REMOTE_NOT_FOUND, ERROR_CONTEXT_REMOTE_FILE ), OK );

  service.advance( 10 );
  EXPECT_EQ( state_of( service, ALICE, id ), JOB_STATE_ERROR );
  EXPECT_EQ( service.resume( ALICE, id ), E_INVALID_STATE );
  EXPECT_EQ( service.complete( ALICE, id ), E_INVALID_STATE );
  EXPECT_EQ( service.cancel( ALICE, id ), OK );
}

TEST( SimulatedTransferService, MissingLocalSourceFails )
{
  SimulatedTransferService service;

  string id;
  ASSERT_EQ( service.create_job( ALICE, "up", JOB_TYPE_UPLOAD, id ), OK );
  ASSERT_EQ( service.add_files( ALICE, id, { { "http://example/up.bin", "/nonexistent/xferd/up.bin" } } ), OK );
  ASSERT_EQ( service.start( ALICE, id ), OK );
  service.advance();

  JobStatus status;
  ASSERT_EQ( service.get_status( ALICE, id, status ), OK );
  EXPECT_EQ( status.state, JOB_STATE_ERROR );
  ASSERT_TRUE( status.error.has_value() );
  EXPECT_EQ( status.error->code, E_FILE_NOT_AVAILABLE );
  EXPECT_EQ( status.error->context, ERROR_CONTEXT_LOCAL_FILE );
}

TEST( SimulatedTransferService, FileUrlsAreCopiedOnComplete )
{
  TempDirectory dir { "/tmp/xferd-sim" };
  const string source = dir.name() + "/source.bin";
  const string destination = dir.name() + "/destination.bin";

  {
    ofstream out { source, ios::binary };
    out << string( 5000, 'z' );
  }

  SimulatedTransferService::Options options;
  options.bytes_per_step = 4096;
  SimulatedTransferService service { options };

  const string id = create_download( service, ALICE, { { "file://" + source, destination } } );
  ASSERT_EQ( service.start( ALICE, id ), OK );
  service.advance( 3 );

  JobStatus status;
  ASSERT_EQ( service.get_status( ALICE, id, status ), OK );
  ASSERT_EQ( status.state, JOB_STATE_TRANSFERRED );
  EXPECT_EQ( status.files[0].bytes_total, 5000 );

  EXPECT_FALSE( filesystem::exists( destination ) );
  ASSERT_EQ( service.complete( ALICE, id ), OK );
  EXPECT_EQ( roost::read_file( destination ), string( 5000, 'z' ) );
}

TEST( SimulatedTransferService, Credentials )
{
  SimulatedTransferService service;
  const string id = create_download( service, ALICE );

  EXPECT_EQ( service.set_credentials( ALICE, id, AUTH_TARGET_SERVER, AUTH_SCHEME_BASIC, "" ), E_INVALID_ARG );
  EXPECT_EQ( service.set_credentials( ALICE, id, 7, AUTH_SCHEME_BASIC, "x" ), E_INVALID_ARG );

  EXPECT_EQ( service.set_credentials( ALICE, id, AUTH_TARGET_SERVER, AUTH_SCHEME_BASIC, "a" ), OK );
  EXPECT_EQ( service.set_credentials( ALICE, id, AUTH_TARGET_SERVER, AUTH_SCHEME_DIGEST, "b" ), OK );
  EXPECT_EQ( service.set_credentials( ALICE, id, AUTH_TARGET_PROXY, AUTH_SCHEME_NTLM, "c" ), OK );
  EXPECT_EQ( service.credential_count( id ), 2 );

  ASSERT_EQ( service.cancel( ALICE, id ), OK );
  EXPECT_EQ( service.credential_count( id ), 0 );
}

TEST( SimulatedTransferService, ProxyUsage )
{
  TempDirectory dir { "/tmp/xferd-sim" };

  SimulatedTransferService::Options options;
  options.store_path = dir.name() + "/store.bin";

  SimulatedTransferService service { options };
  const string id = create_download( service, ALICE );

  EXPECT_EQ( service.set_proxy_usage( ALICE, id, 2 ), E_INVALID_ARG );
  EXPECT_EQ( service.set_proxy_usage( ALICE, id, 4 ), E_INVALID_ARG );
  EXPECT_EQ( service.set_proxy_usage( BOB, id, PROXY_USAGE_NO_PROXY ), E_ACCESS_DENIED );
  ASSERT_EQ( service.set_proxy_usage( ALICE, id, PROXY_USAGE_AUTODETECT ), OK );

  /* kept in the state file */
  SimulatedTransferService reopened { options };
  JobStatus status;
  ASSERT_EQ( reopened.get_status( ALICE, id, status ), OK );
  EXPECT_EQ( status.proxy_usage, PROXY_USAGE_AUTODETECT );

  ASSERT_EQ( service.cancel( ALICE, id ), OK );
  EXPECT_EQ( service.set_proxy_usage( ALICE, id, PROXY_USAGE_PRECONFIG ), E_NOT_FOUND );
}

TEST( SimulatedTransferService, Unavailable )
{
  SimulatedTransferService service;
  service.set_available( false );

  string id;
  EXPECT_EQ( service.create_job( ALICE, "T1", JOB_TYPE_DOWNLOAD, id ), E_SERVICE_UNAVAILABLE );

  service.set_available( true );
  EXPECT_EQ( service.create_job( ALICE, "T1", JOB_TYPE_DOWNLOAD, id ), OK );
}

TEST( SimulatedTransferService, SharedStoreFile )
{
  TempDirectory dir { "/tmp/xferd-sim" };
  const string secret = "hunter2-do-not-persist";

  SimulatedTransferService::Options options;
  options.store_path = dir.name() + "/store.bin";

  SimulatedTransferService first { options };
  SimulatedTransferService second { options };

  const string id = create_download( first, ALICE );
  ASSERT_EQ( first.set_credentials( ALICE, id, AUTH_TARGET_SERVER, AUTH_SCHEME_BASIC, secret ), OK );

  /* a second instance sees the same jobs */
  EXPECT_EQ( state_of( second, ALICE, id ), JOB_STATE_QUEUED );
  ASSERT_EQ( second.start( ALICE, id ), OK );
  EXPECT_EQ( state_of( first, ALICE, id ), JOB_STATE_CONNECTING );

  /* credentials stay in the memory of the instance that received them */
  EXPECT_EQ( roost::read_file( *options.store_path ).find( secret ), string::npos );
  EXPECT_EQ( second.credential_count( id ), 0 );

  ASSERT_EQ( second.cancel( ALICE, id ), OK );
  JobStatus status;
  EXPECT_EQ( first.get_status( ALICE, id, status ), E_NOT_FOUND );
}

TEST( SimulatedTransferService, WallClockSteps )
{
  SimulatedTransferService::Options options;
  options.step_interval = 10ms;
  options.bytes_per_step = 1024 * 1024;

  SimulatedTransferService service { options };
  const string id = create_download( service, ALICE );
  ASSERT_EQ( service.start( ALICE, id ), OK );

  this_thread::sleep_for( 50ms );
  EXPECT_EQ( state_of( service, ALICE, id ), JOB_STATE_TRANSFERRED );
}

TEST( SimulatedTransferService, Describe )
{
  SimulatedTransferService service;
  EXPECT_EQ( service.describe( E_NOT_FOUND ), "the requested job was not found" );
  EXPECT_EQ( service.describe( static_cast<Result>( 0x8badf00d ) ), "unrecognized error 0x8badf00d" );
}
