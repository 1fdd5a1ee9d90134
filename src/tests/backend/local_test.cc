#include <gtest/gtest.h>

#include <functional>
#include <memory>

#include "backend/local.hh"
#include "native/simulated_service.hh"

using namespace std;
using namespace xferd;

namespace {

class LocalBackendTest : public ::testing::Test
{
protected:
  shared_ptr<native::SimulatedTransferService> service_
    = make_shared<native::SimulatedTransferService>();

  LocalBackend backend_ { service_, { 1000, false } };

  JobHandle queued_download()
  {
    auto handle = backend_.create_job( "T1", Direction::Download );
    backend_.add_file( handle, "http://example/test.bin", "/tmp/test.bin" );
    return handle;
  }
};

ErrorKind kind_of( const function<void()>& fn )
{
  try {
    fn();
  } catch ( const JobError& e ) {
    return e.kind();
  }

  ADD_FAILURE() << "no JobError thrown";
  return ErrorKind::Unknown;
}

}

TEST_F( LocalBackendTest, CreateValidatesName )
{
  EXPECT_EQ( kind_of( [&] { backend_.create_job( "", Direction::Download ); } ),
             ErrorKind::InvalidArgument );

  const auto handle = backend_.create_job( "T1", Direction::Upload );
  const auto snapshot = backend_.get_status( handle );

  EXPECT_EQ( snapshot.id, handle.id() );
  EXPECT_EQ( snapshot.display_name, "T1" );
  EXPECT_EQ( snapshot.direction, Direction::Upload );
  EXPECT_EQ( snapshot.state, JobState::Queued );
}

TEST_F( LocalBackendTest, ForeignHandleIsRejected )
{
  LocalBackend other { service_, { 1000, false } };
  const auto handle = other.create_job( "elsewhere", Direction::Download );

  EXPECT_EQ( kind_of( [&] { backend_.get_status( handle ); } ), ErrorKind::InvalidArgument );
  EXPECT_EQ( kind_of( [&] { backend_.cancel( handle ); } ), ErrorKind::InvalidArgument );

  /* the same job re-attached through open_job is fine */
  EXPECT_EQ( backend_.get_status( backend_.open_job( handle.id() ) ).display_name, "elsewhere" );
}

TEST_F( LocalBackendTest, FileValidationFollowsDirection )
{
  const auto download = backend_.create_job( "down", Direction::Download );
  const auto upload = backend_.create_job( "up", Direction::Upload );

  EXPECT_EQ( kind_of( [&] { backend_.add_file( download, "/tmp/a", "http://example/a" ); } ),
             ErrorKind::InvalidArgument );
  EXPECT_EQ( kind_of( [&] { backend_.add_file( download, "http://example/a", "relative" ); } ),
             ErrorKind::InvalidArgument );
  EXPECT_EQ( kind_of( [&] { backend_.add_file( upload, "http://example/a", "/tmp/a" ); } ),
             ErrorKind::InvalidArgument );
  EXPECT_EQ( kind_of( [&] { backend_.add_files( upload, {} ); } ), ErrorKind::InvalidArgument );

  backend_.add_file( download, "http://example/a", "/tmp/a" );
  backend_.add_file( upload, "/tmp/a", "http://example/a" );

  const auto snapshot = backend_.get_status( upload );
  ASSERT_EQ( snapshot.files.size(), 1 );
  EXPECT_EQ( snapshot.files[0].source, "/tmp/a" );
  EXPECT_EQ( snapshot.files[0].destination, "http://example/a" );
}

TEST_F( LocalBackendTest, BatchIsAtomic )
{
  const auto handle = backend_.create_job( "batch", Direction::Download );

  EXPECT_EQ( kind_of( [&] {
               backend_.add_files( handle,
                                   { { "http://example/a", "/tmp/a" }, { "http://example/b", "b" } } );
             } ),
             ErrorKind::InvalidArgument );

  EXPECT_TRUE( backend_.get_status( handle ).files.empty() );
}

TEST_F( LocalBackendTest, ForbiddenTransitions )
{
  const auto handle = queued_download();

  EXPECT_EQ( kind_of( [&] { backend_.suspend( handle ); } ), ErrorKind::InvalidState );
  EXPECT_EQ( kind_of( [&] { backend_.resume( handle ); } ), ErrorKind::InvalidState );
  EXPECT_EQ( kind_of( [&] { backend_.complete( handle ); } ), ErrorKind::InvalidState );

  backend_.start( handle );
  EXPECT_EQ( kind_of( [&] { backend_.start( handle ); } ), ErrorKind::InvalidState );
  EXPECT_EQ( kind_of( [&] { backend_.add_file( handle, "http://example/b", "/tmp/b" ); } ),
             ErrorKind::InvalidState );

  const auto empty = backend_.create_job( "empty", Direction::Download );
  EXPECT_EQ( kind_of( [&] { backend_.start( empty ); } ), ErrorKind::InvalidState );
}

TEST_F( LocalBackendTest, SecondCompleteOrCancelIsNotFound )
{
  const auto completed = queued_download();
  backend_.start( completed );
  service_->advance( 5 );
  ASSERT_EQ( backend_.get_status( completed ).state, JobState::Transferred );

  backend_.complete( completed );
  EXPECT_EQ( kind_of( [&] { backend_.complete( completed ); } ), ErrorKind::NotFound );
  EXPECT_EQ( kind_of( [&] { backend_.cancel( completed ); } ), ErrorKind::NotFound );
  EXPECT_EQ( kind_of( [&] { backend_.get_status( completed ); } ), ErrorKind::NotFound );

  const auto cancelled = queued_download();
  backend_.cancel( cancelled );
  EXPECT_EQ( kind_of( [&] { backend_.cancel( cancelled ); } ), ErrorKind::NotFound );
  EXPECT_EQ( kind_of( [&] { backend_.complete( cancelled ); } ), ErrorKind::NotFound );
}

TEST_F( LocalBackendTest, ErrorsCarryNativeDetails )
{
  const auto handle = queued_download();
  backend_.cancel( handle );

  try {
    backend_.get_status( handle );
    FAIL() << "expected NotFound";
  } catch ( const JobError& e ) {
    EXPECT_EQ( e.kind(), ErrorKind::NotFound );
    EXPECT_EQ( e.operation(), "get_status" );
    EXPECT_EQ( e.job_id(), handle.id() );
    EXPECT_EQ( e.native_code(), native::E_NOT_FOUND );
  }
}

TEST_F( LocalBackendTest, OtherUsersJobs )
{
  LocalBackend bob { service_, { 1001, false } };
  const auto handle = queued_download();

  EXPECT_EQ( kind_of( [&] { bob.open_job( handle.id() ); } ), ErrorKind::NotFound );
  EXPECT_EQ( kind_of( [&] { bob.cancel( bob.attach( handle.id() ) ); } ),
             ErrorKind::PermissionDenied );
  EXPECT_TRUE( bob.list_jobs().empty() );

  LocalBackend service_identity { service_, { 0, true } };
  EXPECT_EQ( service_identity.list_jobs().size(), 1 );
  service_identity.cancel( service_identity.open_job( handle.id() ) );
  EXPECT_TRUE( backend_.list_jobs().empty() );
}

TEST_F( LocalBackendTest, ListInCreationOrder )
{
  const auto a = backend_.create_job( "a", Direction::Download );
  const auto b = backend_.create_job( "b", Direction::Upload );
  const auto c = backend_.create_job( "c", Direction::Download );

  const auto handles = backend_.list_jobs();
  ASSERT_EQ( handles.size(), 3 );
  EXPECT_EQ( handles[0].id(), a.id() );
  EXPECT_EQ( handles[1].id(), b.id() );
  EXPECT_EQ( handles[2].id(), c.id() );
  EXPECT_EQ( handles[0].owner(), &backend_ );
}

TEST_F( LocalBackendTest, Credentials )
{
  const auto handle = queued_download();

  EXPECT_EQ( kind_of( [&] {
               backend_.set_credentials( handle, { CredentialTarget::Server, CredentialScheme::Basic, "" } );
             } ),
             ErrorKind::InvalidArgument );

  EXPECT_EQ( kind_of( [&] {
               backend_.set_credentials(
                 handle, { static_cast<CredentialTarget>( 9 ), CredentialScheme::Basic, "x" } );
             } ),
             ErrorKind::InvalidArgument );

  backend_.set_credentials( handle, { CredentialTarget::Proxy, CredentialScheme::Negotiate, "token" } );
  EXPECT_EQ( service_->credential_count( handle.id().str() ), 1 );
}

TEST_F( LocalBackendTest, Priority )
{
  const auto handle = queued_download();

  backend_.set_priority( handle, JobPriority::Foreground );
  EXPECT_EQ( backend_.get_status( handle ).priority, JobPriority::Foreground );

  backend_.start( handle );
  backend_.set_priority( handle, JobPriority::Low );
  EXPECT_EQ( backend_.get_status( handle ).priority, JobPriority::Low );
}

TEST_F( LocalBackendTest, ProxyUsage )
{
  const auto handle = queued_download();
  EXPECT_EQ( backend_.get_status( handle ).proxy_usage, ProxyUsage::Preconfig );

  backend_.set_proxy_usage( handle, ProxyUsage::NoProxy );
  EXPECT_EQ( backend_.get_status( handle ).proxy_usage, ProxyUsage::NoProxy );

  backend_.start( handle );
  backend_.set_proxy_usage( handle, ProxyUsage::AutoDetect );
  EXPECT_EQ( backend_.get_status( handle ).proxy_usage, ProxyUsage::AutoDetect );

  LocalBackend other { service_, { 1001, false } };
  EXPECT_EQ( kind_of( [&] { other.set_proxy_usage( other.attach( handle.id() ), ProxyUsage::Preconfig ); } ),
             ErrorKind::PermissionDenied );

  backend_.cancel( handle );
  EXPECT_EQ( kind_of( [&] { backend_.set_proxy_usage( handle, ProxyUsage::Preconfig ); } ),
             ErrorKind::NotFound );
}

TEST_F( LocalBackendTest, UnknownNativeStateOnlyAllowsCancel )
{
  const auto handle = queued_download();
  ASSERT_EQ( service_->inject_raw_state( handle.id().str(), 42 ), native::OK );

  EXPECT_EQ( backend_.get_status( handle ).state, JobState::Unknown );
  EXPECT_EQ( kind_of( [&] { backend_.start( handle ); } ), ErrorKind::InvalidState );
  EXPECT_EQ( kind_of( [&] { backend_.complete( handle ); } ), ErrorKind::InvalidState );

  backend_.cancel( handle );
  EXPECT_EQ( kind_of( [&] { backend_.get_status( handle ); } ), ErrorKind::NotFound );
}

TEST_F( LocalBackendTest, ServiceOutage )
{
  service_->set_available( false );
  EXPECT_EQ( kind_of( [&] { backend_.create_job( "T1", Direction::Download ); } ),
             ErrorKind::ServiceUnavailable );
  EXPECT_EQ( kind_of( [&] { backend_.list_jobs(); } ), ErrorKind::ServiceUnavailable );
}
