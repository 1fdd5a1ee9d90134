/* -*-mode:c++; tab-width: 2; indent-tabs-mode: nil; c-basic-offset: 2 -*- */

#include "local.hh"

#include <glog/logging.h>
#include <unistd.h>

#include "job/native.hh"

using namespace std;

namespace xferd {

namespace {

bool is_url( const string& locator )
{
  const size_t pos = locator.find( "://" );
  return pos != string::npos and pos > 0 and pos + 3 < locator.length();
}

bool is_absolute_path( const string& path )
{
  return not path.empty() and path.front() == '/';
}

}

LocalBackend::LocalBackend( shared_ptr<native::TransferService> service,
                            const native::Principal& principal )
  : service_( move( service ) )
  , principal_( principal )
{
  if ( not service_ ) {
    throw runtime_error( "LocalBackend: no transfer service" );
  }
}

native::Principal LocalBackend::current_principal()
{
  const uid_t uid = geteuid();
  return { static_cast<uint32_t>( uid ), uid == 0 };
}

void LocalBackend::check( const native::Result result,
                          const string_view operation,
                          const optional<JobId>& job_id ) const
{
  if ( result == native::OK ) {
    return;
  }

  throw JobError( kind_from_native( result ),
                  operation,
                  service_->describe( result ),
                  job_id,
                  result );
}

native::JobStatus LocalBackend::native_status( const JobId& id, const string_view operation )
{
  native::JobStatus status;
  check( service_->get_status( principal_, id.str(), status ), operation, id );
  return status;
}

JobHandle LocalBackend::create_job( const string& display_name, const Direction direction )
{
  if ( display_name.empty() ) {
    throw JobError( ErrorKind::InvalidArgument, "create_job", "display name is empty" );
  }

  string raw_id;
  check( service_->create_job( principal_, display_name, direction_to_native( direction ), raw_id ),
         "create_job" );

  const auto id = JobId::parse( raw_id );
  if ( not id.has_value() ) {
    throw JobError( ErrorKind::Unknown,
                    "create_job",
                    "transfer service returned a malformed job id: " + raw_id );
  }

  VLOG( 1 ) << "created " << to_string( direction ) << " job " << *id << " \""
            << display_name << "\"";

  return make_handle( *id );
}

void LocalBackend::add_files( const JobHandle& handle, const vector<FileSpec>& files )
{
  const JobId& id = check_handle( handle, "add_files" );

  if ( files.empty() ) {
    throw JobError( ErrorKind::InvalidArgument, "add_files", "no files given", id );
  }

  const auto direction = direction_from_native( native_status( id, "add_files" ).type );
  if ( not direction.has_value() ) {
    throw JobError( ErrorKind::Unknown, "add_files", "job has an unrecognized direction", id );
  }

  vector<pair<string, string>> native_files;

  for ( const auto& file : files ) {
    const string& remote = ( *direction == Direction::Download ) ? file.source : file.destination;
    const string& local = ( *direction == Direction::Download ) ? file.destination : file.source;

    if ( not is_url( remote ) ) {
      throw JobError( ErrorKind::InvalidArgument, "add_files", "not a URL: \"" + remote + "\"", id );
    }

    if ( not is_absolute_path( local ) ) {
      throw JobError( ErrorKind::InvalidArgument,
                      "add_files",
                      "not an absolute local path: \"" + local + "\"",
                      id );
    }

    native_files.emplace_back( remote, local );
  }

  check( service_->add_files( principal_, id.str(), native_files ), "add_files", id );
}

void LocalBackend::start( const JobHandle& handle )
{
  const JobId& id = check_handle( handle, "start" );
  check( service_->start( principal_, id.str() ), "start", id );
}

void LocalBackend::suspend( const JobHandle& handle )
{
  const JobId& id = check_handle( handle, "suspend" );
  check( service_->suspend( principal_, id.str() ), "suspend", id );
}

void LocalBackend::resume( const JobHandle& handle )
{
  const JobId& id = check_handle( handle, "resume" );
  check( service_->resume( principal_, id.str() ), "resume", id );
}

void LocalBackend::cancel( const JobHandle& handle )
{
  const JobId& id = check_handle( handle, "cancel" );
  check( service_->cancel( principal_, id.str() ), "cancel", id );
  VLOG( 1 ) << "cancelled job " << id;
}

void LocalBackend::complete( const JobHandle& handle )
{
  const JobId& id = check_handle( handle, "complete" );
  check( service_->complete( principal_, id.str() ), "complete", id );
  VLOG( 1 ) << "completed job " << id;
}

JobSnapshot LocalBackend::get_status( const JobHandle& handle )
{
  const JobId& id = check_handle( handle, "get_status" );
  const auto status = native_status( id, "get_status" );

  return snapshot_from_native( id.str(), status, [this]( const native::Result code ) {
    return service_->describe( code );
  } );
}

void LocalBackend::set_credentials( const JobHandle& handle, const Credential& credential )
{
  const JobId& id = check_handle( handle, "set_credentials" );

  if ( not credential.well_formed() ) {
    throw JobError( ErrorKind::InvalidArgument, "set_credentials", "malformed credential", id );
  }

  check( service_->set_credentials( principal_,
                                    id.str(),
                                    target_to_native( credential.target ),
                                    scheme_to_native( credential.scheme ),
                                    credential.blob ),
         "set_credentials",
         id );
}

void LocalBackend::set_priority( const JobHandle& handle, const JobPriority priority )
{
  const JobId& id = check_handle( handle, "set_priority" );
  check( service_->set_priority( principal_, id.str(), priority_to_native( priority ) ),
         "set_priority",
         id );
}

void LocalBackend::set_proxy_usage( const JobHandle& handle, const ProxyUsage usage )
{
  const JobId& id = check_handle( handle, "set_proxy_usage" );
  check( service_->set_proxy_usage( principal_, id.str(), proxy_usage_to_native( usage ) ),
         "set_proxy_usage",
         id );
}

JobHandle LocalBackend::open_job( const JobId& id )
{
  if ( id.empty() ) {
    throw JobError( ErrorKind::InvalidArgument, "open_job", "empty job id" );
  }

  native::JobStatus status;
  const native::Result result = service_->get_status( principal_, id.str(), status );

  /* a job owned by someone else is indistinguishable from a missing one */
  check( ( result == native::E_ACCESS_DENIED ) ? native::E_NOT_FOUND : result, "open_job", id );

  return make_handle( id );
}

vector<JobHandle> LocalBackend::list_jobs()
{
  vector<string> raw_ids;
  check( service_->enum_jobs( principal_, raw_ids ), "list_jobs" );

  vector<JobHandle> handles;
  for ( const auto& raw_id : raw_ids ) {
    const auto id = JobId::parse( raw_id );
    if ( not id.has_value() ) {
      LOG( WARNING ) << "skipping job with malformed id \"" << raw_id << "\"";
      continue;
    }

    handles.push_back( make_handle( *id ) );
  }

  return handles;
}

} // namespace xferd
