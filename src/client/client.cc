/* -*-mode:c++; tab-width: 2; indent-tabs-mode: nil; c-basic-offset: 2 -*- */

#include "client.hh"

#include <stdexcept>

#include "common/defaults.hh"
#include "native/simulated_service.hh"
#include "util/util.hh"

using namespace std;
using namespace std::chrono;

namespace xferd {

Client::Client( unique_ptr<Backend>&& backend )
  : backend_( move( backend ) )
{
  if ( not backend_ ) {
    throw runtime_error( "Client: no backend" );
  }
}

Client Client::in_process( shared_ptr<native::TransferService> service,
                           const native::Principal& principal )
{
  return Client { make_unique<LocalBackend>( move( service ), principal ) };
}

Client Client::in_process()
{
  native::SimulatedTransferService::Options options;
  options.store_path = safe_getenv_or( "XFERD_STORE", DEFAULT_STORE_PATH );
  options.step_interval = 1s;

  return in_process( make_shared<native::SimulatedTransferService>( options ) );
}

Client Client::remote( const RemoteOptions& options, shared_ptr<AgentLauncher> launcher )
{
  if ( not launcher ) {
    launcher = make_shared<CommandLauncher>( CommandLauncher::default_command( options.socket_path ) );
  }

  return Client { make_unique<RemoteBackend>( options, move( launcher ) ) };
}

Client Client::from_uri( const string& uri )
{
  return Client { Backend::create_backend( uri ) };
}

JobHandle Client::create_job( const string& display_name, const Direction direction )
{
  return backend_->create_job( display_name, direction );
}

void Client::add_file( const JobHandle& handle, const string& source, const string& destination )
{
  backend_->add_file( handle, source, destination );
}

void Client::add_files( const JobHandle& handle, const vector<FileSpec>& files )
{
  backend_->add_files( handle, files );
}

void Client::start( const JobHandle& handle ) { backend_->start( handle ); }
void Client::suspend( const JobHandle& handle ) { backend_->suspend( handle ); }
void Client::resume( const JobHandle& handle ) { backend_->resume( handle ); }
void Client::cancel( const JobHandle& handle ) { backend_->cancel( handle ); }
void Client::complete( const JobHandle& handle ) { backend_->complete( handle ); }

JobSnapshot Client::get_status( const JobHandle& handle )
{
  return backend_->get_status( handle );
}

JobMonitor Client::monitor( const JobHandle& handle, const milliseconds interval )
{
  MonitorOptions options;
  options.interval = interval;
  return monitor( handle, options );
}

JobMonitor Client::monitor( const JobHandle& handle, const MonitorOptions& options )
{
  return JobMonitor { backend_, handle, options };
}

void Client::set_credentials( const JobHandle& handle, const Credential& credential )
{
  backend_->set_credentials( handle, credential );
}

void Client::set_priority( const JobHandle& handle, const JobPriority priority )
{
  backend_->set_priority( handle, priority );
}

void Client::set_proxy_usage( const JobHandle& handle, const ProxyUsage usage )
{
  backend_->set_proxy_usage( handle, usage );
}

JobHandle Client::open_job( const JobId& id ) { return backend_->open_job( id ); }

vector<JobHandle> Client::list_jobs() { return backend_->list_jobs(); }

} // namespace xferd
