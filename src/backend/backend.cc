/* -*-mode:c++; tab-width: 2; indent-tabs-mode: nil; c-basic-offset: 2 -*- */

#include "backend.hh"

#include <chrono>
#include <stdexcept>

#include "backend/launcher.hh"
#include "backend/local.hh"
#include "backend/remote.hh"
#include "common/defaults.hh"
#include "native/simulated_service.hh"
#include "util/uri.hh"
#include "util/util.hh"

using namespace std;
using namespace std::chrono;

namespace xferd {

const JobId& Backend::check_handle( const JobHandle& handle,
                                    const string_view operation ) const
{
  if ( handle.owner() != this ) {
    throw JobError( ErrorKind::InvalidArgument,
                    operation,
                    "job handle belongs to a different backend",
                    handle.id() );
  }

  return handle.id();
}

void Backend::add_file( const JobHandle& handle,
                        const string& source,
                        const string& destination )
{
  add_files( handle, { FileSpec { source, destination } } );
}

namespace {

uint64_t option_or( ParsedURI& endpoint, const string& key, const uint64_t def_val )
{
  const auto it = endpoint.options.find( key );
  if ( it == endpoint.options.end() ) {
    return def_val;
  }

  try {
    return stoull( it->second );
  } catch ( const exception& ) {
    throw runtime_error( "invalid value for backend option " + key + ": " + it->second );
  }
}

}

unique_ptr<Backend> Backend::create_backend( const string& uri )
{
  ParsedURI endpoint { uri };

  unique_ptr<Backend> backend;

  if ( endpoint.protocol == "local" ) {
    native::SimulatedTransferService::Options options;
    options.store_path = endpoint.path.empty()
                           ? safe_getenv_or( "XFERD_STORE", DEFAULT_STORE_PATH )
                           : endpoint.path;
    options.step_interval = milliseconds { option_or( endpoint, "step_ms", 1000 ) };
    options.bytes_per_step = option_or( endpoint, "bytes_per_step", options.bytes_per_step );

    backend = make_unique<LocalBackend>(
      make_shared<native::SimulatedTransferService>( options ),
      LocalBackend::current_principal() );
  } else if ( endpoint.protocol == "agent" ) {
    RemoteOptions options;
    options.socket_path = endpoint.path.empty()
                            ? safe_getenv_or( "XFERD_SOCKET", DEFAULT_SOCKET_PATH )
                            : endpoint.path;
    options.bootstrap.deadline = milliseconds { option_or( endpoint, "deadline_ms", options.bootstrap.deadline.count() ) };
    options.bootstrap.max_attempts = static_cast<uint32_t>( option_or( endpoint, "attempts", options.bootstrap.max_attempts ) );
    options.bootstrap.initial_delay = milliseconds { option_or( endpoint, "initial_delay_ms", options.bootstrap.initial_delay.count() ) };
    options.bootstrap.max_delay = milliseconds { option_or( endpoint, "max_delay_ms", options.bootstrap.max_delay.count() ) };
    options.request_timeout = milliseconds { option_or( endpoint, "request_timeout_ms", options.request_timeout.count() ) };

    vector<string> command = CommandLauncher::default_command( options.socket_path );
    if ( endpoint.options.count( "agent" ) ) {
      command.front() = endpoint.options["agent"];
    }

    backend = make_unique<RemoteBackend>( options, make_shared<CommandLauncher>( move( command ) ) );
  } else {
    throw runtime_error( "unknown backend: " + uri );
  }

  return backend;
}

} // namespace xferd
