/* -*-mode:c++; tab-width: 2; indent-tabs-mode: nil; c-basic-offset: 2 -*- */

#include <getopt.h>
#include <glog/logging.h>
#include <signal.h>

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

#include "agent/server.hh"
#include "common/defaults.hh"
#include "native/simulated_service.hh"
#include "util/exception.hh"
#include "util/util.hh"

using namespace std;
using namespace std::chrono;
using namespace xferd;

namespace {

AgentServer* active_server = nullptr;

void handle_signal( int )
{
  if ( active_server ) {
    active_server->stop();
  }
}

}

void usage( const char* argv0, int exit_code )
{
  cerr << "Usage: " << argv0 << " [OPTION]..." << endl
       << endl
       << "Options:" << endl
       << "  -s --socket PATH           listen on PATH (default: $XFERD_SOCKET or "
       << DEFAULT_SOCKET_PATH << ")" << endl
       << "  -S --store PATH            job state file (default: $XFERD_STORE or "
       << DEFAULT_STORE_PATH << ")" << endl
       << "  -u --allow-uid UID         accept callers running as UID (repeatable;"
       << endl
       << "                             default: only the agent's own uid)" << endl
       << "  -t --idle-timeout T        exit after T seconds without connections"
       << endl
       << "  -i --step-interval MS      simulated progress step (default: 1000)"
       << endl
       << "  -b --bytes-per-step N      bytes moved per step (default: 65536)"
       << endl
       << "  -h --help                  show help information" << endl;

  exit( exit_code );
}

int main( int argc, char* argv[] )
{
  if ( argc <= 0 ) {
    abort();
  }

  google::InitGoogleLogging( argv[0] );

  AgentConfiguration config;
  config.socket_path = safe_getenv_or( "XFERD_SOCKET", DEFAULT_SOCKET_PATH );

  native::SimulatedTransferService::Options service_options;
  service_options.store_path = safe_getenv_or( "XFERD_STORE", DEFAULT_STORE_PATH );
  service_options.step_interval = 1s;

  struct option long_options[] = {
    { "socket", required_argument, nullptr, 's' },
    { "store", required_argument, nullptr, 'S' },
    { "allow-uid", required_argument, nullptr, 'u' },
    { "idle-timeout", required_argument, nullptr, 't' },
    { "step-interval", required_argument, nullptr, 'i' },
    { "bytes-per-step", required_argument, nullptr, 'b' },
    { "help", no_argument, nullptr, 'h' },
    { nullptr, 0, nullptr, 0 },
  };

  try {
    while ( true ) {
      const int opt = getopt_long( argc, argv, "s:S:u:t:i:b:h", long_options, nullptr );

      if ( opt == -1 ) {
        break;
      }

      switch ( opt ) {
        // clang-format off
        case 's': config.socket_path = optarg; break;
        case 'S': service_options.store_path = optarg; break;
        case 'u': config.allowed_uids.insert( static_cast<uid_t>( stoul( optarg ) ) ); break;
        case 't': config.idle_timeout = seconds { stoul( optarg ) }; break;
        case 'i': service_options.step_interval = milliseconds { stoul( optarg ) }; break;
        case 'b': service_options.bytes_per_step = stoull( optarg ); break;
        case 'h': usage( argv[0], EXIT_SUCCESS ); break;
          // clang-format on

        default: usage( argv[0], EXIT_FAILURE ); break;
      }
    }
  } catch ( const logic_error& ) {
    /* stoul() on a malformed number */
    usage( argv[0], EXIT_FAILURE );
  }

  if ( optind != argc or config.socket_path.empty() or service_options.bytes_per_step == 0 ) {
    usage( argv[0], EXIT_FAILURE );
  }

  try {
    auto service = make_shared<native::SimulatedTransferService>( service_options );

    AgentServer server { config, service };

    active_server = &server;
    signal( SIGINT, handle_signal );
    signal( SIGTERM, handle_signal );
    signal( SIGPIPE, SIG_IGN );

    server.run();

    active_server = nullptr;
  } catch ( const exception& e ) {
    active_server = nullptr;
    print_exception( argv[0], e );
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
