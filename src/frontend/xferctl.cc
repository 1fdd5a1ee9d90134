/* -*-mode:c++; tab-width: 2; indent-tabs-mode: nil; c-basic-offset: 2 -*- */

#include <getopt.h>
#include <glog/logging.h>
#include <signal.h>

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "client/client.hh"
#include "util/exception.hh"
#include "util/util.hh"

using namespace std;
using namespace std::chrono;
using namespace xferd;

namespace {

volatile sig_atomic_t interrupted = 0;

void handle_interrupt( int ) { interrupted = 1; }

}

void usage( const char* argv0, int exit_code )
{
  cerr << "Usage: " << argv0 << " [OPTION]... COMMAND [ARG]..." << endl
       << endl
       << "Commands:" << endl
       << "  download URL PATH          download URL to PATH and monitor it" << endl
       << "  upload PATH URL            upload PATH to URL and monitor it" << endl
       << "  start URL PATH             same as download" << endl
       << "  monitor ID                 follow a job until it stops making progress"
       << endl
       << "  status ID                  print the state of a job" << endl
       << "  list                       list the jobs visible to this user" << endl
       << "  suspend ID | resume ID     pause or continue a job" << endl
       << "  priority ID LEVEL          foreground, high, normal or low" << endl
       << "  fg ID | bg ID              foreground or normal priority" << endl
       << "  proxy ID USAGE             preconfig, no-proxy or auto-detect" << endl
       << "  complete ID                acknowledge a transferred job" << endl
       << "  cancel ID...               cancel one or more jobs" << endl
       << endl
       << "Options:" << endl
       << "  -b --backend URI           local://[PATH] or agent://[PATH]" << endl
       << "                             (default: local://)" << endl
       << "  -n --name NAME             display name for new jobs" << endl
       << "  -i --interval MS           polling interval (default: 1000)" << endl
       << "  -s --store PATH            job state file for local://" << endl
       << "  -h --help                  show help information" << endl;

  exit( exit_code );
}

JobHandle open_job( Client& client, const string& text )
{
  const auto id = JobId::parse( text );
  if ( not id.has_value() ) {
    throw runtime_error( "not a job id: " + text );
  }

  return client.open_job( *id );
}

/* follows the job while it is moving; returns the last state seen */
JobState monitor_job( Client& client, const JobHandle& handle, const milliseconds interval )
{
  JobMonitor monitor = client.monitor( handle, interval );
  JobState last_state = JobState::Unknown;

  while ( not interrupted ) {
    const auto event = monitor.next();
    if ( not event.has_value() ) {
      break;
    }

    if ( event->kind == MonitorEvent::Kind::TransportFailure ) {
      throw *event->error;
    }

    cout << event->snapshot << endl;
    last_state = event->snapshot.state;

    if ( last_state != JobState::Connecting and last_state != JobState::Transferring
         and last_state != JobState::TransientError ) {
      break;
    }
  }

  if ( interrupted ) {
    cerr << "interrupted; job " << handle.id() << " continues in the background" << endl;
  }

  return last_state;
}

int main( int argc, char* argv[] )
{
  if ( argc <= 0 ) {
    abort();
  }

  google::InitGoogleLogging( argv[0] );

  string backend_uri { "local://" };
  string display_name { "xferctl" };
  milliseconds interval { 1000 };
  string store_path;

  struct option long_options[] = {
    { "backend", required_argument, nullptr, 'b' },
    { "name", required_argument, nullptr, 'n' },
    { "interval", required_argument, nullptr, 'i' },
    { "store", required_argument, nullptr, 's' },
    { "help", no_argument, nullptr, 'h' },
    { nullptr, 0, nullptr, 0 },
  };

  try {
    while ( true ) {
      const int opt = getopt_long( argc, argv, "b:n:i:s:h", long_options, nullptr );

      if ( opt == -1 ) {
        break;
      }

      switch ( opt ) {
        // clang-format off
        case 'b': backend_uri = optarg; break;
        case 'n': display_name = optarg; break;
        case 'i': interval = milliseconds { stoul( optarg ) }; break;
        case 's': store_path = optarg; break;
        case 'h': usage( argv[0], EXIT_SUCCESS ); break;
          // clang-format on

        default: usage( argv[0], EXIT_FAILURE ); break;
      }
    }
  } catch ( const logic_error& ) {
    usage( argv[0], EXIT_FAILURE );
  }

  if ( optind >= argc or interval <= 0ms ) {
    usage( argv[0], EXIT_FAILURE );
  }

  const string command { argv[optind] };
  const vector<string> args { argv + optind + 1, argv + argc };

  if ( not store_path.empty() ) {
    if ( backend_uri != "local://" ) {
      cerr << "Error: --store only applies to the local:// backend." << endl;
      usage( argv[0], EXIT_FAILURE );
    }

    backend_uri += filesystem::absolute( store_path ).string();
  }

  signal( SIGINT, handle_interrupt );

  try {
    Client client = Client::from_uri( backend_uri );

    const optional<Direction> direction = ( command == "start" )
                                            ? Direction::Download
                                            : direction_from_string( command );

    if ( direction.has_value() and args.size() == 2 ) {
      const auto handle = client.create_job( display_name, *direction );

      try {
        client.add_file( handle, args[0], args[1] );
        client.start( handle );
      } catch ( const JobError& ) {
        client.cancel( handle );
        throw;
      }

      cout << "started job " << handle.id() << endl;
      monitor_job( client, handle, interval );
    } else if ( command == "monitor" and args.size() == 1 ) {
      monitor_job( client, open_job( client, args[0] ), interval );
    } else if ( command == "status" and args.size() == 1 ) {
      cout << client.get_status( open_job( client, args[0] ) ) << endl;
    } else if ( command == "list" and args.empty() ) {
      for ( const auto& handle : client.list_jobs() ) {
        const auto snapshot = client.get_status( handle );
        cout << handle.id() << "  " << snapshot.state << "  " << snapshot.display_name
             << endl;
      }
    } else if ( command == "suspend" and args.size() == 1 ) {
      client.suspend( open_job( client, args[0] ) );
    } else if ( command == "resume" and args.size() == 1 ) {
      client.resume( open_job( client, args[0] ) );
    } else if ( ( command == "fg" or command == "bg" ) and args.size() == 1 ) {
      client.set_priority( open_job( client, args[0] ), *priority_from_string( command ) );
    } else if ( command == "priority" and args.size() == 2 ) {
      const auto priority = priority_from_string( args[1] );
      if ( not priority.has_value() ) {
        throw runtime_error( "unknown priority: " + args[1] );
      }

      client.set_priority( open_job( client, args[0] ), *priority );
    } else if ( command == "proxy" and args.size() == 2 ) {
      const auto usage = proxy_usage_from_string( args[1] );
      if ( not usage.has_value() ) {
        throw runtime_error( "unknown proxy usage: " + args[1] );
      }

      client.set_proxy_usage( open_job( client, args[0] ), *usage );
    } else if ( command == "complete" and args.size() == 1 ) {
      client.complete( open_job( client, args[0] ) );
    } else if ( command == "cancel" and not args.empty() ) {
      for ( const auto& id : args ) {
        client.cancel( open_job( client, id ) );
      }
    } else {
      usage( argv[0], EXIT_FAILURE );
    }
  } catch ( const exception& e ) {
    print_exception( argv[0], e );
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
