/* -*-mode:c++; tab-width: 2; indent-tabs-mode: nil; c-basic-offset: 2 -*- */

#include "server.hh"

#include <glog/logging.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <unistd.h>

#include <filesystem>

#include "util/exception.hh"

using namespace std;
using namespace std::chrono;

using OpCode = xferd::Message::OpCode;

namespace xferd {

AgentServer::AgentServer( const AgentConfiguration& config,
                          shared_ptr<native::TransferService> service )
  : config_( config )
  , service_( move( service ) )
{
  if ( not service_ ) {
    throw runtime_error( "AgentServer: no transfer service" );
  }

  if ( config_.socket_path.empty() ) {
    throw runtime_error( "AgentServer: no socket path" );
  }

  if ( filesystem::exists( config_.socket_path ) ) {
    try {
      IPCSocket existing;
      existing.connect( config_.socket_path );
      throw runtime_error( "another agent is already listening on " + config_.socket_path );
    } catch ( const unix_error& ) {
      LOG( INFO ) << "removing stale socket " << config_.socket_path;
      filesystem::remove( config_.socket_path );
    }
  }

  listener_.bind( config_.socket_path );

  /* callers are authorized by their peer credentials, not by file mode */
  CheckSystemCall( "chmod", chmod( config_.socket_path.c_str(), 0666 ) );

  listener_.listen();
  running_ = true;
}

AgentServer::~AgentServer()
{
  stop();

  try {
    shutdown_connections();
  } catch ( const exception& e ) {
    LOG( ERROR ) << "shutting down connections: " << e.what();
  }

  if ( unlink( config_.socket_path.c_str() ) < 0 and errno != ENOENT ) {
    PLOG( WARNING ) << "unlink " << config_.socket_path;
  }
}

bool AgentServer::authorized( const PeerCredentials& peer ) const
{
  if ( config_.allowed_uids.empty() ) {
    return peer.uid == geteuid();
  }

  return config_.allowed_uids.count( peer.uid ) > 0;
}

native::Principal AgentServer::caller_principal( const PeerCredentials& peer )
{
  return { static_cast<uint32_t>( peer.uid ), peer.uid == 0 };
}

void AgentServer::run()
{
  LOG( INFO ) << "agent listening on " << config_.socket_path;

  auto last_activity = steady_clock::now();

  while ( running_ ) {
    pollfd pfd { listener_.fd_num(), POLLIN, 0 };
    const int ready = ::poll( &pfd, 1, static_cast<int>( config_.poll_interval.count() ) );

    if ( ready < 0 ) {
      if ( errno == EINTR ) {
        continue;
      }

      throw unix_error( "poll" );
    }

    if ( ready > 0 and ( pfd.revents & POLLIN ) ) {
      accept_connection();
    }

    const auto now = steady_clock::now();

    if ( reap_connections() > 0 or ready > 0 ) {
      last_activity = now;
    } else if ( config_.idle_timeout > 0ms and now - last_activity >= config_.idle_timeout ) {
      LOG( INFO ) << "no connections for " << config_.idle_timeout.count() << " ms, exiting";
      break;
    }
  }

  running_ = false;
  shutdown_connections();

  LOG( INFO ) << "agent stopped";
}

void AgentServer::accept_connection()
{
  IPCSocket socket = listener_.accept();

  lock_guard<mutex> lock { connections_mutex_ };

  Connection& connection = connections_.emplace_back( next_connection_id_++, move( socket ) );
  connection.worker = thread( [this, &connection] {
    serve( connection );
    connection.done = true;
  } );
}

size_t AgentServer::reap_connections()
{
  lock_guard<mutex> lock { connections_mutex_ };

  for ( auto it = connections_.begin(); it != connections_.end(); ) {
    if ( it->done ) {
      it->worker.join();
      it = connections_.erase( it );
    } else {
      it++;
    }
  }

  return connections_.size();
}

void AgentServer::shutdown_connections()
{
  lock_guard<mutex> lock { connections_mutex_ };

  for ( auto& connection : connections_ ) {
    if ( connection.done ) {
      continue;
    }

    try {
      connection.socket.shutdown( SHUT_RDWR );
    } catch ( const unix_error& e ) {
      VLOG( 1 ) << "connection " << connection.id << ": " << e.what();
    }
  }

  for ( auto& connection : connections_ ) {
    if ( connection.worker.joinable() ) {
      connection.worker.join();
    }
  }

  connections_.clear();
}

void AgentServer::serve( Connection& connection )
{
  Channel channel { IPCSocket { connection.socket.duplicate() } };

  try {
    const PeerCredentials peer = channel.socket().peer_credentials();
    const native::Principal caller = caller_principal( peer );

    const auto hello = channel.receive();
    if ( not hello.has_value() ) {
      return;
    }

    const uint32_t version = decode_hello( *hello );

    if ( not authorized( peer ) ) {
      LOG( WARNING ) << "refusing connection from uid " << peer.uid << " (pid " << peer.pid << ")";

      Response refusal;
      refusal.error = RemoteError { ErrorKind::PermissionDenied,
                                    "uid " + std::to_string( peer.uid )
                                      + " is not allowed to use this agent",
                                    "handshake" };
      channel.send( encode( refusal ) );
      return;
    }

    if ( version != PROTOCOL_VERSION ) {
      LOG( WARNING ) << "connection " << connection.id << ": client speaks protocol version "
                     << version;

      Response refusal;
      refusal.error = RemoteError { ErrorKind::ProtocolError,
                                    "unsupported protocol version " + std::to_string( version ),
                                    "handshake" };
      channel.send( encode( refusal ) );
      return;
    }

    channel.send( encode_hello() );

    LOG( INFO ) << "connection " << connection.id << " from uid " << peer.uid << " (pid "
                << peer.pid << ")";

    while ( running_ ) {
      const auto message = channel.receive();
      if ( not message.has_value() or message->opcode() == OpCode::Bye ) {
        break;
      }

      Request request;
      try {
        request = decode_request( *message );
      } catch ( const JobError& e ) {
        LOG( WARNING ) << "connection " << connection.id << ": " << e.what();

        Response error;
        error.correlation_id = message->correlation_id();
        error.error = RemoteError::from_exception( e );
        channel.send( encode( error ) );
        break;
      }

      const Response response = dispatch( caller, request );

      try {
        channel.send( encode( response ) );
      } catch ( const JobError& e ) {
        if ( e.kind() != ErrorKind::ProtocolError ) {
          throw;
        }

        /* the response itself could not be framed */
        Response error;
        error.correlation_id = response.correlation_id;
        error.error = RemoteError::from_exception( e );
        channel.send( encode( error ) );
      }
    }
  } catch ( const JobError& e ) {
    if ( e.kind() == ErrorKind::ProtocolError ) {
      LOG( WARNING ) << "connection " << connection.id << ": " << e.what();

      try {
        Response error;
        error.error = RemoteError::from_exception( e );
        channel.send( encode( error ) );
      } catch ( const JobError& send_error ) {
        VLOG( 1 ) << "connection " << connection.id << ": " << send_error.what();
      }
    } else {
      VLOG( 1 ) << "connection " << connection.id << ": " << e.what();
    }
  } catch ( const exception& e ) {
    LOG( ERROR ) << "connection " << connection.id << ": " << e.what();
  }

  VLOG( 1 ) << "connection " << connection.id << " closed";
}

Response AgentServer::dispatch( const native::Principal& caller, const Request& request )
{
  LocalBackend backend { service_, caller };

  Response response;
  response.correlation_id = request.correlation_id;

  const string operation { to_string( request.operation ) };

  VLOG( 2 ) << "<- " << operation << " #" << request.correlation_id << " uid " << caller.uid;

  const auto job_id = [&]() {
    const auto id = JobId::parse( request.job_id );
    if ( not id.has_value() ) {
      throw JobError( ErrorKind::InvalidArgument,
                      operation,
                      "malformed job id \"" + request.job_id + "\"" );
    }

    return *id;
  };

  const auto job = [&]() { return backend.attach( job_id() ); };

  try {
    switch ( request.operation ) {
      case Operation::CreateJob:
        response.job_id = backend.create_job( request.display_name, request.direction ).id();
        break;

      case Operation::AddFiles: backend.add_files( job(), request.files ); break;
      case Operation::Start: backend.start( job() ); break;
      case Operation::Suspend: backend.suspend( job() ); break;
      case Operation::Resume: backend.resume( job() ); break;
      case Operation::Cancel: backend.cancel( job() ); break;
      case Operation::Complete: backend.complete( job() ); break;
      case Operation::GetStatus: response.snapshot = backend.get_status( job() ); break;

      case Operation::SetCredentials:
        if ( not request.credential.has_value() ) {
          throw JobError( ErrorKind::InvalidArgument, operation, "no credential given" );
        }

        backend.set_credentials( job(), *request.credential );
        break;

      case Operation::SetPriority: backend.set_priority( job(), request.priority ); break;

      case Operation::SetProxyUsage:
        backend.set_proxy_usage( job(), request.proxy_usage );
        break;

      case Operation::OpenJob:
        response.job_id = backend.open_job( job_id() ).id();
        break;

      case Operation::ListJobs:
        for ( const auto& handle : backend.list_jobs() ) {
          response.job_ids.push_back( handle.id() );
        }
        break;
    }
  } catch ( const JobError& e ) {
    VLOG( 1 ) << e.what();
    response.error = RemoteError::from_exception( e );
  } catch ( const exception& e ) {
    LOG( ERROR ) << operation << ": " << e.what();
    response.error = RemoteError { ErrorKind::Unknown, e.what(), operation };
  }

  return response;
}

} // namespace xferd
