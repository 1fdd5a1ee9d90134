/* -*-mode:c++; tab-width: 2; indent-tabs-mode: nil; c-basic-offset: 2 -*- */

#include "remote.hh"

#include <glog/logging.h>

#include <thread>

#include "util/exception.hh"

using namespace std;
using namespace std::chrono;

using OpCode = xferd::Message::OpCode;

namespace xferd {

RemoteBackend::RemoteBackend( const RemoteOptions& options,
                              shared_ptr<AgentLauncher> launcher )
  : options_( options )
  , launcher_( move( launcher ) )
{
  if ( options_.socket_path.empty() ) {
    throw runtime_error( "RemoteBackend: no agent socket path" );
  }
}

RemoteBackend::~RemoteBackend()
{
  if ( not channel_ ) {
    return;
  }

  try {
    channel_->send( { 0, OpCode::Bye, {} } );
  } catch ( const JobError& e ) {
    VLOG( 1 ) << "could not say goodbye to the agent: " << e.what();
  }
}

bool RemoteBackend::connected()
{
  lock_guard<mutex> lock { mutex_ };
  return channel_ != nullptr;
}

unique_ptr<Channel> RemoteBackend::open_channel()
{
  IPCSocket socket;
  socket.connect( options_.socket_path );

  if ( options_.request_timeout > 0ms ) {
    socket.set_read_timeout( options_.request_timeout );
    socket.set_write_timeout( options_.request_timeout );
  }

  auto channel = make_unique<Channel>( move( socket ) );
  channel->send( encode_hello() );

  const auto reply = channel->receive();
  if ( not reply.has_value() ) {
    throw JobError( ErrorKind::TransportError, "handshake", "agent closed the connection" );
  }

  if ( reply->opcode() == OpCode::Response ) {
    const Response refusal = decode_response( *reply );
    if ( refusal.error.has_value() ) {
      throw refusal.error->to_exception();
    }

    throw JobError( ErrorKind::ProtocolError, "handshake", "agent answered hello with a response" );
  }

  const uint32_t version = decode_hello( *reply );
  if ( version != PROTOCOL_VERSION ) {
    throw JobError( ErrorKind::ProtocolError,
                    "handshake",
                    "agent speaks protocol version " + std::to_string( version )
                      + ", expected " + std::to_string( PROTOCOL_VERSION ) );
  }

  return channel;
}

void RemoteBackend::bootstrap( const string_view operation )
{
  Backoff backoff { options_.bootstrap };
  bool triggered = false;
  string last_error;

  while ( true ) {
    try {
      channel_ = open_channel();

      if ( backoff.failures() > 0 ) {
        LOG( INFO ) << "connected to agent at " << options_.socket_path << " after "
                    << backoff.elapsed().count() << " ms";
      }

      return;
    } catch ( const unix_error& e ) {
      last_error = e.what();
    } catch ( const JobError& e ) {
      if ( e.kind() != ErrorKind::TransportError ) {
        throw;
      }

      last_error = e.what();
    }

    if ( not triggered and launcher_ ) {
      triggered = true;

      try {
        launcher_->request_start();
      } catch ( const exception& e ) {
        LOG( WARNING ) << "could not request agent start: " << e.what();
      }
    }

    const auto delay = backoff.next_delay();
    if ( not delay.has_value() ) {
      LOG( ERROR ) << "giving up on agent at " << options_.socket_path << ": " << last_error;

      throw JobError( ErrorKind::AgentUnreachable,
                      operation,
                      "no agent reachable at " + options_.socket_path + " after "
                        + std::to_string( backoff.failures() ) + " attempts in "
                        + std::to_string( backoff.elapsed().count() ) + " ms (" + last_error
                        + ")" );
    }

    VLOG( 1 ) << "agent not reachable (" << last_error << "), retrying in " << delay->count()
              << " ms";

    this_thread::sleep_for( *delay );
  }
}

Response RemoteBackend::round_trip( const Message& request,
                                    const uint64_t correlation_id,
                                    bool& sent )
{
  sent = false;
  channel_->send( request );
  sent = true;

  const auto reply = channel_->receive();
  if ( not reply.has_value() ) {
    throw JobError( ErrorKind::TransportError, "receive", "agent closed the connection" );
  }

  if ( reply->opcode() != OpCode::Response ) {
    throw JobError( ErrorKind::ProtocolError,
                    "receive",
                    string( "expected Response frame, got " ) + to_string( reply->opcode() ) );
  }

  Response response = decode_response( *reply );
  if ( response.correlation_id != correlation_id ) {
    throw JobError( ErrorKind::ProtocolError,
                    "receive",
                    "response " + std::to_string( response.correlation_id )
                      + " does not answer request " + std::to_string( correlation_id ) );
  }

  return response;
}

Response RemoteBackend::call( Request&& request )
{
  lock_guard<mutex> lock { mutex_ };

  const string operation { to_string( request.operation ) };
  request.correlation_id = next_correlation_id_++;
  const Message message = encode( request );

  if ( not channel_ ) {
    bootstrap( operation );
  }

  VLOG( 2 ) << "-> " << operation << " #" << request.correlation_id;

  Response response;
  bool sent = false;

  try {
    response = round_trip( message, request.correlation_id, sent );
  } catch ( const JobError& e ) {
    const bool timed_out = channel_->timed_out();
    channel_.reset();

    if ( e.kind() != ErrorKind::TransportError ) {
      throw;
    }

    if ( timed_out ) {
      throw JobError( ErrorKind::TransportError,
                      operation,
                      "no answer from the agent within "
                        + std::to_string( options_.request_timeout.count() ) + " ms" );
    }

    LOG( WARNING ) << "lost agent connection during " << operation << " (" << e.what()
                   << "), reconnecting";

    try {
      channel_ = open_channel();
    } catch ( const unix_error& reconnect_error ) {
      throw JobError( ErrorKind::TransportError,
                      operation,
                      string( "agent connection lost and reconnection failed: " )
                        + reconnect_error.what() );
    } catch ( const JobError& reconnect_error ) {
      if ( reconnect_error.kind() != ErrorKind::TransportError ) {
        throw;
      }

      throw JobError( ErrorKind::TransportError,
                      operation,
                      string( "agent connection lost and reconnection failed: " )
                        + reconnect_error.what() );
    }

    if ( sent and not is_read_only( request.operation ) ) {
      throw JobError( ErrorKind::TransportError,
                      operation,
                      "agent connection lost after the request was sent; its outcome is unknown" );
    }

    try {
      response = round_trip( message, request.correlation_id, sent );
    } catch ( const JobError& ) {
      channel_.reset();
      throw;
    }
  }

  if ( response.error.has_value() ) {
    throw response.error->to_exception();
  }

  return response;
}

Request RemoteBackend::make_request( const Operation operation, const JobHandle& handle ) const
{
  Request request;
  request.operation = operation;
  request.job_id = check_handle( handle, to_string( operation ) ).str();
  return request;
}

JobHandle RemoteBackend::create_job( const string& display_name, const Direction direction )
{
  Request request;
  request.operation = Operation::CreateJob;
  request.display_name = display_name;
  request.direction = direction;

  const Response response = call( move( request ) );
  if ( not response.job_id.has_value() or response.job_id->empty() ) {
    throw JobError( ErrorKind::ProtocolError, "create_job", "agent response carries no job id" );
  }

  return make_handle( *response.job_id );
}

void RemoteBackend::add_files( const JobHandle& handle, const vector<FileSpec>& files )
{
  Request request = make_request( Operation::AddFiles, handle );
  request.files = files;
  call( move( request ) );
}

void RemoteBackend::start( const JobHandle& handle )
{
  call( make_request( Operation::Start, handle ) );
}

void RemoteBackend::suspend( const JobHandle& handle )
{
  call( make_request( Operation::Suspend, handle ) );
}

void RemoteBackend::resume( const JobHandle& handle )
{
  call( make_request( Operation::Resume, handle ) );
}

void RemoteBackend::cancel( const JobHandle& handle )
{
  call( make_request( Operation::Cancel, handle ) );
}

void RemoteBackend::complete( const JobHandle& handle )
{
  call( make_request( Operation::Complete, handle ) );
}

JobSnapshot RemoteBackend::get_status( const JobHandle& handle )
{
  const Response response = call( make_request( Operation::GetStatus, handle ) );
  if ( not response.snapshot.has_value() ) {
    throw JobError( ErrorKind::ProtocolError, "get_status", "agent response carries no snapshot", handle.id() );
  }

  return *response.snapshot;
}

void RemoteBackend::set_credentials( const JobHandle& handle, const Credential& credential )
{
  Request request = make_request( Operation::SetCredentials, handle );

  if ( not credential.well_formed() ) {
    throw JobError( ErrorKind::InvalidArgument, "set_credentials", "malformed credential", handle.id() );
  }

  request.credential = credential;
  call( move( request ) );
}

void RemoteBackend::set_priority( const JobHandle& handle, const JobPriority priority )
{
  Request request = make_request( Operation::SetPriority, handle );
  request.priority = priority;
  call( move( request ) );
}

void RemoteBackend::set_proxy_usage( const JobHandle& handle, const ProxyUsage usage )
{
  Request request = make_request( Operation::SetProxyUsage, handle );
  request.proxy_usage = usage;
  call( move( request ) );
}

JobHandle RemoteBackend::open_job( const JobId& id )
{
  if ( id.empty() ) {
    throw JobError( ErrorKind::InvalidArgument, "open_job", "empty job id" );
  }

  Request request;
  request.operation = Operation::OpenJob;
  request.job_id = id.str();
  call( move( request ) );

  return make_handle( id );
}

vector<JobHandle> RemoteBackend::list_jobs()
{
  Request request;
  request.operation = Operation::ListJobs;

  vector<JobHandle> handles;
  for ( const auto& id : call( move( request ) ).job_ids ) {
    handles.push_back( make_handle( id ) );
  }

  return handles;
}

} // namespace xferd
