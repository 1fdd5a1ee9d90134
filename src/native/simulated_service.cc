/* -*-mode:c++; tab-width: 2; indent-tabs-mode: nil; c-basic-offset: 2 -*- */

#include "simulated_service.hh"

#include <glog/logging.h>

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <system_error>

#include "job/native.hh"
#include "messages/utils.hh"
#include "util/fileutils.hh"
#include "util/uuid.hh"

using namespace std;
using namespace std::chrono;

namespace xferd::native {

namespace {

const string FILE_SCHEME = "file://";

int64_t now_ms()
{
  return duration_cast<milliseconds>( system_clock::now().time_since_epoch() ).count();
}

bool is_url( const string& locator )
{
  const size_t pos = locator.find( "://" );
  return pos != string::npos and pos > 0 and pos + 3 < locator.length();
}

bool is_absolute_path( const string& path )
{
  return not path.empty() and path.front() == '/';
}

optional<filesystem::path> file_url_path( const string& locator )
{
  if ( locator.compare( 0, FILE_SCHEME.length(), FILE_SCHEME ) != 0 ) {
    return nullopt;
  }

  return filesystem::path { locator.substr( FILE_SCHEME.length() ) };
}

bool is_active( const uint32_t state )
{
  return state == JOB_STATE_CONNECTING or state == JOB_STATE_TRANSFERRING
         or state == JOB_STATE_TRANSIENT_ERROR;
}

}

SimulatedTransferService::SimulatedTransferService()
  : SimulatedTransferService( Options {} )
{}

SimulatedTransferService::SimulatedTransferService( const Options& options )
  : options_( options )
{
  if ( options_.bytes_per_step == 0 ) {
    throw runtime_error( "bytes_per_step must be positive" );
  }
}

Result SimulatedTransferService::with_store( const Mutation& fn )
{
  lock_guard<mutex> lock { mutex_ };

  if ( not available_ ) {
    return E_SERVICE_UNAVAILABLE;
  }

  const int64_t now = now_ms();

  if ( not options_.store_path.has_value() ) {
    for ( auto& job : jobs_ ) {
      catch_up( job, now );
    }

    return fn( jobs_ );
  }

  try {
    roost::FileLock file_lock { options_.store_path->string() + ".lock" };

    vector<Job> jobs;
    load( jobs );

    for ( auto& job : jobs ) {
      catch_up( job, now );
    }

    const Result result = fn( jobs );
    save( jobs );
    return result;
  } catch ( const exception& e ) {
    LOG( ERROR ) << "job store " << *options_.store_path << ": " << e.what();
    return E_SERVICE_UNAVAILABLE;
  }
}

void SimulatedTransferService::load( vector<Job>& jobs ) const
{
  jobs.clear();

  if ( not filesystem::exists( *options_.store_path ) ) {
    return;
  }

  protobuf::Store store;
  if ( not protoutil::from_string( roost::read_file( *options_.store_path ), store ) ) {
    throw runtime_error( "corrupt job store" );
  }

  for ( const auto& stored : store.jobs() ) {
    Job job;
    job.id = stored.id();
    job.last_step_time = stored.last_step_time();

    auto& status = job.status;
    status.display_name = stored.display_name();
    status.type = stored.type();
    status.state = stored.state();
    status.priority = stored.priority();
    status.proxy_usage = stored.proxy_usage();
    status.owner_uid = stored.owner_uid();
    status.error_count = stored.error_count();
    status.creation_time = stored.creation_time();
    status.modification_time = stored.modification_time();
    status.transfer_completion_time = stored.transfer_completion_time();

    for ( const auto& file : stored.files() ) {
      status.files.push_back( { file.remote_name(),
                                file.local_name(),
                                file.bytes_transferred(),
                                file.bytes_total(),
                                file.completed() } );
    }

    if ( stored.has_error() ) {
      status.error = ErrorStatus { stored.error().context(),
                                   stored.error().code(),
                                   stored.error().context_description() };
    }

    jobs.push_back( move( job ) );
  }
}

void SimulatedTransferService::save( const vector<Job>& jobs ) const
{
  protobuf::Store store;

  for ( const auto& job : jobs ) {
    auto& stored = *store.add_jobs();
    const auto& status = job.status;

    stored.set_id( job.id );
    stored.set_last_step_time( job.last_step_time );
    stored.set_display_name( status.display_name );
    stored.set_type( status.type );
    stored.set_state( status.state );
    stored.set_priority( status.priority );
    stored.set_proxy_usage( status.proxy_usage );
    stored.set_owner_uid( status.owner_uid );
    stored.set_error_count( status.error_count );
    stored.set_creation_time( status.creation_time );
    stored.set_modification_time( status.modification_time );
    stored.set_transfer_completion_time( status.transfer_completion_time );

    for ( const auto& file : status.files ) {
      auto& f = *stored.add_files();
      f.set_remote_name( file.remote_name );
      f.set_local_name( file.local_name );
      f.set_bytes_transferred( file.bytes_transferred );
      f.set_bytes_total( file.bytes_total );
      f.set_completed( file.completed );
    }

    if ( status.error.has_value() ) {
      auto& e = *stored.mutable_error();
      e.set_context( status.error->context );
      e.set_code( status.error->code );
      e.set_context_description( status.error->context_description );
    }
  }

  roost::atomic_create( protoutil::to_string( store ), *options_.store_path, true, 0666 );
}

Result SimulatedTransferService::find( vector<Job>& jobs,
                                       const Principal& principal,
                                       const string& job_id,
                                       Job*& job )
{
  auto it = find_if( jobs.begin(), jobs.end(), [&]( const Job& j ) { return j.id == job_id; } );

  if ( it == jobs.end() ) {
    return E_NOT_FOUND;
  }

  if ( not principal.privileged and it->status.owner_uid != principal.uid ) {
    return E_ACCESS_DENIED;
  }

  job = &*it;
  return OK;
}

void SimulatedTransferService::catch_up( Job& job, const int64_t now )
{
  const int64_t interval = options_.step_interval.count();
  if ( interval <= 0 ) {
    return;
  }

  while ( is_active( job.status.state ) and now - job.last_step_time >= interval ) {
    job.last_step_time += interval;
    step( job, job.last_step_time );
  }

  if ( not is_active( job.status.state ) ) {
    job.last_step_time = now;
  }
}

uint64_t SimulatedTransferService::measure_size( const string& locator ) const
{
  optional<filesystem::path> path = file_url_path( locator );
  if ( not path.has_value() and is_absolute_path( locator ) ) {
    path = filesystem::path { locator };
  }

  if ( not path.has_value() ) {
    return options_.default_file_size;
  }

  error_code ec;
  const auto size = filesystem::file_size( *path, ec );
  return ec ? SIZE_UNKNOWN : static_cast<uint64_t>( size );
}

void SimulatedTransferService::step( Job& job, const int64_t now )
{
  auto& status = job.status;
  const bool download = ( status.type == JOB_TYPE_DOWNLOAD );

  switch ( status.state ) {
    case JOB_STATE_CONNECTING:
      for ( auto& file : status.files ) {
        const string& source = download ? file.remote_name : file.local_name;
        file.bytes_total = measure_size( source );

        if ( file.bytes_total == SIZE_UNKNOWN ) {
          fail( job,
                true,
                E_FILE_NOT_AVAILABLE,
                download ? ERROR_CONTEXT_REMOTE_FILE : ERROR_CONTEXT_LOCAL_FILE,
                "cannot open " + source,
                now );
          return;
        }
      }

      status.state = state_to_native( *transition( JobState::Connecting, JobOperation::Connected ) );
      break;

    case JOB_STATE_TRANSFERRING: {
      uint64_t budget = options_.bytes_per_step;
      bool all_done = true;

      for ( auto& file : status.files ) {
        if ( not file.completed ) {
          const uint64_t chunk = min( budget, file.bytes_total - file.bytes_transferred );
          file.bytes_transferred += chunk;
          budget -= chunk;
          file.completed = ( file.bytes_transferred == file.bytes_total );
        }

        all_done = all_done and file.completed;
      }

      if ( all_done ) {
        status.state = state_to_native( *transition( JobState::Transferring, JobOperation::Finished ) );
        status.transfer_completion_time = now;
      }

      break;
    }

    case JOB_STATE_TRANSIENT_ERROR:
      status.state = state_to_native( *transition( JobState::TransientError, JobOperation::Retry ) );
      status.error.reset();
      break;

    default:
      return;
  }

  status.modification_time = now;
}

void SimulatedTransferService::fail( Job& job,
                                     const bool fatal,
                                     const Result code,
                                     const uint32_t context,
                                     const string& context_description,
                                     const int64_t now )
{
  const auto next = transition( state_from_native( job.status.state ),
                                fatal ? JobOperation::FatalFailure : JobOperation::TransientFailure );
  if ( not next.has_value() ) {
    return;
  }

  job.status.state = state_to_native( *next );
  job.status.error = ErrorStatus { context, code, context_description };
  job.status.error_count++;
  job.status.modification_time = now;

  VLOG( 1 ) << "job " << job.id << " failed (" << describe( code ) << ")";
}

Result SimulatedTransferService::materialize( const Job& job ) const
{
  const bool download = ( job.status.type == JOB_TYPE_DOWNLOAD );

  for ( const auto& file : job.status.files ) {
    const auto remote = file_url_path( file.remote_name );
    if ( not remote.has_value() ) {
      continue;
    }

    const filesystem::path from = download ? *remote : filesystem::path { file.local_name };
    const filesystem::path to = download ? filesystem::path { file.local_name } : *remote;

    error_code ec;
    filesystem::copy_file( from, to, filesystem::copy_options::overwrite_existing, ec );
    if ( ec ) {
      LOG( WARNING ) << "job " << job.id << ": cannot copy " << from << " to " << to
                     << ": " << ec.message();
      return E_FILE_NOT_AVAILABLE;
    }
  }

  return OK;
}

Result SimulatedTransferService::apply( const Principal& principal,
                                        const string& job_id,
                                        const JobOperation op )
{
  return with_store( [&]( vector<Job>& jobs ) {
    Job* job = nullptr;
    if ( const Result r = find( jobs, principal, job_id, job ); r != OK ) {
      return r;
    }

    const JobState from = state_from_native( job->status.state );

    if ( op == JobOperation::Start and from == JobState::Queued
         and job->status.files.empty() ) {
      return E_EMPTY;
    }

    const auto to = transition( from, op );
    if ( not to.has_value() ) {
      return E_INVALID_STATE;
    }

    if ( op == JobOperation::Complete ) {
      if ( const Result r = materialize( *job ); r != OK ) {
        return r;
      }
    }

    if ( is_terminal( *to ) ) {
      credentials_.erase( job->id );
      jobs.erase( jobs.begin() + ( job - jobs.data() ) );
      return OK;
    }

    const int64_t now = now_ms();
    job->status.state = state_to_native( *to );
    job->status.modification_time = now;
    job->last_step_time = now;

    return OK;
  } );
}

Result SimulatedTransferService::create_job( const Principal& principal,
                                             const string& display_name,
                                             const uint32_t type,
                                             string& job_id )
{
  if ( display_name.empty() or not direction_from_native( type ).has_value() ) {
    return E_INVALID_ARG;
  }

  return with_store( [&]( vector<Job>& jobs ) {
    const int64_t now = now_ms();

    Job job;
    job.id = uuid::generate();
    job.last_step_time = now;
    job.status.display_name = display_name;
    job.status.type = type;
    job.status.owner_uid = principal.uid;
    job.status.creation_time = now;
    job.status.modification_time = now;

    job_id = job.id;
    jobs.push_back( move( job ) );
    return OK;
  } );
}

Result SimulatedTransferService::add_files( const Principal& principal,
                                            const string& job_id,
                                            const vector<pair<string, string>>& files )
{
  return with_store( [&]( vector<Job>& jobs ) {
    Job* job = nullptr;
    if ( const Result r = find( jobs, principal, job_id, job ); r != OK ) {
      return r;
    }

    if ( not transition( state_from_native( job->status.state ), JobOperation::AddFile ) ) {
      return E_INVALID_STATE;
    }

    const bool download = ( job->status.type == JOB_TYPE_DOWNLOAD );

    for ( const auto& [remote, local] : files ) {
      if ( not is_url( remote ) or not is_absolute_path( local ) ) {
        return E_INVALID_ARG;
      }
    }

    for ( const auto& [remote, local] : files ) {
      FileStatus file;
      file.remote_name = remote;
      file.local_name = local;
      file.bytes_total = measure_size( download ? remote : local );
      job->status.files.push_back( move( file ) );
    }

    job->status.modification_time = now_ms();
    return OK;
  } );
}

Result SimulatedTransferService::start( const Principal& principal, const string& job_id )
{
  return apply( principal, job_id, JobOperation::Start );
}

Result SimulatedTransferService::suspend( const Principal& principal, const string& job_id )
{
  return apply( principal, job_id, JobOperation::Suspend );
}

Result SimulatedTransferService::resume( const Principal& principal, const string& job_id )
{
  return apply( principal, job_id, JobOperation::Resume );
}

Result SimulatedTransferService::cancel( const Principal& principal, const string& job_id )
{
  return apply( principal, job_id, JobOperation::Cancel );
}

Result SimulatedTransferService::complete( const Principal& principal, const string& job_id )
{
  return apply( principal, job_id, JobOperation::Complete );
}

Result SimulatedTransferService::get_status( const Principal& principal,
                                             const string& job_id,
                                             JobStatus& status )
{
  return with_store( [&]( vector<Job>& jobs ) {
    Job* job = nullptr;
    if ( const Result r = find( jobs, principal, job_id, job ); r != OK ) {
      return r;
    }

    if ( options_.advance_on_query ) {
      step( *job, now_ms() );
    }

    status = job->status;
    return OK;
  } );
}

Result SimulatedTransferService::set_credentials( const Principal& principal,
                                                  const string& job_id,
                                                  const uint32_t target,
                                                  const uint32_t scheme,
                                                  const string& blob )
{
  if ( ( target != AUTH_TARGET_SERVER and target != AUTH_TARGET_PROXY )
       or scheme < AUTH_SCHEME_BASIC or scheme > AUTH_SCHEME_PASSPORT or blob.empty() ) {
    return E_INVALID_ARG;
  }

  return with_store( [&]( vector<Job>& jobs ) {
    Job* job = nullptr;
    if ( const Result r = find( jobs, principal, job_id, job ); r != OK ) {
      return r;
    }

    if ( not transition( state_from_native( job->status.state ), JobOperation::SetCredentials ) ) {
      return E_INVALID_STATE;
    }

    auto& stored = credentials_[job_id];
    stored.erase( remove_if( stored.begin(),
                             stored.end(),
                             [&]( const StoredCredential& c ) { return c.target == target; } ),
                  stored.end() );
    stored.push_back( { target, scheme, blob } );
    return OK;
  } );
}

Result SimulatedTransferService::set_priority( const Principal& principal,
                                               const string& job_id,
                                               const uint32_t priority )
{
  if ( priority > PRIORITY_LOW ) {
    return E_INVALID_ARG;
  }

  return with_store( [&]( vector<Job>& jobs ) {
    Job* job = nullptr;
    if ( const Result r = find( jobs, principal, job_id, job ); r != OK ) {
      return r;
    }

    if ( not transition( state_from_native( job->status.state ), JobOperation::SetPriority ) ) {
      return E_INVALID_STATE;
    }

    job->status.priority = priority;
    job->status.modification_time = now_ms();
    return OK;
  } );
}

Result SimulatedTransferService::set_proxy_usage( const Principal& principal,
                                                  const string& job_id,
                                                  const uint32_t usage )
{
  if ( usage != PROXY_USAGE_PRECONFIG and usage != PROXY_USAGE_NO_PROXY
       and usage != PROXY_USAGE_AUTODETECT ) {
    return E_INVALID_ARG;
  }

  return with_store( [&]( vector<Job>& jobs ) {
    Job* job = nullptr;
    if ( const Result r = find( jobs, principal, job_id, job ); r != OK ) {
      return r;
    }

    if ( not transition( state_from_native( job->status.state ), JobOperation::SetProxyUsage ) ) {
      return E_INVALID_STATE;
    }

    job->status.proxy_usage = usage;
    job->status.modification_time = now_ms();
    return OK;
  } );
}

Result SimulatedTransferService::enum_jobs( const Principal& principal,
                                            vector<string>& job_ids )
{
  return with_store( [&]( vector<Job>& jobs ) {
    job_ids.clear();
    for ( const auto& job : jobs ) {
      if ( principal.privileged or job.status.owner_uid == principal.uid ) {
        job_ids.push_back( job.id );
      }
    }

    return OK;
  } );
}

string SimulatedTransferService::describe( const Result code ) const
{
  switch ( code ) {
    case OK: return "the operation completed successfully";
    case E_NOT_FOUND: return "the requested job was not found";
    case E_INVALID_STATE: return "the requested action is not allowed in the current job state";
    case E_EMPTY: return "there are no files attached to this job";
    case E_FILE_NOT_AVAILABLE: return "no file is available because no URL generated an error";
    case E_ERROR_INFO_UNAVAILABLE: return "error information is unavailable";
    case E_ACCESS_DENIED: return "access is denied";
    case E_INVALID_ARG: return "one or more arguments are invalid";
    case E_SERVICE_UNAVAILABLE: return "the transfer service is unavailable";
    case E_TRANSIENT_NETWORK: return "the operation timed out";
    case E_REMOTE_NOT_FOUND: return "the remote server reported that the file was not found";
  }

  ostringstream oss;
  oss << "unrecognized error 0x" << hex << setw( 8 ) << setfill( '0' )
      << static_cast<uint32_t>( code );
  return oss.str();
}

Result SimulatedTransferService::advance( const size_t steps )
{
  return with_store( [&]( vector<Job>& jobs ) {
    for ( size_t i = 0; i < steps; i++ ) {
      const int64_t now = now_ms();
      for ( auto& job : jobs ) {
        step( job, now );
      }
    }

    return OK;
  } );
}

Result SimulatedTransferService::inject_transient_failure( const string& job_id, const Result code )
{
  return with_store( [&]( vector<Job>& jobs ) {
    Job* job = nullptr;
    if ( const Result r = find( jobs, { 0, true }, job_id, job ); r != OK ) {
      return r;
    }

    if ( job->status.state != JOB_STATE_TRANSFERRING ) {
      return E_INVALID_STATE;
    }

    fail( *job, false, code, ERROR_CONTEXT_GENERAL_TRANSPORT, "transfer interrupted", now_ms() );
    return OK;
  } );
}

Result SimulatedTransferService::inject_fatal_failure( const string& job_id,
                                                       const Result code,
                                                       const uint32_t context )
{
  return with_store( [&]( vector<Job>& jobs ) {
    Job* job = nullptr;
    if ( const Result r = find( jobs, { 0, true }, job_id, job ); r != OK ) {
      return r;
    }

    if ( not transition( state_from_native( job->status.state ), JobOperation::FatalFailure ) ) {
      return E_INVALID_STATE;
    }

    fail( *job, true, code, context, "", now_ms() );
    return OK;
  } );
}

Result SimulatedTransferService::inject_raw_state( const string& job_id, const uint32_t state )
{
  return with_store( [&]( vector<Job>& jobs ) {
    Job* job = nullptr;
    if ( const Result r = find( jobs, { 0, true }, job_id, job ); r != OK ) {
      return r;
    }

    job->status.state = state;
    return OK;
  } );
}

void SimulatedTransferService::set_available( const bool available )
{
  lock_guard<mutex> lock { mutex_ };
  available_ = available;
}

size_t SimulatedTransferService::credential_count( const string& job_id )
{
  lock_guard<mutex> lock { mutex_ };
  const auto it = credentials_.find( job_id );
  return ( it == credentials_.end() ) ? 0 : it->second.size();
}

} // namespace xferd::native
