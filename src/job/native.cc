/* -*-mode:c++; tab-width: 2; indent-tabs-mode: nil; c-basic-offset: 2 -*- */

#include "job/native.hh"

#include <limits>

using namespace std;

namespace xferd {

JobState state_from_native( const uint32_t code )
{
  switch ( code ) {
    case native::JOB_STATE_QUEUED: return JobState::Queued;
    case native::JOB_STATE_CONNECTING: return JobState::Connecting;
    case native::JOB_STATE_TRANSFERRING: return JobState::Transferring;
    case native::JOB_STATE_SUSPENDED: return JobState::Suspended;
    case native::JOB_STATE_ERROR: return JobState::Error;
    case native::JOB_STATE_TRANSIENT_ERROR: return JobState::TransientError;
    case native::JOB_STATE_TRANSFERRED: return JobState::Transferred;
    case native::JOB_STATE_ACKNOWLEDGED: return JobState::Acknowledged;
    case native::JOB_STATE_CANCELLED: return JobState::Cancelled;
    default: return JobState::Unknown;
  }
}

uint32_t state_to_native( const JobState state )
{
  switch ( state ) {
    case JobState::Queued: return native::JOB_STATE_QUEUED;
    case JobState::Connecting: return native::JOB_STATE_CONNECTING;
    case JobState::Transferring: return native::JOB_STATE_TRANSFERRING;
    case JobState::Suspended: return native::JOB_STATE_SUSPENDED;
    case JobState::Error: return native::JOB_STATE_ERROR;
    case JobState::TransientError: return native::JOB_STATE_TRANSIENT_ERROR;
    case JobState::Transferred: return native::JOB_STATE_TRANSFERRED;
    case JobState::Acknowledged: return native::JOB_STATE_ACKNOWLEDGED;
    case JobState::Cancelled: return native::JOB_STATE_CANCELLED;
    case JobState::Unknown: break;
  }

  return numeric_limits<uint32_t>::max();
}

ErrorContext context_from_native( const uint32_t code )
{
  switch ( code ) {
    case native::ERROR_CONTEXT_NONE: return ErrorContext::None;
    case native::ERROR_CONTEXT_UNKNOWN: return ErrorContext::Unknown;
    case native::ERROR_CONTEXT_GENERAL_QUEUE_MANAGER: return ErrorContext::GeneralQueueManager;
    case native::ERROR_CONTEXT_QUEUE_MANAGER_NOTIFICATION: return ErrorContext::QueueManagerNotification;
    case native::ERROR_CONTEXT_LOCAL_FILE: return ErrorContext::LocalFile;
    case native::ERROR_CONTEXT_REMOTE_FILE: return ErrorContext::RemoteFile;
    case native::ERROR_CONTEXT_GENERAL_TRANSPORT: return ErrorContext::GeneralTransport;
    case native::ERROR_CONTEXT_REMOTE_APPLICATION: return ErrorContext::RemoteApplication;
    default: return ErrorContext::Unknown;
  }
}

ErrorKind kind_from_native( const native::Result code )
{
  switch ( code ) {
    case native::E_NOT_FOUND: return ErrorKind::NotFound;
    case native::E_INVALID_STATE:
    case native::E_EMPTY: return ErrorKind::InvalidState;
    case native::E_INVALID_ARG: return ErrorKind::InvalidArgument;
    case native::E_ACCESS_DENIED: return ErrorKind::PermissionDenied;
    case native::E_SERVICE_UNAVAILABLE: return ErrorKind::ServiceUnavailable;
    default: return ErrorKind::Unknown;
  }
}

optional<Direction> direction_from_native( const uint32_t type )
{
  switch ( type ) {
    case native::JOB_TYPE_DOWNLOAD: return Direction::Download;
    case native::JOB_TYPE_UPLOAD: return Direction::Upload;
    default: return nullopt;
  }
}

uint32_t direction_to_native( const Direction direction )
{
  return ( direction == Direction::Upload ) ? native::JOB_TYPE_UPLOAD
                                            : native::JOB_TYPE_DOWNLOAD;
}

JobPriority priority_from_native( const uint32_t priority )
{
  switch ( priority ) {
    case native::PRIORITY_FOREGROUND: return JobPriority::Foreground;
    case native::PRIORITY_HIGH: return JobPriority::High;
    case native::PRIORITY_LOW: return JobPriority::Low;
    default: return JobPriority::Normal;
  }
}

uint32_t priority_to_native( const JobPriority priority )
{
  switch ( priority ) {
    case JobPriority::Foreground: return native::PRIORITY_FOREGROUND;
    case JobPriority::High: return native::PRIORITY_HIGH;
    case JobPriority::Normal: return native::PRIORITY_NORMAL;
    case JobPriority::Low: return native::PRIORITY_LOW;
  }

  return native::PRIORITY_NORMAL;
}

ProxyUsage proxy_usage_from_native( const uint32_t usage )
{
  switch ( usage ) {
    case native::PROXY_USAGE_NO_PROXY: return ProxyUsage::NoProxy;
    case native::PROXY_USAGE_AUTODETECT: return ProxyUsage::AutoDetect;
    default: return ProxyUsage::Preconfig;
  }
}

uint32_t proxy_usage_to_native( const ProxyUsage usage )
{
  switch ( usage ) {
    case ProxyUsage::Preconfig: return native::PROXY_USAGE_PRECONFIG;
    case ProxyUsage::NoProxy: return native::PROXY_USAGE_NO_PROXY;
    case ProxyUsage::AutoDetect: return native::PROXY_USAGE_AUTODETECT;
  }

  return native::PROXY_USAGE_PRECONFIG;
}

uint32_t target_to_native( const CredentialTarget target )
{
  return ( target == CredentialTarget::Proxy ) ? native::AUTH_TARGET_PROXY
                                               : native::AUTH_TARGET_SERVER;
}

uint32_t scheme_to_native( const CredentialScheme scheme )
{
  switch ( scheme ) {
    case CredentialScheme::Basic: return native::AUTH_SCHEME_BASIC;
    case CredentialScheme::Digest: return native::AUTH_SCHEME_DIGEST;
    case CredentialScheme::Ntlm: return native::AUTH_SCHEME_NTLM;
    case CredentialScheme::Negotiate: return native::AUTH_SCHEME_NEGOTIATE;
    case CredentialScheme::Passport: return native::AUTH_SCHEME_PASSPORT;
  }

  return 0;
}

namespace {

JobTimes::time_point from_epoch_ms( const int64_t ms )
{
  return JobTimes::time_point { chrono::duration_cast<JobTimes::time_point::duration>(
    chrono::milliseconds { ms } ) };
}

}

JobSnapshot snapshot_from_native( const string_view native_id,
                                  const native::JobStatus& status,
                                  const DescribeFunction& describe )
{
  JobSnapshot snapshot;

  const auto id = JobId::parse( native_id );
  const auto direction = direction_from_native( status.type );

  snapshot.id = id.value_or( JobId {} );
  snapshot.display_name = status.display_name;
  snapshot.direction = direction.value_or( Direction::Download );
  snapshot.state = ( id.has_value() and direction.has_value() )
                     ? state_from_native( status.state )
                     : JobState::Unknown;
  snapshot.priority = priority_from_native( status.priority );
  snapshot.proxy_usage = proxy_usage_from_native( status.proxy_usage );
  snapshot.error_count = status.error_count;

  bool total_known = true;
  for ( const auto& file : status.files ) {
    FileEntry entry;

    if ( snapshot.direction == Direction::Download ) {
      entry.source = file.remote_name;
      entry.destination = file.local_name;
    } else {
      entry.source = file.local_name;
      entry.destination = file.remote_name;
    }

    entry.bytes_transferred = file.bytes_transferred;
    if ( file.bytes_total != native::SIZE_UNKNOWN ) {
      entry.bytes_total = file.bytes_total;
    } else {
      total_known = false;
    }

    snapshot.progress.bytes_transferred += file.bytes_transferred;
    snapshot.progress.files_total++;
    if ( file.completed ) {
      snapshot.progress.files_transferred++;
    }

    snapshot.files.push_back( move( entry ) );
  }

  if ( total_known ) {
    uint64_t total = 0;
    for ( const auto& entry : snapshot.files ) {
      total += *entry.bytes_total;
    }
    snapshot.progress.bytes_total = total;
  }

  if ( is_error_state( snapshot.state ) ) {
    ErrorInfo info;

    if ( status.error.has_value() ) {
      info.code = status.error->code;
      info.context = context_from_native( status.error->context );
      info.message = describe( status.error->code );
      info.context_message = status.error->context_description;
    } else {
      info.code = native::E_ERROR_INFO_UNAVAILABLE;
      info.context = ErrorContext::Unknown;
      info.message = "error information unavailable";
    }

    snapshot.error = move( info );
  }

  snapshot.times.creation = from_epoch_ms( status.creation_time );
  snapshot.times.modification = from_epoch_ms( status.modification_time );
  if ( status.transfer_completion_time != 0 ) {
    snapshot.times.transfer_completion = from_epoch_ms( status.transfer_completion_time );
  }

  return snapshot;
}

} // namespace xferd
