/* -*-mode:c++; tab-width: 2; indent-tabs-mode: nil; c-basic-offset: 2 -*- */

#include "job/types.hh"

#include "util/util.hh"
#include "util/uuid.hh"

using namespace std;

namespace xferd {

optional<JobId> JobId::parse( const string_view text )
{
  auto canonical = uuid::canonicalize( text );
  if ( not canonical.has_value() ) {
    return nullopt;
  }

  return JobId { move( *canonical ) };
}

ostream& operator<<( ostream& os, const JobId& id )
{
  return os << ( id.empty() ? "<no id>" : id.str() );
}

bool FileEntry::operator==( const FileEntry& other ) const
{
  return source == other.source and destination == other.destination
         and bytes_transferred == other.bytes_transferred
         and bytes_total == other.bytes_total;
}

bool ErrorInfo::operator==( const ErrorInfo& other ) const
{
  return code == other.code and context == other.context
         and message == other.message
         and context_message == other.context_message;
}

bool JobProgress::operator==( const JobProgress& other ) const
{
  return bytes_transferred == other.bytes_transferred
         and bytes_total == other.bytes_total
         and files_transferred == other.files_transferred
         and files_total == other.files_total;
}

bool JobTimes::operator==( const JobTimes& other ) const
{
  return creation == other.creation and modification == other.modification
         and transfer_completion == other.transfer_completion;
}

bool JobSnapshot::operator==( const JobSnapshot& other ) const
{
  return id == other.id and display_name == other.display_name
         and direction == other.direction and state == other.state
         and priority == other.priority and proxy_usage == other.proxy_usage
         and files == other.files
         and progress == other.progress and error_count == other.error_count
         and error == other.error and times == other.times;
}

bool Credential::well_formed() const
{
  if ( to_underlying( target ) > to_underlying( CredentialTarget::Proxy ) ) {
    return false;
  }

  if ( to_underlying( scheme ) > to_underlying( CredentialScheme::Passport ) ) {
    return false;
  }

  return not blob.empty();
}

bool is_terminal( const JobState state )
{
  return state == JobState::Acknowledged or state == JobState::Cancelled;
}

bool is_error_state( const JobState state )
{
  return state == JobState::Error or state == JobState::TransientError;
}

const char* to_string( const Direction d )
{
  switch ( d ) {
    case Direction::Download: return "download";
    case Direction::Upload: return "upload";
  }

  return "invalid";
}

const char* to_string( const JobState s )
{
  switch ( s ) {
    case JobState::Queued: return "Queued";
    case JobState::Connecting: return "Connecting";
    case JobState::Transferring: return "Transferring";
    case JobState::Suspended: return "Suspended";
    case JobState::Error: return "Error";
    case JobState::TransientError: return "TransientError";
    case JobState::Transferred: return "Transferred";
    case JobState::Acknowledged: return "Acknowledged";
    case JobState::Cancelled: return "Cancelled";
    case JobState::Unknown: return "Unknown";
  }

  return "invalid";
}

const char* to_string( const JobPriority p )
{
  switch ( p ) {
    case JobPriority::Foreground: return "foreground";
    case JobPriority::High: return "high";
    case JobPriority::Normal: return "normal";
    case JobPriority::Low: return "low";
  }

  return "invalid";
}

const char* to_string( const ProxyUsage u )
{
  switch ( u ) {
    case ProxyUsage::Preconfig: return "preconfig";
    case ProxyUsage::NoProxy: return "no-proxy";
    case ProxyUsage::AutoDetect: return "auto-detect";
  }

  return "invalid";
}

const char* to_string( const ErrorContext c )
{
  switch ( c ) {
    case ErrorContext::None: return "none";
    case ErrorContext::Unknown: return "unknown";
    case ErrorContext::GeneralQueueManager: return "general queue manager";
    case ErrorContext::QueueManagerNotification: return "queue manager notification";
    case ErrorContext::LocalFile: return "local file";
    case ErrorContext::RemoteFile: return "remote file";
    case ErrorContext::GeneralTransport: return "general transport";
    case ErrorContext::RemoteApplication: return "remote application";
  }

  return "invalid";
}

optional<Direction> direction_from_string( const string_view s )
{
  if ( s == "download" ) return Direction::Download;
  if ( s == "upload" ) return Direction::Upload;
  return nullopt;
}

optional<JobPriority> priority_from_string( const string_view s )
{
  if ( s == "foreground" or s == "fg" ) return JobPriority::Foreground;
  if ( s == "high" ) return JobPriority::High;
  if ( s == "normal" or s == "bg" ) return JobPriority::Normal;
  if ( s == "low" ) return JobPriority::Low;
  return nullopt;
}

optional<ProxyUsage> proxy_usage_from_string( const string_view s )
{
  if ( s == "preconfig" ) return ProxyUsage::Preconfig;
  if ( s == "no-proxy" ) return ProxyUsage::NoProxy;
  if ( s == "auto-detect" ) return ProxyUsage::AutoDetect;
  return nullopt;
}

ostream& operator<<( ostream& os, const JobState s )
{
  return os << to_string( s );
}

ostream& operator<<( ostream& os, const JobSnapshot& snapshot )
{
  os << snapshot.id << " \"" << snapshot.display_name << "\" "
     << to_string( snapshot.direction ) << " " << snapshot.state << " "
     << format_bytes( snapshot.progress.bytes_transferred );

  if ( snapshot.progress.bytes_total.has_value() ) {
    os << " of " << format_bytes( *snapshot.progress.bytes_total );
  }

  os << ", " << snapshot.progress.files_transferred << "/"
     << snapshot.progress.files_total << " "
     << pluralize( "file", snapshot.progress.files_total );

  if ( snapshot.error.has_value() ) {
    os << " [" << to_string( snapshot.error->context ) << ": "
       << snapshot.error->message << "]";
  }

  return os;
}

} // namespace xferd
