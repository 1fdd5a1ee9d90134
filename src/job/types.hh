/* -*-mode:c++; tab-width: 2; indent-tabs-mode: nil; c-basic-offset: 2 -*- */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace xferd {

/* Identifier assigned by the native service at creation; never reused.
   Always holds the canonical (lowercase) text form of a UUID, or nothing. */
class JobId
{
private:
  std::string str_ {};

  explicit JobId( std::string&& canonical )
    : str_( std::move( canonical ) )
  {}

public:
  JobId() = default;

  static std::optional<JobId> parse( const std::string_view text );

  const std::string& str() const { return str_; }
  bool empty() const { return str_.empty(); }

  bool operator==( const JobId& other ) const { return str_ == other.str_; }
  bool operator!=( const JobId& other ) const { return str_ != other.str_; }
  bool operator<( const JobId& other ) const { return str_ < other.str_; }
};

std::ostream& operator<<( std::ostream& os, const JobId& id );

enum class Direction : uint8_t
{
  Download,
  Upload,
};

enum class JobState : uint8_t
{
  Queued,
  Connecting,
  Transferring,
  Suspended,
  Error,
  TransientError,
  Transferred,
  Acknowledged,
  Cancelled,
  Unknown,
};

enum class JobPriority : uint8_t
{
  Foreground,
  High,
  Normal,
  Low,
};

/* how transfers of a job reach the network */
enum class ProxyUsage : uint8_t
{
  Preconfig,
  NoProxy,
  AutoDetect,
};

enum class ErrorContext : uint8_t
{
  None,
  Unknown,
  GeneralQueueManager,
  QueueManagerNotification,
  LocalFile,
  RemoteFile,
  GeneralTransport,
  RemoteApplication,
};

struct FileSpec
{
  std::string source {};
  std::string destination {};

  bool operator==( const FileSpec& other ) const
  {
    return source == other.source and destination == other.destination;
  }
};

struct FileEntry
{
  std::string source {};
  std::string destination {};
  uint64_t bytes_transferred { 0 };
  std::optional<uint64_t> bytes_total {};

  bool operator==( const FileEntry& other ) const;
};

struct ErrorInfo
{
  int32_t code { 0 };
  ErrorContext context { ErrorContext::None };
  std::string message {};
  std::string context_message {};

  bool operator==( const ErrorInfo& other ) const;
};

struct JobProgress
{
  uint64_t bytes_transferred { 0 };
  std::optional<uint64_t> bytes_total {};
  uint32_t files_transferred { 0 };
  uint32_t files_total { 0 };

  bool operator==( const JobProgress& other ) const;
};

struct JobTimes
{
  using time_point = std::chrono::system_clock::time_point;

  time_point creation {};
  time_point modification {};
  std::optional<time_point> transfer_completion {};

  bool operator==( const JobTimes& other ) const;
};

/* Point-in-time view of a job. Byte counts are refreshed only by an explicit
   status query. `error` is present iff `state` is an error state. */
struct JobSnapshot
{
  JobId id {};
  std::string display_name {};
  Direction direction { Direction::Download };
  JobState state { JobState::Unknown };
  JobPriority priority { JobPriority::Normal };
  ProxyUsage proxy_usage { ProxyUsage::Preconfig };
  std::vector<FileEntry> files {};
  JobProgress progress {};
  uint32_t error_count { 0 };
  std::optional<ErrorInfo> error {};
  JobTimes times {};

  bool operator==( const JobSnapshot& other ) const;
  bool operator!=( const JobSnapshot& other ) const { return not( *this == other ); }
};

enum class CredentialTarget : uint8_t
{
  Server,
  Proxy,
};

enum class CredentialScheme : uint8_t
{
  Basic,
  Digest,
  Ntlm,
  Negotiate,
  Passport,
};

/* Opaque authentication material for the transfers themselves. Deliberately
   has no stream operator: it must never reach a log. */
struct Credential
{
  CredentialTarget target { CredentialTarget::Server };
  CredentialScheme scheme { CredentialScheme::Basic };
  std::string blob {};

  bool well_formed() const;

  bool operator==( const Credential& other ) const
  {
    return target == other.target and scheme == other.scheme
           and blob == other.blob;
  }
};

bool is_terminal( const JobState state );
bool is_error_state( const JobState state );

const char* to_string( const Direction d );
const char* to_string( const JobState s );
const char* to_string( const JobPriority p );
const char* to_string( const ProxyUsage u );
const char* to_string( const ErrorContext c );

/* inverses of to_string(); nothing for unknown names */
std::optional<Direction> direction_from_string( const std::string_view s );
std::optional<JobPriority> priority_from_string( const std::string_view s );
std::optional<ProxyUsage> proxy_usage_from_string( const std::string_view s );

std::ostream& operator<<( std::ostream& os, const JobState s );
std::ostream& operator<<( std::ostream& os, const JobSnapshot& snapshot );

} // namespace xferd
