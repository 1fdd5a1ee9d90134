/* -*-mode:c++; tab-width: 2; indent-tabs-mode: nil; c-basic-offset: 2 -*- */

#pragma once

#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <utility>
#include <vector>

/* The host's native transfer service, seen only through its documented
   operations. Every call returns a native result code (0 on success) and
   identifies the acting principal; job ids are opaque text. */

namespace xferd::native {

using Result = int32_t;

constexpr Result OK = 0;
constexpr Result E_NOT_FOUND = static_cast<Result>( 0x80200001 );
constexpr Result E_INVALID_STATE = static_cast<Result>( 0x80200002 );
constexpr Result E_EMPTY = static_cast<Result>( 0x80200003 );
constexpr Result E_FILE_NOT_AVAILABLE = static_cast<Result>( 0x80200004 );
constexpr Result E_ERROR_INFO_UNAVAILABLE = static_cast<Result>( 0x8020000F );
constexpr Result E_ACCESS_DENIED = static_cast<Result>( 0x80070005 );
constexpr Result E_INVALID_ARG = static_cast<Result>( 0x80070057 );
constexpr Result E_SERVICE_UNAVAILABLE = static_cast<Result>( 0x800706BA );
constexpr Result E_TRANSIENT_NETWORK = static_cast<Result>( 0x80072EE2 );
constexpr Result E_REMOTE_NOT_FOUND = static_cast<Result>( 0x80190194 );

constexpr uint32_t JOB_STATE_QUEUED = 0;
constexpr uint32_t JOB_STATE_CONNECTING = 1;
constexpr uint32_t JOB_STATE_TRANSFERRING = 2;
constexpr uint32_t JOB_STATE_SUSPENDED = 3;
constexpr uint32_t JOB_STATE_ERROR = 4;
constexpr uint32_t JOB_STATE_TRANSIENT_ERROR = 5;
constexpr uint32_t JOB_STATE_TRANSFERRED = 6;
constexpr uint32_t JOB_STATE_ACKNOWLEDGED = 7;
constexpr uint32_t JOB_STATE_CANCELLED = 8;

constexpr uint32_t JOB_TYPE_DOWNLOAD = 0;
constexpr uint32_t JOB_TYPE_UPLOAD = 1;

constexpr uint32_t PRIORITY_FOREGROUND = 0;
constexpr uint32_t PRIORITY_HIGH = 1;
constexpr uint32_t PRIORITY_NORMAL = 2;
constexpr uint32_t PRIORITY_LOW = 3;

/* 2 (an explicit proxy list) is not offered */
constexpr uint32_t PROXY_USAGE_PRECONFIG = 0;
constexpr uint32_t PROXY_USAGE_NO_PROXY = 1;
constexpr uint32_t PROXY_USAGE_AUTODETECT = 3;

constexpr uint32_t ERROR_CONTEXT_NONE = 0;
constexpr uint32_t ERROR_CONTEXT_UNKNOWN = 1;
constexpr uint32_t ERROR_CONTEXT_GENERAL_QUEUE_MANAGER = 2;
constexpr uint32_t ERROR_CONTEXT_QUEUE_MANAGER_NOTIFICATION = 3;
constexpr uint32_t ERROR_CONTEXT_LOCAL_FILE = 4;
constexpr uint32_t ERROR_CONTEXT_REMOTE_FILE = 5;
constexpr uint32_t ERROR_CONTEXT_GENERAL_TRANSPORT = 6;
constexpr uint32_t ERROR_CONTEXT_REMOTE_APPLICATION = 7;

constexpr uint32_t AUTH_TARGET_SERVER = 1;
constexpr uint32_t AUTH_TARGET_PROXY = 2;

constexpr uint32_t AUTH_SCHEME_BASIC = 1;
constexpr uint32_t AUTH_SCHEME_DIGEST = 2;
constexpr uint32_t AUTH_SCHEME_NTLM = 3;
constexpr uint32_t AUTH_SCHEME_NEGOTIATE = 4;
constexpr uint32_t AUTH_SCHEME_PASSPORT = 5;

constexpr uint64_t SIZE_UNKNOWN = std::numeric_limits<uint64_t>::max();

struct Principal
{
  uint32_t uid { 0 };
  bool privileged { false };
};

struct FileStatus
{
  std::string remote_name {};
  std::string local_name {};
  uint64_t bytes_transferred { 0 };
  uint64_t bytes_total { SIZE_UNKNOWN };
  bool completed { false };
};

struct ErrorStatus
{
  uint32_t context { ERROR_CONTEXT_NONE };
  Result code { OK };
  std::string context_description {};
};

/* times are milliseconds since the unix epoch; 0 means "not reached" */
struct JobStatus
{
  std::string display_name {};
  uint32_t type { JOB_TYPE_DOWNLOAD };
  uint32_t state { JOB_STATE_QUEUED };
  uint32_t priority { PRIORITY_NORMAL };
  uint32_t proxy_usage { PROXY_USAGE_PRECONFIG };
  uint32_t owner_uid { 0 };
  std::vector<FileStatus> files {};
  uint32_t error_count { 0 };
  std::optional<ErrorStatus> error {};
  int64_t creation_time { 0 };
  int64_t modification_time { 0 };
  int64_t transfer_completion_time { 0 };
};

class TransferService
{
public:
  virtual ~TransferService() {}

  virtual Result create_job( const Principal& principal,
                             const std::string& display_name,
                             const uint32_t type,
                             std::string& job_id )
    = 0;

  /* all of `files` are added, or none; files are {remote, local} pairs */
  virtual Result add_files(
    const Principal& principal,
    const std::string& job_id,
    const std::vector<std::pair<std::string, std::string>>& files )
    = 0;

  virtual Result start( const Principal& principal, const std::string& job_id ) = 0;
  virtual Result suspend( const Principal& principal, const std::string& job_id ) = 0;
  virtual Result resume( const Principal& principal, const std::string& job_id ) = 0;
  virtual Result cancel( const Principal& principal, const std::string& job_id ) = 0;
  virtual Result complete( const Principal& principal, const std::string& job_id ) = 0;

  virtual Result get_status( const Principal& principal,
                             const std::string& job_id,
                             JobStatus& status )
    = 0;

  virtual Result set_credentials( const Principal& principal,
                                  const std::string& job_id,
                                  const uint32_t target,
                                  const uint32_t scheme,
                                  const std::string& blob )
    = 0;

  virtual Result set_priority( const Principal& principal,
                               const std::string& job_id,
                               const uint32_t priority )
    = 0;

  virtual Result set_proxy_usage( const Principal& principal,
                                  const std::string& job_id,
                                  const uint32_t usage )
    = 0;

  /* jobs visible to `principal`, oldest first */
  virtual Result enum_jobs( const Principal& principal,
                            std::vector<std::string>& job_ids )
    = 0;

  virtual std::string describe( const Result code ) const = 0;
};

} // namespace xferd::native
