/* -*-mode:c++; tab-width: 2; indent-tabs-mode: nil; c-basic-offset: 2 -*- */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "job/error.hh"
#include "job/types.hh"
#include "messages/message.hh"

namespace xferd {

constexpr uint32_t PROTOCOL_VERSION = 1;

enum class Operation : uint8_t
{
  CreateJob,
  AddFiles,
  Start,
  Suspend,
  Resume,
  Cancel,
  Complete,
  GetStatus,
  SetCredentials,
  SetPriority,
  OpenJob,
  ListJobs,
  SetProxyUsage,
};

const char* to_string( const Operation op );

/* operations that do not change the native store */
bool is_read_only( const Operation op );

struct Request
{
  uint64_t correlation_id { 0 };
  Operation operation { Operation::GetStatus };

  std::string job_id {};
  std::string display_name {};
  Direction direction { Direction::Download };
  std::vector<FileSpec> files {};
  std::optional<Credential> credential {};
  JobPriority priority { JobPriority::Normal };
  ProxyUsage proxy_usage { ProxyUsage::Preconfig };

  bool operator==( const Request& other ) const;
};

struct RemoteError
{
  ErrorKind kind { ErrorKind::Unknown };
  std::string message {};
  std::string operation {};
  std::optional<JobId> job_id {};
  std::optional<int32_t> native_code {};

  static RemoteError from_exception( const JobError& e );
  JobError to_exception() const;

  bool operator==( const RemoteError& other ) const;
};

/* exactly one of the payload members is meaningful for a given operation;
   an error response carries nothing else */
struct Response
{
  uint64_t correlation_id { 0 };

  std::optional<RemoteError> error {};
  std::optional<JobId> job_id {};
  std::vector<JobId> job_ids {};
  std::optional<JobSnapshot> snapshot {};

  bool operator==( const Response& other ) const;
};

Message encode( const Request& request );
Message encode( const Response& response );
Message encode_hello( const uint32_t version = PROTOCOL_VERSION );

/* these throw JobError( ProtocolError ) on anything malformed */
Request decode_request( const Message& message );
Response decode_response( const Message& message );
uint32_t decode_hello( const Message& message );

} // namespace xferd
