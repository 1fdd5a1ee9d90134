/* -*-mode:c++; tab-width: 2; indent-tabs-mode: nil; c-basic-offset: 2 -*- */

#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

#include "job/types.hh"

namespace xferd {

enum class ErrorKind : uint8_t
{
  InvalidArgument,
  InvalidState,
  NotFound,
  PermissionDenied,
  ServiceUnavailable,
  AgentUnreachable,
  ProtocolError,
  TransportError,
  Unknown,
};

const char* to_string( const ErrorKind kind );

/* Raised by every job-control operation. Carries enough context to be
   reconstructed on the other side of the agent channel. */
class JobError : public std::runtime_error
{
private:
  ErrorKind kind_;
  std::string operation_;
  std::string message_;
  std::optional<JobId> job_id_;
  std::optional<int32_t> native_code_;

public:
  JobError( const ErrorKind kind,
            const std::string_view operation,
            const std::string_view message,
            const std::optional<JobId>& job_id = std::nullopt,
            const std::optional<int32_t> native_code = std::nullopt );

  ErrorKind kind() const { return kind_; }
  const std::string& operation() const { return operation_; }
  const std::string& message() const { return message_; }
  const std::optional<JobId>& job_id() const { return job_id_; }
  std::optional<int32_t> native_code() const { return native_code_; }
};

} // namespace xferd
