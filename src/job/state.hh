/* -*-mode:c++; tab-width: 2; indent-tabs-mode: nil; c-basic-offset: 2 -*- */

#pragma once

#include <cstdint>
#include <optional>

#include "job/types.hh"

namespace xferd {

enum class JobOperation : uint8_t
{
  /* caller-issued */
  AddFile,
  Start,
  Suspend,
  Resume,
  Cancel,
  Complete,
  SetPriority,
  SetProxyUsage,
  SetCredentials,

  /* driven by the native service */
  Connected,
  Finished,
  TransientFailure,
  Retry,
  FatalFailure,

  COUNT
};

const char* to_string( const JobOperation op );

/* The job state machine. Returns the state reached by applying `op` in
   `from`, or nothing if `op` is forbidden there. Acknowledged and Cancelled
   are terminal (no operation applies); Unknown only admits Cancel. */
std::optional<JobState> transition( const JobState from, const JobOperation op );

} // namespace xferd
