/* -*-mode:c++; tab-width: 2; indent-tabs-mode: nil; c-basic-offset: 2 -*- */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>

struct BackoffPolicy
{
  std::chrono::milliseconds initial_delay { 50 };
  double multiplier { 2.0 };
  std::chrono::milliseconds max_delay { 1000 };
  uint32_t max_attempts { 20 };
  std::chrono::milliseconds deadline { 10'000 };
};

/* Exponential backoff bounded by both an attempt count and a total deadline,
   measured from construction (or the last reset()). */
class Backoff
{
private:
  BackoffPolicy policy_;
  std::chrono::steady_clock::time_point started_;
  std::chrono::milliseconds next_delay_;
  uint32_t failures_ { 0 };

public:
  explicit Backoff( const BackoffPolicy& policy );

  /* Records a failed attempt. Returns how long to wait before the next one,
     or nothing once the attempt or time budget is exhausted. The delay never
     extends past the deadline. */
  std::optional<std::chrono::milliseconds> next_delay();

  uint32_t failures() const { return failures_; }
  std::chrono::milliseconds elapsed() const;

  void reset();
};
