/* -*-mode:c++; tab-width: 2; indent-tabs-mode: nil; c-basic-offset: 2 -*- */

#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>

#include "backend/backend.hh"
#include "util/backoff.hh"

namespace xferd {

struct MonitorOptions
{
  std::chrono::milliseconds interval { 1000 };

  /* consecutive failed polls tolerated before the sequence gives up */
  BackoffPolicy transport_retry { std::chrono::milliseconds { 100 },
                                  2.0,
                                  std::chrono::milliseconds { 2000 },
                                  5,
                                  std::chrono::milliseconds { 30'000 } };
};

struct MonitorEvent
{
  enum class Kind
  {
    Progress,
    Terminal,
    TransportFailure,
  };

  Kind kind { Kind::Progress };
  JobSnapshot snapshot {};

  /* set for TransportFailure only */
  std::optional<JobError> error {};
};

/* Lazy sequence of status snapshots for one job. The first call to next()
   polls immediately; each later call waits one interval first. The sequence
   ends after a Terminal or TransportFailure event, or once cancel() is
   called, after which next() returns nothing until restart(). */
class JobMonitor
{
private:
  std::shared_ptr<Backend> backend_;
  JobHandle handle_;
  MonitorOptions options_;

  mutable std::mutex mutex_ {};
  std::condition_variable wakeup_ {};
  bool cancelled_ { false };
  bool finished_ { false };
  bool first_poll_ { true };

  /* guarded by mutex_, like the flags above */
  std::optional<JobSnapshot> last_ {};

  /* false if cancelled while waiting */
  bool wait( const std::chrono::milliseconds duration );

  MonitorEvent finish( MonitorEvent&& event );

  /* both expect mutex_ to be held */
  JobSnapshot removed_snapshot() const;
  JobSnapshot stale_snapshot() const;

public:
  JobMonitor( std::shared_ptr<Backend> backend,
              const JobHandle& handle,
              const MonitorOptions& options = {} );

  std::optional<MonitorEvent> next();

  /* thread-safe; wakes a pending wait */
  void cancel();

  void set_interval( const std::chrono::milliseconds interval );

  /* begin a new sequence for the same job */
  void restart();

  bool finished() const;

  std::optional<JobSnapshot> last_snapshot() const;
};

} // namespace xferd
