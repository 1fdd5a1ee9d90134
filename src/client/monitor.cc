/* -*-mode:c++; tab-width: 2; indent-tabs-mode: nil; c-basic-offset: 2 -*- */

#include "monitor.hh"

#include <glog/logging.h>

using namespace std;
using namespace std::chrono;

namespace xferd {

JobMonitor::JobMonitor( shared_ptr<Backend> backend,
                        const JobHandle& handle,
                        const MonitorOptions& options )
  : backend_( move( backend ) )
  , handle_( handle )
  , options_( options )
{
  if ( not backend_ ) {
    throw JobError( ErrorKind::InvalidArgument, "monitor", "no backend", handle.id() );
  }
}

bool JobMonitor::wait( const milliseconds duration )
{
  unique_lock<mutex> lock { mutex_ };
  wakeup_.wait_for( lock, duration, [this] { return cancelled_; } );
  return not cancelled_;
}

MonitorEvent JobMonitor::finish( MonitorEvent&& event )
{
  lock_guard<mutex> lock { mutex_ };
  finished_ = true;
  return move( event );
}

JobSnapshot JobMonitor::removed_snapshot() const
{
  JobSnapshot snapshot;

  if ( last_.has_value() ) {
    snapshot = *last_;

    /* a removal already reported keeps its verdict across restart() */
    if ( not is_terminal( last_->state ) ) {
      snapshot.state = ( last_->state == JobState::Transferred ) ? JobState::Acknowledged
                                                                  : JobState::Cancelled;
    }
  } else {
    snapshot.id = handle_.id();
    snapshot.state = JobState::Cancelled;
  }

  snapshot.error.reset();
  return snapshot;
}

JobSnapshot JobMonitor::stale_snapshot() const
{
  if ( last_.has_value() ) {
    return *last_;
  }

  JobSnapshot snapshot;
  snapshot.id = handle_.id();
  return snapshot;
}

optional<MonitorEvent> JobMonitor::next()
{
  bool first_poll;
  milliseconds interval;

  {
    lock_guard<mutex> lock { mutex_ };

    if ( finished_ or cancelled_ ) {
      return nullopt;
    }

    first_poll = first_poll_;
    first_poll_ = false;
    interval = options_.interval;
  }

  if ( not first_poll and not wait( interval ) ) {
    return nullopt;
  }

  Backoff backoff { options_.transport_retry };

  while ( true ) {
    JobSnapshot snapshot;

    try {
      snapshot = backend_->get_status( handle_ );
    } catch ( const JobError& e ) {
      switch ( e.kind() ) {
        case ErrorKind::NotFound: {
          JobSnapshot removed;

          {
            lock_guard<mutex> lock { mutex_ };
            removed = removed_snapshot();
            last_ = removed;
          }

          VLOG( 1 ) << "job " << handle_.id() << " is gone, reporting " << removed.state;
          return finish( { MonitorEvent::Kind::Terminal, move( removed ), nullopt } );
        }

        case ErrorKind::TransportError:
        case ErrorKind::AgentUnreachable: {
          const auto delay = backoff.next_delay();

          if ( not delay.has_value() ) {
            LOG( ERROR ) << "giving up on job " << handle_.id() << " after "
                         << backoff.failures() << " failed polls: " << e.what();

            JobSnapshot stale;

            {
              lock_guard<mutex> lock { mutex_ };
              stale = stale_snapshot();
            }

            return finish( { MonitorEvent::Kind::TransportFailure, move( stale ), e } );
          }

          LOG( WARNING ) << "polling job " << handle_.id() << " failed (" << e.what()
                         << "), retrying in " << delay->count() << " ms";

          if ( not wait( *delay ) ) {
            return nullopt;
          }

          continue;
        }

        default: throw;
      }
    }

    {
      lock_guard<mutex> lock { mutex_ };
      last_ = snapshot;
    }

    if ( is_terminal( snapshot.state ) or snapshot.state == JobState::Error ) {
      return finish( { MonitorEvent::Kind::Terminal, move( snapshot ), nullopt } );
    }

    return MonitorEvent { MonitorEvent::Kind::Progress, move( snapshot ), nullopt };
  }
}

void JobMonitor::cancel()
{
  {
    lock_guard<mutex> lock { mutex_ };
    cancelled_ = true;
  }

  wakeup_.notify_all();
}

void JobMonitor::set_interval( const milliseconds interval )
{
  lock_guard<mutex> lock { mutex_ };
  options_.interval = interval;
}

void JobMonitor::restart()
{
  lock_guard<mutex> lock { mutex_ };
  cancelled_ = false;
  finished_ = false;
  first_poll_ = true;
}

optional<JobSnapshot> JobMonitor::last_snapshot() const
{
  lock_guard<mutex> lock { mutex_ };
  return last_;
}

bool JobMonitor::finished() const
{
  lock_guard<mutex> lock { mutex_ };
  return finished_ or cancelled_;
}

} // namespace xferd
