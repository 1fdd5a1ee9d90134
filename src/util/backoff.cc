/* -*-mode:c++; tab-width: 2; indent-tabs-mode: nil; c-basic-offset: 2 -*- */

#include "backoff.hh"

#include <algorithm>
#include <stdexcept>

using namespace std;
using namespace std::chrono;

Backoff::Backoff( const BackoffPolicy& policy )
  : policy_( policy )
  , started_( steady_clock::now() )
  , next_delay_( policy.initial_delay )
{
  if ( policy_.multiplier < 1.0 ) {
    throw runtime_error( "backoff multiplier must be at least 1" );
  }
}

milliseconds Backoff::elapsed() const
{
  return duration_cast<milliseconds>( steady_clock::now() - started_ );
}

optional<milliseconds> Backoff::next_delay()
{
  failures_++;

  if ( failures_ >= policy_.max_attempts ) {
    return nullopt;
  }

  const milliseconds remaining = policy_.deadline - elapsed();
  if ( remaining <= 0ms ) {
    return nullopt;
  }

  const milliseconds delay = min( { next_delay_, policy_.max_delay, remaining } );

  next_delay_ = min( policy_.max_delay,
                     milliseconds { static_cast<milliseconds::rep>( next_delay_.count() * policy_.multiplier ) } );

  return delay;
}

void Backoff::reset()
{
  started_ = steady_clock::now();
  next_delay_ = policy_.initial_delay;
  failures_ = 0;
}
