#include <gtest/gtest.h>

#include <random>
#include <vector>

#include "job/state.hh"
#include "util/util.hh"

using namespace std;
using namespace xferd;

namespace {

const vector<JobState> ALL_STATES = {
  JobState::Queued,         JobState::Connecting,  JobState::Transferring,
  JobState::Suspended,      JobState::Error,       JobState::TransientError,
  JobState::Transferred,    JobState::Acknowledged, JobState::Cancelled,
  JobState::Unknown,
};

vector<JobOperation> all_operations()
{
  vector<JobOperation> ops;
  for ( uint8_t i = 0; i < to_underlying( JobOperation::COUNT ); i++ ) {
    ops.push_back( static_cast<JobOperation>( i ) );
  }
  return ops;
}

}

TEST( JobStateMachine, CallerTransitions )
{
  EXPECT_EQ( transition( JobState::Queued, JobOperation::Start ), JobState::Connecting );
  EXPECT_EQ( transition( JobState::Connecting, JobOperation::Suspend ), JobState::Suspended );
  EXPECT_EQ( transition( JobState::Transferring, JobOperation::Suspend ), JobState::Suspended );
  EXPECT_EQ( transition( JobState::Suspended, JobOperation::Resume ), JobState::Connecting );
  EXPECT_EQ( transition( JobState::Transferred, JobOperation::Complete ), JobState::Acknowledged );
  EXPECT_EQ( transition( JobState::Queued, JobOperation::AddFile ), JobState::Queued );

  EXPECT_FALSE( transition( JobState::Connecting, JobOperation::Start ) );
  EXPECT_FALSE( transition( JobState::Queued, JobOperation::Suspend ) );
  EXPECT_FALSE( transition( JobState::Transferring, JobOperation::Complete ) );
  EXPECT_FALSE( transition( JobState::Transferring, JobOperation::AddFile ) );
  EXPECT_FALSE( transition( JobState::Error, JobOperation::Resume ) );
}

TEST( JobStateMachine, SettingsKeepTheState )
{
  for ( const auto state : ALL_STATES ) {
    for ( const auto op : { JobOperation::SetPriority, JobOperation::SetProxyUsage,
                            JobOperation::SetCredentials } ) {
      if ( is_terminal( state ) or state == JobState::Unknown ) {
        EXPECT_FALSE( transition( state, op ) ) << state << " " << to_string( op );
      } else {
        EXPECT_EQ( transition( state, op ), state ) << to_string( op );
      }
    }
  }
}

TEST( JobStateMachine, NativeTransitions )
{
  EXPECT_EQ( transition( JobState::Connecting, JobOperation::Connected ), JobState::Transferring );
  EXPECT_EQ( transition( JobState::Transferring, JobOperation::Finished ), JobState::Transferred );
  EXPECT_EQ( transition( JobState::Transferring, JobOperation::TransientFailure ),
             JobState::TransientError );
  EXPECT_EQ( transition( JobState::TransientError, JobOperation::Retry ), JobState::Transferring );

  for ( const auto state : ALL_STATES ) {
    const auto next = transition( state, JobOperation::FatalFailure );
    if ( is_terminal( state ) or state == JobState::Error or state == JobState::Unknown ) {
      EXPECT_FALSE( next ) << state;
    } else {
      EXPECT_EQ( next, JobState::Error ) << state;
    }
  }
}

TEST( JobStateMachine, CancelFromEveryNonTerminalState )
{
  for ( const auto state : ALL_STATES ) {
    if ( is_terminal( state ) ) {
      EXPECT_FALSE( transition( state, JobOperation::Cancel ) ) << state;
    } else {
      EXPECT_EQ( transition( state, JobOperation::Cancel ), JobState::Cancelled ) << state;
    }
  }
}

TEST( JobStateMachine, TerminalAndUnknownStatesAreClosed )
{
  for ( const auto op : all_operations() ) {
    EXPECT_FALSE( transition( JobState::Acknowledged, op ) ) << to_string( op );
    EXPECT_FALSE( transition( JobState::Cancelled, op ) ) << to_string( op );

    if ( op != JobOperation::Cancel ) {
      EXPECT_FALSE( transition( JobState::Unknown, op ) ) << to_string( op );
    }
  }
}

TEST( JobStateMachine, RandomWalksStayDefined )
{
  mt19937 gen { 20240611 };
  const auto ops = all_operations();

  for ( size_t walk = 0; walk < 500; walk++ ) {
    JobState state = JobState::Queued;
    size_t terminal_visits = 0;

    for ( size_t i = 0; i < 64 and not is_terminal( state ); i++ ) {
      vector<JobState> choices;
      for ( const auto op : ops ) {
        if ( const auto next = transition( state, op ); next.has_value() ) {
          choices.push_back( *next );
        }
      }

      ASSERT_FALSE( choices.empty() ) << "stuck in " << state;

      state = choices[uniform_int_distribution<size_t> { 0, choices.size() - 1 }( gen )];
      ASSERT_NE( state, JobState::Unknown );

      if ( is_terminal( state ) ) {
        terminal_visits++;
      }
    }

    EXPECT_LE( terminal_visits, 1 );
  }
}
