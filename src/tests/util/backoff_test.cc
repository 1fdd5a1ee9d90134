#include <gtest/gtest.h>

#include <thread>

#include "util/backoff.hh"

using namespace std;
using namespace std::chrono;

TEST( Backoff, DelaysGrowUntilCapped )
{
  Backoff backoff { { 10ms, 2.0, 50ms, 10, 60'000ms } };

  EXPECT_EQ( backoff.next_delay(), 10ms );
  EXPECT_EQ( backoff.next_delay(), 20ms );
  EXPECT_EQ( backoff.next_delay(), 40ms );
  EXPECT_EQ( backoff.next_delay(), 50ms );
  EXPECT_EQ( backoff.next_delay(), 50ms );
  EXPECT_EQ( backoff.failures(), 5 );
}

TEST( Backoff, AttemptBudget )
{
  Backoff backoff { { 1ms, 2.0, 10ms, 3, 60'000ms } };

  EXPECT_TRUE( backoff.next_delay().has_value() );
  EXPECT_TRUE( backoff.next_delay().has_value() );
  EXPECT_FALSE( backoff.next_delay().has_value() );

  backoff.reset();
  EXPECT_EQ( backoff.failures(), 0 );
  EXPECT_EQ( backoff.next_delay(), 1ms );
}

TEST( Backoff, DeadlineBudget )
{
  Backoff backoff { { 1000ms, 2.0, 1000ms, 100, 30ms } };

  const auto first = backoff.next_delay();
  ASSERT_TRUE( first.has_value() );
  EXPECT_LE( *first, 30ms );

  this_thread::sleep_for( 40ms );
  EXPECT_FALSE( backoff.next_delay().has_value() );
}

TEST( Backoff, RejectsShrinkingMultiplier )
{
  EXPECT_THROW( Backoff( { 10ms, 0.5, 100ms, 5, 1000ms } ), runtime_error );
}
