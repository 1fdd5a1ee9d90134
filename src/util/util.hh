/* -*-mode:c++; tab-width: 2; indent-tabs-mode: nil; c-basic-offset: 2 -*- */

#pragma once

#include <sys/time.h>

#include <chrono>
#include <cstdint>
#include <string>
#include <type_traits>

/* value of the environment variable `key`, or `fallback` when unset or empty */
std::string safe_getenv_or( const std::string& key, const std::string& fallback );

/* 262144 -> "256.0 KiB" */
std::string format_bytes( const uint64_t bytes );

template<typename E>
constexpr auto to_underlying( E e ) noexcept
{
  return static_cast<std::underlying_type_t<E>>( e );
}

inline std::string pluralize( const std::string& word, const size_t count )
{
  return word + ( count != 1 ? "s" : "" );
}

template<typename Duration>
inline timeval to_timeval( const Duration& d )
{
  const auto sec = std::chrono::duration_cast<std::chrono::seconds>( d );

  timeval tv;
  tv.tv_sec = sec.count();
  tv.tv_usec = std::chrono::duration_cast<std::chrono::microseconds>( d - sec ).count();
  return tv;
}
