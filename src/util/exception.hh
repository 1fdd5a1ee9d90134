/* -*-mode:c++; tab-width: 2; indent-tabs-mode: nil; c-basic-offset: 2 -*- */

#pragma once

#include <cerrno>
#include <cstdlib>
#include <cxxabi.h>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>
#include <typeinfo>

class tagged_error : public std::system_error
{
private:
  std::string attempt_and_error_;

public:
  tagged_error( const std::error_category& category,
                const std::string_view s_attempt,
                const int error_code )
    : system_error( error_code, category )
    , attempt_and_error_( std::string( s_attempt ) + ": "
                          + std::system_error::what() )
  {}

  const char* what() const noexcept override
  {
    return attempt_and_error_.c_str();
  }
};

class unix_error : public tagged_error
{
public:
  unix_error( const std::string_view s_attempt, const int s_errno = errno )
    : tagged_error( std::system_category(), s_attempt, s_errno )
  {}
};

inline int CheckSystemCall( const std::string_view s_attempt,
                            const int return_value )
{
  if ( return_value >= 0 ) {
    return return_value;
  }

  throw unix_error( s_attempt );
}

inline std::string demangle( const char* name )
{
  int status = 0;
  std::unique_ptr<char, void ( * )( void* )> res {
    abi::__cxa_demangle( name, nullptr, nullptr, &status ), std::free
  };

  return ( status == 0 ) ? res.get() : name;
}

inline void print_exception( const char* argv0, const std::exception& e )
{
  std::cerr << argv0 << ": " << e.what() << " (" << demangle( typeid( e ).name() )
            << ")" << std::endl;
}
