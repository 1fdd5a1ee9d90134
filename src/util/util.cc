/* -*-mode:c++; tab-width: 2; indent-tabs-mode: nil; c-basic-offset: 2 -*- */

#include "util.hh"

#include <array>
#include <cstdlib>
#include <iomanip>
#include <sstream>

using namespace std;

string safe_getenv_or( const string& key, const string& fallback )
{
  const char* const value = getenv( key.c_str() );
  if ( value == nullptr or *value == '\0' ) {
    return fallback;
  }
  return value;
}

string format_bytes( const uint64_t bytes )
{
  static const array<const char*, 5> units { "B", "KiB", "MiB", "GiB", "TiB" };

  if ( bytes < 1024 ) {
    return to_string( bytes ) + " B";
  }

  double value = bytes;
  size_t unit = 0;

  while ( value >= 1024 and unit + 1 < units.size() ) {
    value /= 1024;
    unit++;
  }

  ostringstream oss;
  oss << fixed << setprecision( 1 ) << value << " " << units[unit];
  return oss.str();
}
