#include "split.hh"

#include <stdexcept>

using namespace std;

vector<string> split( const string& str, const string& separator )
{
  if ( separator.empty() ) {
    throw runtime_error( "split: empty separator" );
  }

  vector<string> ret;

  size_t field_start = 0;
  while ( true ) {
    const size_t next = str.find( separator, field_start );
    if ( next == string::npos ) {
      ret.emplace_back( str.substr( field_start ) );
      break;
    }

    ret.emplace_back( str.substr( field_start, next - field_start ) );
    field_start = next + separator.size();
  }

  return ret;
}
