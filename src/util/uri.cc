/* -*-mode:c++; tab-width: 2; indent-tabs-mode: nil; c-basic-offset: 2 -*- */

#include "uri.hh"

#include <regex>
#include <stdexcept>

#include "split.hh"

using namespace std;

ParsedURI::ParsedURI( const string& uri )
{
  static const regex uri_regex {
    R"RAWSTR(^([A-Za-z][A-Za-z0-9+.\-]*)://(?:([^:@/]*)(?::([^@/]*))?@)?([^:/?]*)(?::(\d+))?([^?]*)(?:\?(.*))?$)RAWSTR"
  };

  smatch uri_match;
  if ( not regex_match( uri, uri_match, uri_regex ) ) {
    throw runtime_error( "malformed uri: " + uri );
  }

  protocol = uri_match[1];
  username = uri_match[2];
  password = uri_match[3];
  host = uri_match[4];

  if ( uri_match[5].length() ) {
    const unsigned long p = stoul( uri_match[5] );
    if ( p > UINT16_MAX ) {
      throw runtime_error( "port out of range: " + uri );
    }
    port = static_cast<uint16_t>( p );
  }

  path = uri_match[6];

  if ( uri_match[7].length() ) {
    for ( const string& option : split( uri_match[7], "&" ) ) {
      if ( option.empty() ) {
        continue;
      }

      const size_t eq = option.find( '=' );
      if ( eq == string::npos ) {
        options[option] = "";
      } else {
        options[option.substr( 0, eq )] = option.substr( eq + 1 );
      }
    }
  }
}
