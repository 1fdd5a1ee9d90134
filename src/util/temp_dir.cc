/* -*-mode:c++; tab-width: 2; indent-tabs-mode: nil; c-basic-offset: 2 -*- */

#include "temp_dir.hh"

#include <cstdlib>
#include <filesystem>
#include <system_error>
#include <vector>

#include <glog/logging.h>

#include "exception.hh"

using namespace std;

TempDirectory::TempDirectory( const string& prefix )
{
  const string name_template = prefix + ".XXXXXX";
  vector<char> buffer { name_template.begin(), name_template.end() };
  buffer.push_back( '\0' );

  if ( mkdtemp( buffer.data() ) == nullptr ) {
    throw unix_error( "mkdtemp " + name_template );
  }

  name_ = buffer.data();
}

TempDirectory::TempDirectory( TempDirectory&& other )
  : name_( move( other.name_ ) )
{
  other.name_.clear();
}

TempDirectory::~TempDirectory()
{
  if ( name_.empty() ) {
    return;
  }

  error_code ec;
  filesystem::remove_all( name_, ec );
  if ( ec ) {
    LOG( WARNING ) << "could not remove " << name_ << ": " << ec.message();
  }
}
