/* -*-mode:c++; tab-width: 2; indent-tabs-mode: nil; c-basic-offset: 2 -*- */

#include "fileutils.hh"

#include <cstdlib>
#include <fcntl.h>
#include <glog/logging.h>
#include <stdexcept>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>
#include <vector>

#include "exception.hh"

using namespace std;

namespace roost {

void atomic_create( const string& contents,
                    const filesystem::path& dst,
                    const bool set_mode,
                    const mode_t target_mode )
{
  const string name_template = dst.string() + ".XXXXXX";
  vector<char> tmp_name { name_template.begin(), name_template.end() };
  tmp_name.push_back( '\0' );

  {
    FileDescriptor tmp_file { CheckSystemCall( "mkstemp " + name_template,
                                               mkstemp( tmp_name.data() ) ) };

    try {
      for ( string_view remaining = contents; not remaining.empty(); ) {
        remaining.remove_prefix( tmp_file.write( remaining ) );
      }

      if ( set_mode ) {
        CheckSystemCall( "fchmod", fchmod( tmp_file.fd_num(), target_mode ) );
      }

      CheckSystemCall( "fsync", fsync( tmp_file.fd_num() ) );
    } catch ( const exception& ) {
      unlink( tmp_name.data() );
      throw;
    }

    /* the descriptor is closed before the rename */
  }

  CheckSystemCall( "rename", ::rename( tmp_name.data(), dst.c_str() ) );
}

string read_file( const filesystem::path& pathn )
{
  /* read input file into memory */
  FileDescriptor in_file { CheckSystemCall(
    "open (" + pathn.string() + ")",
    open( pathn.string().c_str(), O_RDONLY | O_CLOEXEC ) ) };
  struct stat pathn_info;
  CheckSystemCall( "fstat", fstat( in_file.fd_num(), &pathn_info ) );

  if ( not S_ISREG( pathn_info.st_mode ) ) {
    throw runtime_error( pathn.string() + " is not a regular file" );
  }

  string contents;
  contents.resize( pathn_info.st_size );

  for ( size_t index = 0; not in_file.eof() and index < contents.length(); ) {
    index
      += in_file.read( contents.data() + index, contents.length() - index );
  }

  return contents;
}

FileLock::FileLock( const filesystem::path& lock_path )
  : fd_( CheckSystemCall( "open (" + lock_path.string() + ")",
                          open( lock_path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0666 ) ) )
{
  while ( flock( fd_.fd_num(), LOCK_EX ) < 0 ) {
    if ( errno != EINTR ) {
      throw unix_error( "flock " + lock_path.string() );
    }
  }
}

FileLock::~FileLock()
{
  if ( flock( fd_.fd_num(), LOCK_UN ) < 0 ) {
    PLOG( WARNING ) << "flock(LOCK_UN)";
  }
}

}
