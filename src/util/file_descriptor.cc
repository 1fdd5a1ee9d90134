/* -*-mode:c++; tab-width: 2; indent-tabs-mode: nil; c-basic-offset: 2 -*- */

#include "file_descriptor.hh"

#include <unistd.h>

#include <stdexcept>
#include <string>

#include <glog/logging.h>

#include "exception.hh"

using namespace std;

FileDescriptor::Handle::Handle( const int number )
  : fd( number )
{
  if ( fd < 0 ) {
    throw runtime_error( "invalid fd number: " + to_string( fd ) );
  }
}

void FileDescriptor::Handle::close()
{
  if ( closed ) {
    return;
  }

  closed = eof = true;
  CheckSystemCall( "close", ::close( fd ) );
}

FileDescriptor::Handle::~Handle()
{
  try {
    close();
  } catch ( const exception& e ) {
    LOG( ERROR ) << "closing fd " << fd << ": " << e.what();
  }
}

FileDescriptor::FileDescriptor( const int fd )
  : handle_( make_shared<Handle>( fd ) )
{}

FileDescriptor::FileDescriptor( shared_ptr<Handle> handle )
  : handle_( move( handle ) )
{}

FileDescriptor FileDescriptor::duplicate() const
{
  return FileDescriptor { handle_ };
}

size_t FileDescriptor::read( char* buffer, const size_t capacity )
{
  if ( capacity == 0 ) {
    throw runtime_error( "FileDescriptor::read: no space to read" );
  }

  ssize_t bytes_read;
  do {
    bytes_read = ::read( fd_num(), buffer, capacity );
  } while ( bytes_read < 0 and errno == EINTR );

  if ( bytes_read < 0 ) {
    throw unix_error( "read" );
  }

  if ( bytes_read == 0 ) {
    handle_->eof = true;
  }

  return static_cast<size_t>( bytes_read );
}

size_t FileDescriptor::write( const string_view buffer )
{
  ssize_t bytes_written;
  do {
    bytes_written = ::write( fd_num(), buffer.data(), buffer.size() );
  } while ( bytes_written < 0 and errno == EINTR );

  if ( bytes_written < 0 ) {
    throw unix_error( "write" );
  }

  if ( bytes_written == 0 and not buffer.empty() ) {
    throw runtime_error( "write returned 0 given non-empty input buffer" );
  }

  return static_cast<size_t>( bytes_written );
}
