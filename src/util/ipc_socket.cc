/* -*-mode:c++; tab-width: 2; indent-tabs-mode: nil; c-basic-offset: 2 -*- */

#include "ipc_socket.hh"

#include <cstring>
#include <stdexcept>
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/uio.h>
#include <sys/un.h>

#include "exception.hh"
#include "util.hh"

using namespace std;

namespace {

sockaddr_un create_sockaddr( const string& path )
{
  sockaddr_un addr;
  memset( &addr, 0, sizeof( addr ) );
  addr.sun_family = AF_UNIX;

  if ( path.size() >= sizeof( addr.sun_path ) ) {
    throw runtime_error( "path size is too long for a unix socket: " + path );
  }

  strcpy( addr.sun_path, path.c_str() );
  return addr;
}

}

IPCSocket::IPCSocket()
  : FileDescriptor( ::CheckSystemCall( "socket",
                                     socket( AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0 ) ) )
{}

IPCSocket::IPCSocket( FileDescriptor&& fd )
  : FileDescriptor( move( fd ) )
{}

void IPCSocket::bind( const string& path )
{
  const sockaddr_un addr = create_sockaddr( path );
  CheckSystemCall( "bind(" + path + ")",
                   ::bind( fd_num(), reinterpret_cast<const sockaddr*>( &addr ), sizeof( addr ) ) );
}

void IPCSocket::connect( const string& path )
{
  const sockaddr_un addr = create_sockaddr( path );
  CheckSystemCall( "connect(" + path + ")",
                   ::connect( fd_num(), reinterpret_cast<const sockaddr*>( &addr ), sizeof( addr ) ) );
}

void IPCSocket::listen( const int backlog )
{
  CheckSystemCall( "listen", ::listen( fd_num(), backlog ) );
}

IPCSocket IPCSocket::accept( void )
{
  return IPCSocket { FileDescriptor { ::CheckSystemCall( "accept",
                                                       ::accept4( fd_num(), nullptr, nullptr, SOCK_CLOEXEC ) ) } };
}

void IPCSocket::shutdown( const int how )
{
  CheckSystemCall( "shutdown", ::shutdown( fd_num(), how ) );
}

void IPCSocket::set_read_timeout( const chrono::milliseconds timeout )
{
  const timeval tv = to_timeval( timeout );
  CheckSystemCall( "setsockopt(SO_RCVTIMEO)",
                   setsockopt( fd_num(), SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof( tv ) ) );
}

void IPCSocket::set_write_timeout( const chrono::milliseconds timeout )
{
  const timeval tv = to_timeval( timeout );
  CheckSystemCall( "setsockopt(SO_SNDTIMEO)",
                   setsockopt( fd_num(), SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof( tv ) ) );
}

PeerCredentials IPCSocket::peer_credentials() const
{
  ucred cred;
  socklen_t len = sizeof( cred );
  CheckSystemCall( "getsockopt(SO_PEERCRED)",
                   getsockopt( fd_num(), SOL_SOCKET, SO_PEERCRED, &cred, &len ) );

  if ( len != sizeof( cred ) ) {
    throw runtime_error( "unexpected SO_PEERCRED length" );
  }

  return { cred.pid, cred.uid, cred.gid };
}

void IPCSocket::send_all( vector<string_view> buffers )
{
  vector<iovec> iovecs;
  size_t remaining = 0;
  for ( const auto& b : buffers ) {
    if ( not b.empty() ) {
      iovecs.push_back( { const_cast<char*>( b.data() ), b.size() } );
      remaining += b.size();
    }
  }

  size_t first = 0;
  while ( remaining > 0 ) {
    msghdr msg {};
    msg.msg_iov = iovecs.data() + first;
    msg.msg_iovlen = iovecs.size() - first;

    const ssize_t sent = ::sendmsg( fd_num(), &msg, MSG_NOSIGNAL );
    if ( sent < 0 ) {
      if ( errno == EINTR ) {
        continue;
      }
      throw unix_error( "sendmsg" );
    }

    remaining -= sent;

    size_t advance = sent;
    while ( advance > 0 and advance >= iovecs[first].iov_len ) {
      advance -= iovecs[first].iov_len;
      first++;
    }

    if ( advance > 0 ) {
      iovecs[first].iov_base = static_cast<char*>( iovecs[first].iov_base ) + advance;
      iovecs[first].iov_len -= advance;
    }
  }
}
