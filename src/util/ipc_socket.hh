/* -*-mode:c++; tab-width: 2; indent-tabs-mode: nil; c-basic-offset: 2 -*- */

#ifndef XFERD_UTIL_IPC_SOCKET_HH
#define XFERD_UTIL_IPC_SOCKET_HH

#include <chrono>
#include <string>
#include <string_view>
#include <sys/types.h>
#include <vector>

#include "file_descriptor.hh"

/* identity of the process at the other end, as vouched for by the kernel */
struct PeerCredentials
{
  pid_t pid { 0 };
  uid_t uid { 0 };
  gid_t gid { 0 };
};

/* Unix domain stream socket */
class IPCSocket : public FileDescriptor
{
public:
  IPCSocket();
  explicit IPCSocket( FileDescriptor&& fd );

  void bind( const std::string& path );
  void connect( const std::string& path );

  void listen( const int backlog = 200 );
  IPCSocket accept( void );

  void shutdown( const int how );

  /* SO_RCVTIMEO / SO_SNDTIMEO; a zero duration disables the timeout */
  void set_read_timeout( const std::chrono::milliseconds timeout );
  void set_write_timeout( const std::chrono::milliseconds timeout );

  PeerCredentials peer_credentials() const;

  /* writes every byte (blocking socket), never raising SIGPIPE */
  void send_all( std::vector<std::string_view> buffers );
};

#endif /* XFERD_UTIL_IPC_SOCKET_HH */
