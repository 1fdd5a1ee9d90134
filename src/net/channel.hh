/* -*-mode:c++; tab-width: 2; indent-tabs-mode: nil; c-basic-offset: 2 -*- */

#pragma once

#include <optional>

#include "messages/message.hh"
#include "util/ipc_socket.hh"

namespace xferd {

/* Blocking, framed message channel over a connected unix socket. Failures of
   the underlying socket surface as JobError( TransportError ); malformed
   frames as JobError( ProtocolError ). */
class Channel
{
private:
  IPCSocket socket_;
  MessageParser parser_ {};
  bool timed_out_ { false };

public:
  explicit Channel( IPCSocket&& socket );

  void send( const Message& message );

  /* Next complete message, or nothing if the peer closed the connection
     cleanly between messages. */
  std::optional<Message> receive();

  /* whether the last TransportError was a read/write timeout */
  bool timed_out() const { return timed_out_; }

  IPCSocket& socket() { return socket_; }
};

} // namespace xferd
