/* -*-mode:c++; tab-width: 2; indent-tabs-mode: nil; c-basic-offset: 2 -*- */

#include "net/channel.hh"

#include <array>
#include <cerrno>

#include "job/error.hh"
#include "util/exception.hh"

using namespace std;

namespace xferd {

namespace {

bool is_timeout( const unix_error& e )
{
  return e.code().value() == EAGAIN or e.code().value() == EWOULDBLOCK;
}

}

Channel::Channel( IPCSocket&& socket )
  : socket_( move( socket ) )
{}

void Channel::send( const Message& message )
{
  const string header = message.serialize_header();

  try {
    socket_.send_all( { header, message.payload() } );
  } catch ( const unix_error& e ) {
    timed_out_ = is_timeout( e );
    throw JobError( ErrorKind::TransportError, "send", e.what() );
  }
}

optional<Message> Channel::receive()
{
  array<char, 4096> buffer;

  while ( parser_.empty() ) {
    size_t bytes_read = 0;

    try {
      bytes_read = socket_.read( buffer.data(), buffer.size() );
    } catch ( const unix_error& e ) {
      timed_out_ = is_timeout( e );
      throw JobError( ErrorKind::TransportError,
                      "receive",
                      timed_out_ ? "timed out waiting for peer" : e.what() );
    }

    if ( bytes_read == 0 ) {
      if ( parser_.mid_message() ) {
        throw JobError( ErrorKind::TransportError, "receive", "connection closed mid-message" );
      }

      return nullopt;
    }

    parser_.parse( { buffer.data(), bytes_read } );
  }

  Message message = move( parser_.front() );
  parser_.pop();
  return message;
}

} // namespace xferd
