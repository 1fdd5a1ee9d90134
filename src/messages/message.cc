/* -*-mode:c++; tab-width: 2; indent-tabs-mode: nil; c-basic-offset: 2 -*- */

#include "message.hh"

#include <stdexcept>

#include "job/error.hh"
#include "net/util.hh"

using namespace std;

namespace xferd {

constexpr char const* Message::OPCODE_NAMES[to_underlying( Message::OpCode::COUNT )];

Message::Message( const string_view header, string&& payload )
  : payload_( move( payload ) )
{
  if ( header.length() != HEADER_LENGTH ) {
    throw out_of_range( "incomplete header" );
  }

  correlation_id_ = get_field<uint64_t>( header );
  payload_length_ = get_field<uint32_t>( header.substr( 8 ) );
  opcode_ = static_cast<OpCode>( header[12] );

  if ( payload_length_ != payload_.length() ) {
    throw runtime_error( "payload length does not match header" );
  }
}

Message::Message( const uint64_t correlation_id,
                  const OpCode opcode,
                  string&& payload )
  : correlation_id_( correlation_id )
  , payload_length_( payload.length() )
  , opcode_( opcode )
  , payload_( move( payload ) )
{
  if ( payload_.length() > MAX_PAYLOAD_LENGTH ) {
    throw JobError( ErrorKind::ProtocolError,
                    "encode",
                    "payload of " + std::to_string( payload_.length() )
                      + " bytes exceeds the frame limit" );
  }
}

string Message::serialize_header() const
{
  string output;
  output.reserve( HEADER_LENGTH );

  output += put_field( correlation_id_ );
  output += put_field( payload_length_ );
  output += static_cast<char>( to_underlying( opcode_ ) );

  return output;
}

uint32_t Message::expected_payload_length( const string_view header )
{
  return ( header.length() < HEADER_LENGTH )
           ? 0
           : get_field<uint32_t>( header.substr( 8, 4 ) );
}

bool Message::valid_opcode( const uint8_t raw )
{
  return raw >= to_underlying( OpCode::Hey ) and raw < to_underlying( OpCode::COUNT );
}

const char* to_string( const Message::OpCode opcode )
{
  return Message::valid_opcode( to_underlying( opcode ) )
           ? Message::OPCODE_NAMES[to_underlying( opcode )]
           : "invalid";
}

void MessageParser::complete_message()
{
  expected_payload_length_.reset();

  completed_messages_.emplace( incomplete_header_, move( incomplete_payload_ ) );

  incomplete_header_.clear();
  incomplete_payload_.clear();
}

size_t MessageParser::parse( string_view buf )
{
  const size_t consumed_bytes = buf.length();

  while ( not buf.empty() ) {
    if ( not expected_payload_length_.has_value() ) {
      const auto remaining_length
        = min( buf.length(), Message::HEADER_LENGTH - incomplete_header_.length() );

      incomplete_header_.append( buf.substr( 0, remaining_length ) );
      buf.remove_prefix( remaining_length );

      if ( incomplete_header_.length() == Message::HEADER_LENGTH ) {
        const uint8_t raw_opcode = static_cast<uint8_t>( incomplete_header_[12] );
        if ( not Message::valid_opcode( raw_opcode ) ) {
          throw JobError( ErrorKind::ProtocolError,
                          "parse",
                          "unknown opcode " + std::to_string( raw_opcode ) );
        }

        const uint32_t length = Message::expected_payload_length( incomplete_header_ );
        if ( length > Message::MAX_PAYLOAD_LENGTH ) {
          throw JobError( ErrorKind::ProtocolError,
                          "parse",
                          "frame announces " + std::to_string( length )
                            + " payload bytes, limit is "
                            + std::to_string( Message::MAX_PAYLOAD_LENGTH ) );
        }

        expected_payload_length_ = length;
      }
    }

    if ( expected_payload_length_.has_value() ) {
      const auto remaining_length
        = min( buf.length(), *expected_payload_length_ - incomplete_payload_.length() );

      incomplete_payload_.append( buf.substr( 0, remaining_length ) );
      buf.remove_prefix( remaining_length );

      if ( incomplete_payload_.length() == *expected_payload_length_ ) {
        complete_message();
      }
    }
  }

  return consumed_bytes;
}

} // namespace xferd
