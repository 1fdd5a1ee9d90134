/* -*-mode:c++; tab-width: 2; indent-tabs-mode: nil; c-basic-offset: 2 -*- */

#pragma once

#include <cstdint>
#include <optional>
#include <queue>
#include <string>
#include <string_view>

#include "util/util.hh"

namespace xferd {

/* One frame on the agent channel:
     [ correlation id : u64 ][ payload length : u32 ][ opcode : u8 ][ payload ]
   all integers big endian. */
class Message
{
public:
  enum class OpCode : uint8_t
  {
    Hey = 0x1,
    Request,
    Response,
    Bye,

    COUNT
  };

  static constexpr char const* OPCODE_NAMES[to_underlying( OpCode::COUNT )]
    = { "", "Hey", "Request", "Response", "Bye" };

  constexpr static size_t HEADER_LENGTH = 13;
  constexpr static size_t MAX_PAYLOAD_LENGTH = 64 * 1024;

private:
  uint64_t correlation_id_ { 0 };
  uint32_t payload_length_ { 0 };
  OpCode opcode_ { OpCode::Hey };
  std::string payload_ {};

public:
  Message( const std::string_view header, std::string&& payload );

  Message( const uint64_t correlation_id,
           const OpCode opcode,
           std::string&& payload );

  uint64_t correlation_id() const { return correlation_id_; }
  uint32_t payload_length() const { return payload_length_; }
  OpCode opcode() const { return opcode_; }
  const std::string& payload() const { return payload_; }

  std::string serialize_header() const;

  size_t total_length() const { return HEADER_LENGTH + payload_length(); }
  static uint32_t expected_payload_length( const std::string_view header );

  static bool valid_opcode( const uint8_t raw );
};

const char* to_string( const Message::OpCode opcode );

/* Reassembles frames from arbitrarily split reads. Throws a ProtocolError
   JobError on an unknown opcode or an oversized payload; the parser is not
   usable afterwards. */
class MessageParser
{
private:
  std::optional<size_t> expected_payload_length_ { std::nullopt };

  std::string incomplete_header_ {};
  std::string incomplete_payload_ {};

  std::queue<Message> completed_messages_ {};

  void complete_message();

public:
  size_t parse( std::string_view buf );

  bool empty() const { return completed_messages_.empty(); }
  Message& front() { return completed_messages_.front(); }
  void pop() { completed_messages_.pop(); }

  size_t size() const { return completed_messages_.size(); }

  /* true if bytes of an unfinished frame are buffered */
  bool mid_message() const
  {
    return not incomplete_header_.empty() or expected_payload_length_.has_value();
  }
};

} // namespace xferd
