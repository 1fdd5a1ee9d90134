/* -*-mode:c++; tab-width: 2; indent-tabs-mode: nil; c-basic-offset: 2 -*- */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>

/* scheme://[user[:password]@]host[:port][/path][?key=value&...]
   `path` keeps its leading slash, so "agent:///run/x.sock" has an empty host
   and path "/run/x.sock". */
struct ParsedURI
{
  std::string protocol {};
  std::string username {};
  std::string password {};
  std::string host {};
  std::optional<uint16_t> port {};
  std::string path {};
  std::unordered_map<std::string, std::string> options {};

  ParsedURI( const std::string& uri );
};
