/* -*-mode:c++; tab-width: 2; indent-tabs-mode: nil; c-basic-offset: 2 -*- */

#pragma once

#include <string>

#include "job/types.hh"
#include "messages/protocol.hh"
#include "xferd.pb.h"

namespace protoutil {

template<class ProtobufType>
std::string to_string( const ProtobufType& proto )
{
  return proto.SerializeAsString();
}

template<class ProtobufType>
bool from_string( const std::string& data, ProtobufType& dest )
{
  return dest.ParseFromString( data );
}

} // namespace protoutil

namespace xferd {

protobuf::FileSpec to_protobuf( const FileSpec& spec );
protobuf::Credential to_protobuf( const Credential& credential );
protobuf::JobSnapshot to_protobuf( const JobSnapshot& snapshot );
protobuf::Error to_protobuf( const RemoteError& error );
protobuf::Request to_protobuf( const Request& request );
protobuf::Response to_protobuf( const Response& response );

/* throw JobError( ProtocolError ) on out-of-range values */
FileSpec from_protobuf( const protobuf::FileSpec& proto );
Credential from_protobuf( const protobuf::Credential& proto );
JobSnapshot from_protobuf( const protobuf::JobSnapshot& proto );
RemoteError from_protobuf( const protobuf::Error& proto );
Request from_protobuf( const protobuf::Request& proto );
Response from_protobuf( const protobuf::Response& proto );

} // namespace xferd
