/* -*-mode:c++; tab-width: 2; indent-tabs-mode: nil; c-basic-offset: 2 -*- */

#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>

#include "job/error.hh"
#include "job/types.hh"
#include "native/transfer_service.hh"

/* Translation between the native service's opaque codes and the public job
   model. Nothing here fails: unrecognized inputs map to the Unknown
   variants. */

namespace xferd {

JobState state_from_native( const uint32_t code );
uint32_t state_to_native( const JobState state );

ErrorContext context_from_native( const uint32_t code );
ErrorKind kind_from_native( const native::Result code );

std::optional<Direction> direction_from_native( const uint32_t type );
uint32_t direction_to_native( const Direction direction );

JobPriority priority_from_native( const uint32_t priority );
uint32_t priority_to_native( const JobPriority priority );

ProxyUsage proxy_usage_from_native( const uint32_t usage );
uint32_t proxy_usage_to_native( const ProxyUsage usage );

uint32_t target_to_native( const CredentialTarget target );
uint32_t scheme_to_native( const CredentialScheme scheme );

using DescribeFunction = std::function<std::string( const native::Result )>;

/* A status whose id does not parse, or whose type or state is unrecognized,
   yields a snapshot in the Unknown state. An error state without error
   details gets a synthesized ErrorInfo; error details outside an error state
   are dropped. */
JobSnapshot snapshot_from_native( const std::string_view native_id,
                                  const native::JobStatus& status,
                                  const DescribeFunction& describe );

} // namespace xferd
