/* -*-mode:c++; tab-width: 2; indent-tabs-mode: nil; c-basic-offset: 2 -*- */

#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

#include "backend/backend.hh"
#include "backend/launcher.hh"
#include "messages/protocol.hh"
#include "net/channel.hh"
#include "util/backoff.hh"

namespace xferd {

struct RemoteOptions
{
  std::string socket_path {};

  /* budget for reaching an agent that is not listening yet */
  BackoffPolicy bootstrap {};

  /* bound on each request/response round trip */
  std::chrono::milliseconds request_timeout { 30'000 };
};

/* Forwards every operation to the agent over a single connection, opened on
   first use. Concurrent callers are serialized: one request is in flight at a
   time. If the agent is not reachable the launcher is asked to start it once
   and connection attempts are retried under `bootstrap`. A connection lost in
   the middle of a call is reopened once; the request is sent again only if
   it never fully left this process or cannot change the job store. */
class RemoteBackend : public Backend
{
private:
  RemoteOptions options_;
  std::shared_ptr<AgentLauncher> launcher_;

  std::mutex mutex_ {};
  std::unique_ptr<Channel> channel_ {};
  uint64_t next_correlation_id_ { 1 };

  std::unique_ptr<Channel> open_channel();
  void bootstrap( const std::string_view operation );
  Response round_trip( const Message& request, const uint64_t correlation_id, bool& sent );

  Response call( Request&& request );
  Request make_request( const Operation operation, const JobHandle& handle ) const;

public:
  RemoteBackend( const RemoteOptions& options,
                 std::shared_ptr<AgentLauncher> launcher = nullptr );
  ~RemoteBackend();

  JobHandle create_job( const std::string& display_name,
                        const Direction direction ) override;

  void add_files( const JobHandle& handle,
                  const std::vector<FileSpec>& files ) override;

  void start( const JobHandle& handle ) override;
  void suspend( const JobHandle& handle ) override;
  void resume( const JobHandle& handle ) override;
  void cancel( const JobHandle& handle ) override;
  void complete( const JobHandle& handle ) override;

  JobSnapshot get_status( const JobHandle& handle ) override;

  void set_credentials( const JobHandle& handle,
                        const Credential& credential ) override;

  void set_priority( const JobHandle& handle,
                     const JobPriority priority ) override;

  void set_proxy_usage( const JobHandle& handle,
                        const ProxyUsage usage ) override;

  JobHandle open_job( const JobId& id ) override;

  std::vector<JobHandle> list_jobs() override;

  bool connected();
};

} // namespace xferd
