/* -*-mode:c++; tab-width: 2; indent-tabs-mode: nil; c-basic-offset: 2 -*- */

#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "backend/backend.hh"
#include "backend/launcher.hh"
#include "backend/local.hh"
#include "backend/remote.hh"
#include "client/monitor.hh"
#include "native/transfer_service.hh"

namespace xferd {

/* Entry point for applications. The backend is chosen once, at
   construction; after that both kinds behave identically. */
class Client
{
private:
  std::shared_ptr<Backend> backend_;

public:
  explicit Client( std::unique_ptr<Backend>&& backend );

  /* talk to `service` directly, acting as `principal` */
  static Client in_process( std::shared_ptr<native::TransferService> service,
                            const native::Principal& principal
                            = LocalBackend::current_principal() );

  /* the simulated service, persisted at $XFERD_STORE */
  static Client in_process();

  /* talk to the agent at `options.socket_path`, starting it if needed */
  static Client remote( const RemoteOptions& options,
                        std::shared_ptr<AgentLauncher> launcher = nullptr );

  /* see Backend::create_backend() */
  static Client from_uri( const std::string& uri );

  JobHandle create_job( const std::string& display_name,
                        const Direction direction = Direction::Download );

  void add_file( const JobHandle& handle,
                 const std::string& source,
                 const std::string& destination );

  void add_files( const JobHandle& handle, const std::vector<FileSpec>& files );

  void start( const JobHandle& handle );
  void suspend( const JobHandle& handle );
  void resume( const JobHandle& handle );
  void cancel( const JobHandle& handle );
  void complete( const JobHandle& handle );

  JobSnapshot get_status( const JobHandle& handle );

  JobMonitor monitor( const JobHandle& handle,
                      const std::chrono::milliseconds interval
                      = std::chrono::milliseconds { 1000 } );

  JobMonitor monitor( const JobHandle& handle, const MonitorOptions& options );

  void set_credentials( const JobHandle& handle, const Credential& credential );
  void set_priority( const JobHandle& handle, const JobPriority priority );
  void set_proxy_usage( const JobHandle& handle, const ProxyUsage usage );

  JobHandle open_job( const JobId& id );
  std::vector<JobHandle> list_jobs();

  Backend& backend() { return *backend_; }
};

} // namespace xferd
