/* -*-mode:c++; tab-width: 2; indent-tabs-mode: nil; c-basic-offset: 2 -*- */

#pragma once

#include <memory>
#include <optional>
#include <string_view>

#include "backend/backend.hh"
#include "native/transfer_service.hh"

namespace xferd {

/* Calls the native transfer service directly, as `principal`. Holds no
   per-job state, so one instance may serve any number of callers. */
class LocalBackend : public Backend
{
private:
  std::shared_ptr<native::TransferService> service_;
  native::Principal principal_;

  /* throws the JobError matching a failed native result */
  void check( const native::Result result,
              const std::string_view operation,
              const std::optional<JobId>& job_id = std::nullopt ) const;

  native::JobStatus native_status( const JobId& id, const std::string_view operation );

public:
  LocalBackend( std::shared_ptr<native::TransferService> service,
                const native::Principal& principal );

  /* the identity of this process; root is privileged */
  static native::Principal current_principal();

  /* handle for a job id received from elsewhere; existence is not checked */
  JobHandle attach( const JobId& id ) const { return make_handle( id ); }

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
};

} // namespace xferd
