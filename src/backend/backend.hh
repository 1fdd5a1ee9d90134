/* -*-mode:c++; tab-width: 2; indent-tabs-mode: nil; c-basic-offset: 2 -*- */

#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "job/error.hh"
#include "job/types.hh"

namespace xferd {

class Backend;

/* Names a job through the backend that produced it. It does not own the job:
   destroying a handle leaves the job untouched. */
class JobHandle
{
private:
  JobId id_;
  const Backend* owner_;

public:
  JobHandle( const JobId& id, const Backend& owner )
    : id_( id )
    , owner_( &owner )
  {}

  const JobId& id() const { return id_; }
  const Backend* owner() const { return owner_; }
};

/* Job-control operations, executed either directly against the native
   transfer service or through the agent. Every operation is synchronous and
   reports failure by throwing JobError. */
class Backend
{
protected:
  /* throws InvalidArgument if `handle` came from another backend */
  const JobId& check_handle( const JobHandle& handle,
                             const std::string_view operation ) const;

  JobHandle make_handle( const JobId& id ) const { return { id, *this }; }

public:
  virtual ~Backend() {}

  virtual JobHandle create_job( const std::string& display_name,
                                const Direction direction )
    = 0;

  void add_file( const JobHandle& handle,
                 const std::string& source,
                 const std::string& destination );

  /* all files are added or none are */
  virtual void add_files( const JobHandle& handle,
                          const std::vector<FileSpec>& files )
    = 0;

  virtual void start( const JobHandle& handle ) = 0;
  virtual void suspend( const JobHandle& handle ) = 0;
  virtual void resume( const JobHandle& handle ) = 0;
  virtual void cancel( const JobHandle& handle ) = 0;
  virtual void complete( const JobHandle& handle ) = 0;

  virtual JobSnapshot get_status( const JobHandle& handle ) = 0;

  virtual void set_credentials( const JobHandle& handle,
                                const Credential& credential )
    = 0;

  virtual void set_priority( const JobHandle& handle,
                             const JobPriority priority )
    = 0;

  virtual void set_proxy_usage( const JobHandle& handle,
                                const ProxyUsage usage )
    = 0;

  /* re-attach to a job created earlier (possibly by another process) */
  virtual JobHandle open_job( const JobId& id ) = 0;

  virtual std::vector<JobHandle> list_jobs() = 0;

  /* local://[/store/path][?step_ms=N&bytes_per_step=N]
     agent:///socket/path[?deadline_ms=N&attempts=N&initial_delay_ms=N&max_delay_ms=N&request_timeout_ms=N&agent=PATH] */
  static std::unique_ptr<Backend> create_backend( const std::string& uri );
};

} // namespace xferd
