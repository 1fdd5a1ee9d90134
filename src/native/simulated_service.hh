/* -*-mode:c++; tab-width: 2; indent-tabs-mode: nil; c-basic-offset: 2 -*- */

#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "job/state.hh"
#include "native/transfer_service.hh"

namespace xferd::native {

/* Stand-in for the host transfer service.

   Jobs live in memory, or in a state file shared by every process that opens
   the same `store_path` (each call takes an exclusive flock, reloads the file
   and rewrites it atomically before returning). Progress is made in discrete
   steps: explicitly through advance(), once per get_status() when
   `advance_on_query` is set, or one step per `step_interval` of wall-clock
   time.

   file:// locators are real: sizes are taken from the file system and
   complete() copies the data into place. Any other scheme is simulated with
   a size of `default_file_size` and writes nothing. */
class SimulatedTransferService : public TransferService
{
public:
  struct Options
  {
    std::optional<std::filesystem::path> store_path {};
    uint64_t bytes_per_step { 64 * 1024 };
    uint64_t default_file_size { 256 * 1024 };
    bool advance_on_query { false };
    std::chrono::milliseconds step_interval { 0 };
  };

private:
  struct Job
  {
    std::string id {};
    JobStatus status {};
    int64_t last_step_time { 0 };
  };

  struct StoredCredential
  {
    uint32_t target;
    uint32_t scheme;
    std::string blob;
  };

  Options options_;

  std::mutex mutex_ {};
  std::vector<Job> jobs_ {};
  bool available_ { true };

  /* kept in memory only, never written to the state file */
  std::map<std::string, std::vector<StoredCredential>> credentials_ {};

  using Mutation = std::function<Result( std::vector<Job>& )>;

  /* runs `fn` against the current store (reloaded from and saved to the
     state file when one is configured) */
  Result with_store( const Mutation& fn );

  void load( std::vector<Job>& jobs ) const;
  void save( const std::vector<Job>& jobs ) const;

  Result find( std::vector<Job>& jobs,
               const Principal& principal,
               const std::string& job_id,
               Job*& job );

  void catch_up( Job& job, const int64_t now );
  void step( Job& job, const int64_t now );
  void fail( Job& job,
             const bool fatal,
             const Result code,
             const uint32_t context,
             const std::string& context_description,
             const int64_t now );

  uint64_t measure_size( const std::string& locator ) const;
  Result materialize( const Job& job ) const;

  Result apply( const Principal& principal,
                const std::string& job_id,
                const JobOperation op );

public:
  SimulatedTransferService();
  explicit SimulatedTransferService( const Options& options );

  Result create_job( const Principal& principal,
                     const std::string& display_name,
                     const uint32_t type,
                     std::string& job_id ) override;

  Result add_files(
    const Principal& principal,
    const std::string& job_id,
    const std::vector<std::pair<std::string, std::string>>& files ) override;

  Result start( const Principal& principal, const std::string& job_id ) override;
  Result suspend( const Principal& principal, const std::string& job_id ) override;
  Result resume( const Principal& principal, const std::string& job_id ) override;
  Result cancel( const Principal& principal, const std::string& job_id ) override;
  Result complete( const Principal& principal, const std::string& job_id ) override;

  Result get_status( const Principal& principal,
                     const std::string& job_id,
                     JobStatus& status ) override;

  Result set_credentials( const Principal& principal,
                          const std::string& job_id,
                          const uint32_t target,
                          const uint32_t scheme,
                          const std::string& blob ) override;

  Result set_priority( const Principal& principal,
                       const std::string& job_id,
                       const uint32_t priority ) override;

  Result set_proxy_usage( const Principal& principal,
                          const std::string& job_id,
                          const uint32_t usage ) override;

  Result enum_jobs( const Principal& principal,
                    std::vector<std::string>& job_ids ) override;

  std::string describe( const Result code ) const override;

  /* simulation controls */

  Result advance( const size_t steps = 1 );

  /* Transferring -> TransientError; the next step retries */
  Result inject_transient_failure( const std::string& job_id,
                                   const Result code = E_TRANSIENT_NETWORK );

  /* any non-terminal state -> Error */
  Result inject_fatal_failure( const std::string& job_id,
                               const Result code,
                               const uint32_t context );

  /* overwrite the raw state code, e.g. with one the client does not know */
  Result inject_raw_state( const std::string& job_id, const uint32_t state );

  /* while unavailable every call fails with E_SERVICE_UNAVAILABLE */
  void set_available( const bool available );

  size_t credential_count( const std::string& job_id );
};

} // namespace xferd::native
