/* -*-mode:c++; tab-width: 2; indent-tabs-mode: nil; c-basic-offset: 2 -*- */

#pragma once

#include <atomic>
#include <chrono>
#include <list>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <sys/types.h>
#include <thread>

#include "backend/local.hh"
#include "messages/protocol.hh"
#include "net/channel.hh"
#include "util/ipc_socket.hh"

namespace xferd {

struct AgentConfiguration
{
  std::string socket_path {};

  /* callers allowed to connect, by kernel-reported uid; empty admits only the
     agent's own uid */
  std::set<uid_t> allowed_uids {};

  /* exit after this long without any connection; zero runs until stop() */
  std::chrono::milliseconds idle_timeout { 0 };

  /* granularity at which run() notices stop() and the idle timeout */
  std::chrono::milliseconds poll_interval { 100 };
};

/* Serves the agent protocol on a unix socket. Every request runs against the
   native service as the connected caller, identified by the kernel-reported
   peer uid; only root is privileged. Each connection gets its own worker
   thread; workers share only the service. The server keeps no job state
   between requests. */
class AgentServer
{
private:
  struct Connection
  {
    uint64_t id;
    std::thread worker {};
    IPCSocket socket;
    std::atomic<bool> done { false };

    Connection( const uint64_t id_, IPCSocket&& socket_ )
      : id( id_ )
      , socket( std::move( socket_ ) )
    {}
  };

  AgentConfiguration config_;
  std::shared_ptr<native::TransferService> service_;

  IPCSocket listener_ {};
  std::atomic<bool> running_ { false };

  std::mutex connections_mutex_ {};
  std::list<Connection> connections_ {};
  uint64_t next_connection_id_ { 0 };

  void accept_connection();
  size_t reap_connections();
  void shutdown_connections();

  void serve( Connection& connection );

public:
  AgentServer( const AgentConfiguration& config,
               std::shared_ptr<native::TransferService> service );
  ~AgentServer();

  /* blocks until stop() is called or the idle timeout expires */
  void run();

  /* callable from any thread, including signal-driven ones */
  void stop() { running_ = false; }

  bool authorized( const PeerCredentials& peer ) const;

  /* the principal requests from `peer` run as */
  static native::Principal caller_principal( const PeerCredentials& peer );

  /* executes one decoded request as `caller`; failures become error
     responses */
  Response dispatch( const native::Principal& caller, const Request& request );

  AgentServer( const AgentServer& ) = delete;
  AgentServer& operator=( const AgentServer& ) = delete;
};

} // namespace xferd
