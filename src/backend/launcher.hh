/* -*-mode:c++; tab-width: 2; indent-tabs-mode: nil; c-basic-offset: 2 -*- */

#pragma once

#include <string>
#include <vector>

namespace xferd {

/* Asks the host to start the agent. Returning only means the request was
   made; the agent becomes reachable some time later, or never. */
class AgentLauncher
{
public:
  virtual ~AgentLauncher() {}
  virtual void request_start() = 0;
};

/* Spawns the agent binary as a detached process. */
class CommandLauncher : public AgentLauncher
{
private:
  std::vector<std::string> command_;

public:
  explicit CommandLauncher( std::vector<std::string>&& command );

  void request_start() override;

  /* $XFERD_AGENT --socket <path> --idle-timeout 60 */
  static std::vector<std::string> default_command( const std::string& socket_path );
};

} // namespace xferd
