/* -*-mode:c++; tab-width: 2; indent-tabs-mode: nil; c-basic-offset: 2 -*- */

#include "launcher.hh"

#include <glog/logging.h>

#include <stdexcept>

#include "common/defaults.hh"
#include "util/system_runner.hh"
#include "util/util.hh"

using namespace std;

namespace xferd {

CommandLauncher::CommandLauncher( vector<string>&& command )
  : command_( move( command ) )
{
  if ( command_.empty() ) {
    throw runtime_error( "CommandLauncher: empty command" );
  }
}

void CommandLauncher::request_start()
{
  LOG( INFO ) << "starting agent: " << command_str( command_ );
  spawn_detached( command_ );
}

vector<string> CommandLauncher::default_command( const string& socket_path )
{
  return { safe_getenv_or( "XFERD_AGENT", DEFAULT_AGENT_COMMAND ),
           "--socket",
           socket_path,
           "--idle-timeout",
           "60" };
}

} // namespace xferd
