/* -*-mode:c++; tab-width: 2; indent-tabs-mode: nil; c-basic-offset: 2 -*- */

#include "system_runner.hh"

#include <cstdlib>
#include <fcntl.h>
#include <stdexcept>
#include <sys/wait.h>
#include <unistd.h>

#include "exception.hh"

using namespace std;

namespace {

/* NUL-terminated copies of `args`, prepared before forking */
class ArgumentVector
{
private:
  vector<vector<char>> storage_ {};
  vector<char*> argv_ {};

public:
  explicit ArgumentVector( const vector<string>& args )
  {
    storage_.reserve( args.size() );
    for ( const auto& arg : args ) {
      storage_.emplace_back( arg.begin(), arg.end() );
      storage_.back().push_back( '\0' );
      argv_.push_back( storage_.back().data() );
    }

    argv_.push_back( nullptr );
  }

  char* const* data() const { return argv_.data(); }
};

}

void spawn_detached( const vector<string>& args, const bool path_search )
{
  if ( args.empty() ) {
    throw runtime_error( "spawn_detached: empty args" );
  }

  const ArgumentVector argv { args };
  const pid_t intermediate = CheckSystemCall( "fork", fork() );

  if ( intermediate == 0 ) {
    /* only async-signal-safe calls from here on */
    setsid();

    if ( fork() != 0 ) {
      _exit( EXIT_SUCCESS );
    }

    const int devnull = open( "/dev/null", O_RDWR );
    if ( devnull >= 0 ) {
      dup2( devnull, STDIN_FILENO );
      dup2( devnull, STDOUT_FILENO );
      close( devnull );
    }

    if ( path_search ) {
      execvp( argv.data()[0], argv.data() );
    } else {
      execv( argv.data()[0], argv.data() );
    }

    _exit( 127 );
  }

  int status;
  while ( waitpid( intermediate, &status, 0 ) < 0 ) {
    if ( errno != EINTR ) {
      throw unix_error( "waitpid" );
    }
  }

  if ( not WIFEXITED( status ) or WEXITSTATUS( status ) != EXIT_SUCCESS ) {
    throw runtime_error( "spawn_detached: intermediate process failed: "
                         + command_str( args ) );
  }
}

string command_str( const vector<string>& command )
{
  string ret;

  for ( const auto& c : command ) {
    if ( not ret.empty() ) {
      ret += ' ';
    }
    ret += c;
  }

  return ret;
}
