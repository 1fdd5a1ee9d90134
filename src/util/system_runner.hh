/* -*-mode:c++; tab-width: 2; indent-tabs-mode: nil; c-basic-offset: 2 -*- */

#pragma once

#include <string>
#include <vector>

/* runs `args` in a new session, detached from the caller (no zombie is left
   behind and the child outlives the caller). returns once the intermediate
   child has been reaped. */
void spawn_detached( const std::vector<std::string>& args,
                     const bool path_search = true );

std::string command_str( const std::vector<std::string>& command );
