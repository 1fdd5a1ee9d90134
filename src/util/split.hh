/* -*-mode:c++; tab-width: 2; indent-tabs-mode: nil; c-basic-offset: 2 -*- */

#pragma once

#include <string>
#include <vector>

std::vector<std::string> split( const std::string& str,
                                const std::string& separator );
