#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace uuid {

std::string generate();

/* lowercase canonical form if `text` parses as a UUID */
std::optional<std::string> canonicalize( const std::string_view text );

} // namespace uuid
