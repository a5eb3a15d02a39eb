#pragma once
#include <string_view>

namespace wtm::log {

// Progress line on stdout
void info(std::string_view msg);

// "warning: <msg>" on stderr; never changes the exit status
void warn(std::string_view msg);

} // namespace wtm::log
