#include "wtm/log.hpp"

#include <iostream>

namespace wtm::log {

void info(std::string_view msg) { std::cout << msg << "\n"; }

void warn(std::string_view msg) { std::cerr << "warning: " << msg << "\n"; }

} // namespace wtm::log
