#include "wtm/time.hpp"

#include <chrono>

namespace wtm::timeutil {

std::time_t now_epoch() {
  return std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
}

std::string relative_age(std::time_t then, std::time_t now) {
  const long long diff = static_cast<long long>(now) - static_cast<long long>(then);
  if (diff < 60)
    return "just now";
  if (diff < 3600)
    return std::to_string(diff / 60) + "m ago";
  if (diff < 86400)
    return std::to_string(diff / 3600) + "h ago";
  return std::to_string(diff / 86400) + "d ago";
}

} // namespace wtm::timeutil
