#pragma once
#include <ctime>
#include <string>

namespace wtm::timeutil {

// Seconds since the epoch, as stored in the recent-access file
auto now_epoch() -> std::time_t;

// Human age of `then` relative to `now`: "just now", "5m ago", "3h ago", "2d ago"
auto relative_age(std::time_t then, std::time_t now) -> std::string;

} // namespace wtm::timeutil
