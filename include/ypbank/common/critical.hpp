#pragma once

#include <exception>
#include <string_view>
#include <utility>

#include <spdlog/spdlog.h>

namespace ypbank::common {

// Logs and terminates. Reserved for states the wire formats cannot represent
// at all; malformed input is reported through codec::app_error instead.
[[noreturn]] inline void critical(const std::string_view message) {
  spdlog::critical("{}", message);
  spdlog::shutdown();
  std::terminate();
}

template <typename... Args>
[[noreturn]] void critical(spdlog::format_string_t<Args...> format,
                           Args&&... args) {
  spdlog::critical(format, std::forward<Args>(args)...);
  spdlog::shutdown();
  std::terminate();
}

}  // namespace ypbank::common
