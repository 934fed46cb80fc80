#pragma once

#include <csignal>
#include <exception>
#include <string>
#include <string_view>
#include <utility>

#include <spdlog/spdlog.h>

namespace reliquary::common {

/// Log and terminate on an unrecoverable infrastructure fault.
[[noreturn]] inline void critical(const std::string_view message) {
  spdlog::critical("{}", message);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

/// Formatted variant, e.g. `critical("failed to open {}: {}", path, why)`.
template <typename Arg, typename... Args>
[[noreturn]] void critical(spdlog::format_string_t<Arg, Args...> format,
                           Arg&& arg,
                           Args&&... args) {
  auto message = fmt::format(format, std::forward<Arg>(arg),
                             std::forward<Args>(args)...);
  critical(std::string_view{message});
}

}  // namespace reliquary::common
