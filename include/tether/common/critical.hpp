#pragma once

#include <csignal>
#include <exception>
#include <utility>

#include <spdlog/spdlog.h>

namespace tether::common {

/// Log and terminate. Reserved for storage failures the process cannot
/// continue past; recoverable errors are thrown as tether::common::error.
template <typename... Args>
[[noreturn]] void critical(spdlog::format_string_t<Args...> format,
                           Args&&... args) {
  spdlog::critical(format, std::forward<Args>(args)...);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

}  // namespace tether::common
