#pragma once

#include <csignal>
#include <exception>
#include <string_view>

#include <spdlog/spdlog.h>

namespace tessera::common {

/// Log and terminate. Used for failures the node cannot recover from, such as
/// an unreadable database or undecodable bytes the node wrote itself.
[[noreturn]] inline void critical(const std::string_view message) {
  spdlog::critical("{}", message);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

}  // namespace tessera::common
