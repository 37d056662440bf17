#pragma once

#include <csignal>
#include <exception>
#include <string>
#include <string_view>
#include <utility>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

namespace mosaic::common {

/// Log, flush and terminate. Used for failures the node cannot recover from
/// (storage I/O, encoding of in-memory values); never for registry errors.
[[noreturn]] inline void critical(const std::string_view message) {
  spdlog::critical("{}", message);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

template <typename Arg, typename... Args>
[[noreturn]] void critical(fmt::format_string<Arg, Args...> format,
                           Arg&& arg,
                           Args&&... args) {
  auto message = fmt::format(format, std::forward<Arg>(arg),
                             std::forward<Args>(args)...);
  critical(std::string_view{message});
}

}  // namespace mosaic::common
