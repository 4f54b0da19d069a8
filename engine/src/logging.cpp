#include "logging.h"

#include <mutex>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace drinkd {

namespace {

std::mutex& logger_mutex() {
  static std::mutex m;
  return m;
}

}  // namespace

void init_logging(std::string_view level) {
  spdlog::set_level(spdlog::level::from_str(std::string(level)));
  spdlog::set_pattern("%Y-%m-%d %H:%M:%S.%e [%n] [%^%l%$] %v");
}

std::shared_ptr<spdlog::logger> get_logger(const std::string& name) {
  // spdlog::get + create is not atomic; two threads may race on first use
  std::lock_guard<std::mutex> lock(logger_mutex());
  if (auto existing = spdlog::get(name)) {
    return existing;
  }
  return spdlog::stderr_color_mt(name);
}

}  // namespace drinkd
