#pragma once

#include <memory>
#include <spdlog/spdlog.h>
#include <string>
#include <string_view>

namespace drinkd {

// Configure the global level and pattern. Safe to call more than once;
// the last call wins. Accepts spdlog level names ("trace" .. "off").
void init_logging(std::string_view level = "info");

// Get (or lazily create) a named stderr logger, e.g. get_logger("container").
std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

}  // namespace drinkd
