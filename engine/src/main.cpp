#include <CLI/CLI.hpp>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>
#include <variant>

#include "drink_service.h"
#include "drivers.h"
#include "errors.h"
#include "logging.h"
#include "resource_container.h"

using json = nlohmann::json;

namespace {

int print_error(const std::string& error, const std::string& detail) {
  json error_response;
  error_response["error"] = error;
  error_response["detail"] = detail;
  std::cout << error_response.dump() << std::endl;
  return 1;
}

// Payload from --payload, or all of stdin when no file is given
std::variant<json, std::string> read_payload(const std::string& path) {
  std::ostringstream buf;
  if (path.empty()) {
    buf << std::cin.rdbuf();
  } else {
    std::ifstream file(path);
    if (!file.is_open()) {
      return "cannot open " + path;
    }
    buf << file.rdbuf();
  }
  auto parsed = json::parse(buf.str(), nullptr, false);
  if (parsed.is_discarded()) {
    return std::string("invalid JSON payload");
  }
  return parsed;
}

bool needs_payload(const std::string& op) {
  return op == "stores" || op == "drinks" || op == "simplified-drinks";
}

}  // namespace

int main(int argc, char* argv[]) {
  CLI::App app{"drinkd - drink and store discovery"};

  std::string config_path;
  std::string op;
  std::string payload_path;
  int64_t limit = 0;
  std::string log_level = "warn";

  app.add_option("--config", config_path,
                 "Resource config JSON (defaults are used when omitted)");
  app.add_option("--op", op, "Operation to run")
      ->required()
      ->check(CLI::IsMember({"stores", "drinks", "simplified-drinks",
                             "drink-tags", "brands", "companies", "health"}));
  app.add_option("--payload", payload_path,
                 "List-store payload JSON file (stdin when omitted)");
  app.add_option("--limit", limit,
                 "Result limit for drinks (default 100; 0 = none)");
  app.add_option("--log-level", log_level, "trace|debug|info|warn|error|off");

  CLI11_PARSE(app, argc, argv);

  drinkd::init_logging(log_level);

  drinkd::DriverConfig config = drinkd::DriverConfig::Defaults();
  if (!config_path.empty()) {
    auto loaded = drinkd::DriverConfig::LoadFromJson(config_path);
    if (std::holds_alternative<std::string>(loaded)) {
      return print_error("Invalid config", std::get<std::string>(loaded));
    }
    config = std::get<drinkd::DriverConfig>(std::move(loaded));
  }

  auto shared = std::make_shared<drinkd::SharedState>();
  drinkd::ResourceContainer container(std::move(config), shared);
  drinkd::register_default_drivers(container);
  drinkd::DrinkService service(container);

  json response;
  try {
    if (op == "health") {
      json status = json::object();
      for (const auto& [name, healthy] :
           drinkd::default_drivers_health(container)) {
        status[name] = healthy;
      }
      response["data"] = status;
    } else if (needs_payload(op)) {
      auto payload = read_payload(payload_path);
      if (std::holds_alternative<std::string>(payload)) {
        return print_error("Invalid payload", std::get<std::string>(payload));
      }
      drinkd::DrinkQuery query;
      try {
        query = drinkd::parse_list_store_payload(std::get<json>(payload));
      } catch (const std::invalid_argument& e) {
        return print_error("Invalid payload", e.what());
      }

      std::optional<int64_t> effective_limit;
      if (app.get_option("--limit")->count() > 0) {
        if (limit > 0) effective_limit = limit;
      } else if (op == "drinks") {
        effective_limit = drinkd::kDefaultDrinkLimit;
      }

      if (op == "stores") {
        query.limit = effective_limit;
        response["data"] = drinkd::to_json_array(service.list_stores(query));
      } else if (op == "drinks") {
        response["data"] =
            drinkd::to_json_array(service.list_drinks(query, effective_limit));
      } else {
        response["data"] = drinkd::to_json_array(
            service.list_simplified_drinks(query, effective_limit));
      }
    } else if (op == "drink-tags") {
      response["data"] = drinkd::to_json_array(service.list_drink_tags());
    } else if (op == "brands") {
      response["data"] = drinkd::to_json_array(service.list_brands());
    } else if (op == "companies") {
      response["data"] = drinkd::to_json_array(service.list_companies());
    }
  } catch (const drinkd::ConfigurationError& e) {
    return print_error("Configuration error", e.what());
  } catch (const std::exception& e) {
    drinkd::get_logger("service")->error("{} failed: {}", op, e.what());
    return print_error("Internal error", e.what());
  }

  container.cleanup_all();
  std::cout << response.dump() << std::endl;
  return 0;
}
