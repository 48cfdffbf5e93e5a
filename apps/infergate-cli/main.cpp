/**
 * infergate-cli: run prediction requests against local model artifacts.
 * Build: cmake -B build && cmake --build build
 * Run:   ./build/apps/infergate-cli/infergate_cli [--config path] --request file.json
 * A request file holds one request object or an array of them (run concurrently).
 */

#include <infergate/app/batch_runner.hpp>
#include <infergate/app/config.hpp>
#include <infergate/app/dispatcher.hpp>
#include <infergate/app/logging.hpp>
#include <infergate/app/predict_request.hpp>
#include <infergate/backend/backend_registry.hpp>
#include <json/writer.h>
#include <spdlog/spdlog.h>

#include <exception>
#include <fstream>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

std::string read_request(const std::string& path) {
  if (path == "-") {
    return std::string(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
  }
  std::ifstream f(path, std::ios::binary);
  if (!f) {
    throw std::runtime_error("cannot open request file " + path);
  }
  return std::string(std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>());
}

void print_json(const Json::Value& value) {
  Json::StreamWriterBuilder builder;
  builder["indentation"] = "  ";
  std::cout << Json::writeString(builder, value) << "\n";
}

void print_usage() {
  std::cout << "Usage: infergate_cli [options]\n"
            << "  --config <path>     Service config (key=value file); default: built-in\n"
            << "  --request <path|->  Request JSON (object or array of objects); - reads stdin\n"
            << "  --health            Print the health report\n"
            << "  --log-level <lvl>   trace | debug | info | warn | error | off (overrides config)\n"
            << "  --workers <n>       Batch concurrency; 0 = TBB default (overrides config)\n";
}

}  // namespace

int main(int argc, char* argv[]) {
  std::string config_path;
  std::string request_path;
  std::string log_level_override;
  std::string workers_override;
  bool health = false;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--request" && i + 1 < argc) {
      request_path = argv[++i];
    } else if (arg == "--log-level" && i + 1 < argc) {
      log_level_override = argv[++i];
    } else if (arg == "--workers" && i + 1 < argc) {
      workers_override = argv[++i];
    } else if (arg == "--health") {
      health = true;
    } else if (arg == "--help" || arg == "-h") {
      print_usage();
      return 0;
    } else {
      std::cerr << "Unknown argument " << arg << "\n";
      print_usage();
      return 1;
    }
  }

  try {
    infergate::app::ServiceConfig cfg = config_path.empty()
                                            ? infergate::app::default_config()
                                            : infergate::app::load_config(config_path);
    if (!log_level_override.empty()) cfg.log_level = log_level_override;
    if (!workers_override.empty()) cfg.batch_workers = std::stoi(workers_override);
    infergate::app::init_logging(cfg.log_level);

    auto registry = infergate::backend::make_default_registry(infergate::app::to_load_options(cfg));
    infergate::app::Dispatcher dispatcher(registry, cfg);

    if (health) {
      print_json(dispatcher.health());
      if (request_path.empty()) return 0;
    }
    if (request_path.empty()) {
      print_usage();
      return 1;
    }

    auto parsed = infergate::app::parse_json(read_request(request_path));
    if (!parsed) {
      std::cerr << parsed.error().message << "\n";
      return 1;
    }

    if (parsed->isArray()) {
      std::vector<Json::Value> requests;
      requests.reserve(parsed->size());
      for (const auto& item : *parsed) requests.push_back(item);
      const auto responses =
          infergate::app::run_batch_parallel(dispatcher, requests, cfg.batch_workers);
      Json::Value out(Json::arrayValue);
      for (const auto& r : responses) {
        Json::Value item(Json::objectValue);
        item["status"] = r.status;
        item["body"] = r.body;
        out.append(item);
      }
      print_json(out);
      return 0;
    }

    const auto response = dispatcher.handle(*parsed);
    print_json(response.body);
    std::cerr << "status " << response.status << "\n";
    return response.status == 200 ? 0 : 1;
  } catch (const std::exception& e) {
    std::cerr << "infergate_cli: " << e.what() << "\n";
    return 1;
  }
}
