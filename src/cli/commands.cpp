#include "opgate/cli/commands.hpp"

#include "opgate/cli/bridge.hpp"
#include "opgate/common/fs.hpp"
#include "opgate/config/config.hpp"
#include "opgate/observability/factory.hpp"
#include "opgate/observability/global.hpp"
#include "opgate/operation/allowlist_store.hpp"
#include "opgate/operation/handler.hpp"

#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace opgate::cli {

namespace {

std::string version_string() {
#ifdef OPGATE_VERSION
  return std::string("opgate ") + OPGATE_VERSION;
#else
  return "opgate 0.1.0";
#endif
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(args[i + 1]);
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(value);
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

struct Session {
  config::Config config;
  std::shared_ptr<operation::IAllowlistStore> store;
};

common::Result<Session> open_session() {
  auto cfg = config::load_config();
  if (!cfg.ok()) {
    return common::Result<Session>::failure(cfg);
  }
  auto store = operation::create_allowlist_store(cfg.value().allowlist);
  if (!store.ok()) {
    return common::Result<Session>::failure(store);
  }

  Session session{.config = cfg.value(), .store = store.value()};
  const auto blob = session.store->load(session.config.allowlist.key);
  if (blob.ok()) {
    config::apply_store_settings(session.config, blob.value());
  }

  auto validated = config::validate_config(session.config);
  if (!validated.ok()) {
    return common::Result<Session>::failure(validated);
  }

  observability::set_global_observer(observability::create_observer(session.config));
  if (!blob.ok()) {
    observability::record_warning("cli", "allow-list store unavailable: " + blob.error());
  }
  for (const auto &warning : validated.value()) {
    observability::record_warning("config", warning);
  }
  return common::Result<Session>::success(std::move(session));
}

void print_help() {
  std::cout << "Usage: opgate [--config PATH] <command>\n\n";
  std::cout << "Commands:\n";
  std::cout << "  serve                  Run the JSON-lines tool bridge on stdin/stdout (default)\n";
  std::cout << "  allowlist list         Show auto-approved directories\n";
  std::cout << "  allowlist add <dir>    Auto-approve writes under a directory\n";
  std::cout << "  config [path]          Print the effective configuration or its location\n";
  std::cout << "  tools                  Print tool schemas as JSON\n";
  std::cout << "  version                Show version\n";
}

int run_serve() {
  auto session = open_session();
  if (!session.ok()) {
    std::cerr << session.error() << "\n";
    return 1;
  }
  auto handler = operation::OperationHandler::create(session.value().config, session.value().store);
  StdioBridge bridge(handler, std::cout);
  bridge.run(std::cin);
  return 0;
}

int run_allowlist(std::vector<std::string> args) {
  auto session = open_session();
  if (!session.ok()) {
    std::cerr << session.error() << "\n";
    return 1;
  }
  auto handler = operation::OperationHandler::create(session.value().config, session.value().store);

  if (args.empty() || args[0] == "list") {
    for (const auto &dir : handler->permissions()->load_allowlist()) {
      std::cout << dir << "\n";
    }
    return 0;
  }

  if (args[0] == "add") {
    if (args.size() < 2) {
      std::cerr << "usage: opgate allowlist add <directory>\n";
      return 1;
    }
    std::error_code ec;
    const auto absolute = std::filesystem::absolute(common::expand_path(args[1]), ec);
    if (ec) {
      std::cerr << "cannot resolve " << args[1] << ": " << ec.message() << "\n";
      return 1;
    }
    const auto status =
        handler->permissions()->add_allowed_directory(absolute.lexically_normal().string());
    if (!status.ok()) {
      std::cerr << status.error() << "\n";
      return 1;
    }
    std::cout << "Added " << absolute.lexically_normal().string() << "\n";
    return 0;
  }

  std::cerr << "unknown allowlist command: " << args[0] << "\n";
  return 1;
}

int run_config(std::vector<std::string> args) {
  if (!args.empty() && args[0] == "path") {
    auto path_result = config::config_path();
    if (!path_result.ok()) {
      std::cerr << path_result.error() << "\n";
      return 1;
    }
    std::cout << path_result.value().string() << "\n";
    return 0;
  }

  auto session = open_session();
  if (!session.ok()) {
    std::cerr << session.error() << "\n";
    return 1;
  }
  std::cout << config::render_config(session.value().config);
  return 0;
}

int run_tools() {
  auto session = open_session();
  if (!session.ok()) {
    std::cerr << session.error() << "\n";
    return 1;
  }
  auto handler = operation::OperationHandler::create(session.value().config, session.value().store);
  const auto registry = tools::ToolRegistry::create_operation(handler);
  std::cout << tools::specs_to_json(registry.all_specs()) << "\n";
  return 0;
}

} // namespace

int run_cli(int argc, char **argv) {
  std::vector<std::string> args = collect_args(argc > 0 ? argc - 1 : 0, argv + (argc > 0 ? 1 : 0));
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    std::cerr << global_error << "\n";
    return 1;
  }

  if (args.empty()) {
    return run_serve();
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return 0;
  }
  if (subcommand == "serve") {
    return run_serve();
  }
  if (subcommand == "allowlist") {
    return run_allowlist(std::move(args));
  }
  if (subcommand == "config") {
    return run_config(std::move(args));
  }
  if (subcommand == "tools") {
    return run_tools();
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_help();
  return 1;
}

} // namespace opgate::cli
