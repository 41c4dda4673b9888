#include <chrono>
#include <fstream>
#include <iostream>
#include <string>

#include "lindos/c_api.h"
#include "lindos/client.hpp"
#include "lindos/config.hpp"
#include "lindos/dispatcher.hpp"
#include "lindos/engine.hpp"
#include "lindos/interaction_loop.hpp"
#include "lindos/jsonlite.hpp"
#include "lindos/types.hpp"
#include "lindos/version.hpp"
#include "lindos/worker_pool.hpp"

namespace {

// Upper bound on one engine round trip before the CLI gives up waiting.
constexpr std::chrono::milliseconds kReplyWait{30000};

bool read_file(const std::string& path, std::string* out) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) return false;
  out->assign((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
  return true;
}

void print_usage() {
  std::cerr << "usage: lindos_chat [--debug] [--suspend] [--config <json-file>]\n"
               "                   [--validate <text>] [--stats] [--version]\n"
               "\n"
               "Reads one message per line from stdin. Commands:\n"
               "  /reset        back to the prompt\n"
               "  /debug on|off toggle diagnostic logging\n";
}

void print_state(const lindos::InteractionState& s) {
  switch (s.phase) {
    case lindos::Phase::settled:
      std::cout << s.reply << "\n";
      break;
    case lindos::Phase::error_shown:
      if (!s.reply.empty()) std::cout << s.reply << "\n";
      std::cerr << s.error_message << "\n";
      break;
    case lindos::Phase::idle:
      std::cout << s.prompt << "\n";
      break;
    default:
      break;
  }
}

int run_validate(const std::string& text) {
  const int32_t code = lindos_validate_message(text.c_str());
  const lindos::ErrorKind kind = lindos::error_kind_from_code(code);
  std::cout << "{\"code\":" << code
            << ",\"kind\":\"" << lindos::to_string(kind) << "\""
            << ",\"message\":\"" << lindos::jsonlite::escape(lindos::user_message(kind)) << "\"}"
            << "\n";
  return code == 0 ? 0 : 2;
}

int apply_config_file(const std::string& path) {
  std::string json;
  if (!read_file(path, &json)) {
    std::cerr << "lindos_chat: cannot read config " << path << "\n";
    return 2;
  }
  const auto check = lindos::validate_config(json);
  for (const auto& w : check.warnings) std::cerr << "lindos_chat: warning: " << w << "\n";
  if (!check.ok) {
    for (const auto& e : check.errors) std::cerr << "lindos_chat: config error: " << e << "\n";
    return 2;
  }
  if (lindos_configure(json.c_str()) != LINDOS_CONFIG_OK) {
    std::cerr << "lindos_chat: config rejected\n";
    return 2;
  }
  return 0;
}

}  // namespace

int main(int argc, char** argv) {
  if (lindos_abi_version() != LINDOS_ABI_VERSION) {
    std::cerr << "lindos_chat: engine ABI " << lindos_abi_version()
              << " != header ABI " << LINDOS_ABI_VERSION << "\n";
    return 1;
  }

  bool debug = false;
  bool stats = false;
  lindos::DispatcherConfig dcfg;
  std::string config_path;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--debug") {
      debug = true;
    } else if (arg == "--suspend") {
      dcfg.mode = lindos::CallMode::suspend;
    } else if (arg == "--stats") {
      stats = true;
    } else if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--validate" && i + 1 < argc) {
      return run_validate(argv[++i]);
    } else if (arg == "--version") {
      std::cout << lindos::version::manifest_to_json(lindos::version::current_manifest()) << "\n";
      return 0;
    } else if (arg == "--help" || arg == "-h") {
      print_usage();
      return 0;
    } else {
      std::cerr << "lindos_chat: unknown argument " << arg << "\n";
      print_usage();
      return 2;
    }
  }

  if (!config_path.empty()) {
    const int rc = apply_config_file(config_path);
    if (rc != 0) return rc;
  }
  if (debug) lindos_set_debug(true);

  lindos::Client client;
  lindos::InteractionLoop loop;
  lindos::WorkerPool pool(lindos::current_config().worker_threads);
  int rc = 0;
  {
    lindos::CallDispatcher dispatcher(loop, client, pool, dcfg);
    std::cout << dispatcher.state().prompt << "\n";

    std::string line;
    while (std::getline(std::cin, line)) {
      if (line == "/reset") {
        dispatcher.reset();
        print_state(dispatcher.state());
        continue;
      }
      if (line == "/debug on" || line == "/debug off") {
        client.set_debug(line == "/debug on");
        continue;
      }

      if (!dispatcher.submit(line)) {
        std::cerr << "lindos_chat: busy\n";
        continue;
      }
      const bool done = loop.pump_until([&] { return dispatcher.can_send(); }, kReplyWait);
      if (!done) {
        std::cerr << "lindos_chat: no reply within " << kReplyWait.count() << " ms\n";
        rc = 1;
        break;
      }
      print_state(dispatcher.state());
    }
  }
  // Drain the pool before the loop it posts to goes away.
  pool.shutdown();

  if (stats) {
    lindos::ScopedString s(lindos_stats());
    if (s) std::cout << s.get() << "\n";
  }
  return rc;
}
