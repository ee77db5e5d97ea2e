// File: src/apps/fsink_log/fsink_log_app.cpp
#include "fsink_log_app.hpp"

#include <cstddef>
#include <istream>
#include <ostream>
#include <string>

#include "fsink/core/dispatch/level.hpp"
#include "fsink/core/dispatch/log_output.hpp"
#include "fsink/core/mode_resolver.hpp"
#include "fsink/core/util/config_loader.hpp"

namespace fsink::app {
namespace {

struct Args {
  std::string config_path;
  std::string level;
  bool help{false};
};

Args parse_args(const std::vector<std::string>& argv) {
  Args a;
  for (std::size_t i = 0; i < argv.size(); ++i) {
    const std::string& s = argv[i];
    if (s == "--help" || s == "-h") {
      a.help = true;
      return a;
    }
    if (s == "--config" && i + 1 < argv.size()) {
      a.config_path = argv[++i];
      continue;
    }
    if (s == "--level" && i + 1 < argv.size()) {
      a.level = argv[++i];
      continue;
    }
    a.help = true;
    return a;
  }
  return a;
}

void print_usage(std::ostream& out) {
  out << "fsink_log: append stdin lines to a configured log file\n"
      << "  --config <path>\n"
      << "  --level <debug|info|notice|warning|error|critical|alert|emergency>\n";
}

}  // namespace

int run_fsink_log(const std::vector<std::string>& argv, std::istream& in, std::ostream& out,
                  std::ostream& err) {
  const Args args = parse_args(argv);
  if (args.help || args.config_path.empty()) {
    print_usage(out);
    return args.help ? 0 : 2;
  }

  auto cfg_r = load_config(args.config_path);
  if (!cfg_r.ok()) {
    err << cfg_r.status().message() << "\n";
    return 1;
  }
  AppConfig cfg = cfg_r.take_value();

  Level level = cfg.default_level;
  if (!args.level.empty()) {
    auto l = parse_level(args.level);
    if (!l.ok()) {
      err << l.status().message() << "\n";
      return 2;
    }
    level = *l;
  }

  const SinkConfig sink_cfg = cfg.output.sink;
  auto out_r = make_file_output(cfg.output);
  if (!out_r.ok()) {
    err << out_r.status().message() << "\n";
    return 2;
  }
  LogOutput output = out_r.take_value();

  // Ensure we always close cleanly.
  struct Guard {
    LogOutput& o;
    ~Guard() { o.close(); }
  } guard{output};

  out << "Output: " << output.name() << " -> " << sink_cfg.filename << " ("
      << to_string(resolve_open_mode(sink_cfg.close_after_write, sink_cfg.mode))
      << (sink_cfg.close_after_write ? ", close_after_write" : "") << ")\n";

  std::string line;
  std::size_t accepted = 0;
  while (std::getline(in, line)) {
    const Status st = output.log(level, line + "\n");
    if (!st.ok()) {
      err << st.message() << "\n";
      return 2;
    }
    if (output.would_log(level)) ++accepted;
  }

  const Status st_flush = output.flush();
  if (!st_flush.ok()) {
    err << st_flush.message() << "\n";
    return 2;
  }

  out << "OK lines=" << accepted << " level=" << to_string(level) << "\n";
  return 0;
}

}  // namespace fsink::app
