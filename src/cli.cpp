#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <string>
#include <vector>

#include "scratchpad/boundary.hpp"
#include "scratchpad/config.hpp"
#include "scratchpad/engine.hpp"
#include "scratchpad/executor.hpp"
#include "scratchpad/hash.hpp"
#include "scratchpad/jsonlite.hpp"
#include "scratchpad/observability.hpp"
#include "scratchpad/preprocessor.hpp"
#include "scratchpad/references.hpp"
#include "scratchpad/sandbox.hpp"
#include "scratchpad/version.hpp"

#ifndef PROJECT_VERSION
#define PROJECT_VERSION "0.1.0"
#endif

namespace {

bool read_source(const std::string& path, std::string& out) {
  if (path == "-") {
    out.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    return true;
  }
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) return false;
  out.assign(std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>());
  return true;
}

std::string error_json(const std::string& code, const std::string& message) {
  return "{\"error\":\"" + scratchpad::jsonlite::escape(code) + "\",\"message\":\"" +
         scratchpad::jsonlite::escape(message) + "\"}";
}

// Fragments go to stdout as they arrive; the result JSON then goes to stderr.
class StreamingObserver : public scratchpad::OutputObserver {
 public:
  void on_output_fragment(const std::string& text) override {
    std::cout << text;
    std::cout.flush();
  }
  void on_structured_value(const scratchpad::DumpRecord& value) override {
    std::cout << "[" << (value.label.empty() ? value.type_name : value.label) << "] "
              << value.text << "\n";
  }
};

struct CommonArgs {
  std::string file;
  std::string config_path;
  bool trace{false};
  bool stream{false};
  int repeat{1};
  long long timeout_ms{-1};
  std::string bad_arg;
};

CommonArgs parse_common(int argc, char** argv, int first) {
  CommonArgs a;
  for (int i = first; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      a.config_path = argv[++i];
    } else if (arg == "--timeout" && i + 1 < argc) {
      a.timeout_ms = std::atoll(argv[++i]);
    } else if (arg == "--repeat" && i + 1 < argc) {
      a.repeat = std::atoi(argv[++i]);
    } else if (arg == "--trace") {
      a.trace = true;
    } else if (arg == "--stream") {
      a.stream = true;
    } else if (a.file.empty() && (arg == "-" || arg.rfind("--", 0) != 0)) {
      a.file = arg;
    } else {
      a.bad_arg = arg;
    }
  }
  return a;
}

// Defaults, then --config, then environment, then explicit flags.
bool load_effective_config(const CommonArgs& args, scratchpad::ScriptConfig& config) {
  if (!args.config_path.empty()) {
    const auto loaded = scratchpad::load_config_file(args.config_path);
    if (!loaded.ok) {
      std::cerr << error_json(loaded.error_code, loaded.error_message) << "\n";
      return false;
    }
    config = loaded.config;
  }
  scratchpad::apply_env_overrides(config);
  if (args.timeout_ms > 0) config.timeout_ms = static_cast<std::uint64_t>(args.timeout_ms);
  return true;
}

void print_usage() {
  std::cerr << "usage: scratchpad <command> [args]\n"
               "  run <file|-> [--config f] [--timeout ms] [--trace] [--stream]\n"
               "  compile <file|-> [--config f]\n"
               "  preprocess <file|->\n"
               "  references [--config f]\n"
               "  config validate <file>\n"
               "  stats <file|-> [--repeat n] [--config f]\n"
               "  rid | health | version\n";
}

}  // namespace

int main(int argc, char** argv) {
  std::string cmd;
  int cmd_index = 0;
  for (int i = 1; i < argc; ++i) {
    if (std::string(argv[i]).rfind("--", 0) == 0)
      continue;
    cmd = argv[i];
    cmd_index = i;
    break;
  }
  if (cmd.empty()) {
    print_usage();
    return 1;
  }

  if (cmd == "version") {
    std::cout << scratchpad::version::manifest_to_json(
                     scratchpad::version::current_manifest(PROJECT_VERSION))
              << "\n";
    return 0;
  }

  if (cmd == "rid") {
    std::cout << scratchpad::runtime_identifier() << "\n";
    return 0;
  }

  if (cmd == "health") {
    const auto h = scratchpad::hash_runtime_info();
    const auto baseline = scratchpad::validate_baseline();
    scratchpad::ScriptConfig config;
    scratchpad::apply_env_overrides(config);
    const std::string compiler = scratchpad::resolve_executable(scratchpad::effective_compiler(config));
    const std::string runner = scratchpad::resolve_executable(scratchpad::host_runner_path());

    std::vector<std::string> blockers;
    if (!baseline.ok) blockers.push_back("baseline_unavailable");
    if (compiler.empty()) blockers.push_back("compiler_unavailable");
    if (runner.empty()) blockers.push_back("runner_unavailable");

    std::cout << "{\"ok\":" << (blockers.empty() ? "true" : "false") << ",\"blockers\":[";
    for (size_t i = 0; i < blockers.size(); ++i) {
      if (i > 0)
        std::cout << ",";
      std::cout << "\"" << blockers[i] << "\"";
    }
    std::cout << "]";
    std::cout << ",\"engine_version\":\"" << PROJECT_VERSION << "\"";
    std::cout << ",\"hash_primitive\":\"" << h.primitive << "\"";
    std::cout << ",\"hash_version\":\"" << scratchpad::jsonlite::escape(h.version) << "\"";
    std::cout << ",\"rid\":\"" << scratchpad::runtime_identifier() << "\"";
    std::cout << ",\"include_dir\":\"" << scratchpad::jsonlite::escape(baseline.include_dir) << "\"";
    std::cout << ",\"compiler\":\"" << scratchpad::jsonlite::escape(compiler) << "\"";
    std::cout << ",\"runner\":\"" << scratchpad::jsonlite::escape(runner) << "\"";
    std::cout << "}\n";
    return blockers.empty() ? 0 : 2;
  }

  if (cmd == "config" && argc >= cmd_index + 3 && std::string(argv[cmd_index + 1]) == "validate") {
    std::string text;
    if (!read_source(argv[cmd_index + 2], text)) {
      std::cerr << error_json("config_invalid", std::string("cannot read ") + argv[cmd_index + 2]) << "\n";
      return 2;
    }
    const auto v = scratchpad::validate_config(text);
    scratchpad::jsonlite::Array errors, warnings;
    for (const auto& e : v.errors) errors.push_back(scratchpad::jsonlite::Value(e));
    for (const auto& w : v.warnings) warnings.push_back(scratchpad::jsonlite::Value(w));
    scratchpad::jsonlite::Object o;
    o["ok"] = scratchpad::jsonlite::Value(v.ok);
    o["errors"] = scratchpad::jsonlite::Value(std::move(errors));
    o["warnings"] = scratchpad::jsonlite::Value(std::move(warnings));
    std::cout << scratchpad::jsonlite::to_json(scratchpad::jsonlite::Value(std::move(o))) << "\n";
    return v.ok ? 0 : 2;
  }

  const CommonArgs args = parse_common(argc, argv, cmd_index + 1);
  if (!args.bad_arg.empty()) {
    std::cerr << error_json("usage", "unexpected argument " + args.bad_arg) << "\n";
    return 2;
  }

  if (cmd == "references") {
    scratchpad::ScriptConfig config;
    if (!load_effective_config(args, config))
      return 2;
    const auto refs = scratchpad::resolve_references(config);
    if (!refs.ok) {
      std::cerr << error_json(refs.error_code, refs.error_message) << "\n";
      return 2;
    }
    scratchpad::jsonlite::Array list, skipped;
    for (const auto& r : refs.references) {
      scratchpad::jsonlite::Object o;
      o["kind"] = scratchpad::jsonlite::Value(scratchpad::to_string(r.kind));
      o["name"] = scratchpad::jsonlite::Value(r.name);
      o["path"] = scratchpad::jsonlite::Value(r.path);
      o["baseline"] = scratchpad::jsonlite::Value(r.baseline);
      list.push_back(scratchpad::jsonlite::Value(std::move(o)));
    }
    for (const auto& s : refs.skipped) skipped.push_back(scratchpad::jsonlite::Value(s));
    scratchpad::jsonlite::Object o;
    o["references"] = scratchpad::jsonlite::Value(std::move(list));
    o["skipped"] = scratchpad::jsonlite::Value(std::move(skipped));
    o["digest"] = scratchpad::jsonlite::Value(
        scratchpad::reference_set_digest(scratchpad::canonical_reference_list(refs)));
    std::cout << scratchpad::jsonlite::to_json(scratchpad::jsonlite::Value(std::move(o))) << "\n";
    return 0;
  }

  if (args.file.empty()) {
    print_usage();
    return 2;
  }
  std::string source;
  if (!read_source(args.file, source)) {
    std::cerr << error_json("usage", "cannot read " + args.file) << "\n";
    return 2;
  }

  if (cmd == "preprocess") {
    const auto pre = scratchpad::preprocess(source);
    scratchpad::jsonlite::Array imports;
    for (const auto& i : pre.imports) imports.push_back(scratchpad::jsonlite::Value(i));
    scratchpad::jsonlite::Object o;
    o["imports"] = scratchpad::jsonlite::Value(std::move(imports));
    o["removed_line_count"] = scratchpad::jsonlite::Value(static_cast<std::uint64_t>(pre.removed_line_count));
    o["body"] = scratchpad::jsonlite::Value(pre.body);
    std::cout << scratchpad::jsonlite::to_json(scratchpad::jsonlite::Value(std::move(o))) << "\n";
    return 0;
  }

  scratchpad::ScriptConfig config;
  if (!load_effective_config(args, config))
    return 2;

  if (cmd == "compile") {
    scratchpad::Engine engine;
    const auto outcome = engine.compile(source, config, args.file == "-" ? "script.cpp" : args.file);
    std::ostringstream o;
    o << "{\"ok\":" << (outcome.succeeded() ? "true" : "false");
    o << ",\"error_code\":\"" << outcome.error_code << "\"";
    o << ",\"entry_point\":\"" << outcome.entry_point << "\"";
    o << ",\"image_digest\":\"" << outcome.image_digest << "\"";
    o << ",\"image_bytes\":" << (outcome.image ? outcome.image->size() : 0);
    o << ",\"compile_ns\":" << outcome.compile_duration_ns;
    o << ",\"diagnostics\":[";
    for (size_t i = 0; i < outcome.diagnostics.size(); ++i) {
      if (i > 0)
        o << ",";
      o << scratchpad::diagnostic_to_json(outcome.diagnostics[i]);
    }
    o << "],\"dependencies\":" << scratchpad::dependency_manifest_to_json(outcome.dependencies);
    o << "}";
    std::cout << o.str() << "\n";
    return outcome.succeeded() ? 0 : 1;
  }

  if (cmd == "run") {
    scratchpad::Engine engine;
    StreamingObserver observer;
    scratchpad::ExecutionRequest request;
    request.source_text = source;
    request.config = config;
    if (args.file != "-")
      request.source_name = args.file;
    const auto result = engine.execute(request, args.stream ? &observer : nullptr);
    (args.stream ? std::cerr : std::cout) << scratchpad::execution_result_to_json(result, args.trace) << "\n";
    // Let the reclamation pass finish so its event reaches the log.
    engine.verifier().drain();
    return result.success ? 0 : 1;
  }

  if (cmd == "stats") {
    scratchpad::Engine engine;
    int failures = 0;
    for (int i = 0; i < std::max(1, args.repeat); ++i) {
      if (!engine.execute(source, config).success)
        ++failures;
    }
    engine.verifier().drain();
    std::cout << scratchpad::global_engine_stats().to_json() << "\n";
    return failures == 0 ? 0 : 1;
  }

  print_usage();
  return 1;
}
