#include "scratchpad/compiler.hpp"

#include <stdlib.h>

#include <cctype>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <system_error>

#include "scratchpad/config.hpp"
#include "scratchpad/hash.hpp"
#include "scratchpad/observability.hpp"
#include "scratchpad/sandbox.hpp"

namespace scratchpad {

namespace fs = std::filesystem;

namespace {

// Escapes a file name for use inside a #line directive string literal.
std::string line_directive_name(const std::string& name) {
  std::string out;
  for (char c : name) {
    if (c == '\\' || c == '"') out += '\\';
    out += c;
  }
  return out;
}

std::size_t count_lines(const std::string& text) {
  std::size_t n = 0;
  for (char c : text) {
    if (c == '\n') ++n;
  }
  return n;
}

// Private compiler working directory, removed on scope exit.
class TempDir {
 public:
  TempDir() {
    std::error_code ec;
    const fs::path base = fs::temp_directory_path(ec);
    std::string tmpl = ((ec ? fs::path("/tmp") : base) / "scratchpad-cc-XXXXXX").string();
    if (::mkdtemp(tmpl.data())) path_ = tmpl;
  }
  ~TempDir() {
    if (!path_.empty()) {
      std::error_code ec;
      fs::remove_all(path_, ec);
    }
  }
  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  bool ok() const { return !path_.empty(); }
  const std::string& path() const { return path_; }

 private:
  std::string path_;
};

bool parse_number(const std::string& s, std::size_t& out) {
  if (s.empty()) return false;
  std::size_t v = 0;
  for (char c : s) {
    if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    v = v * 10 + static_cast<std::size_t>(c - '0');
  }
  out = v;
  return true;
}

struct SeverityMarker {
  const char* text;
  Severity severity;
};

constexpr SeverityMarker kMarkers[] = {
    {": fatal error: ", Severity::error},
    {": error: ", Severity::error},
    {": warning: ", Severity::warning},
    {": note: ", Severity::note},
};

bool parse_line(const std::string& line, const std::string& user_source_name, Diagnostic& out) {
  for (const auto& marker : kMarkers) {
    const auto pos = line.find(marker.text);
    if (pos == std::string::npos) continue;

    // Location: file:line:col or file:line
    std::string location = line.substr(0, pos);
    std::size_t first = 0, second = 0;
    auto last_colon = location.rfind(':');
    if (last_colon == std::string::npos || !parse_number(location.substr(last_colon + 1), second)) {
      return false;
    }
    std::string file = location.substr(0, last_colon);
    const auto prev_colon = file.rfind(':');
    if (prev_colon != std::string::npos && parse_number(file.substr(prev_colon + 1), first)) {
      out.line = first;
      out.column = second;
      file = file.substr(0, prev_colon);
    } else {
      out.line = second;
      out.column = 0;
    }

    out.severity = marker.severity;
    out.message = line.substr(pos + std::char_traits<char>::length(marker.text));
    out.code = to_string(marker.severity);
    if (!out.message.empty() && out.message.back() == ']') {
      const auto open = out.message.rfind(" [");
      if (open != std::string::npos && out.message.compare(open + 2, 1, "-") == 0) {
        out.code = out.message.substr(open + 2, out.message.size() - open - 3);
        out.message.erase(open);
      }
    }
    out.in_user_code = file == user_source_name;
    return true;
  }
  return false;
}

std::string first_line(const std::string& text) {
  const auto nl = text.find('\n');
  return nl == std::string::npos ? text : text.substr(0, nl);
}

Diagnostic synthetic_error(const std::string& code, const std::string& message) {
  Diagnostic d;
  d.severity = Severity::error;
  d.code = code;
  d.message = message;
  d.in_user_code = false;
  return d;
}

}  // namespace

std::string entry_point_name() {
  return std::string(kEntryHolder) + "." + kEntryMethod;
}

ScaffoldText build_scaffold(const CompilationUnit& unit) {
  std::string s;
  s.reserve(unit.body.size() + 1024);
  s += "#include <scratchpad/script_host.hpp>\n";
  for (const auto& name : unit.imports) {
    s += "#include <" + name + ">\n";
  }
  s += "namespace scratchpad_script {\n";
  s += "using namespace ::scratchpad;\n";
  s += std::string("struct ") + kEntryHolder + " {\n";
  s += std::string("  static std::string ") + kConnectionProperty + ";\n";
  s += std::string("  static ::scratchpad::ReturnValue ") + kEntryMethod + "();\n";
  s += "};\n";
  s += std::string("std::string ") + kEntryHolder + "::" + kConnectionProperty + ";\n";
  s += std::string("::scratchpad::ReturnValue ") + kEntryHolder + "::" + kEntryMethod + "() {\n";
  s += "#line " + std::to_string(unit.removed_line_count + 1) + " \"" +
       line_directive_name(unit.source_name) + "\"\n";

  ScaffoldText out;
  out.body_first_line = count_lines(s) + 1;

  s += unit.body;
  s += "\n";
  // Resynchronize with the real scaffold position after the body.
  const std::size_t next_line = count_lines(s) + 2;
  s += "#line " + std::to_string(next_line) + " \"" + kScaffoldName + "\"\n";
  s += "  return {};\n";
  s += "}\n";
  s += "}  // namespace scratchpad_script\n";
  s += std::string("SCRATCHPAD_EXPORT_ENTRY(") + kEntryHolder + ", " + kEntryMethod + ", " +
       kConnectionProperty + ")\n";
  out.text = std::move(s);
  return out;
}

std::vector<Diagnostic> parse_compiler_output(const std::string& output,
                                              const std::string& user_source_name) {
  std::vector<Diagnostic> out;
  std::istringstream in(output);
  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    Diagnostic d;
    if (parse_line(line, user_source_name, d)) out.push_back(std::move(d));
  }
  return out;
}

std::vector<Diagnostic> select_diagnostics(std::vector<Diagnostic> all) {
  bool user_error = false;
  bool any_error = false;
  for (const auto& d : all) {
    if (d.severity != Severity::error) continue;
    any_error = true;
    if (d.in_user_code) user_error = true;
  }
  if (!any_error) return {};

  std::vector<Diagnostic> selected;
  if (user_error) {
    for (auto& d : all) {
      if (d.in_user_code) selected.push_back(std::move(d));
    }
    return selected;
  }
  return all;
}

std::string dependency_name(const std::string& library_path) {
  const std::string file = fs::path(library_path).filename().string();
  std::size_t cut = file.size();
  for (const char* ext : {".so", ".dylib", ".dll"}) {
    const auto pos = file.find(ext);
    if (pos != std::string::npos && pos < cut) cut = pos;
  }
  return file.substr(0, cut);
}

std::vector<std::string> SystemCompilerBackend::build_arguments(const BackendInvocation& inv,
                                                                const std::string& scaffold_path,
                                                                const std::string& output_path) {
  std::vector<std::string> args = {"-std=c++20", "-shared", "-fPIC", "-fvisibility=hidden",
                                   "-fdiagnostics-color=never"};
  args.insert(args.end(), inv.extra_flags.begin(), inv.extra_flags.end());
  for (const auto& dir : inv.include_dirs) args.push_back("-I" + dir);
  // -x none keeps library paths after the source from being read as C++.
  args.push_back("-x");
  args.push_back("c++");
  args.push_back(scaffold_path);
  args.push_back("-x");
  args.push_back("none");
  args.insert(args.end(), inv.libraries.begin(), inv.libraries.end());
  args.insert(args.end(), inv.link_flags.begin(), inv.link_flags.end());
  args.push_back("-o");
  args.push_back(output_path);
  return args;
}

BackendResult SystemCompilerBackend::compile(const BackendInvocation& inv) {
  BackendResult result;
  TempDir dir;
  if (!dir.ok()) {
    result.error_message = "cannot create compiler working directory";
    return result;
  }

  const std::string scaffold_path = (fs::path(dir.path()) / kScaffoldName).string();
  const std::string output_path = (fs::path(dir.path()) / "unit.so").string();
  {
    std::ofstream ofs(scaffold_path, std::ios::binary | std::ios::trunc);
    ofs << inv.scaffold_text;
    if (!ofs) {
      result.error_message = "cannot write scaffold to " + scaffold_path;
      return result;
    }
  }

  ProcessSpec spec;
  spec.command = inv.compiler;
  spec.argv = build_arguments(inv, scaffold_path, output_path);
  spec.cwd = dir.path();
  spec.timeout_ms = inv.timeout_ms;
  spec.max_output_bytes = 256 * 1024;

  const ProcessResult pr = run_process(spec);
  if (!pr.error_message.empty()) {
    result.error_message = pr.error_message;
    return result;
  }
  result.started = true;
  result.timed_out = pr.timed_out;
  result.exit_code = pr.exit_code;
  result.output = pr.stderr_text;
  if (!pr.stdout_text.empty()) {
    if (!result.output.empty() && result.output.back() != '\n') result.output += '\n';
    result.output += pr.stdout_text;
  }

  if (pr.exit_code == 0 && !pr.timed_out) {
    std::ifstream ifs(output_path, std::ios::binary);
    if (ifs) {
      result.image = std::string((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
    }
  }
  return result;
}

CompilerFrontend::CompilerFrontend(std::shared_ptr<CompilerBackend> backend)
    : backend_(backend ? std::move(backend) : std::make_shared<SystemCompilerBackend>()) {}

CompilationOutcome CompilerFrontend::compile(const CompilationUnit& unit,
                                             const ReferenceSet& references,
                                             const ScriptConfig& config) {
  CompilationOutcome outcome;
  ScopeTimer timer(outcome.compile_duration_ns);

  BackendInvocation inv;
  inv.compiler = effective_compiler(config);
  inv.scaffold_text = build_scaffold(unit).text;
  inv.extra_flags = config.extra_compiler_flags;
  inv.timeout_ms = config.compile_timeout_ms;
  for (const auto& ref : references.references) {
    switch (ref.kind) {
      case ReferenceKind::include_dir: inv.include_dirs.push_back(ref.path); break;
      case ReferenceKind::library: inv.libraries.push_back(ref.path); break;
      case ReferenceKind::link_flag: inv.link_flags.push_back(ref.path); break;
    }
  }

  BackendResult br = backend_->compile(inv);
  if (!br.started || br.timed_out) {
    outcome.error_code = to_string(ErrorCode::compiler_unavailable);
    outcome.diagnostics.push_back(synthetic_error(
        "compiler", br.timed_out
                        ? "Compilation timed out after " + std::to_string(inv.timeout_ms) + " ms"
                        : "C++ compiler unavailable: " + br.error_message));
    return outcome;
  }

  auto all = parse_compiler_output(br.output, unit.source_name);
  auto errors = select_diagnostics(all);
  if (!errors.empty() || br.exit_code != 0 || !br.image) {
    outcome.error_code = to_string(ErrorCode::compilation_failed);
    outcome.diagnostics = std::move(errors);
    if (outcome.diagnostics.empty()) {
      const std::string text = first_line(br.output);
      outcome.diagnostics.push_back(synthetic_error(
          "compiler", text.empty() ? "compiler exited with code " + std::to_string(br.exit_code)
                                   : text));
    }
    return outcome;
  }

  // Success: only warnings survive next to the image.
  for (auto& d : all) {
    if (d.severity == Severity::warning && d.in_user_code) outcome.diagnostics.push_back(std::move(d));
  }
  outcome.image = std::move(br.image);
  outcome.entry_point = entry_point_name();
  outcome.image_digest = image_digest(*outcome.image);
  for (const auto& lib : inv.libraries) {
    outcome.dependencies.entries.emplace_back(dependency_name(lib), lib);
  }
  return outcome;
}

}  // namespace scratchpad
