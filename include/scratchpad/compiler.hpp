#pragma once

// scratchpad/compiler.hpp - Scaffold construction and compilation to a shared object.
//
// SCAFFOLD:
//   The user body is wrapped into a holder type whose static entry method
//   runs it verbatim:
//
//     #include <scratchpad/script_host.hpp>
//     #include <...merged imports...>
//     namespace scratchpad_script {
//     using namespace ::scratchpad;
//     struct Script {
//       static std::string ConnectionString;
//       static ::scratchpad::ReturnValue Main();
//     };
//     std::string Script::ConnectionString;
//     ::scratchpad::ReturnValue Script::Main() {
//     #line <removed_line_count + 1> "<source name>"
//     <body>
//     #line <n> "scratchpad_scaffold.cpp"
//       return {};
//     }
//     }  // namespace scratchpad_script
//     SCRATCHPAD_EXPORT_ENTRY(Script, Main, ConnectionString)
//
//   The first #line directive is the only line-remapping mechanism: every
//   diagnostic inside the body is reported by the compiler itself in the
//   user's original coordinates and under the user's source name.
//
// DIAGNOSTIC SELECTION:
//   Errors located in the user's source come first. Diagnostics located
//   anywhere else (scaffold, headers) are kept only when no user-located
//   error exists, and are then flagged in_user_code=false. A failing
//   compiler that prints nothing parseable yields one synthetic error.
//
// EXTENSION_POINT: compiler_backend
//   CompilerBackend is the seam. SystemCompilerBackend runs $CXX (or the
//   configured compiler) through the sandbox process layer. Tests inject
//   their own backend to exercise selection without a toolchain.

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "scratchpad/types.hpp"

namespace scratchpad {

constexpr const char* kScaffoldName = "scratchpad_scaffold.cpp";
constexpr const char* kEntryHolder = "Script";
constexpr const char* kEntryMethod = "Main";
constexpr const char* kConnectionProperty = "ConnectionString";

struct ScaffoldText {
  std::string text;
  std::size_t body_first_line{0};  // scaffold line holding the first body line
};

ScaffoldText build_scaffold(const CompilationUnit& unit);

// Dotted entry point identifier, "Script.Main".
std::string entry_point_name();

struct BackendInvocation {
  std::string compiler;
  std::string scaffold_text;
  std::vector<std::string> include_dirs;
  std::vector<std::string> libraries;
  std::vector<std::string> link_flags;
  std::vector<std::string> extra_flags;
  std::uint64_t timeout_ms{60000};
};

struct BackendResult {
  bool started{false};
  bool timed_out{false};
  int exit_code{0};
  std::string output;              // compiler stdout + stderr
  std::optional<std::string> image;
  std::string error_message;       // set when the compiler could not be run
};

class CompilerBackend {
 public:
  virtual ~CompilerBackend() = default;
  virtual BackendResult compile(const BackendInvocation& invocation) = 0;
  virtual std::string name() const = 0;
};

// Runs the compiler in a private temporary directory which is removed
// before compile() returns.
class SystemCompilerBackend : public CompilerBackend {
 public:
  BackendResult compile(const BackendInvocation& invocation) override;
  std::string name() const override { return "system"; }

  // Full argv (without argv[0]) for a given scaffold path and output path.
  static std::vector<std::string> build_arguments(const BackendInvocation& invocation,
                                                  const std::string& scaffold_path,
                                                  const std::string& output_path);
};

// Parse GCC/Clang "file:line[:col]: severity: message [-Wcode]" lines.
// Diagnostics located in `user_source_name` get in_user_code=true.
std::vector<Diagnostic> parse_compiler_output(const std::string& output,
                                              const std::string& user_source_name);

// Apply the selection rule above. Returns an empty list when nothing is an
// error, in which case warnings are carried alongside the image.
std::vector<Diagnostic> select_diagnostics(std::vector<Diagnostic> all);

// Managed dependency key for a library path: file name up to its first
// ".so", ".dylib" or ".dll" ("libfoo.so.1" -> "libfoo").
std::string dependency_name(const std::string& library_path);

class CompilerFrontend {
 public:
  // nullptr selects SystemCompilerBackend.
  explicit CompilerFrontend(std::shared_ptr<CompilerBackend> backend = nullptr);

  CompilationOutcome compile(const CompilationUnit& unit, const ReferenceSet& references,
                             const ScriptConfig& config);

 private:
  std::shared_ptr<CompilerBackend> backend_;
};

}  // namespace scratchpad
