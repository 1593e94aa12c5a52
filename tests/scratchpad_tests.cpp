#include <signal.h>
#include <stdlib.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <random>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "scratchpad/boundary.hpp"
#include "scratchpad/compiler.hpp"
#include "scratchpad/config.hpp"
#include "scratchpad/engine.hpp"
#include "scratchpad/executor.hpp"
#include "scratchpad/hash.hpp"
#include "scratchpad/jsonlite.hpp"
#include "scratchpad/observability.hpp"
#include "scratchpad/output.hpp"
#include "scratchpad/preprocessor.hpp"
#include "scratchpad/reclamation.hpp"
#include "scratchpad/references.hpp"
#include "scratchpad/sandbox.hpp"
#include "scratchpad/version.hpp"
#include "scratchpad/wire.hpp"

namespace fs = std::filesystem;

namespace {
int g_tests_run = 0;
int g_tests_passed = 0;
int g_tests_skipped = 0;

void expect(bool condition, const std::string& message) {
  if (!condition) {
    std::cerr << "FAIL: " << message << "\n";
    std::exit(1);
  }
}

void run_test(const std::string& name, void (*fn)()) {
  std::cout << "  " << name << "...";
  fn();
  std::cout << " PASSED\n";
  g_tests_run++;
  g_tests_passed++;
}

bool contains(const std::string& haystack, const std::string& needle) {
  return haystack.find(needle) != std::string::npos;
}

// Scratch directory removed when the test returns.
struct TempTree {
  fs::path root;
  TempTree() {
    std::string tmpl = (fs::temp_directory_path() / "scratchpad-test-XXXXXX").string();
    expect(::mkdtemp(tmpl.data()) != nullptr, "mkdtemp");
    root = tmpl;
  }
  ~TempTree() {
    std::error_code ec;
    fs::remove_all(root, ec);
  }
  fs::path touch(const fs::path& rel, const std::string& content = "x") {
    const fs::path p = root / rel;
    fs::create_directories(p.parent_path());
    std::ofstream(p, std::ios::binary) << content;
    return p;
  }
};

// A few bytes that pass the shared-object magic check and nothing else.
std::string fake_elf_image() {
  std::string image("\x7f" "ELF", 4);
  image += std::string(64, '\0');
  return image;
}

class RecordingObserver : public scratchpad::OutputObserver {
 public:
  void on_output_fragment(const std::string& text) override { fragments.push_back(text); }
  void on_structured_value(const scratchpad::DumpRecord& value) override { values.push_back(value); }

  std::vector<std::string> fragments;
  std::vector<scratchpad::DumpRecord> values;
};

class ScriptedBackend : public scratchpad::CompilerBackend {
 public:
  explicit ScriptedBackend(scratchpad::BackendResult r) : result(std::move(r)) {}
  scratchpad::BackendResult compile(const scratchpad::BackendInvocation& inv) override {
    last = inv;
    return result;
  }
  std::string name() const override { return "scripted"; }

  scratchpad::BackendResult result;
  scratchpad::BackendInvocation last;
};

scratchpad::CompilationUnit unit_for(const std::string& source) {
  return scratchpad::make_compilation_unit(scratchpad::preprocess(source), scratchpad::ScriptConfig{});
}

bool toolchain_available() {
  scratchpad::ScriptConfig config;
  scratchpad::apply_env_overrides(config);
  return !scratchpad::resolve_executable(scratchpad::effective_compiler(config)).empty() &&
         !scratchpad::resolve_executable(scratchpad::host_runner_path()).empty() &&
         scratchpad::validate_baseline().ok;
}

bool runner_available() {
  return !scratchpad::resolve_executable(scratchpad::host_runner_path()).empty();
}

void run_e2e(const std::string& name, void (*fn)()) {
  static const bool available = toolchain_available();
  if (!available) {
    std::cout << "  " << name << "... SKIPPED (no C++ compiler or host runner)\n";
    g_tests_skipped++;
    return;
  }
  run_test(name, fn);
}

// ============================================================================
// Hashing
// ============================================================================

void test_blake3_known_vectors() {
  expect(scratchpad::blake3_hex("") == "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262",
         "BLAKE3 empty vector");
  expect(scratchpad::blake3_hex("hello") == "ea8f163db38682925e4491c5e58d4bb3506ef8c14eb78a86e908c5624a67200f",
         "BLAKE3 hello vector");
}

void test_domain_separation() {
  const std::string payload = "System.out(\"hi\");";
  expect(scratchpad::source_digest(payload) != scratchpad::image_digest(payload),
         "src and img digests of the same bytes differ");
  expect(scratchpad::image_digest(payload) != scratchpad::reference_set_digest(payload),
         "img and ref digests of the same bytes differ");
  expect(scratchpad::source_digest(payload).size() == 64, "digest is 32 bytes hex");
  expect(scratchpad::hash_runtime_info().primitive == "blake3", "hash primitive");
}

// ============================================================================
// Preprocessor
// ============================================================================

void test_preprocess_leading_section() {
  const std::string src =
      "// header comment\n"
      "#include <cmath>\n"
      "\n"
      "/* block\n"
      "   still block */\n"
      "  #include \"local.h\"\n"
      "int x = 1;\n"
      "// kept once code started\n"
      "\n"
      "#include <never_an_import>\n"
      "System.out(x);";
  const auto pre = scratchpad::preprocess(src);
  expect(pre.imports.size() == 2, "two imports collected");
  expect(pre.imports[0] == "cmath" && pre.imports[1] == "local.h", "imports in order");
  expect(pre.removed_line_count == 6, "six leading lines removed");
  expect(pre.body.rfind("int x = 1;", 0) == 0, "body starts at first code line");
  expect(contains(pre.body, "// kept once code started"), "later comments kept");
  expect(contains(pre.body, "#include <never_an_import>"), "later include lines kept verbatim");
}

void test_preprocess_crlf_and_inline_block() {
  const auto pre = scratchpad::preprocess("/* one line */\r\n#include <set>\r\nSystem.out(1);\r\n");
  expect(pre.imports.size() == 1 && pre.imports[0] == "set", "crlf import");
  expect(pre.removed_line_count == 2, "crlf removed count");
  expect(pre.body == "System.out(1);\n", "trailing separator kept as final empty line");
}

void test_preprocess_unterminated_comment_swallows_body() {
  const auto pre = scratchpad::preprocess("/* never closed\nint x = 1;\nSystem.out(x);");
  expect(pre.body.empty(), "unterminated leading comment consumes the body");
  expect(pre.removed_line_count == 3, "every line counted as removed");
  expect(pre.imports.empty(), "no imports");
}

void test_preprocess_only_code() {
  const auto pre = scratchpad::preprocess("System.out(\"hi\");");
  expect(pre.removed_line_count == 0, "nothing removed");
  expect(pre.body == "System.out(\"hi\");", "body verbatim");
}

void test_match_import() {
  expect(scratchpad::match_import("#include <vector>").value_or("") == "vector", "angle include");
  expect(scratchpad::match_import("  #  include   \"a/b.h\"  ").value_or("") == "a/b.h", "quoted include");
  expect(!scratchpad::match_import("#includex <a>"), "directive name must end");
  expect(!scratchpad::match_import("#include <a"), "unterminated name");
  expect(!scratchpad::match_import("#include <>"), "empty name");
  expect(!scratchpad::match_import("#define X 1"), "other directives");
}

void test_compilation_unit_import_merge() {
  scratchpad::PreprocessedSource pre;
  pre.imports = {"vector", "cmath", "cmath"};
  pre.body = "System.out(1);";
  pre.removed_line_count = 3;
  const scratchpad::ScriptConfig config;
  const auto unit = scratchpad::make_compilation_unit(pre, config, "demo.cpp");
  expect(unit.imports.size() == config.default_imports.size() + 1, "defaults plus one new import");
  expect(unit.imports.front() == "iostream", "configured imports first");
  expect(unit.imports.back() == "cmath", "user import appended once");
  expect(unit.removed_line_count == 3 && unit.source_name == "demo.cpp", "offset and name carried");
}

// ============================================================================
// Configuration
// ============================================================================

void test_config_parse_full() {
  const std::string json =
      "{\"default_imports\":[\"vector\"],\"packages\":{\"fmt\":\"10.2.1\"},"
      "\"references\":[\"m\"],\"connection_string\":\"Server=db\",\"timeout_ms\":1500,"
      "\"compile_timeout_ms\":9000,\"probing_paths\":[\"/opt/p\"],\"max_output_bytes\":64,"
      "\"terminate_on_timeout\":false,\"compiler\":\"clang++\",\"extra_compiler_flags\":[\"-O1\"]}";
  const auto r = scratchpad::parse_config_json(json);
  expect(r.ok, "config parses: " + r.error_message);
  const auto& c = r.config;
  expect(c.default_imports.size() == 1 && c.default_imports[0] == "vector", "default_imports");
  expect(c.packages.at("fmt") == "10.2.1", "packages");
  expect(c.references.size() == 1 && c.references[0] == "m", "references");
  expect(c.timeout_ms == 1500 && c.compile_timeout_ms == 9000, "timeouts");
  expect(c.max_output_bytes == 64, "max_output_bytes");
  expect(!c.terminate_on_timeout, "terminate_on_timeout");
  expect(c.compiler == "clang++" && c.extra_compiler_flags.size() == 1, "compiler settings");

  const std::string rendered = scratchpad::config_to_json(c);
  expect(!contains(rendered, "Server=db"), "connection string redacted");
  expect(contains(rendered, "<redacted>"), "redaction marker");
}

void test_config_rejects_bad_input() {
  auto r = scratchpad::parse_config_json("{\"timeout_ms\":1,\"timeout_ms\":2}");
  expect(!r.ok && r.error_code == "config_invalid", "duplicate keys rejected");
  expect(contains(r.error_message, "json_duplicate_key"), "duplicate key reason");

  r = scratchpad::parse_config_json("{\"timeout_ms\":0}");
  expect(!r.ok && r.error_message == "must_be_positive:timeout_ms", "zero timeout rejected");

  r = scratchpad::parse_config_json("{\"timeout_ms\":9223372036854775807}");
  expect(!r.ok && r.error_message == "must_be_at_most:timeout_ms", "huge timeout rejected");

  r = scratchpad::parse_config_json("{\"compile_timeout_ms\":18446744073709551615}");
  expect(!r.ok && r.error_message == "must_be_at_most:compile_timeout_ms", "max u64 compile timeout rejected");

  r = scratchpad::parse_config_json("{\"timeout_ms\":" + std::to_string(scratchpad::kMaxTimeoutMs) + "}");
  expect(r.ok && r.config.timeout_ms == scratchpad::kMaxTimeoutMs, "timeout at the cap accepted");

  r = scratchpad::parse_config_json("{\"references\":\"m\"}");
  expect(!r.ok && r.error_message == "wrong_type:references", "wrong type rejected");

  r = scratchpad::load_config_file("/nonexistent/scratchpad.json");
  expect(!r.ok && r.error_code == "config_invalid", "missing file");
}

void test_config_validate_warnings() {
  const auto v = scratchpad::validate_config("{\"timeout_ms\":10,\"colour\":\"blue\"}");
  expect(v.ok, "unknown keys do not fail validation");
  expect(v.warnings.size() == 1 && v.warnings[0] == "unknown_key:colour", "unknown key warning");

  const auto bad = scratchpad::validate_config("{\"compile_timeout_ms\":0,\"compiler\":7}");
  expect(!bad.ok && bad.errors.size() == 2, "two errors");

  const auto broken = scratchpad::validate_config("{\"a\":");
  expect(!broken.ok && broken.errors.size() == 1, "parse error reported");
}

void test_config_env_overrides() {
  ::setenv("SCRATCHPAD_TIMEOUT_MS", "1234", 1);
  ::setenv("SCRATCHPAD_CONNECTION_STRING", "Server=env", 1);
  ::setenv("CXX", "my-c++", 1);
  scratchpad::ScriptConfig config;
  scratchpad::apply_env_overrides(config);
  expect(config.timeout_ms == 1234, "timeout override");
  expect(config.connection_string == "Server=env", "connection string override");
  expect(config.compiler == "my-c++", "CXX fills an unset compiler");

  scratchpad::ScriptConfig pinned;
  pinned.compiler = "g++";
  scratchpad::apply_env_overrides(pinned);
  expect(pinned.compiler == "g++", "CXX never overrides a configured compiler");

  ::setenv("SCRATCHPAD_TIMEOUT_MS", "not-a-number", 1);
  scratchpad::ScriptConfig untouched;
  scratchpad::apply_env_overrides(untouched);
  expect(untouched.timeout_ms == 30000, "malformed override ignored");

  ::setenv("SCRATCHPAD_TIMEOUT_MS", "18446744073709551615", 1);
  scratchpad::ScriptConfig capped;
  scratchpad::apply_env_overrides(capped);
  expect(capped.timeout_ms == 30000, "override above the cap ignored");

  ::unsetenv("SCRATCHPAD_TIMEOUT_MS");
  ::unsetenv("SCRATCHPAD_CONNECTION_STRING");
  ::unsetenv("CXX");
  expect(scratchpad::effective_compiler(scratchpad::ScriptConfig{}) == "c++", "default compiler");
}

// ============================================================================
// jsonlite + wire frames
// ============================================================================

void test_jsonlite_sorted_output() {
  std::optional<scratchpad::jsonlite::JsonError> err;
  const auto obj = scratchpad::jsonlite::parse("{\"b\":1,\"a\":[true,null,\"x\"]}", &err);
  expect(!err, "parses");
  expect(scratchpad::jsonlite::to_json(scratchpad::jsonlite::Value(obj)) ==
             "{\"a\":[true,null,\"x\"],\"b\":1}",
         "keys emitted sorted");

  scratchpad::jsonlite::parse("{\"a\":1} trailing", &err);
  expect(err.has_value(), "trailing data rejected");
}

void test_wire_frames_stream() {
  scratchpad::Frame hello;
  hello.type = scratchpad::FrameType::hello;
  hello.protocol = scratchpad::version::PROTOCOL_FRAMING_VERSION;
  hello.pid = 42;
  scratchpad::Frame out;
  out.type = scratchpad::FrameType::out;
  out.text = "line one\n\"quoted\"";
  scratchpad::Frame ret;
  ret.type = scratchpad::FrameType::ret;
  ret.type_name = "int";
  ret.text = "42";

  const std::string wire = scratchpad::encode_frame(hello) + scratchpad::encode_frame(out) +
                           scratchpad::encode_frame(ret);
  expect(wire.back() == '\n', "frames are newline terminated");
  expect(contains(wire, "\"type\":\"return\""), "ret frames are spelled return");

  // Feed in awkward chunks: frames must come out whole.
  scratchpad::FrameReader reader;
  std::vector<scratchpad::Frame> frames;
  for (std::size_t i = 0; i < wire.size(); i += 7) {
    reader.feed(wire.data() + i, std::min<std::size_t>(7, wire.size() - i));
    scratchpad::Frame f;
    std::string e;
    while (reader.next(f, &e)) frames.push_back(f);
    expect(e.empty(), "no decode error");
  }
  expect(frames.size() == 3, "three frames decoded");
  expect(frames[0].type == scratchpad::FrameType::hello && frames[0].pid == 42, "hello");
  expect(frames[1].text == "line one\n\"quoted\"", "escaped text survives");
  expect(frames[2].type == scratchpad::FrameType::ret && frames[2].text == "42", "return");
  expect(!reader.has_partial(), "nothing left over");
}

void test_wire_rejects_garbage() {
  std::string e;
  expect(!scratchpad::decode_frame("{\"type\":\"teleport\"}", &e), "unknown type");
  expect(contains(e, "teleport"), "error names the type");

  scratchpad::FrameReader reader;
  const std::string data = "not json\n{\"type\":\"done\"}\n";
  reader.feed(data.data(), data.size());
  scratchpad::Frame f;
  e.clear();
  expect(!reader.next(f, &e) && !e.empty(), "malformed line reported");
  e.clear();
  expect(reader.next(f, &e) && f.type == scratchpad::FrameType::done, "next line still decodes");
}

void test_version_compatibility() {
  using namespace scratchpad::version;
  expect(check_compatibility(PROTOCOL_FRAMING_VERSION).ok, "matching protocol");
  const auto bad_protocol = check_compatibility(PROTOCOL_FRAMING_VERSION + 1);
  expect(!bad_protocol.ok && bad_protocol.error_code == "protocol_error", "protocol mismatch");
  const auto bad_scaffold = check_compatibility(PROTOCOL_FRAMING_VERSION, SCAFFOLD_VERSION + 1);
  expect(!bad_scaffold.ok && bad_scaffold.error_code == "image_invalid", "scaffold mismatch");
  const auto m = current_manifest("9.9.9");
  expect(m.engine_semver == "9.9.9" && m.hash_primitive == "blake3", "manifest fields");
  expect(contains(manifest_to_json(m), "\"protocol_framing\""), "manifest json");
}

// ============================================================================
// Reference resolver
// ============================================================================

void test_baseline_references() {
  const auto v = scratchpad::validate_baseline();
  expect(v.ok, "baseline include dir present: " + v.error_message);
  const auto& base = scratchpad::baseline_references();
  expect(base.ok, "baseline ok");
  expect(&base == &scratchpad::baseline_references(), "baseline computed once");
  bool has_include = false;
  for (const auto& r : base.references) {
    expect(r.baseline, "baseline entries flagged");
    if (r.kind == scratchpad::ReferenceKind::include_dir) has_include = true;
  }
  expect(has_include, "host include dir in baseline");
}

void test_package_layout() {
  TempTree t;
  t.touch("fmt/10.2.1/lib/net/libfmt.so");
  t.touch("fmt/10.2.1/lib/libfmt.so.10");
  t.touch("fmt/10.2.1/lib/ref/libfmt.so");
  t.touch("fmt/10.2.1/lib/readme.txt");
  t.touch("fmt/10.2.1/include/fmt/core.h");

  const auto bins = scratchpad::get_package_binaries(t.root.string(), "FMT", "10.2.1");
  expect(bins.size() == 2, "two binaries, ref segment excluded");
  expect(contains(bins[0], "libfmt.so.10") && contains(bins[1], "net/libfmt.so"), "sorted paths");
  expect(scratchpad::get_package_binaries(t.root.string(), "fmt", "9.0.0").empty(), "absent version");

  scratchpad::ScriptConfig config;
  config.package_cache_root = t.root.string();
  config.packages = {{"Fmt", "10.2.1"}, {"ghost", "1.0"}};
  config.references = {"definitely_not_a_library_xyz"};
  const auto refs = scratchpad::resolve_references(config);
  expect(refs.ok, "resolves");
  std::size_t libs = 0, includes = 0;
  for (const auto& r : refs.references) {
    if (r.baseline) continue;
    if (r.kind == scratchpad::ReferenceKind::library) ++libs;
    if (r.kind == scratchpad::ReferenceKind::include_dir) ++includes;
  }
  expect(libs == 2 && includes == 1, "package binaries and include dir");
  expect(refs.skipped.size() == 2, "missing package and reference skipped");
  expect(refs.skipped[0] == "definitely_not_a_library_xyz" && refs.skipped[1] == "ghost@1.0",
         "skipped names");
  expect(!scratchpad::canonical_reference_list(refs).empty(), "canonical list");
}

void test_package_cache_root_precedence() {
  scratchpad::ScriptConfig config;
  config.package_cache_root = "/explicit";
  expect(scratchpad::package_cache_root(config) == "/explicit", "config wins");
  ::setenv("SCRATCHPAD_PACKAGE_CACHE", "/from-env", 1);
  expect(scratchpad::package_cache_root(scratchpad::ScriptConfig{}) == "/from-env", "env next");
  ::unsetenv("SCRATCHPAD_PACKAGE_CACHE");
  expect(contains(scratchpad::package_cache_root(scratchpad::ScriptConfig{}), ".package-cache"),
         "home default");
}

// ============================================================================
// Isolation context manager
// ============================================================================

void test_runtime_identifiers() {
  using scratchpad::CpuArch;
  using scratchpad::OsFamily;
  expect(scratchpad::make_runtime_identifier(OsFamily::gnu_linux, CpuArch::x64) == "linux-x64", "linux-x64");
  expect(scratchpad::make_runtime_identifier(OsFamily::gnu_linux, CpuArch::arm64) == "linux-arm64", "linux-arm64");
  expect(scratchpad::make_runtime_identifier(OsFamily::gnu_linux, CpuArch::other) == "linux-x64", "fallback");
  expect(scratchpad::make_runtime_identifier(OsFamily::windows, CpuArch::x86) == "win-x86", "win-x86");
  expect(scratchpad::make_runtime_identifier(OsFamily::macos, CpuArch::arm64) == "osx-arm64", "osx-arm64");
  expect(scratchpad::make_runtime_identifier(OsFamily::macos, CpuArch::x86) == "osx-x64", "osx fallback");
  expect(&scratchpad::runtime_identifier() == &scratchpad::runtime_identifier(), "detected once");
}

void test_native_candidates() {
  using scratchpad::OsFamily;
  auto c = scratchpad::native_candidate_names("foo", OsFamily::gnu_linux);
  expect(c == std::vector<std::string>{"foo", "libfoo.so", "foo.so"}, "linux candidates");
  c = scratchpad::native_candidate_names("libfoo.so", OsFamily::gnu_linux);
  expect(c == std::vector<std::string>{"libfoo.so"}, "suffix already present");
  c = scratchpad::native_candidate_names("foo", OsFamily::windows);
  expect(c == std::vector<std::string>{"foo", "foo.dll"}, "windows candidates");
  c = scratchpad::native_candidate_names("foo", OsFamily::macos);
  expect(c == std::vector<std::string>{"foo", "libfoo.dylib", "foo.dylib"}, "macos candidates");
}

void test_native_resolution_order() {
  TempTree t;
  const auto rid_path = t.touch("probe/runtimes/linux-x64/native/libfoo.so");
  const auto flat_path = t.touch("probe/foo.so");
  const std::vector<std::string> probes = {(t.root / "empty").string(), (t.root / "probe").string()};
  const scratchpad::DependencyManifest none;

  auto p = scratchpad::resolve_native_path("foo", none, probes, "linux-x64", scratchpad::OsFamily::gnu_linux);
  expect(p == rid_path.string(), "runtimes/<rid>/native first");

  p = scratchpad::resolve_native_path("foo", none, probes, "linux-arm64", scratchpad::OsFamily::gnu_linux);
  expect(p == flat_path.string(), "flat probe when the rid dir has nothing");

  scratchpad::DependencyManifest manifest;
  const auto pinned = t.touch("pinned/libfoo.so");
  manifest.entries.emplace_back("foo", pinned.string());
  p = scratchpad::resolve_native_path("foo", manifest, probes, "linux-x64", scratchpad::OsFamily::gnu_linux);
  expect(p == pinned.string(), "manifest wins");

  p = scratchpad::resolve_native_path("bar", none, probes, "linux-x64", scratchpad::OsFamily::gnu_linux);
  expect(p.empty(), "unknown names fall through to the default loader");
}

void test_managed_resolution_order() {
  TempTree t;
  const auto probed = t.touch("probe/libdep.so");
  const auto listed = t.touch("elsewhere/libdep.so.2");
  scratchpad::DependencyManifest manifest;
  manifest.entries.emplace_back("libdep", listed.string());
  const std::vector<std::string> probes = {(t.root / "probe").string()};

  expect(scratchpad::resolve_managed_path("libdep", manifest, probes) == listed.string(), "manifest first");
  expect(scratchpad::resolve_managed_path("libdep", {}, probes) == probed.string(), "probe next");
  expect(scratchpad::resolve_managed_path("libnone", {}, probes).empty(), "default linker last");
}

void test_dependency_manifest_preserves_order() {
  scratchpad::DependencyManifest m;
  m.entries.emplace_back("zeta", "/z.so");
  m.entries.emplace_back("alpha", "/a.so");
  std::string err;
  const auto parsed = scratchpad::parse_dependency_manifest(scratchpad::dependency_manifest_to_json(m), &err);
  expect(parsed.has_value(), "parses: " + err);
  expect(parsed->entries == m.entries, "entry order kept");
  expect(!scratchpad::parse_dependency_manifest("{\"version\":7,\"dependencies\":[]}", &err),
         "unknown manifest version rejected");
}

void test_image_magic() {
  expect(!scratchpad::image_matches_platform(""), "empty image");
  expect(!scratchpad::image_matches_platform("MZ\x90\x00"), "foreign image");
#if defined(__linux__)
  expect(scratchpad::image_matches_platform(fake_elf_image()), "elf image");
#endif
}

void test_boundary_generations() {
  TempTree t;
  scratchpad::BoundaryManager mgr((t.root / "staging").string());
  const auto first = mgr.create({"/p"});
  expect(first.valid() && mgr.is_live(first), "created boundary is live");
  expect(mgr.probing_paths(first).value().size() == 1, "probing paths scoped to boundary");
  const std::string dir = mgr.staging_dir(first).value();
  expect(fs::is_directory(dir), "private staging dir");

  const auto ended = mgr.end(first);
  expect(ended.status.ok && ended.ref.pid == 0 && ended.ref.staging_dir == dir, "end returns weak ref");
  expect(!mgr.is_live(first), "ended boundary not live");

  const auto again = mgr.end(first);
  expect(!again.status.ok && again.status.error_code == "stale_boundary", "second end fails loudly");

  const auto second = mgr.create({});
  expect(second.slot == first.slot && second.generation != first.generation, "slot reused, new generation");
  expect(second.id() != first.id(), "distinct ids");

  scratchpad::CompilationOutcome outcome;
  outcome.image = fake_elf_image();
  outcome.image_digest = scratchpad::image_digest(*outcome.image);
  const auto stale_load = mgr.load(first, outcome);
  expect(!stale_load.status.ok && stale_load.status.error_code == "stale_boundary",
         "old handle never reaches the new occupant");
  expect(mgr.live_count() == 1, "one live boundary");
  mgr.end(second);
}

void test_boundary_load_staging() {
  TempTree t;
  scratchpad::BoundaryManager mgr((t.root / "staging").string());
  const auto h = mgr.create({});

  scratchpad::CompilationOutcome bad;
  bad.image = std::string("#!/bin/sh\n");
  const auto rejected = mgr.load(h, bad);
  expect(!rejected.status.ok && rejected.status.error_code == "image_invalid", "bad magic rejected");

#if defined(__linux__)
  scratchpad::CompilationOutcome good;
  good.image = fake_elf_image();
  good.image_digest = scratchpad::image_digest(*good.image);
  good.dependencies.entries.emplace_back("libx", "/x.so");
  const auto loaded = mgr.load(h, good);
  expect(loaded.status.ok, "staged");
  expect(fs::path(loaded.unit.image_path).filename() == "unit-" + good.image_digest.substr(0, 16) + ".so",
         "image named by digest");
  std::string err;
  const auto manifest = scratchpad::read_dependency_manifest(loaded.unit.manifest_path, &err);
  expect(manifest && manifest->entries.size() == 1, "manifest staged next to the image");
#endif

  const auto ref = mgr.end(h).ref;
  scratchpad::ReclamationVerifier verifier({3, std::chrono::milliseconds(5)});
  const auto report = verifier.verify_now(ref);
  expect(report.state == scratchpad::ReclamationState::collected, "staging drained");
  expect(!fs::exists(ref.staging_dir), "staging dir removed");
}

// ============================================================================
// Compiler frontend
// ============================================================================

void test_scaffold_line_mapping() {
  scratchpad::CompilationUnit unit;
  unit.body = "int a = 1;\nSystem.out(a);";
  unit.imports = {"vector"};
  unit.removed_line_count = 3;
  unit.source_name = "demo.cpp";
  const auto scaffold = scratchpad::build_scaffold(unit);

  std::vector<std::string> lines;
  std::istringstream in(scaffold.text);
  for (std::string l; std::getline(in, l);) lines.push_back(l);

  expect(lines.at(scaffold.body_first_line - 1) == "int a = 1;", "body_first_line points at the body");
  expect(lines.at(scaffold.body_first_line - 2) == "#line 4 \"demo.cpp\"", "body remapped to original line 4");
  expect(contains(scaffold.text, "#include <vector>\n"), "imports emitted");
  expect(contains(scaffold.text, "SCRATCHPAD_EXPORT_ENTRY(Script, Main, ConnectionString)"), "export macro");

  // The resync directive names the line that follows it.
  const std::string marker = "\"scratchpad_scaffold.cpp\"";
  bool found = false;
  for (std::size_t i = 0; i < lines.size(); ++i) {
    if (lines[i].rfind("#line ", 0) == 0 && contains(lines[i], marker)) {
      expect(lines[i] == "#line " + std::to_string(i + 2) + " " + marker, "resync line number");
      found = true;
    }
  }
  expect(found, "resync directive present");
  expect(scratchpad::entry_point_name() == "Script.Main", "entry point name");
}

void test_parse_compiler_output() {
  const std::string output =
      "In file included from scratchpad_scaffold.cpp:2:\n"
      "script.cpp:3:5: error: 'y' was not declared in this scope\n"
      "/tmp/cc/scratchpad_scaffold.cpp:20:1: warning: unused variable 'z' [-Wunused-variable]\n"
      "scratchpad_scaffold.cpp:12: error: expected '}'\n"
      "script.cpp:3:5: note: suggested alternative: 'x'\n";
  const auto all = scratchpad::parse_compiler_output(output, "script.cpp");
  expect(all.size() == 4, "four diagnostics");
  expect(all[0].severity == scratchpad::Severity::error && all[0].line == 3 && all[0].column == 5,
         "error position");
  expect(all[0].in_user_code && all[0].code == "error", "user error");
  expect(all[1].code == "-Wunused-variable" && all[1].message == "unused variable 'z'", "warning flag split");
  expect(!all[1].in_user_code, "scaffold warning");
  expect(all[2].line == 12 && all[2].column == 0, "file:line form");
  expect(all[3].severity == scratchpad::Severity::note, "note");

  const auto selected = scratchpad::select_diagnostics(all);
  expect(selected.size() == 2, "only user-located diagnostics");
  for (const auto& d : selected) expect(d.in_user_code, "no plumbing leaks");
}

void test_select_diagnostics_scaffold_only() {
  auto all = scratchpad::parse_compiler_output("scratchpad_scaffold.cpp:9:1: error: broken\n", "script.cpp");
  const auto selected = scratchpad::select_diagnostics(all);
  expect(selected.size() == 1 && !selected[0].in_user_code, "scaffold errors kept when no user error");

  all = scratchpad::parse_compiler_output("script.cpp:1:1: warning: meh [-Wextra]\n", "script.cpp");
  expect(scratchpad::select_diagnostics(all).empty(), "warnings alone select nothing");
}

void test_dependency_name() {
  expect(scratchpad::dependency_name("/a/libfoo.so.1.2") == "libfoo", "versioned so");
  expect(scratchpad::dependency_name("/a/libbar.dylib") == "libbar", "dylib");
  expect(scratchpad::dependency_name("baz.dll") == "baz", "dll");
}

void test_build_arguments() {
  scratchpad::BackendInvocation inv;
  inv.include_dirs = {"/inc"};
  inv.libraries = {"/lib/libx.so"};
  inv.link_flags = {"-pthread"};
  inv.extra_flags = {"-O1"};
  const auto args = scratchpad::SystemCompilerBackend::build_arguments(inv, "/w/s.cpp", "/w/u.so");
  auto pos = [&args](const std::string& a) {
    for (std::size_t i = 0; i < args.size(); ++i) {
      if (args[i] == a) return static_cast<long>(i);
    }
    return -1L;
  };
  expect(pos("-shared") >= 0 && pos("-fPIC") >= 0 && pos("-std=c++20") >= 0, "shared object flags");
  expect(pos("-I/inc") >= 0 && pos("-O1") >= 0, "include dir and extra flag");
  expect(pos("/w/s.cpp") < pos("/lib/libx.so"), "libraries after the source");
  expect(pos("none") > pos("/w/s.cpp") && pos("none") < pos("/lib/libx.so"), "language reset before libraries");
  expect(args[args.size() - 2] == "-o" && args.back() == "/w/u.so", "output last");
}

void test_frontend_failure_paths() {
  scratchpad::ScriptConfig config;
  const auto refs = scratchpad::resolve_references(config);
  const auto unit = unit_for("#include <cmath>\nint x = y;");

  scratchpad::BackendResult failed;
  failed.started = true;
  failed.exit_code = 1;
  failed.output = "script.cpp:2:9: error: 'y' was not declared in this scope\n";
  auto backend = std::make_shared<ScriptedBackend>(failed);
  scratchpad::CompilerFrontend frontend(backend);
  auto outcome = frontend.compile(unit, refs, config);
  expect(!outcome.succeeded() && outcome.error_code == "compilation_failed", "compilation failed");
  expect(outcome.diagnostics.size() == 1 && outcome.diagnostics[0].line == 2, "user line");
  expect(contains(backend->last.scaffold_text, "#line 2 \"script.cpp\""), "scaffold carries offset");

  backend->result.output = "collect2: ld returned 1 exit status\n";
  outcome = frontend.compile(unit, refs, config);
  expect(!outcome.succeeded() && outcome.diagnostics.size() == 1, "synthetic diagnostic");
  expect(outcome.diagnostics[0].code == "compiler" && !outcome.diagnostics[0].in_user_code, "synthetic code");

  backend->result = scratchpad::BackendResult{};
  backend->result.error_message = "executable not found: nope";
  outcome = frontend.compile(unit, refs, config);
  expect(outcome.error_code == "compiler_unavailable", "compiler unavailable");
}

void test_frontend_success_keeps_warnings() {
  scratchpad::ScriptConfig config;
  config.extra_compiler_flags = {"-O2"};
  const auto refs = scratchpad::resolve_references(config);

  scratchpad::BackendResult ok;
  ok.started = true;
  ok.exit_code = 0;
  ok.output = "script.cpp:1:5: warning: unused variable 'q' [-Wunused-variable]\n";
  ok.image = fake_elf_image();
  auto backend = std::make_shared<ScriptedBackend>(ok);
  scratchpad::CompilerFrontend frontend(backend);
  const auto outcome = frontend.compile(unit_for("int q = 0;"), refs, config);
  expect(outcome.succeeded(), "image produced");
  expect(outcome.entry_point == "Script.Main", "entry point");
  expect(outcome.image_digest == scratchpad::image_digest(fake_elf_image()), "image digest");
  expect(outcome.diagnostics.size() == 1 && outcome.diagnostics[0].severity == scratchpad::Severity::warning,
         "warning carried with the image");
  expect(backend->last.extra_flags.size() == 1 && backend->last.extra_flags[0] == "-O2", "extra flags passed");
  expect(!backend->last.include_dirs.empty(), "baseline include dir passed");
}

// ============================================================================
// Output sink
// ============================================================================

void test_output_sink_two_listeners() {
  RecordingObserver observer;
  scratchpad::OutputSink sink(5, &observer);
  sink.write("abc");
  sink.write("");
  sink.write("def");
  sink.structured(scratchpad::DumpRecord{"n", "int", "1"});
  expect(sink.buffer() == "abcde" && sink.truncated(), "buffer bounded");
  expect(observer.fragments == std::vector<std::string>{"abc", "def"}, "observer sees every fragment");
  expect(observer.values.size() == 1 && observer.values[0].label == "n", "structured value forwarded");
  expect(sink.fragments() == 2 && sink.bytes_seen() == 6, "counters");
}

void test_scoped_stream_redirect() {
  std::ostringstream captured;
  std::ostream target(std::cout.rdbuf());
  std::streambuf* original = target.rdbuf();
  {
    scratchpad::ScopedStreamRedirect guard(target, captured.rdbuf());
    target << "inside";
  }
  expect(captured.str() == "inside", "writes captured");
  expect(target.rdbuf() == original, "buffer restored");
}

// ============================================================================
// Observability
// ============================================================================

void test_latency_histogram() {
  scratchpad::LatencyHistogram h;
  expect(h.percentile(0.5) == 0.0, "empty histogram");
  for (int i = 0; i < 10; ++i) h.record(1000);
  h.record(1000000);
  expect(h.count() == 11, "count");
  expect(h.percentile(0.5) > 0.0 && h.percentile(0.5) < h.percentile(1.0), "percentiles ordered");
  expect(contains(h.to_json(), "\"count\":11"), "json");
}

void test_engine_stats_categories() {
  scratchpad::EngineStats stats;
  scratchpad::ExecutionEvent ev;
  ev.ok = false;
  ev.error_code = "timeout";
  ev.duration_ns = 5000;
  stats.record_execution(ev);
  ev.error_code = "stale_boundary";
  stats.record_execution(ev);
  ev.ok = true;
  ev.error_code.clear();
  stats.record_execution(ev);
  stats.record_reclamation(scratchpad::ReclamationEvent{"b-0-1", 1, scratchpad::ReclamationState::collected});

  expect(stats.total_executions == 3 && stats.successful_executions == 1, "totals");
  expect(stats.timeouts == 1 && stats.boundary_errors == 1, "categories");
  expect(stats.reclamations_collected == 1, "reclamation counter");
  expect(stats.failure_categories().at("timeout") == 1, "failure map");
  expect(stats.recent_events_snapshot().size() == 3, "ring");
  const std::string json = scratchpad::execution_event_to_json(ev);
  expect(contains(json, "\"event\":\"execution\"") && !contains(json, "output\":\""), "event carries no output");
}

std::vector<std::string> g_hooked_ids;

void record_execution_hook(const scratchpad::ExecutionEvent& ev) { g_hooked_ids.push_back(ev.boundary_id); }
void record_reclamation_hook(const scratchpad::ReclamationEvent& ev) { g_hooked_ids.push_back(ev.boundary_id); }

void test_event_hooks() {
  scratchpad::set_execution_event_hook(record_execution_hook);
  scratchpad::set_reclamation_event_hook(record_reclamation_hook);
  const auto before = scratchpad::global_engine_stats().reclamations_collected.load();

  scratchpad::ExecutionEvent ev;
  ev.boundary_id = "b-9-1";
  ev.ok = true;
  scratchpad::emit_execution_event(ev);
  scratchpad::ReclamationVerifier verifier({1, std::chrono::milliseconds(1)});
  verifier.verify_now(scratchpad::BoundaryWeakRef{"b-9-2", 0, ""});

  scratchpad::set_execution_event_hook(nullptr);
  scratchpad::set_reclamation_event_hook(nullptr);
  expect(g_hooked_ids == std::vector<std::string>{"b-9-1", "b-9-2"}, "hooks see both events");
  expect(scratchpad::global_engine_stats().reclamations_collected.load() == before + 1,
         "global stats still updated with a hook installed");
  g_hooked_ids.clear();
}

// ============================================================================
// Sandbox + reclamation
// ============================================================================

void test_run_process_capture() {
  scratchpad::ProcessSpec spec;
  spec.command = "sh";
  spec.argv = {"-c", "printf out; printf err 1>&2; exit 3"};
  const auto r = scratchpad::run_process(spec);
  expect(r.error_message.empty(), "started");
  expect(r.stdout_text == "out" && r.stderr_text == "err", "streams captured");
  expect(r.exit_code == 3 && !r.timed_out, "exit code");

  spec.command = "definitely-not-a-command-xyz";
  const auto missing = scratchpad::run_process(spec);
  expect(missing.exit_code == 127 && !missing.error_message.empty(), "missing executable");
}

void test_run_process_timeout() {
  scratchpad::ProcessSpec spec;
  spec.command = "sh";
  spec.argv = {"-c", "sleep 10"};
  spec.timeout_ms = 200;
  const auto start = std::chrono::steady_clock::now();
  const auto r = scratchpad::run_process(spec);
  const auto elapsed = std::chrono::steady_clock::now() - start;
  expect(r.timed_out && r.exit_code == 124, "timed out");
  expect(elapsed < std::chrono::seconds(5), "returned promptly");
}

// True while `pid` exists and is not a zombie waiting for its reaper.
bool process_running(long pid) {
  std::ifstream in("/proc/" + std::to_string(pid) + "/stat");
  std::string line;
  if (!std::getline(in, line)) return false;
  const auto paren = line.rfind(')');
  return paren != std::string::npos && paren + 2 < line.size() && line[paren + 2] != 'Z';
}

void test_run_process_timeout_kills_group() {
  scratchpad::ProcessSpec spec;
  spec.command = "sh";
  spec.argv = {"-c", "sleep 30 & echo $!; wait"};
  spec.timeout_ms = 300;
  const auto r = scratchpad::run_process(spec);
  expect(r.timed_out, "timed out");
  const long grandchild = std::atol(r.stdout_text.c_str());
  expect(grandchild > 0, "background pid reported, got '" + r.stdout_text + "'");
  bool gone = false;
  for (int i = 0; i < 100 && !gone; ++i) {
    gone = !process_running(grandchild);
    if (!gone) std::this_thread::sleep_for(std::chrono::milliseconds(20));
  }
  expect(gone, "background child killed with the group");
}

void test_deadline_saturates() {
  using Clock = std::chrono::steady_clock;
  const auto now = Clock::now();
  const auto far = scratchpad::deadline_after(UINT64_MAX);
  expect(far == Clock::time_point::max(), "max u64 saturates");
  expect(scratchpad::deadline_after(9223372036854775807ULL) > now + std::chrono::hours(1),
         "i64 max lands in the future");
  const auto near = scratchpad::deadline_after(1000);
  expect(near > now && near <= Clock::now() + std::chrono::seconds(1), "small timeout is exact");
}

void test_run_process_huge_timeout() {
  scratchpad::ProcessSpec spec;
  spec.command = "sh";
  spec.argv = {"-c", "echo ok"};
  spec.timeout_ms = UINT64_MAX;
  const auto r = scratchpad::run_process(spec);
  expect(!r.timed_out && r.exit_code == 0, "ran to completion under an unbounded timeout");
  expect(contains(r.stdout_text, "ok"), "output captured");
}

void test_frame_channel_fd() {
  scratchpad::ProcessSpec spec;
  spec.command = "sh";
  spec.argv = {"-c", "printf '{\"type\":\"done\"}\\n' >&3"};
  spec.frame_channel = true;
  auto proc = scratchpad::spawn_process(spec);
  expect(proc.ok() && proc.frame_fd >= 0, "spawned with a frame channel");
  std::string got;
  char buf[256];
  ssize_t n;
  while ((n = ::read(proc.frame_fd, buf, sizeof(buf))) > 0) got.append(buf, static_cast<std::size_t>(n));
  scratchpad::close_process_fds(proc);
  int status = 0;
  ::waitpid(proc.pid, &status, 0);
  expect(got == "{\"type\":\"done\"}\n", "frame written on fd 3");
}

void test_reclamation_collects_killed_process() {
  scratchpad::ProcessSpec spec;
  spec.command = "sh";
  spec.argv = {"-c", "sleep 30"};
  auto proc = scratchpad::spawn_process(spec);
  expect(proc.ok(), "spawned");
  scratchpad::close_process_fds(proc);
  scratchpad::kill_process_group(proc.pid);

  scratchpad::ReclamationVerifier verifier;
  const auto report = verifier.verify_now(scratchpad::BoundaryWeakRef{"b-test", proc.pid, ""});
  expect(report.state == scratchpad::ReclamationState::collected, "killed process collected");
  expect(report.attempts >= 1 && report.attempts <= 10, "within budget");
}

void test_reclamation_watch_list() {
  scratchpad::ProcessSpec spec;
  spec.command = "sh";
  spec.argv = {"-c", "sleep 30"};
  auto proc = scratchpad::spawn_process(spec);
  expect(proc.ok(), "spawned");
  scratchpad::close_process_fds(proc);

  scratchpad::ReclamationVerifier verifier({2, std::chrono::milliseconds(10)});
  const auto report = verifier.verify_now(scratchpad::BoundaryWeakRef{"b-abandoned", proc.pid, ""});
  expect(report.state == scratchpad::ReclamationState::still_reachable && report.attempts == 2,
         "abandoned process still reachable after the budget");
  expect(verifier.watch_list_size() == 1, "kept on the watch list");

  scratchpad::kill_process_group(proc.pid);
  for (int i = 0; i < 100 && verifier.watch_list_size() > 0; ++i) {
    verifier.verify_now(scratchpad::BoundaryWeakRef{"b-noop", 0, ""});
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
  }
  expect(verifier.watch_list_size() == 0, "later passes reap the watch list");
}

void test_reclamation_async_queue() {
  scratchpad::ReclamationVerifier verifier({3, std::chrono::milliseconds(5)});
  std::mutex mu;
  std::vector<std::string> seen;
  verifier.set_report_callback([&](const scratchpad::ReclamationReport& r) {
    std::lock_guard<std::mutex> lk(mu);
    seen.push_back(r.boundary_id);
  });
  verifier.verify(scratchpad::BoundaryWeakRef{"b-1-1", 0, ""});
  verifier.verify(scratchpad::BoundaryWeakRef{"b-2-1", 0, ""});
  verifier.drain();
  std::lock_guard<std::mutex> lk(mu);
  expect(seen == std::vector<std::string>{"b-1-1", "b-2-1"}, "reports in queue order");
}

void test_executor_boundary_error_for_unmappable_image() {
  if (!runner_available()) {
    std::cout << " (runner missing, skipped)";
    return;
  }
  TempTree t;
  scratchpad::BoundaryManager mgr((t.root / "staging").string());
  const auto h = mgr.create({});
  scratchpad::CompilationOutcome outcome;
  outcome.image = fake_elf_image();
  outcome.image_digest = scratchpad::image_digest(*outcome.image);
  const auto loaded = mgr.load(h, outcome);
  expect(loaded.status.ok, "staged");

  scratchpad::ScriptConfig config;
  config.timeout_ms = 10000;
  scratchpad::Executor executor(mgr);
  const auto r = executor.run(h, loaded.unit, "Script.Main", config);
  expect(!r.success && r.error_code == "boundary_error", "boundary error code: " + r.error_code);
  expect(r.error_message && r.error_message->rfind("Boundary error: ", 0) == 0, "distinct message");
  mgr.end(h);
}

void test_executor_rejects_stale_handle() {
  TempTree t;
  scratchpad::BoundaryManager mgr((t.root / "staging").string());
  const auto h = mgr.create({});
  mgr.end(h);
  scratchpad::Executor executor(mgr);
  const auto r = executor.run(h, scratchpad::LoadedUnit{}, "Script.Main", scratchpad::ScriptConfig{});
  expect(!r.success && r.error_code == "stale_boundary", "stale handle");
  expect(r.error_message && r.error_message->rfind("Boundary error: ", 0) == 0, "boundary message");
}

void test_entry_point_split() {
  std::string holder, entry;
  expect(scratchpad::split_entry_point("Script.Main", holder, entry), "splits");
  expect(holder == "Script" && entry == "Main", "holder and method");
  expect(!scratchpad::split_entry_point("NoDot", holder, entry), "missing separator");
  expect(!scratchpad::split_entry_point(".Main", holder, entry), "empty holder");
  expect(scratchpad::signal_name(SIGSEGV) == "SIGSEGV", "signal name");
  expect(contains(scratchpad::describe_signal(SIGFPE), "divide by zero"), "SIGFPE description");
}

// ============================================================================
// End to end (real compiler + host runner)
// ============================================================================

scratchpad::ScriptConfig e2e_config(std::uint64_t timeout_ms = 30000) {
  scratchpad::ScriptConfig config;
  scratchpad::apply_env_overrides(config);
  config.timeout_ms = timeout_ms;
  return config;
}

std::vector<std::string> trace_types(const scratchpad::ExecutionResult& r) {
  std::vector<std::string> out;
  for (const auto& ev : r.trace_events) out.push_back(ev.type);
  return out;
}

void test_scenario_hello() {
  scratchpad::Engine engine;
  const auto r = engine.execute("System.out(\"hi\");", e2e_config());
  expect(r.success, "success: " + r.error_message.value_or(""));
  expect(r.output == "hi", "output is hi, got '" + r.output + "'");
  expect(!r.return_value, "no return value");
  expect(!r.boundary_id.empty() && !r.image_digest.empty(), "boundary and image recorded");
  const std::vector<std::string> expected = {
      "received", "preprocessed", "compiled.succeeded", "boundary.created", "loaded",
      "running", "completed", "boundary.ended", "reclamation.polling", "done"};
  expect(trace_types(r) == expected, "state machine order");
  expect(engine.boundaries().live_count() == 0, "boundary ended before return");
}

void test_scenario_compile_error_lines() {
  scratchpad::Engine engine;
  // Original line 3 holds the undeclared name; line 1 is an import.
  const auto r = engine.execute("#include <cmath>\nint a = 1;\nint b = a + undeclared_name;\n", e2e_config());
  expect(!r.success && r.error_code == "compilation_failed", "compilation failed");
  expect(r.error_message && !r.error_message->empty(), "message present");
  expect(!r.diagnostics.empty(), "diagnostics present");
  for (const auto& d : r.diagnostics) {
    expect(d.in_user_code, "diagnostic in user code: " + d.message);
    expect(d.line == 3, "diagnostic on original line 3, got " + std::to_string(d.line));
  }
  expect(r.boundary_id.empty(), "no boundary for a failed compile");
  expect(trace_types(r).back() == "done" && trace_types(r)[2] == "compiled.failed", "failed path");
}

void test_random_leading_sections_map_lines() {
  const std::vector<std::vector<std::string>> leading_items = {
      {"// note"},
      {""},
      {"#include <cmath>"},
      {"#include <vector>"},
      {"/* one line */"},
      {"/* block", "   continues", "   ends */"},
  };
  std::mt19937 rng(20261019u);
  scratchpad::Engine engine;
  for (int round = 0; round < 8; ++round) {
    std::string src;
    std::size_t lines = 0;
    const int items = std::uniform_int_distribution<int>(0, 6)(rng);
    for (int i = 0; i < items; ++i) {
      const auto& item = leading_items[std::uniform_int_distribution<std::size_t>(0, leading_items.size() - 1)(rng)];
      for (const auto& l : item) {
        src += l + "\n";
        ++lines;
      }
    }
    const int code_lines = std::uniform_int_distribution<int>(0, 5)(rng);
    for (int i = 0; i < code_lines; ++i) {
      src += "int v" + std::to_string(i) + " = " + std::to_string(i) + ";\n";
      ++lines;
    }
    src += "int bad = missing_value_" + std::to_string(round) + ";\n";
    const std::size_t expected_line = lines + 1;

    const auto r = engine.execute(src, e2e_config());
    const std::string where = "round " + std::to_string(round) + ": ";
    expect(!r.success && r.error_code == "compilation_failed", where + "compilation failed");
    bool saw_error = false;
    for (const auto& d : r.diagnostics) {
      if (d.severity != scratchpad::Severity::error) continue;
      saw_error = true;
      expect(d.in_user_code, where + "error in user code: " + d.message);
      expect(d.line == expected_line, where + "expected line " + std::to_string(expected_line) +
                                          ", got " + std::to_string(d.line));
    }
    expect(saw_error, where + "an error diagnostic reported");
  }
}

void test_scenario_missing_semicolon() {
  scratchpad::Engine engine;
  const auto r = engine.execute("// note\nSystem.out(\"a\")\nSystem.out(\"b\");\n", e2e_config());
  expect(!r.success && !r.diagnostics.empty(), "missing semicolon reported");
  for (const auto& d : r.diagnostics) {
    expect(d.in_user_code && (d.line == 2 || d.line == 3),
           "line in original coordinates, got " + std::to_string(d.line));
  }
}

void test_scenario_timeout() {
  scratchpad::Engine engine;
  std::mutex mu;
  std::vector<scratchpad::ReclamationReport> reports;
  engine.verifier().set_report_callback([&](const scratchpad::ReclamationReport& rep) {
    std::lock_guard<std::mutex> lk(mu);
    reports.push_back(rep);
  });
  const auto r = engine.execute("while (true) {}", e2e_config(1000));
  expect(!r.success && r.timed_out && r.error_code == "timeout", "timed out");
  expect(r.error_message.value_or("") == "Script execution timed out after 1000 ms", "timeout message");
  expect(r.metrics.run_duration_ns < 5000000000ULL, "returned promptly");

  engine.verifier().drain();
  std::lock_guard<std::mutex> lk(mu);
  expect(reports.size() == 1, "one reclamation report");
  expect(reports[0].state == scratchpad::ReclamationState::collected, "killed boundary collected");
  expect(reports[0].attempts <= 10, "within the attempt budget");
}

void test_timeout_without_termination() {
  scratchpad::Engine engine(scratchpad::EngineOptions{"", nullptr, {2, std::chrono::milliseconds(10)}});
  auto config = e2e_config(500);
  config.terminate_on_timeout = false;
  const auto r = engine.execute("while (true) {}", config);
  expect(r.timed_out, "timed out");
  engine.verifier().drain();
  expect(engine.verifier().watch_list_size() == 1, "abandoned process watched");

  std::int64_t pid = 0;
  for (const auto& ev : r.trace_events) {
    if (ev.type == "boundary.ended") pid = std::stoll(ev.data.at("pid"));
  }
  expect(pid > 0, "abandoned pid recorded in the trace");
  scratchpad::kill_process_group(static_cast<pid_t>(pid));
  for (int i = 0; i < 100 && engine.verifier().watch_list_size() > 0; ++i) {
    engine.verifier().verify_now(scratchpad::BoundaryWeakRef{"b-noop", 0, ""});
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
  }
  expect(engine.verifier().watch_list_size() == 0, "reaped once killed");
}

void test_scenario_divide_by_zero() {
  scratchpad::Engine engine;
  std::string src =
      "#include <stdexcept>\n"
      "System.outln(\"one\");\n"
      "System.outln(\"two\");\n"
      "System.outln(\"three\");\n"
      "volatile int zero = 0;\n";
#if defined(__x86_64__) || defined(__i386__)
  src += "int q = 10 / zero;\nSystem.outln(q);\n";
#else
  // Integer division does not trap on this architecture.
  src += "if (zero == 0) throw std::domain_error(\"Attempted to divide by zero\");\n";
#endif
  const auto r = engine.execute(src, e2e_config());
  expect(!r.success && r.error_code == "runtime_fault", "runtime fault: " + r.error_code);
  expect(r.output == "one\ntwo\nthree\n", "exactly the three prior lines, got '" + r.output + "'");
  expect(contains(r.error_message.value_or(""), "divide by zero"), "message names the division fault");
}

void test_raw_stdout_kept_on_fault() {
  scratchpad::Engine engine;
  const auto r = engine.execute(
      "#include <cstdio>\n#include <cstdlib>\n"
      "std::printf(\"one\\n\");\n"
      "std::puts(\"two\");\n"
      "std::abort();\n",
      e2e_config());
  expect(!r.success && r.error_code == "runtime_fault", "runtime fault: " + r.error_code);
  expect(contains(r.output, "one\n") && contains(r.output, "two"),
         "raw stdout before the fault kept, got '" + r.output + "'");
}

void test_raw_stdout_kept_on_timeout() {
  scratchpad::Engine engine;
  const auto r = engine.execute("#include <cstdio>\nstd::printf(\"tick\\n\");\nwhile (true) {}\n",
                                e2e_config(1000));
  expect(r.timed_out && r.error_code == "timeout", "timed out");
  expect(contains(r.output, "tick"), "raw stdout before the timeout kept, got '" + r.output + "'");
}

void test_scenario_static_counter_isolation() {
  scratchpad::Engine engine;
  const std::string src =
      "static int counter = 0;\n"
      "counter++;\n"
      "dump(counter, \"counter\");\n"
      "return counter;\n";
  for (int run = 0; run < 2; ++run) {
    const auto r = engine.execute(src, e2e_config());
    expect(r.success, "run succeeded: " + r.error_message.value_or(""));
    expect(r.dumps.size() == 1 && r.dumps[0].label == "counter", "dumped once");
    expect(r.dumps[0].text == "1", "run " + std::to_string(run) + " observed " + r.dumps[0].text);
    expect(r.return_value && r.return_value->text == "1" && r.return_value->type_name == "int",
           "return value");
  }
}

void test_partial_output_on_exception() {
  scratchpad::Engine engine;
  const auto r = engine.execute(
      "#include <stdexcept>\nSystem.out(\"before\");\nthrow std::runtime_error(\"boom\");\n", e2e_config());
  expect(!r.success && r.error_code == "runtime_fault", "fault");
  expect(r.output == "before", "partial output kept");
  expect(r.error_message.value_or("") == "boom", "exception message");
  expect(r.error_cause && r.error_cause->kind == "exception" &&
             r.error_cause->type_name == "std::runtime_error",
         "cause recorded");
}

void test_nested_exception_unwrapped() {
  scratchpad::Engine engine;
  const auto r = engine.execute(
      "#include <exception>\n#include <stdexcept>\n"
      "try { throw std::invalid_argument(\"inner\"); }\n"
      "catch (...) { std::throw_with_nested(std::runtime_error(\"outer\")); }\n",
      e2e_config());
  expect(!r.success, "fault");
  expect(r.error_message.value_or("") == "inner", "inner message reported");
  expect(r.error_cause && r.error_cause->kind == "nested_exception", "nested kind");
  expect(r.error_cause->type_name == "std::invalid_argument", "inner type");
  expect(contains(r.error_cause->detail, "outer"), "outer kept as cause");
}

void test_streaming_order_and_dumps() {
  scratchpad::Engine engine;
  RecordingObserver observer;
  const auto r = engine.execute(
      "for (int i = 0; i < 5; ++i) System.out(i);\n"
      "std::vector<int> v{1, 2, 3};\n"
      "dump(v, \"v\");\n",
      e2e_config(), &observer);
  expect(r.success, "success: " + r.error_message.value_or(""));
  expect(observer.fragments == std::vector<std::string>{"0", "1", "2", "3", "4"}, "fragments in order");
  std::string joined;
  for (const auto& f : observer.fragments) joined += f;
  expect(joined == r.output, "streamed and buffered copies agree");
  expect(observer.values.size() == 1 && observer.values[0].text == "[1, 2, 3]", "structured value streamed");
  expect(r.metrics.output_fragments == 5, "fragment count");
}

void test_connection_string_and_return() {
  scratchpad::Engine engine;
  auto config = e2e_config();
  config.connection_string = "Server=db;Database=app";
  const auto r = engine.execute("System.out(ConnectionString);\nreturn 6 * 7;\n", config);
  expect(r.success, "success: " + r.error_message.value_or(""));
  expect(r.output == "Server=db;Database=app", "connection string injected");
  expect(r.return_value && r.return_value->text == "42" && r.return_value->type_name == "int", "return value");

  const auto text = engine.execute("return \"done\";", e2e_config());
  expect(text.return_value && text.return_value->text == "done", "string return");
}

void test_output_truncation() {
  scratchpad::Engine engine;
  RecordingObserver observer;
  auto config = e2e_config();
  config.max_output_bytes = 4;
  const auto r = engine.execute("System.out(\"abcdefgh\");", config, &observer);
  expect(r.success && r.output == "abcd" && r.output_truncated, "buffer truncated");
  expect(observer.fragments.size() == 1 && observer.fragments[0] == "abcdefgh", "observer unbounded");
}

void test_missing_entry_point_is_boundary_error() {
  scratchpad::Engine engine;
  const auto config = e2e_config();
  const auto outcome = engine.compile("System.out(1);", config);
  expect(outcome.succeeded(), "compiled");
  auto& mgr = engine.boundaries();
  const auto h = mgr.create({});
  const auto loaded = mgr.load(h, outcome);
  expect(loaded.status.ok, "loaded");
  scratchpad::Executor executor(mgr);
  const auto r = executor.run(h, loaded.unit, "Script.Missing", config);
  expect(r.error_code == "boundary_error", "boundary error, got " + r.error_code);
  expect(contains(r.error_message.value_or(""), "Boundary error: "), "distinct message");
  expect(contains(r.error_message.value_or(""), "Script.Missing"), "names the entry point");
  mgr.end(h);
}

void test_concurrent_executions() {
  scratchpad::Engine engine;
  std::vector<scratchpad::ExecutionResult> results(3);
  std::vector<std::thread> threads;
  for (int i = 0; i < 3; ++i) {
    threads.emplace_back([&engine, &results, i] {
      results[i] = engine.execute("System.out(" + std::to_string(i) + ");", e2e_config());
    });
  }
  for (auto& t : threads) t.join();
  for (int i = 0; i < 3; ++i) {
    expect(results[i].success && results[i].output == std::to_string(i), "independent output");
  }
  expect(results[0].boundary_id != results[1].boundary_id, "distinct boundaries");
}

void test_stats_recorded() {
  const auto before = scratchpad::global_engine_stats().total_executions.load();
  scratchpad::Engine engine;
  engine.execute("System.out(1);", e2e_config());
  expect(scratchpad::global_engine_stats().total_executions.load() == before + 1, "execution counted");
}

}  // namespace

int main() {
  std::cout << "=== Scratchpad Engine Test Suite ===\n";

  std::cout << "\n[Hashing]\n";
  run_test("BLAKE3 known vectors", test_blake3_known_vectors);
  run_test("domain separation", test_domain_separation);

  std::cout << "\n[Preprocessor]\n";
  run_test("leading section stripped", test_preprocess_leading_section);
  run_test("crlf and one-line block comment", test_preprocess_crlf_and_inline_block);
  run_test("unterminated comment swallows body", test_preprocess_unterminated_comment_swallows_body);
  run_test("code-only source", test_preprocess_only_code);
  run_test("include matching", test_match_import);
  run_test("import merge", test_compilation_unit_import_merge);

  std::cout << "\n[Configuration]\n";
  run_test("full config parse", test_config_parse_full);
  run_test("bad config rejected", test_config_rejects_bad_input);
  run_test("validation warnings", test_config_validate_warnings);
  run_test("environment overrides", test_config_env_overrides);

  std::cout << "\n[Wire]\n";
  run_test("jsonlite sorted output", test_jsonlite_sorted_output);
  run_test("frame stream", test_wire_frames_stream);
  run_test("garbage frames", test_wire_rejects_garbage);
  run_test("version compatibility", test_version_compatibility);

  std::cout << "\n[Reference resolver]\n";
  run_test("baseline references", test_baseline_references);
  run_test("package cache layout", test_package_layout);
  run_test("package cache root precedence", test_package_cache_root_precedence);

  std::cout << "\n[Isolation]\n";
  run_test("runtime identifiers", test_runtime_identifiers);
  run_test("native candidates", test_native_candidates);
  run_test("native resolution order", test_native_resolution_order);
  run_test("managed resolution order", test_managed_resolution_order);
  run_test("dependency manifest order", test_dependency_manifest_preserves_order);
  run_test("image magic", test_image_magic);
  run_test("boundary generations", test_boundary_generations);
  run_test("boundary staging", test_boundary_load_staging);

  std::cout << "\n[Compiler frontend]\n";
  run_test("scaffold line mapping", test_scaffold_line_mapping);
  run_test("compiler output parsing", test_parse_compiler_output);
  run_test("scaffold-only diagnostics", test_select_diagnostics_scaffold_only);
  run_test("dependency names", test_dependency_name);
  run_test("compiler arguments", test_build_arguments);
  run_test("frontend failure paths", test_frontend_failure_paths);
  run_test("frontend success keeps warnings", test_frontend_success_keeps_warnings);

  std::cout << "\n[Output + observability]\n";
  run_test("sink with two listeners", test_output_sink_two_listeners);
  run_test("scoped stream redirect", test_scoped_stream_redirect);
  run_test("latency histogram", test_latency_histogram);
  run_test("engine stats categories", test_engine_stats_categories);
  run_test("event hooks", test_event_hooks);

  std::cout << "\n[Process layer + reclamation]\n";
  run_test("process capture", test_run_process_capture);
  run_test("process timeout", test_run_process_timeout);
  run_test("timeout kills the process group", test_run_process_timeout_kills_group);
  run_test("deadline saturates", test_deadline_saturates);
  run_test("process with unbounded timeout", test_run_process_huge_timeout);
  run_test("frame channel on fd 3", test_frame_channel_fd);
  run_test("killed process collected", test_reclamation_collects_killed_process);
  run_test("watch list", test_reclamation_watch_list);
  run_test("async verification queue", test_reclamation_async_queue);
  run_test("unmappable image is a boundary error", test_executor_boundary_error_for_unmappable_image);
  run_test("stale handle rejected by executor", test_executor_rejects_stale_handle);
  run_test("entry point names", test_entry_point_split);

  std::cout << "\n[End to end]\n";
  run_e2e("scenario A: hello", test_scenario_hello);
  run_e2e("scenario B: diagnostics in original lines", test_scenario_compile_error_lines);
  run_e2e("random leading sections keep original lines", test_random_leading_sections_map_lines);
  run_e2e("scenario B: missing semicolon", test_scenario_missing_semicolon);
  run_e2e("scenario C: timeout", test_scenario_timeout);
  run_e2e("abandoned boundary on timeout", test_timeout_without_termination);
  run_e2e("scenario D: divide by zero", test_scenario_divide_by_zero);
  run_e2e("raw stdout kept on fault", test_raw_stdout_kept_on_fault);
  run_e2e("raw stdout kept on timeout", test_raw_stdout_kept_on_timeout);
  run_e2e("scenario E: static counter isolation", test_scenario_static_counter_isolation);
  run_e2e("partial output on exception", test_partial_output_on_exception);
  run_e2e("nested exception unwrapped", test_nested_exception_unwrapped);
  run_e2e("streaming order and dumps", test_streaming_order_and_dumps);
  run_e2e("connection string and return value", test_connection_string_and_return);
  run_e2e("output truncation", test_output_truncation);
  run_e2e("missing entry point", test_missing_entry_point_is_boundary_error);
  run_e2e("concurrent executions", test_concurrent_executions);
  run_e2e("stats recorded", test_stats_recorded);

  std::cout << "\n=== " << g_tests_passed << "/" << g_tests_run << " tests passed";
  if (g_tests_skipped > 0) std::cout << " (" << g_tests_skipped << " skipped)";
  std::cout << " ===\n";
  return g_tests_passed == g_tests_run ? 0 : 1;
}
