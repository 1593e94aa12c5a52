// scratchpad-host - program executed inside every boundary process.
//
// Usage (invoked by the Executor, not by hand):
//   scratchpad-host --image <unit.so> --manifest <unit.deps.json>
//                   --holder Script --entry Main --property ConnectionString
//                   [--probe <dir>]...
// Connection string: $SCRATCHPAD_BOUNDARY_CONNECTION_STRING.
//
// Everything the coordinator learns comes back as frames on kFrameFd.

#include <cxxabi.h>
#include <dlfcn.h>
#include <fcntl.h>
#include <signal.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <typeinfo>
#include <vector>

#include "scratchpad/boundary.hpp"
#include "scratchpad/executor.hpp"
#include "scratchpad/host_api.h"
#include "scratchpad/output.hpp"
#include "scratchpad/sandbox.hpp"
#include "scratchpad/version.hpp"
#include "scratchpad/wire.hpp"

namespace {

using namespace scratchpad;

struct RunnerArgs {
  std::string image;
  std::string manifest;
  std::string holder;
  std::string entry;
  std::string property;
  std::vector<std::string> probes;
};

struct RunnerContext {
  DependencyManifest manifest;
  std::vector<std::string> probes;
  bool returned{false};
};

std::mutex g_frame_mu;

void write_all(int fd, const char* data, std::size_t len) {
  while (len > 0) {
    const ssize_t n = ::write(fd, data, len);
    if (n < 0) {
      if (errno == EINTR) continue;
      return;
    }
    data += n;
    len -= static_cast<std::size_t>(n);
  }
}

void send(const Frame& f) {
  const std::string line = encode_frame(f);
  std::lock_guard<std::mutex> lk(g_frame_mu);
  write_all(kFrameFd, line.data(), line.size());
}

void send_boundary_error(const std::string& message) {
  Frame f;
  f.type = FrameType::boundary_error;
  f.message = message;
  send(f);
}

std::string demangle(const char* name) {
  if (!name) return "unknown";
  int status = 0;
  std::unique_ptr<char, void (*)(void*)> out(abi::__cxa_demangle(name, nullptr, nullptr, &status),
                                             std::free);
  return (status == 0 && out) ? std::string(out.get()) : std::string(name);
}

// ---------------------------------------------------------------------------
// Fatal signals
// ---------------------------------------------------------------------------
// Frames are encoded before the handlers are installed; the handler only
// calls write() and raise().

constexpr int kFatalSignals[] = {SIGFPE, SIGSEGV, SIGBUS, SIGILL, SIGABRT};
std::string g_signal_frames[sizeof(kFatalSignals) / sizeof(kFatalSignals[0])];
std::string g_intdiv_frame;

std::string signal_frame(int signo, const std::string& message) {
  Frame f;
  f.type = FrameType::fault;
  f.kind = "signal";
  f.type_name = signal_name(signo);
  f.message = message;
  return encode_frame(f);
}

void on_fatal_signal(int signo, siginfo_t* info, void*) {
  const std::string* frame = nullptr;
  if (signo == SIGFPE && info && info->si_code == FPE_INTDIV) {
    frame = &g_intdiv_frame;
  } else {
    for (std::size_t i = 0; i < sizeof(kFatalSignals) / sizeof(kFatalSignals[0]); ++i) {
      if (kFatalSignals[i] == signo) frame = &g_signal_frames[i];
    }
  }
  if (frame) write_all(kFrameFd, frame->data(), frame->size());
  // SA_RESETHAND restored the default action; die with the original signal.
  ::raise(signo);
}

void install_signal_handlers() {
  for (std::size_t i = 0; i < sizeof(kFatalSignals) / sizeof(kFatalSignals[0]); ++i) {
    g_signal_frames[i] = signal_frame(kFatalSignals[i], describe_signal(kFatalSignals[i]));
  }
  g_intdiv_frame = signal_frame(SIGFPE, "Attempted to divide by zero (SIGFPE: integer divide by zero)");

  // Stack overflows still get their frame.
  static std::vector<char> alt_stack(64 * 1024);
  stack_t ss{};
  ss.ss_sp = alt_stack.data();
  ss.ss_size = alt_stack.size();
  ::sigaltstack(&ss, nullptr);

  struct sigaction sa {};
  sa.sa_sigaction = on_fatal_signal;
  sa.sa_flags = SA_SIGINFO | SA_RESETHAND | SA_NODEFER | SA_ONSTACK;
  sigemptyset(&sa.sa_mask);
  for (int signo : kFatalSignals) ::sigaction(signo, &sa, nullptr);
}

// ---------------------------------------------------------------------------
// Host API callbacks
// ---------------------------------------------------------------------------

void api_write(void*, const char* data, size_t len) {
  Frame f;
  f.type = FrameType::out;
  f.text.assign(data, len);
  send(f);
}

void api_dump(void*, const char* label, const char* type_name, const char* text) {
  Frame f;
  f.type = FrameType::dump;
  f.label = label ? label : "";
  f.type_name = type_name ? type_name : "";
  f.text = text ? text : "";
  send(f);
}

void api_set_return(void* ctx, const char* type_name, const char* text) {
  auto* rc = static_cast<RunnerContext*>(ctx);
  if (rc->returned) return;
  rc->returned = true;
  Frame f;
  f.type = FrameType::ret;
  f.type_name = type_name ? type_name : "";
  f.text = text ? text : "";
  send(f);
}

void* api_load_native(void* ctx, const char* name) {
  if (!name || !name[0]) return nullptr;
  auto* rc = static_cast<RunnerContext*>(ctx);
  const std::string path =
      resolve_native_path(name, rc->manifest, rc->probes, runtime_identifier(), host_os_family());
  return ::dlopen(path.empty() ? name : path.c_str(), RTLD_NOW | RTLD_GLOBAL);
}

// std::cout inside the script becomes out frames. Unbuffered, so frames
// keep the order in which the script produced them.
class FrameStreambuf : public std::streambuf {
 protected:
  int_type overflow(int_type ch) override {
    if (traits_type::eq_int_type(ch, traits_type::eof())) return traits_type::not_eof(ch);
    const char c = traits_type::to_char_type(ch);
    api_write(nullptr, &c, 1);
    return ch;
  }
  std::streamsize xsputn(const char* s, std::streamsize n) override {
    if (n > 0) api_write(nullptr, s, static_cast<size_t>(n));
    return n;
  }
};

void report_exception(const std::exception& e) {
  Frame f;
  f.type = FrameType::fault;
  f.kind = "exception";
  f.type_name = demangle(typeid(e).name());
  f.message = e.what();
  // One level of wrapping: report the inner exception, keep the outer as detail.
  if (const auto* nested = dynamic_cast<const std::nested_exception*>(&e)) {
    if (nested->nested_ptr()) {
      try {
        nested->rethrow_nested();
      } catch (const std::exception& inner) {
        f.kind = "nested_exception";
        f.detail = f.type_name + ": " + f.message;
        f.type_name = demangle(typeid(inner).name());
        f.message = inner.what();
      } catch (...) {
        f.kind = "nested_exception";
        f.detail = f.type_name + ": " + f.message;
        f.type_name = demangle(abi::__cxa_current_exception_type()
                                   ? abi::__cxa_current_exception_type()->name()
                                   : nullptr);
        f.message = "non-standard exception of type " + f.type_name;
      }
    }
  }
  send(f);
}

bool parse_args(int argc, char** argv, RunnerArgs& out) {
  for (int i = 1; i + 1 < argc; i += 2) {
    const std::string key = argv[i];
    const std::string value = argv[i + 1];
    if (key == "--image") out.image = value;
    else if (key == "--manifest") out.manifest = value;
    else if (key == "--holder") out.holder = value;
    else if (key == "--entry") out.entry = value;
    else if (key == "--property") out.property = value;
    else if (key == "--probe") out.probes.push_back(value);
    else return false;
  }
  return !out.image.empty() && !out.holder.empty() && !out.entry.empty();
}

template <typename Fn>
Fn lookup(void* handle, const std::string& symbol) {
  return reinterpret_cast<Fn>(::dlsym(handle, symbol.c_str()));
}

}  // namespace

int main(int argc, char** argv) {
  // stdout is a pipe, so stdio would block-buffer it. Unbuffered, a raw
  // printf reaches the coordinator before a later fault or timeout kill.
  std::setvbuf(stdout, nullptr, _IONBF, 0);

  if (::fcntl(kFrameFd, F_GETFD) < 0) {
    std::cerr << "scratchpad-host: frame channel (fd " << kFrameFd << ") is not open\n";
    return 2;
  }
  install_signal_handlers();

  Frame hello;
  hello.type = FrameType::hello;
  hello.protocol = version::PROTOCOL_FRAMING_VERSION;
  hello.pid = static_cast<std::uint64_t>(::getpid());
  send(hello);

  RunnerArgs args;
  if (!parse_args(argc, argv, args)) {
    send_boundary_error("invalid host runner arguments");
    return 2;
  }

  RunnerContext ctx;
  ctx.probes = args.probes;
  if (!args.manifest.empty()) {
    std::string err;
    auto manifest = read_dependency_manifest(args.manifest, &err);
    if (!manifest) {
      send_boundary_error(err);
      return 2;
    }
    ctx.manifest = std::move(*manifest);
  }

  // Managed dependencies go in first, globally, so the image's DT_NEEDED
  // entries bind to them instead of whatever the default search would find.
  for (const auto& [name, recorded] : ctx.manifest.entries) {
    const std::string path = resolve_managed_path(name, ctx.manifest, ctx.probes);
    const std::string target = path.empty() ? name + ".so" : path;
    if (!::dlopen(target.c_str(), RTLD_NOW | RTLD_GLOBAL)) {
      std::cerr << "scratchpad-host: dependency " << name << " not preloaded: " << ::dlerror() << "\n";
    }
  }

  void* image = ::dlopen(args.image.c_str(), RTLD_NOW | RTLD_LOCAL);
  if (!image) {
    const char* err = ::dlerror();
    send_boundary_error(std::string("cannot map image: ") + (err ? err : "unknown error"));
    return 2;
  }

  using VersionFn = unsigned (*)();
  using BindFn = int (*)(const scratchpad_host_api*);
  using SetterFn = void (*)(const char*);
  using EntryFn = void (*)();

  auto version_fn = lookup<VersionFn>(image, "scratchpad_scaffold_version");
  if (!version_fn) {
    send_boundary_error("image does not export scratchpad_scaffold_version");
    return 2;
  }
  const auto compat = version::check_compatibility(version::PROTOCOL_FRAMING_VERSION, version_fn());
  if (!compat.ok) {
    send_boundary_error(compat.description);
    return 2;
  }

  const std::string entry_symbol = "scratchpad_" + args.holder + "_" + args.entry;
  auto entry_fn = lookup<EntryFn>(image, entry_symbol);
  if (!entry_fn) {
    send_boundary_error("entry point " + args.holder + "." + args.entry + " not found (symbol " +
                        entry_symbol + ")");
    return 2;
  }
  auto bind_fn = lookup<BindFn>(image, "scratchpad_bind_host");
  SetterFn setter_fn = nullptr;
  if (!args.property.empty()) {
    const std::string setter_symbol = "scratchpad_" + args.holder + "_set_" + args.property;
    setter_fn = lookup<SetterFn>(image, setter_symbol);
    if (!setter_fn) {
      send_boundary_error("property " + args.holder + "." + args.property + " not found (symbol " +
                          setter_symbol + ")");
      return 2;
    }
  }

  static scratchpad_host_api api{};
  api.abi_version = SCRATCHPAD_HOST_ABI_VERSION;
  api.ctx = &ctx;
  api.write = api_write;
  api.dump = api_dump;
  api.set_return = api_set_return;
  api.load_native = api_load_native;
  if (!bind_fn || bind_fn(&api) != 0) {
    send_boundary_error("image rejected host API version " + std::to_string(SCRATCHPAD_HOST_ABI_VERSION));
    return 2;
  }

  if (setter_fn) {
    const char* conn = std::getenv("SCRATCHPAD_BOUNDARY_CONNECTION_STRING");
    setter_fn(conn ? conn : "");
  }

  bool faulted = false;
  {
    FrameStreambuf frame_buf;
    ScopedStreamRedirect redirect(std::cout, &frame_buf);
    try {
      entry_fn();
    } catch (const std::exception& e) {
      report_exception(e);
      faulted = true;
    } catch (...) {
      const std::type_info* t = abi::__cxa_current_exception_type();
      Frame f;
      f.type = FrameType::fault;
      f.kind = "exception";
      f.type_name = demangle(t ? t->name() : nullptr);
      f.message = "Script threw a non-standard exception of type " + f.type_name;
      send(f);
      faulted = true;
    }
  }
  std::fflush(stdout);

  if (faulted) return 1;
  Frame done;
  done.type = FrameType::done;
  send(done);
  return 0;
}
