#pragma once

// scratchpad/output.hpp - Output sink with two listeners, and scoped redirects.
//
// One OutputSink per execution. Every fragment goes through write(), which
// performs both side effects in one place:
//   1. append to the result buffer (bounded by max_bytes)
//   2. forward to the OutputObserver, if any
// so the buffered copy and the streamed copy can never disagree on order.
// The observer always sees every fragment; truncation applies to the
// buffer only.
//
// The sink is single-threaded: the coordinator feeds it from the one
// thread that drains the boundary process's pipes.

#include <cstddef>
#include <ostream>
#include <streambuf>
#include <string>

#include "scratchpad/types.hpp"

namespace scratchpad {

class OutputObserver {
 public:
  virtual ~OutputObserver() = default;
  // Called once per fragment, in arrival order, on the executing thread.
  virtual void on_output_fragment(const std::string& text) = 0;
  virtual void on_structured_value(const DumpRecord& value) { (void)value; }
};

class OutputSink {
 public:
  explicit OutputSink(std::size_t max_bytes, OutputObserver* observer = nullptr)
      : max_bytes_(max_bytes), observer_(observer) {}

  void write(const std::string& fragment);
  void structured(const DumpRecord& value);

  const std::string& buffer() const { return buffer_; }
  std::string take_buffer() { return std::move(buffer_); }
  bool truncated() const { return truncated_; }
  std::size_t fragments() const { return fragments_; }
  std::size_t bytes_seen() const { return bytes_seen_; }

 private:
  std::size_t max_bytes_;
  OutputObserver* observer_;
  std::string buffer_;
  bool truncated_{false};
  std::size_t fragments_{0};
  std::size_t bytes_seen_{0};
};

// Swaps a stream's buffer for the lifetime of the guard and restores the
// previous one on every exit path.
class ScopedStreamRedirect {
 public:
  ScopedStreamRedirect(std::ostream& stream, std::streambuf* replacement)
      : stream_(stream), previous_(stream.rdbuf(replacement)) {}
  ~ScopedStreamRedirect() {
    stream_.flush();
    stream_.rdbuf(previous_);
  }
  ScopedStreamRedirect(const ScopedStreamRedirect&) = delete;
  ScopedStreamRedirect& operator=(const ScopedStreamRedirect&) = delete;

 private:
  std::ostream& stream_;
  std::streambuf* previous_;
};

}  // namespace scratchpad
