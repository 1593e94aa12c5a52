#pragma once

// scratchpad/wire.hpp - NDJSON frames between a boundary process and the coordinator.
//
// The host runner writes one JSON object per line on kFrameFd:
//
//   {"type":"hello","protocol":1,"pid":1234}
//   {"type":"out","text":"..."}
//   {"type":"dump","label":"...","type_name":"...","text":"..."}
//   {"type":"return","type_name":"...","text":"..."}
//   {"type":"fault","kind":"exception","type_name":"...","message":"...","detail":"..."}
//   {"type":"boundary_error","message":"..."}
//   {"type":"done"}
//
// INVARIANTS:
//   - hello is always the first frame; its protocol must equal
//     version::PROTOCOL_FRAMING_VERSION.
//   - Frames are written whole with one write() each; a frame is never
//     split across writers.
//   - At most one of {done, fault, boundary_error} terminates a stream. A
//     stream that ends without one means the runner died (signal or exit).

#include <cstdint>
#include <optional>
#include <string>

namespace scratchpad {

enum class FrameType { hello, out, dump, ret, fault, boundary_error, done };

std::string to_string(FrameType type);

struct Frame {
  FrameType type{FrameType::out};
  std::uint64_t protocol{0};
  std::uint64_t pid{0};
  std::string text;
  std::string label;
  std::string type_name;
  std::string kind;
  std::string message;
  std::string detail;
};

// Encodes one frame, newline-terminated.
std::string encode_frame(const Frame& frame);

// Decodes one line (without the newline). nullopt + *error on malformed input.
std::optional<Frame> decode_frame(const std::string& line, std::string* error);

// Splits a byte stream into frames. Partial trailing lines are held until
// the next feed().
class FrameReader {
 public:
  void feed(const char* data, std::size_t len);
  // Returns false when no complete line is buffered. A malformed line sets
  // *error and is consumed.
  bool next(Frame& out, std::string* error);
  bool has_partial() const { return !buffer_.empty(); }

 private:
  std::string buffer_;
};

}  // namespace scratchpad
