#include "scratchpad/wire.hpp"

#include <variant>

#include "scratchpad/jsonlite.hpp"

namespace scratchpad {

namespace {

std::optional<FrameType> frame_type_from(const std::string& s) {
  if (s == "hello") return FrameType::hello;
  if (s == "out") return FrameType::out;
  if (s == "dump") return FrameType::dump;
  if (s == "return") return FrameType::ret;
  if (s == "fault") return FrameType::fault;
  if (s == "boundary_error") return FrameType::boundary_error;
  if (s == "done") return FrameType::done;
  return std::nullopt;
}

}  // namespace

std::string to_string(FrameType type) {
  switch (type) {
    case FrameType::hello: return "hello";
    case FrameType::out: return "out";
    case FrameType::dump: return "dump";
    case FrameType::ret: return "return";
    case FrameType::fault: return "fault";
    case FrameType::boundary_error: return "boundary_error";
    case FrameType::done: return "done";
  }
  return "unknown";
}

std::string encode_frame(const Frame& f) {
  jsonlite::Object o;
  o["type"] = jsonlite::Value(to_string(f.type));
  switch (f.type) {
    case FrameType::hello:
      o["protocol"] = jsonlite::Value(f.protocol);
      o["pid"] = jsonlite::Value(f.pid);
      break;
    case FrameType::out:
      o["text"] = jsonlite::Value(f.text);
      break;
    case FrameType::dump:
      o["label"] = jsonlite::Value(f.label);
      o["type_name"] = jsonlite::Value(f.type_name);
      o["text"] = jsonlite::Value(f.text);
      break;
    case FrameType::ret:
      o["type_name"] = jsonlite::Value(f.type_name);
      o["text"] = jsonlite::Value(f.text);
      break;
    case FrameType::fault:
      o["kind"] = jsonlite::Value(f.kind);
      o["type_name"] = jsonlite::Value(f.type_name);
      o["message"] = jsonlite::Value(f.message);
      o["detail"] = jsonlite::Value(f.detail);
      break;
    case FrameType::boundary_error:
      o["message"] = jsonlite::Value(f.message);
      break;
    case FrameType::done:
      break;
  }
  std::string line = jsonlite::to_json(jsonlite::Value(std::move(o)));
  line += '\n';
  return line;
}

std::optional<Frame> decode_frame(const std::string& line, std::string* error) {
  std::optional<jsonlite::JsonError> err;
  const auto obj = jsonlite::parse(line, &err);
  if (err) {
    if (error) *error = err->code + ": " + err->message;
    return std::nullopt;
  }
  const auto type = frame_type_from(jsonlite::get_string(obj, "type"));
  if (!type) {
    if (error) *error = "unknown frame type: " + jsonlite::get_string(obj, "type");
    return std::nullopt;
  }
  Frame f;
  f.type = *type;
  f.protocol = jsonlite::get_u64(obj, "protocol", 0);
  f.pid = jsonlite::get_u64(obj, "pid", 0);
  f.text = jsonlite::get_string(obj, "text");
  f.label = jsonlite::get_string(obj, "label");
  f.type_name = jsonlite::get_string(obj, "type_name");
  f.kind = jsonlite::get_string(obj, "kind");
  f.message = jsonlite::get_string(obj, "message");
  f.detail = jsonlite::get_string(obj, "detail");
  return f;
}

void FrameReader::feed(const char* data, std::size_t len) {
  buffer_.append(data, len);
}

bool FrameReader::next(Frame& out, std::string* error) {
  while (true) {
    const auto nl = buffer_.find('\n');
    if (nl == std::string::npos) return false;
    std::string line = buffer_.substr(0, nl);
    buffer_.erase(0, nl + 1);
    if (line.empty()) continue;
    auto frame = decode_frame(line, error);
    if (!frame) return false;
    out = std::move(*frame);
    return true;
  }
}

}  // namespace scratchpad
