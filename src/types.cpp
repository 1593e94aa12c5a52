#include "scratchpad/types.hpp"

#include <sstream>

namespace scratchpad {

std::string to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::none: return "";
    case ErrorCode::json_parse_error: return "json_parse_error";
    case ErrorCode::json_duplicate_key: return "json_duplicate_key";
    case ErrorCode::config_invalid: return "config_invalid";
    case ErrorCode::baseline_unavailable: return "baseline_unavailable";
    case ErrorCode::compiler_unavailable: return "compiler_unavailable";
    case ErrorCode::compilation_failed: return "compilation_failed";
    case ErrorCode::image_invalid: return "image_invalid";
    case ErrorCode::stale_boundary: return "stale_boundary";
    case ErrorCode::boundary_error: return "boundary_error";
    case ErrorCode::runner_unavailable: return "runner_unavailable";
    case ErrorCode::protocol_error: return "protocol_error";
    case ErrorCode::timeout: return "timeout";
    case ErrorCode::runtime_fault: return "runtime_fault";
  }
  return "";
}

std::string to_string(Severity severity) {
  switch (severity) {
    case Severity::note: return "note";
    case Severity::warning: return "warning";
    case Severity::error: return "error";
  }
  return "error";
}

std::string to_string(ReclamationState state) {
  switch (state) {
    case ReclamationState::collected: return "collected";
    case ReclamationState::still_reachable: return "still_reachable";
  }
  return "still_reachable";
}

std::string BoundaryHandle::id() const {
  std::ostringstream oss;
  oss << "b-" << slot << "-" << generation;
  return oss.str();
}

}  // namespace scratchpad
