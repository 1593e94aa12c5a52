#include "scratchpad/output.hpp"

#include "scratchpad/sandbox.hpp"

namespace scratchpad {

void OutputSink::write(const std::string& fragment) {
  if (fragment.empty()) return;
  ++fragments_;
  bytes_seen_ += fragment.size();
  append_limited(buffer_, fragment.data(), fragment.size(), max_bytes_, truncated_);
  if (observer_) observer_->on_output_fragment(fragment);
}

void OutputSink::structured(const DumpRecord& value) {
  if (observer_) observer_->on_structured_value(value);
}

}  // namespace scratchpad
