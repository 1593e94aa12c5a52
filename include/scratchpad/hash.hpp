#pragma once

// scratchpad/hash.hpp - BLAKE3 digests for sources, images and references.
//
// Domain separation prefixes ("src:", "img:", "ref:") keep a source digest
// from ever colliding with an image digest of the same bytes. The prefixes
// are part of the staging layout: images are staged as unit-<digest16>.so.

#include <string>
#include <string_view>

namespace scratchpad {

struct HashRuntimeInfo {
  std::string primitive;
  std::string version;
};

std::string blake3_hex(std::string_view payload);
HashRuntimeInfo hash_runtime_info();

std::string hash_domain(std::string_view domain, std::string_view payload);
std::string source_digest(std::string_view source_text);
std::string image_digest(std::string_view image_bytes);
std::string reference_set_digest(std::string_view canonical_reference_list);

}  // namespace scratchpad
