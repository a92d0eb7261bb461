#include "auton/hash.hpp"

#include <array>
#include <initializer_list>

extern "C" {
#include <blake3.h>
}

namespace auton {
namespace {

constexpr char kHexChars[] = "0123456789abcdef";

std::string to_hex(const unsigned char* data, std::size_t len) {
  std::string out;
  out.resize(len * 2);
  for (std::size_t i = 0; i < len; ++i) {
    out[i * 2] = kHexChars[data[i] >> 4];
    out[i * 2 + 1] = kHexChars[data[i] & 0x0f];
  }
  return out;
}

// BLAKE3 over the concatenation of `parts`, as lowercase hex.
std::string digest_of(std::initializer_list<std::string_view> parts) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  for (std::string_view part : parts) blake3_hasher_update(&hasher, part.data(), part.size());
  std::array<unsigned char, BLAKE3_OUT_LEN> out{};
  blake3_hasher_finalize(&hasher, out.data(), out.size());
  return to_hex(out.data(), out.size());
}

}  // namespace

HashRuntimeInfo hash_runtime_info() {
  HashRuntimeInfo info;
  info.primitive = "blake3";
  info.version = blake3_version();
  return info;
}

std::string blake3_hex(std::string_view payload) { return digest_of({payload}); }

std::string hash_domain(std::string_view domain, std::string_view payload) {
  return digest_of({domain, payload});
}

std::string chain_digest(std::string_view domain, std::string_view prev_digest,
                         std::string_view payload) {
  // prev is fixed-width hex (or empty for the genesis link), so the
  // concatenation is unambiguous.
  return digest_of({domain, prev_digest, "|", payload});
}

bool is_hex_digest(std::string_view s) {
  if (s.size() != 64) return false;
  for (char c : s) {
    if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) return false;
  }
  return true;
}

}  // namespace auton
