#pragma once

// auton/hash.hpp: BLAKE3 digests for every tamper-evident structure.
//
// BLAKE3 is the only hash primitive. Domain prefixes keep digests of
// different structures apart; they are part of the on-disk format:
//   "pref:"  preference history record chain
//   "snap:"  frozen project snapshot
//   "event:" session event log chain
//   "env:"   sandbox environment id derivation

#include <string>
#include <string_view>

namespace auton {

struct HashRuntimeInfo {
  std::string primitive;
  std::string version;
};

HashRuntimeInfo hash_runtime_info();

// 64-char lowercase hex digest.
std::string blake3_hex(std::string_view payload);
std::string hash_domain(std::string_view domain, std::string_view payload);

// Digest of `payload` chained to `prev_digest` (empty for the first link).
std::string chain_digest(std::string_view domain, std::string_view prev_digest,
                         std::string_view payload);

bool is_hex_digest(std::string_view s);

}  // namespace auton
