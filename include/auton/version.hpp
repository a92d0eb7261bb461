#pragma once

// auton/version.hpp: Explicit version manifest for every persisted or wire
// format.
//
// INVARIANT:
//   Readers check the matching constant before trusting data. A frame,
//   history record or archive announcing a newer version than the one
//   compiled in is rejected, never guessed at.

#include <cstdint>
#include <string>

namespace auton {
namespace version {

// NDJSON frame schema between front-end and executor ("v" field).
constexpr uint32_t PROTOCOL_FRAMING_VERSION = 1;

// users/<user>.ndjson record layout and chain rule.
constexpr uint32_t PREFERENCE_HISTORY_VERSION = 1;

// Session event record layout and chain rule.
constexpr uint32_t EVENT_LOG_VERSION = 1;

// Session archive layout (header line, frames, events).
constexpr uint32_t ARCHIVE_FORMAT_VERSION = 1;

constexpr const char* ENGINE_SEMVER = "0.1.0";

struct VersionManifest {
  uint32_t protocol_framing{PROTOCOL_FRAMING_VERSION};
  uint32_t preference_history{PREFERENCE_HISTORY_VERSION};
  uint32_t event_log{EVENT_LOG_VERSION};
  uint32_t archive_format{ARCHIVE_FORMAT_VERSION};
  std::string engine_semver;
  std::string hash_primitive;
  std::string build_timestamp;
  bool zstd_available{false};
};

VersionManifest current_manifest();
std::string manifest_to_json(const VersionManifest& m);

}  // namespace version
}  // namespace auton
