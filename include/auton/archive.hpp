#pragma once

// auton/archive.hpp: Append-only record of finished sessions.
//
// LAYOUT:
//   <dir>/<session>.ndjson        uncompressed
//   <dir>/<session>.ndjson.zst    zstd, when built with AUTON_WITH_ZSTD and
//                                 compression == "zstd"
//   Line 1:  {"v":1,"kind":"header","session":..,"user":..,"project":..,
//             "phase":..,"reason":..,"archived_at":..,"frames":N,"events":M}
//   Then N   {"kind":"frame","data":"<encoded protocol frame>"}
//   Then M   {"kind":"event","record":{<SessionEventRecord>}}
//   Readers detect compression by the zstd magic bytes, not the file name.
//   An archive file is written once and never rewritten.

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "auton/session.hpp"

namespace auton {

struct ArchiveConfig {
  std::string dir;                 // empty disables archiving
  std::string compression{"off"};  // "off" | "zstd"
};

struct SessionArchive {
  std::string session_id;
  std::string user_id;
  std::string project_id;
  std::string final_phase;
  std::string reason;
  std::uint64_t archived_at_unix_ms{0};
  std::vector<std::string> frames;  // encoded frames without the trailing '\n'
  std::vector<SessionEventRecord> events;
};

bool zstd_compiled_in();

SessionArchive archive_of(const SessionMachine& session);

std::string archive_to_ndjson(const SessionArchive& archive);
std::optional<SessionArchive> archive_from_ndjson(const std::string& text, std::string* error);

// Returns the path written.
std::optional<std::string> write_archive(const ArchiveConfig& config, const SessionArchive& archive,
                                         std::string* error);
std::optional<SessionArchive> read_archive(const std::string& path, std::string* error);

}  // namespace auton
