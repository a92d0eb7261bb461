#include "auton/version.hpp"

#include <sstream>

namespace auton {
namespace version {

VersionManifest current_manifest() {
  VersionManifest m;
  m.engine_semver = ENGINE_SEMVER;
  m.hash_primitive = "blake3";
  m.build_timestamp = std::string(__DATE__) + "T" + std::string(__TIME__);
#if defined(AUTON_WITH_ZSTD)
  m.zstd_available = true;
#endif
  return m;
}

std::string manifest_to_json(const VersionManifest& m) {
  std::ostringstream o;
  o << "{"
    << "\"protocol_framing\":" << m.protocol_framing
    << ",\"preference_history\":" << m.preference_history
    << ",\"event_log\":" << m.event_log
    << ",\"archive_format\":" << m.archive_format
    << ",\"engine_semver\":\"" << m.engine_semver << "\""
    << ",\"hash_primitive\":\"" << m.hash_primitive << "\""
    << ",\"build_timestamp\":\"" << m.build_timestamp << "\""
    << ",\"zstd\":" << (m.zstd_available ? "true" : "false")
    << "}";
  return o.str();
}

}  // namespace version
}  // namespace auton
