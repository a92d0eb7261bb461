#include "auton/archive.hpp"

#include <filesystem>
#include <fstream>
#include <random>

#if defined(AUTON_WITH_ZSTD)
#include <zstd.h>
#endif

#include "auton/jsonlite.hpp"
#include "auton/version.hpp"

namespace fs = std::filesystem;

namespace auton {

namespace {

using jsonlite::Object;

constexpr unsigned char kZstdMagic[4] = {0x28, 0xB5, 0x2F, 0xFD};

bool has_zstd_magic(const std::string& data) {
  return data.size() >= 4 && static_cast<unsigned char>(data[0]) == kZstdMagic[0] &&
         static_cast<unsigned char>(data[1]) == kZstdMagic[1] &&
         static_cast<unsigned char>(data[2]) == kZstdMagic[2] &&
         static_cast<unsigned char>(data[3]) == kZstdMagic[3];
}

#if defined(AUTON_WITH_ZSTD)
std::string compress_zstd(const std::string& data) {
  std::string out;
  out.resize(ZSTD_compressBound(data.size()));
  size_t n = ZSTD_compress(out.data(), out.size(), data.data(), data.size(), 3);
  if (ZSTD_isError(n)) return {};
  out.resize(n);
  return out;
}

std::optional<std::string> decompress_zstd(const std::string& data) {
  const unsigned long long size = ZSTD_getFrameContentSize(data.data(), data.size());
  if (size == ZSTD_CONTENTSIZE_ERROR || size == ZSTD_CONTENTSIZE_UNKNOWN) return std::nullopt;
  std::string out;
  out.resize(static_cast<std::size_t>(size));
  size_t n = ZSTD_decompress(out.data(), out.size(), data.data(), data.size());
  if (ZSTD_isError(n)) return std::nullopt;
  out.resize(n);
  return out;
}
#endif

std::string make_tmp_name(const fs::path& dir) {
  static thread_local std::mt19937_64 rng(std::random_device{}());
  return (dir / (".tmp_" + std::to_string(rng()))).string();
}

}  // namespace

bool zstd_compiled_in() {
#if defined(AUTON_WITH_ZSTD)
  return true;
#else
  return false;
#endif
}

SessionArchive archive_of(const SessionMachine& session) {
  SessionArchive a;
  a.session_id = session.id();
  a.user_id = session.user_id();
  a.project_id = session.project_id();
  a.final_phase = to_string(session.phase());
  a.reason = session.terminal_reason();
  a.archived_at_unix_ms = now_unix_ms();
  for (const auto& msg : session.transcript()) {
    std::string line = encode(msg);
    if (!line.empty() && line.back() == '\n') line.pop_back();
    a.frames.push_back(std::move(line));
  }
  a.events = session.events();
  return a;
}

std::string archive_to_ndjson(const SessionArchive& a) {
  Object header;
  header["v"] = static_cast<std::uint64_t>(version::ARCHIVE_FORMAT_VERSION);
  header["kind"] = "header";
  header["session"] = a.session_id;
  header["user"] = a.user_id;
  header["project"] = a.project_id;
  header["phase"] = a.final_phase;
  header["reason"] = a.reason;
  header["archived_at"] = a.archived_at_unix_ms;
  header["frames"] = static_cast<std::uint64_t>(a.frames.size());
  header["events"] = static_cast<std::uint64_t>(a.events.size());

  std::string out = jsonlite::to_json(header) + "\n";
  for (const auto& f : a.frames) {
    Object o;
    o["kind"] = "frame";
    o["data"] = f;
    out += jsonlite::to_json(o) + "\n";
  }
  for (const auto& e : a.events) {
    std::optional<jsonlite::JsonError> jerr;
    auto record = jsonlite::parse_value(event_record_to_json(e), &jerr);
    Object o;
    o["kind"] = "event";
    o["record"] = record ? std::move(*record) : jsonlite::Value();
    out += jsonlite::to_json(o) + "\n";
  }
  return out;
}

std::optional<SessionArchive> archive_from_ndjson(const std::string& text, std::string* error) {
  SessionArchive a;
  bool have_header = false;
  std::uint64_t want_frames = 0;
  std::uint64_t want_events = 0;
  std::size_t start = 0;
  std::size_t line_no = 0;
  while (start < text.size()) {
    std::size_t nl = text.find('\n', start);
    if (nl == std::string::npos) nl = text.size();
    const std::string line = text.substr(start, nl - start);
    start = nl + 1;
    ++line_no;
    if (line.empty()) continue;

    std::optional<jsonlite::JsonError> jerr;
    Object o = jsonlite::parse(line, &jerr);
    if (jerr) {
      if (error) *error = "archive line " + std::to_string(line_no) + ": " + jerr->message;
      return std::nullopt;
    }
    const std::string kind = jsonlite::get_string(o, "kind", "");
    if (!have_header) {
      if (kind != "header") {
        if (error) *error = "archive does not start with a header";
        return std::nullopt;
      }
      if (jsonlite::get_u64(o, "v", 0) > version::ARCHIVE_FORMAT_VERSION) {
        if (error) *error = "unsupported archive version";
        return std::nullopt;
      }
      have_header = true;
      a.session_id = jsonlite::get_string(o, "session", "");
      a.user_id = jsonlite::get_string(o, "user", "");
      a.project_id = jsonlite::get_string(o, "project", "");
      a.final_phase = jsonlite::get_string(o, "phase", "");
      a.reason = jsonlite::get_string(o, "reason", "");
      a.archived_at_unix_ms = jsonlite::get_u64(o, "archived_at", 0);
      want_frames = jsonlite::get_u64(o, "frames", 0);
      want_events = jsonlite::get_u64(o, "events", 0);
      continue;
    }
    if (kind == "frame") {
      a.frames.push_back(jsonlite::get_string(o, "data", ""));
    } else if (kind == "event") {
      const Object* rec = jsonlite::get_object(o, "record");
      if (!rec) {
        if (error) *error = "archive line " + std::to_string(line_no) + ": event without record";
        return std::nullopt;
      }
      std::string rerr;
      auto r = event_record_from_json(jsonlite::to_json(*rec), &rerr);
      if (!r) {
        if (error) *error = "archive line " + std::to_string(line_no) + ": " + rerr;
        return std::nullopt;
      }
      a.events.push_back(std::move(*r));
    } else {
      if (error) *error = "archive line " + std::to_string(line_no) + ": unknown kind '" + kind + "'";
      return std::nullopt;
    }
  }
  if (!have_header) {
    if (error) *error = "empty archive";
    return std::nullopt;
  }
  if (a.frames.size() != want_frames || a.events.size() != want_events) {
    if (error) *error = "archive truncated";
    return std::nullopt;
  }
  return a;
}

std::optional<std::string> write_archive(const ArchiveConfig& config, const SessionArchive& archive,
                                         std::string* error) {
  if (config.dir.empty()) {
    if (error) *error = "archive dir not configured";
    return std::nullopt;
  }
  std::error_code ec;
  fs::create_directories(config.dir, ec);
  if (ec) {
    if (error) *error = config.dir + ": " + ec.message();
    return std::nullopt;
  }

  std::string data = archive_to_ndjson(archive);
  std::string name = archive.session_id + ".ndjson";
#if defined(AUTON_WITH_ZSTD)
  if (config.compression == "zstd") {
    std::string c = compress_zstd(data);
    if (!c.empty()) {
      data = std::move(c);
      name += ".zst";
    }
  }
#endif

  const fs::path target = fs::path(config.dir) / name;
  const std::string tmp = make_tmp_name(config.dir);
  {
    std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
    ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
    if (!ofs) {
      if (error) *error = "cannot write " + tmp;
      fs::remove(tmp, ec);
      return std::nullopt;
    }
  }
  fs::rename(tmp, target, ec);
  if (ec) {
    if (error) *error = target.string() + ": " + ec.message();
    fs::remove(tmp, ec);
    return std::nullopt;
  }
  return target.string();
}

std::optional<SessionArchive> read_archive(const std::string& path, std::string* error) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) {
    if (error) *error = "cannot open " + path;
    return std::nullopt;
  }
  std::string data((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
  if (has_zstd_magic(data)) {
#if defined(AUTON_WITH_ZSTD)
    auto plain = decompress_zstd(data);
    if (!plain) {
      if (error) *error = path + ": corrupt zstd stream";
      return std::nullopt;
    }
    data = std::move(*plain);
#else
    if (error) *error = path + ": compressed archive but built without zstd";
    return std::nullopt;
#endif
  }
  return archive_from_ndjson(data, error);
}

}  // namespace auton
