#include "auton/preference_store.hpp"

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>

#include "auton/hash.hpp"
#include "auton/jsonlite.hpp"
#include "auton/observability.hpp"
#include "auton/version.hpp"

namespace fs = std::filesystem;

namespace auton {

namespace {

using jsonlite::Object;

// RAII flock holder over an owned descriptor.
class LockedFile {
 public:
  LockedFile(const std::string& path, int flags, int lock_op) {
    fd_ = open(path.c_str(), flags | O_CLOEXEC, 0644);
    if (fd_ < 0) {
      error_ = path + ": " + std::strerror(errno);
      return;
    }
    while (flock(fd_, lock_op) != 0) {
      if (errno == EINTR) continue;
      error_ = path + ": flock: " + std::strerror(errno);
      close(fd_);
      fd_ = -1;
      return;
    }
  }
  ~LockedFile() {
    if (fd_ >= 0) {
      flock(fd_, LOCK_UN);
      close(fd_);
    }
  }
  LockedFile(const LockedFile&) = delete;
  LockedFile& operator=(const LockedFile&) = delete;

  bool ok() const { return fd_ >= 0; }
  int fd() const { return fd_; }
  const std::string& error() const { return error_; }

 private:
  int fd_{-1};
  std::string error_;
};

bool read_all(int fd, std::string& out) {
  out.clear();
  if (lseek(fd, 0, SEEK_SET) < 0) return false;
  char buf[8192];
  while (true) {
    const ssize_t n = read(fd, buf, sizeof(buf));
    if (n > 0) {
      out.append(buf, static_cast<std::size_t>(n));
      continue;
    }
    if (n == 0) return true;
    if (errno == EINTR) continue;
    return false;
  }
}

bool write_all(int fd, const std::string& data) {
  std::size_t off = 0;
  while (off < data.size()) {
    const ssize_t n = write(fd, data.data() + off, data.size() - off);
    if (n > 0) {
      off += static_cast<std::size_t>(n);
      continue;
    }
    if (n < 0 && errno == EINTR) continue;
    return false;
  }
  return true;
}

std::string file_component(const std::string& id) {
  bool safe = !id.empty() && id.size() <= 128 && id != "." && id != "..";
  for (char c : id) {
    if (!((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
          c == '-' || c == '_' || c == '.')) {
      safe = false;
      break;
    }
  }
  if (safe) return id;
  return "h-" + blake3_hex(id).substr(0, 32);
}

double clamp_confidence(double c) {
  if (!(c >= 0.0)) return 0.0;
  if (c > 1.0) return 1.0;
  return std::round(c * 1e6) / 1e6;
}

Object record_body(const PreferenceRecord& r) {
  Object o;
  o["v"] = static_cast<std::uint64_t>(version::PREFERENCE_HISTORY_VERSION);
  o["seq"] = r.seq;
  o["key"] = r.fact.key;
  o["value"] = r.fact.value;
  o["confidence"] = r.fact.confidence;
  o["source_session"] = r.fact.source_session;
  o["timestamp"] = r.fact.timestamp_unix_ms;
  o["prev"] = r.prev_digest;
  return o;
}

std::string record_digest(const PreferenceRecord& r) {
  return chain_digest("pref:", r.prev_digest, jsonlite::to_json(record_body(r)));
}

std::string record_line(const PreferenceRecord& r) {
  Object o = record_body(r);
  o["digest"] = r.digest;
  std::string line = jsonlite::to_json(o);
  line += '\n';
  return line;
}

std::optional<PreferenceRecord> parse_record(const std::string& line, std::string* error) {
  std::optional<jsonlite::JsonError> jerr;
  Object o = jsonlite::parse(line, &jerr);
  if (jerr) {
    if (error) *error = jerr->message;
    return std::nullopt;
  }
  if (jsonlite::get_u64(o, "v", 0) > version::PREFERENCE_HISTORY_VERSION) {
    if (error) *error = "unsupported history version";
    return std::nullopt;
  }
  PreferenceRecord r;
  r.seq = jsonlite::get_u64(o, "seq", 0);
  r.fact.key = jsonlite::get_string(o, "key", "");
  r.fact.value = jsonlite::get_string(o, "value", "");
  r.fact.confidence = jsonlite::get_double(o, "confidence", 0.0);
  r.fact.source_session = jsonlite::get_string(o, "source_session", "");
  r.fact.timestamp_unix_ms = jsonlite::get_u64(o, "timestamp", 0);
  r.prev_digest = jsonlite::get_string(o, "prev", "");
  r.digest = jsonlite::get_string(o, "digest", "");
  if (r.fact.key.empty() || r.seq == 0) {
    if (error) *error = "record missing key or seq";
    return std::nullopt;
  }
  return r;
}

bool parse_history(const std::string& data, std::vector<PreferenceRecord>& out, std::string* error) {
  std::size_t start = 0;
  std::size_t line_no = 0;
  while (start < data.size()) {
    std::size_t nl = data.find('\n', start);
    if (nl == std::string::npos) nl = data.size();
    const std::string line = data.substr(start, nl - start);
    start = nl + 1;
    ++line_no;
    if (line.empty()) continue;
    std::string perr;
    auto rec = parse_record(line, &perr);
    if (!rec) {
      if (error) *error = "history line " + std::to_string(line_no) + ": " + perr;
      return false;
    }
    out.push_back(std::move(*rec));
  }
  return true;
}

bool record_before(const PreferenceRecord& a, const PreferenceRecord& b) {
  if (fact_precedes(a.fact, b.fact)) return true;
  if (fact_precedes(b.fact, a.fact)) return false;
  return a.seq < b.seq;
}

std::map<std::string, const PreferenceRecord*> fold_effective(
    const std::vector<PreferenceRecord>& history) {
  std::map<std::string, std::vector<const PreferenceRecord*>> by_key;
  for (const auto& r : history) by_key[r.fact.key].push_back(&r);
  std::map<std::string, const PreferenceRecord*> out;
  for (auto& [key, recs] : by_key) {
    std::sort(recs.begin(), recs.end(),
              [](const PreferenceRecord* a, const PreferenceRecord* b) { return record_before(*a, *b); });
    out[key] = recs.back();
  }
  return out;
}

Object fact_to_object(const PreferenceFact& f) {
  Object o;
  o["value"] = f.value;
  o["confidence"] = f.confidence;
  o["source_session"] = f.source_session;
  o["timestamp"] = f.timestamp_unix_ms;
  return o;
}

Object snapshot_body(const ProjectSnapshot& s) {
  Object facts;
  for (const auto& [k, f] : s.facts) facts[k] = fact_to_object(f);
  Object o;
  o["v"] = static_cast<std::uint64_t>(version::PREFERENCE_HISTORY_VERSION);
  o["project"] = s.project_id;
  o["user"] = s.user_id;
  o["frozen_at"] = s.frozen_at_unix_ms;
  o["facts"] = std::move(facts);
  return o;
}

std::string make_tmp_path(const fs::path& dir) {
  static thread_local std::mt19937_64 rng(std::random_device{}());
  return (dir / (".tmp_" + std::to_string(rng()))).string();
}

// Creates `target` with `data` only if it does not exist yet. link() fails
// with EEXIST when another writer won, which makes this safe across
// processes. Returns true if this call created the file.
bool create_exclusive(const fs::path& target, const std::string& data, std::string* error) {
  const std::string tmp = make_tmp_path(target.parent_path());
  {
    std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
    if (!ofs) {
      if (error) *error = "cannot write " + tmp;
      return false;
    }
    ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
    if (!ofs) {
      if (error) *error = "cannot write " + tmp;
      std::error_code ec;
      fs::remove(tmp, ec);
      return false;
    }
  }
  const int rc = link(tmp.c_str(), target.c_str());
  const int saved = errno;
  std::error_code ec;
  fs::remove(tmp, ec);
  if (rc != 0) {
    if (error) *error = saved == EEXIST ? "exists" : std::string(std::strerror(saved));
    return false;
  }
  return true;
}

std::optional<std::string> read_text(const std::string& path) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) return std::nullopt;
  return std::string((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
}

}  // namespace

std::vector<PreferenceFact> effective_facts(const std::vector<PreferenceRecord>& history) {
  std::vector<PreferenceFact> out;
  for (const auto& [key, rec] : fold_effective(history)) out.push_back(rec->fact);
  return out;
}

std::string snapshot_digest(const ProjectSnapshot& s) {
  return hash_domain("snap:", jsonlite::to_json(snapshot_body(s)));
}

std::string snapshot_to_json(const ProjectSnapshot& s) {
  Object o = snapshot_body(s);
  o["digest"] = s.digest;
  return jsonlite::to_json(o);
}

std::optional<ProjectSnapshot> snapshot_from_json(const std::string& text, std::string* error) {
  std::optional<jsonlite::JsonError> jerr;
  Object o = jsonlite::parse(text, &jerr);
  if (jerr) {
    if (error) *error = jerr->message;
    return std::nullopt;
  }
  ProjectSnapshot s;
  s.project_id = jsonlite::get_string(o, "project", "");
  s.user_id = jsonlite::get_string(o, "user", "");
  s.frozen_at_unix_ms = jsonlite::get_u64(o, "frozen_at", 0);
  s.digest = jsonlite::get_string(o, "digest", "");
  if (const Object* facts = jsonlite::get_object(o, "facts")) {
    for (const auto& [key, value] : *facts) {
      const auto* fo = std::get_if<Object>(&value.v);
      if (!fo) continue;
      PreferenceFact f;
      f.key = key;
      f.value = jsonlite::get_string(*fo, "value", "");
      f.confidence = jsonlite::get_double(*fo, "confidence", 0.0);
      f.source_session = jsonlite::get_string(*fo, "source_session", "");
      f.timestamp_unix_ms = jsonlite::get_u64(*fo, "timestamp", 0);
      s.facts[key] = std::move(f);
    }
  }
  if (s.digest != snapshot_digest(s)) {
    if (error) *error = "snapshot digest mismatch";
    return std::nullopt;
  }
  return s;
}

FilePreferenceStore::FilePreferenceStore(std::string root) : root_(std::move(root)) {}

std::string FilePreferenceStore::user_path(const std::string& user_id) const {
  return (fs::path(root_) / "users" / (file_component(user_id) + ".ndjson")).string();
}

std::string FilePreferenceStore::project_path(const std::string& project_id,
                                              const char* suffix) const {
  return (fs::path(root_) / "projects" / (file_component(project_id) + suffix)).string();
}

std::vector<PreferenceRecord> FilePreferenceStore::read_history_file(const std::string& path,
                                                                     std::string* error) const {
  std::vector<PreferenceRecord> out;
  std::error_code ec;
  if (!fs::exists(path, ec)) return out;
  LockedFile f(path, O_RDONLY, LOCK_SH);
  if (!f.ok()) {
    if (error) *error = f.error();
    return out;
  }
  std::string data;
  if (!read_all(f.fd(), data)) {
    if (error) *error = path + ": read failed";
    return out;
  }
  if (!parse_history(data, out, error)) out.clear();
  return out;
}

std::vector<PreferenceRecord> FilePreferenceStore::history(const std::string& user_id) const {
  std::lock_guard<std::mutex> lk(mu_);
  std::string error;
  auto out = read_history_file(user_path(user_id), &error);
  if (!error.empty()) std::cerr << "[prefs] " << error << "\n";
  return out;
}

std::optional<std::vector<PreferenceRecord>> FilePreferenceStore::load_history(
    const std::string& user_id, std::string* error) const {
  std::lock_guard<std::mutex> lk(mu_);
  std::string rerr;
  auto out = read_history_file(user_path(user_id), &rerr);
  if (!rerr.empty()) {
    if (error) *error = rerr;
    return std::nullopt;
  }
  return out;
}

std::vector<PreferenceFact> FilePreferenceStore::get(const std::string& user_id) const {
  return effective_facts(history(user_id));
}

UpsertOutcome FilePreferenceStore::upsert(const std::string& user_id, const PreferenceFact& fact) {
  UpsertOutcome outcome;
  if (fact.key.empty()) {
    outcome.error = "empty preference key";
    return outcome;
  }
  std::lock_guard<std::mutex> lk(mu_);
  const std::string path = user_path(user_id);
  std::error_code ec;
  fs::create_directories(fs::path(path).parent_path(), ec);
  if (ec) {
    outcome.error = to_string(ErrorCode::store_io) + ": " + ec.message();
    return outcome;
  }

  LockedFile f(path, O_RDWR | O_CREAT | O_APPEND, LOCK_EX);
  if (!f.ok()) {
    outcome.error = to_string(ErrorCode::store_io) + ": " + f.error();
    return outcome;
  }
  std::string data;
  std::vector<PreferenceRecord> records;
  std::string perr;
  if (!read_all(f.fd(), data) || !parse_history(data, records, &perr)) {
    outcome.error = to_string(ErrorCode::store_io) + ": " + (perr.empty() ? "read failed" : perr);
    return outcome;
  }

  PreferenceRecord rec;
  rec.seq = records.empty() ? 1 : records.back().seq + 1;
  rec.fact = fact;
  rec.fact.confidence = clamp_confidence(fact.confidence);
  if (rec.fact.timestamp_unix_ms == 0) rec.fact.timestamp_unix_ms = now_unix_ms();
  rec.prev_digest = records.empty() ? std::string{} : records.back().digest;
  rec.digest = record_digest(rec);

  for (const auto& existing : records) {
    if (existing.fact.key == rec.fact.key && fact_precedes(rec.fact, existing.fact)) {
      outcome.conflict = true;
      break;
    }
  }

  if (!write_all(f.fd(), record_line(rec)) || fsync(f.fd()) != 0) {
    outcome.error = to_string(ErrorCode::store_io) + ": append failed: " + std::strerror(errno);
    return outcome;
  }

  records.push_back(rec);
  const auto folded = fold_effective(records);
  auto it = folded.find(rec.fact.key);
  outcome.ok = true;
  outcome.seq = rec.seq;
  outcome.effective = it != folded.end() && it->second->seq == rec.seq;
  if (outcome.conflict) {
    conflicts_.fetch_add(1, std::memory_order_relaxed);
    global_executor_stats().preference_conflicts.fetch_add(1, std::memory_order_relaxed);
  }
  return outcome;
}

bool FilePreferenceStore::verify_history(const std::string& user_id, std::string* error) const {
  std::lock_guard<std::mutex> lk(mu_);
  std::string rerr;
  const auto records = read_history_file(user_path(user_id), &rerr);
  if (!rerr.empty()) {
    if (error) *error = rerr;
    return false;
  }
  std::string prev;
  std::uint64_t expected_seq = 1;
  for (const auto& r : records) {
    if (r.seq != expected_seq) {
      if (error) *error = "seq gap at " + std::to_string(r.seq);
      return false;
    }
    if (r.prev_digest != prev) {
      if (error) *error = "broken prev link at seq " + std::to_string(r.seq);
      return false;
    }
    if (r.digest != record_digest(r)) {
      if (error) *error = "digest mismatch at seq " + std::to_string(r.seq);
      return false;
    }
    prev = r.digest;
    ++expected_seq;
  }
  return true;
}

bool FilePreferenceStore::register_project(const std::string& project_id,
                                           const std::string& user_id, std::string* error) {
  std::lock_guard<std::mutex> lk(mu_);
  const fs::path owner = project_path(project_id, ".owner");
  std::error_code ec;
  fs::create_directories(owner.parent_path(), ec);
  if (ec) {
    if (error) *error = to_string(ErrorCode::store_io) + ": " + ec.message();
    return false;
  }
  std::string cerr;
  if (create_exclusive(owner, user_id, &cerr)) return true;
  auto existing = read_text(owner.string());
  if (!existing) {
    if (error) *error = to_string(ErrorCode::store_io) + ": " + cerr;
    return false;
  }
  if (*existing != user_id) {
    if (error) *error = "project " + project_id + " is bound to another user";
    return false;
  }
  return true;
}

std::optional<ProjectSnapshot> FilePreferenceStore::snapshot_for_project(
    const std::string& project_id, std::string* error) {
  const std::string snap_path = project_path(project_id, ".json");
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (auto text = read_text(snap_path)) return snapshot_from_json(*text, error);
  }

  auto owner = [&]() {
    std::lock_guard<std::mutex> lk(mu_);
    return read_text(project_path(project_id, ".owner"));
  }();
  if (!owner) {
    if (error) *error = "project " + project_id + " is not registered";
    return std::nullopt;
  }

  // A history that cannot be read must not be frozen as an empty snapshot.
  std::string herr;
  const auto records = load_history(*owner, &herr);
  if (!records) {
    std::cerr << "[prefs] snapshot " << project_id << ": " << herr << "\n";
    if (error) *error = to_string(ErrorCode::store_io) + ": " + herr;
    return std::nullopt;
  }

  ProjectSnapshot snap;
  snap.project_id = project_id;
  snap.user_id = *owner;
  snap.frozen_at_unix_ms = now_unix_ms();
  for (auto& f : effective_facts(*records)) snap.facts[f.key] = std::move(f);
  snap.digest = snapshot_digest(snap);

  std::lock_guard<std::mutex> lk(mu_);
  std::string cerr;
  if (create_exclusive(snap_path, snapshot_to_json(snap), &cerr)) return snap;
  // Lost the race against another freezer; theirs is authoritative.
  if (auto text = read_text(snap_path)) return snapshot_from_json(*text, error);
  if (error) *error = to_string(ErrorCode::store_io) + ": " + cerr;
  return std::nullopt;
}

}  // namespace auton
