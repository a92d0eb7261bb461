#pragma once

// auton/preference_store.hpp: Durable per-user preference facts.
//
// LAYOUT (under the store root):
//   users/<user>.ndjson       append-only history, one record per upsert:
//     {"v":1,"seq":N,"key":..,"value":..,"confidence":..,"source_session":..,
//      "timestamp":..,"prev":<digest>,"digest":<digest>}
//     digest = BLAKE3("pref:" | prev | canonical record without digest)
//   projects/<project>.owner  user id the project is bound to
//   projects/<project>.json   frozen snapshot, written once
//
// CONCURRENCY:
//   Upserts for one user are serialised by flock() on the history file
//   (cross-process) and a mutex (in-process). The effective view is folded
//   from history on every read; nothing is cached, so two stores over the
//   same root always agree.
//
// EFFECTIVE VIEW:
//   Per key, records are ordered by (timestamp, source_session, seq). The
//   last record is effective, whatever its confidence. Records are never
//   removed.

#include <atomic>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "auton/types.hpp"

namespace auton {

struct PreferenceRecord {
  std::uint64_t seq{0};
  PreferenceFact fact;
  std::string prev_digest;
  std::string digest;
};

struct UpsertOutcome {
  bool ok{false};
  bool effective{false};  // the new record is now the effective fact for its key
  bool conflict{false};   // arrived out of order relative to the key's history
  std::uint64_t seq{0};
  std::string error;
};

struct ProjectSnapshot {
  std::string project_id;
  std::string user_id;
  std::uint64_t frozen_at_unix_ms{0};
  std::map<std::string, PreferenceFact> facts;
  std::string digest;
};

std::string snapshot_to_json(const ProjectSnapshot& s);
std::optional<ProjectSnapshot> snapshot_from_json(const std::string& text, std::string* error);
std::string snapshot_digest(const ProjectSnapshot& s);

// Folds history into the effective view, ordered by key.
std::vector<PreferenceFact> effective_facts(const std::vector<PreferenceRecord>& history);

class PreferenceStore {
 public:
  virtual ~PreferenceStore() = default;

  virtual std::vector<PreferenceFact> get(const std::string& user_id) const = 0;
  virtual std::vector<PreferenceRecord> history(const std::string& user_id) const = 0;
  virtual UpsertOutcome upsert(const std::string& user_id, const PreferenceFact& fact) = 0;
  virtual bool register_project(const std::string& project_id, const std::string& user_id,
                                std::string* error) = 0;
  virtual std::optional<ProjectSnapshot> snapshot_for_project(const std::string& project_id,
                                                              std::string* error) = 0;
};

class FilePreferenceStore : public PreferenceStore {
 public:
  explicit FilePreferenceStore(std::string root);

  std::vector<PreferenceFact> get(const std::string& user_id) const override;
  std::vector<PreferenceRecord> history(const std::string& user_id) const override;
  UpsertOutcome upsert(const std::string& user_id, const PreferenceFact& fact) override;
  bool register_project(const std::string& project_id, const std::string& user_id,
                        std::string* error) override;
  std::optional<ProjectSnapshot> snapshot_for_project(const std::string& project_id,
                                                      std::string* error) override;

  // Recomputes every digest link. Returns false and sets *error at the first
  // broken link.
  bool verify_history(const std::string& user_id, std::string* error) const;

  std::uint64_t conflicts() const { return conflicts_.load(std::memory_order_relaxed); }
  const std::string& root() const { return root_; }

 private:
  std::string user_path(const std::string& user_id) const;
  std::string project_path(const std::string& project_id, const char* suffix) const;
  std::vector<PreferenceRecord> read_history_file(const std::string& path, std::string* error) const;
  // Like history(), but a read or parse failure is returned instead of
  // logged and treated as empty.
  std::optional<std::vector<PreferenceRecord>> load_history(const std::string& user_id,
                                                            std::string* error) const;

  std::string root_;
  mutable std::mutex mu_;
  std::atomic<std::uint64_t> conflicts_{0};
};

}  // namespace auton
