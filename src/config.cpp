#include "auton/config.hpp"

#include <cstdlib>
#include <fstream>
#include <set>
#include <sstream>

#include "auton/jsonlite.hpp"

namespace auton {

namespace {

using jsonlite::Array;
using jsonlite::Object;
using jsonlite::Value;

// Reads typed keys from one config section and remembers which keys were
// consumed so the rest can be reported.
class SectionReader {
 public:
  SectionReader(const Object& obj, std::string section, ConfigValidationResult& report)
      : obj_(obj), section_(std::move(section)), report_(report) {}

  ~SectionReader() {
    for (const auto& [key, value] : obj_) {
      if (!known_.count(key)) report_.warnings.push_back("unknown key " + section_ + "." + key);
    }
  }

  template <typename T>
  void u64(const std::string& key, T& out) {
    const Value* v = find(key);
    if (!v) return;
    if (const auto* u = std::get_if<std::uint64_t>(&v->v)) out = static_cast<T>(*u);
    else type_error(key, "a non-negative integer");
  }

  void str(const std::string& key, std::string& out) {
    const Value* v = find(key);
    if (!v) return;
    if (const auto* s = std::get_if<std::string>(&v->v)) out = *s;
    else type_error(key, "a string");
  }

  void boolean(const std::string& key, bool& out) {
    const Value* v = find(key);
    if (!v) return;
    if (const auto* b = std::get_if<bool>(&v->v)) out = *b;
    else type_error(key, "a boolean");
  }

  void number(const std::string& key, double& out) {
    const Value* v = find(key);
    if (!v) return;
    if (const auto* d = std::get_if<double>(&v->v)) out = *d;
    else if (const auto* u = std::get_if<std::uint64_t>(&v->v)) out = static_cast<double>(*u);
    else type_error(key, "a number");
  }

  void str_array(const std::string& key, std::vector<std::string>& out) {
    const Value* v = find(key);
    if (!v) return;
    const auto* arr = std::get_if<Array>(&v->v);
    if (!arr) {
      type_error(key, "an array of strings");
      return;
    }
    std::vector<std::string> items;
    for (const auto& item : *arr) {
      const auto* s = std::get_if<std::string>(&item.v);
      if (!s) {
        type_error(key, "an array of strings");
        return;
      }
      items.push_back(*s);
    }
    out = std::move(items);
  }

  void str_map(const std::string& key, std::map<std::string, std::string>& out) {
    const Value* v = find(key);
    if (!v) return;
    const auto* o = std::get_if<Object>(&v->v);
    if (!o) {
      type_error(key, "an object of strings");
      return;
    }
    for (const auto& [k, item] : *o) {
      const auto* s = std::get_if<std::string>(&item.v);
      if (!s) {
        type_error(key + "." + k, "a string");
        continue;
      }
      out[k] = *s;
    }
  }

  const Object* section(const std::string& key) {
    const Value* v = find(key);
    if (!v) return nullptr;
    const auto* o = std::get_if<Object>(&v->v);
    if (!o) type_error(key, "an object");
    return o;
  }

 private:
  const Value* find(const std::string& key) {
    known_.insert(key);
    auto it = obj_.find(key);
    return it == obj_.end() ? nullptr : &it->second;
  }

  void type_error(const std::string& key, const char* want) {
    report_.errors.push_back(section_ + "." + key + " must be " + want);
  }

  const Object& obj_;
  std::string section_;
  ConfigValidationResult& report_;
  std::set<std::string> known_;
};

std::vector<std::string> split_words(const std::string& s) {
  std::vector<std::string> out;
  std::istringstream is(s);
  std::string w;
  while (is >> w) out.push_back(w);
  return out;
}

}  // namespace

ConfigValidationResult apply_config_json(const std::string& text, AutonConfig& config) {
  ConfigValidationResult report;
  std::optional<jsonlite::JsonError> jerr;
  Object root = jsonlite::parse(text, &jerr);
  if (jerr) {
    report.errors.push_back("config: " + jerr->message);
    return report;
  }
  {
    SectionReader top(root, "config", report);
    report.config_version = kConfigVersion;
    top.str("config_version", report.config_version);

    if (const Object* s = top.section("server")) {
      SectionReader r(*s, "server", report);
      r.str("listen", config.server.listen);
      r.u64("grace_ms", config.server.grace_ms);
      r.u64("park_buffer_messages", config.server.park_buffer_messages);
      r.u64("max_frame_bytes", config.server.max_frame_bytes);
      r.u64("max_sessions", config.server.max_sessions);
    }
    if (const Object* s = top.section("sandbox")) {
      SectionReader r(*s, "sandbox", report);
      r.str("root", config.sandbox.root);
      r.u64("max_environments", config.sandbox.max_environments);
      r.u64("kill_grace_ms", config.sandbox.kill_grace_ms);
      r.boolean("network_isolation", config.sandbox.enforce_network_isolation);
      r.boolean("purge_on_teardown", config.sandbox.purge_on_teardown);
      r.boolean("enabled", config.sandbox.sandbox_enabled);
      r.str("path", config.sandbox.path_env);
      r.str_map("env", config.sandbox.extra_env);
      if (const Object* l = r.section("limits")) {
        SectionReader lr(*l, "sandbox.limits", report);
        ResourceLimits& lim = config.sandbox.default_limits;
        lr.u64("cpu_seconds", lim.cpu_seconds);
        lr.u64("memory_bytes", lim.memory_bytes);
        lr.u64("wall_time_ms", lim.wall_time_ms);
        lr.u64("max_file_descriptors", lim.max_file_descriptors);
        lr.u64("max_output_bytes", lim.max_output_bytes);
      }
    }
    if (const Object* s = top.section("session")) {
      SectionReader r(*s, "session", report);
      SessionSettings& ss = config.session;
      r.u64("plan_approval_timeout_ms", ss.plan_approval_timeout_ms);
      r.u64("max_replans", ss.max_replans);
      r.boolean("replan_requires_approval", ss.replan_requires_approval);
      r.u64("planner_attempts", ss.planner_retry.max_attempts);
      r.u64("planner_backoff_ms", ss.planner_retry.initial_backoff_ms);
      r.u64("planner_max_backoff_ms", ss.planner_retry.max_backoff_ms);
      r.number("auto_apply_confidence", ss.auto_apply_confidence);
      r.u64("assistant_chunk_chars", ss.assistant_chunk_chars);
      r.u64("default_command_timeout_ms", ss.default_command_timeout_ms);
    }
    if (const Object* s = top.section("store")) {
      SectionReader r(*s, "store", report);
      r.str("state_dir", config.state_dir);
    }
    if (const Object* s = top.section("planner")) {
      SectionReader r(*s, "planner", report);
      r.str_array("argv", config.planner.argv);
      r.u64("timeout_ms", config.planner.timeout_ms);
      r.str_map("env", config.planner.env);
    }
    if (const Object* s = top.section("archive")) {
      SectionReader r(*s, "archive", report);
      r.str("dir", config.archive.dir);
      r.str("compression", config.archive.compression);
    }
  }
  config.session.limits = config.sandbox.default_limits;
  report.ok = report.errors.empty();
  return report;
}

void apply_env_overrides(AutonConfig& config) {
  config.sandbox.apply_env_overrides();
  if (const char* v = std::getenv("AUTON_STATE_DIR"); v && v[0]) config.state_dir = v;
  if (const char* v = std::getenv("AUTON_PLANNER"); v && v[0]) config.planner.argv = split_words(v);
  if (const char* v = std::getenv("AUTON_LISTEN"); v && v[0]) config.server.listen = v;
  if (const char* v = std::getenv("AUTON_GRACE_MS"); v && v[0]) {
    char* end = nullptr;
    const unsigned long long ms = std::strtoull(v, &end, 10);
    if (end && *end == '\0') config.server.grace_ms = ms;
  }
  config.session.limits = config.sandbox.default_limits;
}

ConfigValidationResult validate_config(const AutonConfig& config) {
  ConfigValidationResult r;
  r.config_version = kConfigVersion;

  std::string err;
  if (!parse_listen_address(config.server.listen, &err)) r.errors.push_back("server.listen: " + err);
  if (config.server.park_buffer_messages == 0) {
    r.warnings.push_back("server.park_buffer_messages is 0: parked sessions lose all output");
  }
  if (config.server.max_frame_bytes < 1024) r.errors.push_back("server.max_frame_bytes below 1024");
  if (config.server.max_sessions == 0) r.errors.push_back("server.max_sessions must be positive");

  if (config.sandbox.root.empty()) r.errors.push_back("sandbox.root is empty");
  if (config.sandbox.max_environments == 0) {
    r.errors.push_back("sandbox.max_environments must be positive");
  }
  if (config.sandbox.default_limits.wall_time_ms == 0) {
    r.errors.push_back("sandbox.limits.wall_time_ms must be positive");
  }
  if (config.sandbox.default_limits.max_output_bytes == 0) {
    r.errors.push_back("sandbox.limits.max_output_bytes must be positive");
  }
  if (!config.sandbox.sandbox_enabled) {
    r.warnings.push_back("sandbox disabled: commands run without resource limits");
  }
  for (const auto& [k, v] : config.sandbox.extra_env) {
    if (is_secret_key(k)) r.warnings.push_back("sandbox.env." + k + " looks secret and is dropped");
  }

  const SessionSettings& s = config.session;
  if (s.auto_apply_confidence < 0.0 || s.auto_apply_confidence > 1.0) {
    r.errors.push_back("session.auto_apply_confidence must be within [0, 1]");
  }
  if (s.planner_retry.max_attempts == 0) {
    r.errors.push_back("session.planner_attempts must be positive");
  }
  if (s.planner_retry.initial_backoff_ms > s.planner_retry.max_backoff_ms) {
    r.warnings.push_back("session.planner_backoff_ms exceeds planner_max_backoff_ms");
  }
  if (s.default_command_timeout_ms == 0) {
    r.errors.push_back("session.default_command_timeout_ms must be positive");
  }

  if (config.state_dir.empty()) r.errors.push_back("store.state_dir is empty");
  if (config.planner.argv.empty()) {
    r.warnings.push_back("planner.argv is empty: sessions fail with planning_unavailable");
  }
  if (config.archive.compression != "off" && config.archive.compression != "zstd") {
    r.errors.push_back("archive.compression must be off or zstd");
  } else if (config.archive.compression == "zstd" && !zstd_compiled_in()) {
    r.warnings.push_back("archive.compression=zstd but built without zstd; writing plain ndjson");
  }
  r.ok = r.errors.empty();
  return r;
}

std::optional<AutonConfig> load_config(const std::string& path, ConfigValidationResult* report) {
  AutonConfig config;
  config.session.limits = config.sandbox.default_limits;
  std::string file = path;
  if (file.empty()) {
    if (const char* env = std::getenv("AUTON_CONFIG"); env && env[0]) file = env;
  }
  if (!file.empty()) {
    std::ifstream ifs(file, std::ios::binary);
    if (!ifs) {
      if (report) {
        *report = ConfigValidationResult{};
        report->errors.push_back("cannot read config file " + file);
      }
      return std::nullopt;
    }
    const std::string text((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
    ConfigValidationResult parsed = apply_config_json(text, config);
    if (report) *report = parsed;
    if (!parsed.ok) return std::nullopt;
  } else if (report) {
    *report = ConfigValidationResult{};
    report->ok = true;
    report->config_version = kConfigVersion;
  }
  apply_env_overrides(config);
  return config;
}

std::string config_to_json(const AutonConfig& c) {
  Object server;
  server["listen"] = c.server.listen;
  server["grace_ms"] = c.server.grace_ms;
  server["park_buffer_messages"] = static_cast<std::uint64_t>(c.server.park_buffer_messages);
  server["max_frame_bytes"] = static_cast<std::uint64_t>(c.server.max_frame_bytes);
  server["max_sessions"] = static_cast<std::uint64_t>(c.server.max_sessions);

  Object limits;
  limits["cpu_seconds"] = c.sandbox.default_limits.cpu_seconds;
  limits["memory_bytes"] = c.sandbox.default_limits.memory_bytes;
  limits["wall_time_ms"] = c.sandbox.default_limits.wall_time_ms;
  limits["max_file_descriptors"] = c.sandbox.default_limits.max_file_descriptors;
  limits["max_output_bytes"] = static_cast<std::uint64_t>(c.sandbox.default_limits.max_output_bytes);

  Object sandbox;
  sandbox["root"] = c.sandbox.root;
  sandbox["max_environments"] = static_cast<std::uint64_t>(c.sandbox.max_environments);
  sandbox["kill_grace_ms"] = c.sandbox.kill_grace_ms;
  sandbox["network_isolation"] = c.sandbox.enforce_network_isolation;
  sandbox["purge_on_teardown"] = c.sandbox.purge_on_teardown;
  sandbox["enabled"] = c.sandbox.sandbox_enabled;
  sandbox["path"] = c.sandbox.path_env;
  Object env;
  for (const auto& [k, v] : c.sandbox.extra_env) env[k] = is_secret_key(k) ? "<redacted>" : v;
  sandbox["env"] = std::move(env);
  sandbox["limits"] = std::move(limits);

  Object session;
  session["plan_approval_timeout_ms"] = c.session.plan_approval_timeout_ms;
  session["max_replans"] = static_cast<std::uint64_t>(c.session.max_replans);
  session["replan_requires_approval"] = c.session.replan_requires_approval;
  session["planner_attempts"] = static_cast<std::uint64_t>(c.session.planner_retry.max_attempts);
  session["planner_backoff_ms"] = c.session.planner_retry.initial_backoff_ms;
  session["planner_max_backoff_ms"] = c.session.planner_retry.max_backoff_ms;
  session["auto_apply_confidence"] = c.session.auto_apply_confidence;
  session["assistant_chunk_chars"] = static_cast<std::uint64_t>(c.session.assistant_chunk_chars);
  session["default_command_timeout_ms"] = c.session.default_command_timeout_ms;

  Object store;
  store["state_dir"] = c.state_dir;

  Object planner;
  planner["argv"] = jsonlite::to_array(c.planner.argv);
  planner["timeout_ms"] = c.planner.timeout_ms;

  Object archive;
  archive["dir"] = c.archive.dir;
  archive["compression"] = c.archive.compression;

  Object root;
  root["config_version"] = kConfigVersion;
  root["server"] = std::move(server);
  root["sandbox"] = std::move(sandbox);
  root["session"] = std::move(session);
  root["store"] = std::move(store);
  root["planner"] = std::move(planner);
  root["archive"] = std::move(archive);
  return jsonlite::to_json(root);
}

}  // namespace auton
