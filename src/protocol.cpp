#include "auton/protocol.hpp"

#include "auton/jsonlite.hpp"
#include "auton/version.hpp"

namespace auton {

namespace {

using jsonlite::Array;
using jsonlite::Object;
using jsonlite::Value;

// Records the first schema violation. Optional fields of the wrong type are
// violations too.
struct FieldReader {
  const Object& obj;
  std::optional<ProtocolError> err;

  void fail(const char* code, const std::string& key) {
    if (!err) err = ProtocolError{code, key, false, 0, {}};
  }

  template <typename T>
  const T* find(const std::string& key, bool required) {
    auto it = obj.find(key);
    if (it == obj.end()) {
      if (required) fail("missing_field", key);
      return nullptr;
    }
    const T* p = std::get_if<T>(&it->second.v);
    if (!p) fail("invalid_field", key);
    return p;
  }

  std::string str(const std::string& key, bool required = false) {
    const auto* p = find<std::string>(key, required);
    return p ? *p : std::string{};
  }

  bool boolean(const std::string& key, bool def) {
    const auto* p = find<bool>(key, false);
    return p ? *p : def;
  }

  std::uint64_t u64(const std::string& key, bool required = false) {
    const auto* p = find<std::uint64_t>(key, required);
    return p ? *p : 0;
  }

  std::int64_t i64(const std::string& key, std::int64_t def) {
    auto it = obj.find(key);
    if (it == obj.end()) return def;
    if (const auto* u = std::get_if<std::uint64_t>(&it->second.v)) {
      return static_cast<std::int64_t>(*u);
    }
    if (const auto* d = std::get_if<double>(&it->second.v)) {
      return static_cast<std::int64_t>(*d);
    }
    fail("invalid_field", key);
    return def;
  }

  std::vector<std::string> strings(const std::string& key, bool required = false) {
    std::vector<std::string> out;
    const auto* arr = find<Array>(key, required);
    if (!arr) return out;
    for (const auto& item : *arr) {
      const auto* s = std::get_if<std::string>(&item.v);
      if (!s) {
        fail("invalid_field", key);
        return {};
      }
      out.push_back(*s);
    }
    return out;
  }
};

Object body_to_object(const MessageBody& body) {
  Object o;
  if (const auto* m = std::get_if<UserInput>(&body)) {
    o["text"] = m->text;
    if (m->approve) o["approve"] = true;
    if (!m->confirm_preferences.empty()) o["confirm_preferences"] = jsonlite::to_array(m->confirm_preferences);
  } else if (const auto* m = std::get_if<AssistantOutput>(&body)) {
    o["text"] = m->text;
    o["topic"] = m->topic;
    o["first"] = m->first;
    o["last"] = m->last;
  } else if (const auto* m = std::get_if<CommandRequest>(&body)) {
    o["correlation_id"] = m->correlation_id;
    if (!m->command_id.empty()) o["command_id"] = m->command_id;
    o["argv"] = jsonlite::to_array(m->argv);
    if (!m->cwd.empty()) o["cwd"] = m->cwd;
    if (m->timeout_ms) o["timeout_ms"] = m->timeout_ms;
    o["origin"] = to_string(m->origin);
    if (!m->step.empty()) o["step"] = m->step;
  } else if (const auto* m = std::get_if<CommandOutputChunk>(&body)) {
    o["correlation_id"] = m->correlation_id;
    o["command_id"] = m->command_id;
    o["seq"] = m->seq;
    o["stream"] = m->stream;
    o["data"] = m->data;
  } else if (const auto* m = std::get_if<CommandResult>(&body)) {
    o["correlation_id"] = m->correlation_id;
    o["command_id"] = m->command_id;
    o["status"] = to_string(m->status);
    if (m->exit_code >= 0) {
      o["exit_code"] = static_cast<std::uint64_t>(m->exit_code);
    } else {
      o["exit_code"] = static_cast<double>(m->exit_code);
    }
    o["duration_ms"] = m->duration_ms;
    o["output_truncated"] = m->output_truncated;
    if (!m->error.empty()) o["error"] = m->error;
  } else if (const auto* m = std::get_if<SessionEvent>(&body)) {
    o["kind"] = m->kind;
    if (!m->phase.empty()) o["phase"] = m->phase;
    if (!m->from_phase.empty()) o["from_phase"] = m->from_phase;
    if (!m->trigger.empty()) o["trigger"] = m->trigger;
    if (!m->reason.empty()) o["reason"] = m->reason;
    if (m->seq) o["seq"] = m->seq;
  } else if (const auto* m = std::get_if<ErrorMessage>(&body)) {
    o["code"] = m->code;
    if (!m->detail.empty()) o["detail"] = m->detail;
    o["fatal"] = m->fatal;
    if (!m->ref_id.empty()) o["ref_id"] = m->ref_id;
  } else if (const auto* m = std::get_if<Attach>(&body)) {
    if (!m->user_id.empty()) o["user"] = m->user_id;
    if (!m->project_id.empty()) o["project"] = m->project_id;
    if (!m->resume_session.empty()) o["resume"] = m->resume_session;
  } else if (const auto* m = std::get_if<Cancel>(&body)) {
    if (!m->target.empty()) o["target"] = m->target;
  }
  return o;
}

std::optional<MessageBody> body_from_object(MessageKind kind, FieldReader& r) {
  switch (kind) {
    case MessageKind::user_input: {
      UserInput m;
      m.text = r.str("text", true);
      m.approve = r.boolean("approve", false);
      m.confirm_preferences = r.strings("confirm_preferences");
      return m;
    }
    case MessageKind::assistant_output: {
      AssistantOutput m;
      m.text = r.str("text", true);
      m.topic = r.str("topic");
      m.first = r.boolean("first", true);
      m.last = r.boolean("last", true);
      return m;
    }
    case MessageKind::command_request: {
      CommandRequest m;
      m.correlation_id = r.str("correlation_id", true);
      m.command_id = r.str("command_id");
      m.argv = r.strings("argv", true);
      if (!r.err && m.argv.empty()) r.fail("invalid_field", "argv");
      m.cwd = r.str("cwd");
      m.timeout_ms = r.u64("timeout_ms");
      const std::string origin = r.str("origin");
      if (origin == "plan") {
        m.origin = CommandOrigin::plan;
      } else if (origin.empty() || origin == "user") {
        m.origin = CommandOrigin::user;
      } else {
        r.fail("invalid_field", "origin");
      }
      m.step = r.str("step");
      return m;
    }
    case MessageKind::command_output_chunk: {
      CommandOutputChunk m;
      m.correlation_id = r.str("correlation_id", true);
      m.command_id = r.str("command_id");
      m.seq = r.u64("seq", true);
      m.stream = r.str("stream", true);
      if (!r.err && m.stream != "stdout" && m.stream != "stderr") r.fail("invalid_field", "stream");
      m.data = r.str("data", true);
      return m;
    }
    case MessageKind::command_result: {
      CommandResult m;
      m.correlation_id = r.str("correlation_id", true);
      m.command_id = r.str("command_id");
      const std::string status = r.str("status", true);
      if (!r.err) {
        auto st = parse_command_status(status);
        if (!st) r.fail("invalid_field", "status");
        else m.status = *st;
      }
      m.exit_code = r.i64("exit_code", -1);
      m.duration_ms = r.u64("duration_ms");
      m.output_truncated = r.boolean("output_truncated", false);
      m.error = r.str("error");
      return m;
    }
    case MessageKind::session_event: {
      SessionEvent m;
      m.kind = r.str("kind", true);
      m.phase = r.str("phase");
      m.from_phase = r.str("from_phase");
      m.trigger = r.str("trigger");
      m.reason = r.str("reason");
      m.seq = r.u64("seq");
      return m;
    }
    case MessageKind::error: {
      ErrorMessage m;
      m.code = r.str("code", true);
      m.detail = r.str("detail");
      m.fatal = r.boolean("fatal", false);
      m.ref_id = r.str("ref_id");
      return m;
    }
    case MessageKind::attach: {
      Attach m;
      m.user_id = r.str("user");
      m.project_id = r.str("project");
      m.resume_session = r.str("resume");
      if (!r.err && m.resume_session.empty()) {
        if (m.user_id.empty()) r.fail("missing_field", "user");
        else if (m.project_id.empty()) r.fail("missing_field", "project");
      }
      return m;
    }
    case MessageKind::cancel: {
      Cancel m;
      m.target = r.str("target");
      return m;
    }
  }
  return std::nullopt;
}

DecodeItem error_item(ProtocolError e) {
  DecodeItem item;
  item.error = std::move(e);
  return item;
}

std::string oversize_detail(std::size_t max) {
  return "frame exceeds " + std::to_string(max) + " bytes";
}

bool is_blank(std::string_view line) {
  for (char c : line) {
    if (c != ' ' && c != '\t') return false;
  }
  return true;
}

}  // namespace

std::string to_string(MessageKind kind) {
  switch (kind) {
    case MessageKind::user_input: return "user_input";
    case MessageKind::assistant_output: return "assistant_output";
    case MessageKind::command_request: return "command_request";
    case MessageKind::command_output_chunk: return "command_output_chunk";
    case MessageKind::command_result: return "command_result";
    case MessageKind::session_event: return "session_event";
    case MessageKind::error: return "error";
    case MessageKind::attach: return "attach";
    case MessageKind::cancel: return "cancel";
  }
  return "";
}

std::optional<MessageKind> parse_message_kind(const std::string& s) {
  if (s == "user_input") return MessageKind::user_input;
  if (s == "assistant_output") return MessageKind::assistant_output;
  if (s == "command_request") return MessageKind::command_request;
  if (s == "command_output_chunk") return MessageKind::command_output_chunk;
  if (s == "command_result") return MessageKind::command_result;
  if (s == "session_event") return MessageKind::session_event;
  if (s == "error") return MessageKind::error;
  if (s == "attach") return MessageKind::attach;
  if (s == "cancel") return MessageKind::cancel;
  return std::nullopt;
}

MessageKind ProtocolMessage::kind() const {
  return static_cast<MessageKind>(body.index());
}

ProtocolMessage make_message(const std::string& session_id, MessageBody body) {
  ProtocolMessage msg;
  msg.id = new_id("m");
  msg.session_id = session_id;
  msg.body = std::move(body);
  return msg;
}

std::string encode(const ProtocolMessage& msg) {
  Object o = body_to_object(msg.body);
  o["v"] = static_cast<std::uint64_t>(version::PROTOCOL_FRAMING_VERSION);
  o["id"] = msg.id;
  o["session"] = msg.session_id;
  o["type"] = to_string(msg.kind());
  std::string line = jsonlite::to_json(o);
  line += '\n';
  return line;
}

DecodeItem decode_frame(std::string_view line, std::uint64_t frame_index) {
  std::optional<jsonlite::JsonError> jerr;
  Object obj = jsonlite::parse(line, &jerr);
  if (jerr) {
    return error_item(ProtocolError{"malformed_json", jerr->message, false, frame_index, {}});
  }

  FieldReader r{obj, std::nullopt};
  const std::string id = r.str("id", true);
  const std::uint64_t v = r.u64("v", true);
  if (r.err) {
    r.err->frame_index = frame_index;
    r.err->message_id = id;
    return error_item(*r.err);
  }
  if (v > version::PROTOCOL_FRAMING_VERSION) {
    return error_item(ProtocolError{"unsupported_version",
                                    "frame version " + std::to_string(v), true,
                                    frame_index, id});
  }
  if (v == 0) {
    return error_item(ProtocolError{"invalid_field", "v", false, frame_index, id});
  }

  const std::string type = r.str("type", true);
  const std::string session = r.str("session");
  if (r.err) {
    r.err->frame_index = frame_index;
    r.err->message_id = id;
    return error_item(*r.err);
  }
  auto kind = parse_message_kind(type);
  if (!kind) {
    return error_item(ProtocolError{"unknown_type", type, false, frame_index, id});
  }

  auto body = body_from_object(*kind, r);
  if (r.err || !body) {
    ProtocolError e = r.err.value_or(ProtocolError{"unknown_type", type, false, 0, {}});
    e.frame_index = frame_index;
    e.message_id = id;
    return error_item(std::move(e));
  }

  DecodeItem item;
  item.message = ProtocolMessage{id, session, std::move(*body)};
  return item;
}

FrameDecoder::FrameDecoder(std::size_t max_frame_bytes) : max_frame_bytes_(max_frame_bytes) {}

void FrameDecoder::break_stream(std::string code, std::string detail,
                                std::vector<DecodeItem>& out) {
  broken_ = true;
  buf_.clear();
  out.push_back(error_item(ProtocolError{std::move(code), std::move(detail), true,
                                         frames_seen_, {}}));
}

void FrameDecoder::process_line(std::string_view line, std::vector<DecodeItem>& out) {
  if (line.size() > max_frame_bytes_) {
    ++frames_seen_;
    break_stream("frame_too_large", oversize_detail(max_frame_bytes_), out);
    return;
  }
  if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
  if (is_blank(line)) return;
  ++frames_seen_;
  DecodeItem item = decode_frame(line, frames_seen_);
  if (item.error && item.error->fatal) {
    broken_ = true;
    buf_.clear();
  }
  out.push_back(std::move(item));
}

std::vector<DecodeItem> FrameDecoder::feed(std::string_view bytes) {
  std::vector<DecodeItem> out;
  if (broken_) return out;
  buf_.append(bytes.data(), bytes.size());

  std::size_t start = 0;
  while (!broken_) {
    const std::size_t nl = buf_.find('\n', start);
    if (nl == std::string::npos) break;
    // Copy out the line: process_line may clear buf_ on a fatal error.
    const std::string line = buf_.substr(start, nl - start);
    start = nl + 1;
    process_line(line, out);
  }
  if (broken_) return out;
  buf_.erase(0, start);

  // An unterminated frame already over the cap can never become valid.
  if (buf_.size() > max_frame_bytes_) {
    ++frames_seen_;
    break_stream("frame_too_large", oversize_detail(max_frame_bytes_), out);
  }
  return out;
}

}  // namespace auton
