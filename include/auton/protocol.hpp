#pragma once

// auton/protocol.hpp: Front-end <-> executor message model and NDJSON codec.
//
// FRAMING (version 1):
//   One frame = one line of compact JSON terminated by '\n'.
//     {"v":1,"id":"<msg id>","session":"<session id>","type":"<kind>",...}
//   A trailing '\r' is tolerated. Blank lines are keep-alives. The JSON
//   writer never emits a raw newline, so '\n' is always a frame boundary and
//   resynchronising after a bad frame means dropping that one line.
//
// DECODING:
//   FrameDecoder is resumable: feeding a byte stream in any split pattern
//   yields the same ordered items as feeding the concatenation at once.
//   Each bad frame yields exactly one ProtocolError item in stream position.
//   Oversize frames and frames announcing a newer framing version are fatal:
//   the decoder reports broken() and ignores all further input.

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "auton/types.hpp"

namespace auton {

constexpr std::size_t kDefaultMaxFrameBytes = 1u << 20;

enum class MessageKind {
  user_input,
  assistant_output,
  command_request,
  command_output_chunk,
  command_result,
  session_event,
  error,
  attach,
  cancel,
};

std::string to_string(MessageKind kind);
std::optional<MessageKind> parse_message_kind(const std::string& s);

struct UserInput {
  std::string text;
  bool approve{false};  // acknowledges the plan awaiting approval
  std::vector<std::string> confirm_preferences;
};

struct AssistantOutput {
  std::string text;
  std::string topic;  // "question" | "plan" | "summary" | "preferences" | "notice"
  bool first{true};
  bool last{true};
};

struct CommandRequest {
  std::string correlation_id;
  std::string command_id;
  std::vector<std::string> argv;
  std::string cwd;
  std::uint64_t timeout_ms{0};
  CommandOrigin origin{CommandOrigin::user};
  std::string step;  // plan step description, empty for manual commands
};

struct CommandOutputChunk {
  std::string correlation_id;
  std::string command_id;
  std::uint64_t seq{0};
  std::string stream;  // "stdout" | "stderr"
  std::string data;
};

struct CommandResult {
  std::string correlation_id;
  std::string command_id;
  CommandStatus status{CommandStatus::failed};
  std::int64_t exit_code{-1};
  std::uint64_t duration_ms{0};
  bool output_truncated{false};
  std::string error;
};

struct SessionEvent {
  // "transition" | "attached" | "parked" | "cancel_acknowledged" |
  // "sandbox_ready" | "preferences_committed" | "terminal" | "notice"
  std::string kind;
  std::string phase;
  std::string from_phase;
  std::string trigger;
  std::string reason;
  std::uint64_t seq{0};
};

struct ErrorMessage {
  std::string code;
  std::string detail;
  bool fatal{false};
  std::string ref_id;  // id of the offending message, if known
};

struct Attach {
  std::string user_id;
  std::string project_id;
  std::string resume_session;
};

struct Cancel {
  std::string target;  // correlation id; empty cancels the session
};

using MessageBody = std::variant<UserInput, AssistantOutput, CommandRequest,
                                 CommandOutputChunk, CommandResult, SessionEvent,
                                 ErrorMessage, Attach, Cancel>;

struct ProtocolMessage {
  std::string id;
  std::string session_id;
  MessageBody body;

  MessageKind kind() const;
};

// Wraps a body with a fresh message id.
ProtocolMessage make_message(const std::string& session_id, MessageBody body);

struct ProtocolError {
  std::string code;  // malformed_json | missing_field | unknown_type | invalid_field
                     // | frame_too_large | unsupported_version
  std::string detail;
  bool fatal{false};
  std::uint64_t frame_index{0};
  std::string message_id;  // when the frame got far enough to carry one
};

// Exactly one of message/error is set.
struct DecodeItem {
  std::optional<ProtocolMessage> message;
  std::optional<ProtocolError> error;
};

// Encodes one frame, including the trailing '\n'.
std::string encode(const ProtocolMessage& msg);

// Decodes one complete line (without '\n'). Never reports frame_too_large.
DecodeItem decode_frame(std::string_view line, std::uint64_t frame_index = 0);

class FrameDecoder {
 public:
  explicit FrameDecoder(std::size_t max_frame_bytes = kDefaultMaxFrameBytes);

  std::vector<DecodeItem> feed(std::string_view bytes);

  bool broken() const { return broken_; }
  std::size_t buffered() const { return buf_.size(); }
  std::uint64_t frames_seen() const { return frames_seen_; }

 private:
  void process_line(std::string_view line, std::vector<DecodeItem>& out);
  void break_stream(std::string code, std::string detail, std::vector<DecodeItem>& out);

  std::size_t max_frame_bytes_;
  std::string buf_;
  std::uint64_t frames_seen_{0};
  bool broken_{false};
};

}  // namespace auton
