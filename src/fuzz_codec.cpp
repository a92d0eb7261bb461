// fuzz_codec.cpp: libFuzzer harness for the NDJSON frame codec.
//
// Build with LLVM libFuzzer:
//   cmake -DAUTON_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++
//   cmake --build build --target fuzz_codec
//
// Run:
//   ./build/fuzz_codec corpus/frames/ -max_len=65536 -timeout=5
//
// Targets:
//   1. FrameDecoder::feed(): split-invariance of the resumable decoder
//   2. decode_frame()/encode(): re-encoding a decoded frame is stable
//   3. canonicalize_json(): idempotent

#include "auton/jsonlite.hpp"
#include "auton/protocol.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace {

std::string item_key(const auton::DecodeItem& item) {
  if (item.message) return "m:" + auton::encode(*item.message);
  return "e:" + item.error->code + ":" + (item.error->fatal ? "1" : "0");
}

}  // namespace

// ---------------------------------------------------------------------------
// Fuzz target 1: decoder split-invariance
// ---------------------------------------------------------------------------
// Invariants verified:
//   - feed() never crashes for any byte stream.
//   - Feeding the input whole or in two arbitrary pieces yields the same
//     ordered items and the same broken() state.
//   - Nothing is buffered beyond the frame limit.
extern "C" int LLVMFuzzerTestOneInput_Decoder(const uint8_t* data, size_t size) {
  if (size < 1) return 0;
  const std::size_t split = data[0] % size;
  const std::string input(reinterpret_cast<const char*>(data + 1), size - 1);
  constexpr std::size_t kLimit = 4096;

  auton::FrameDecoder whole(kLimit);
  std::vector<std::string> a;
  for (const auto& item : whole.feed(input)) a.push_back(item_key(item));

  auton::FrameDecoder pieces(kLimit);
  std::vector<std::string> b;
  const std::size_t cut = split < input.size() ? split : input.size();
  for (const auto& item : pieces.feed(std::string_view(input).substr(0, cut)))
    b.push_back(item_key(item));
  for (const auto& item : pieces.feed(std::string_view(input).substr(cut)))
    b.push_back(item_key(item));

  if (a != b || whole.broken() != pieces.broken()) {
    __builtin_trap();  // BUG: decoder output depends on read boundaries
  }
  if (whole.buffered() > kLimit) {
    __builtin_trap();  // BUG: buffered past the frame limit
  }
  return 0;
}

// ---------------------------------------------------------------------------
// Fuzz target 2: single frame re-encode
// ---------------------------------------------------------------------------
// Invariants verified:
//   - decode_frame() never crashes.
//   - encode() of a decoded message contains exactly one '\n', at the end.
//   - decoding that encoding again yields the same encoding.
extern "C" int LLVMFuzzerTestOneInput_Frame(const uint8_t* data, size_t size) {
  const std::string input(reinterpret_cast<const char*>(data), size);
  auto item = auton::decode_frame(input);
  if (!item.message) return 0;
  const std::string first = auton::encode(*item.message);
  if (first.empty() || first.find('\n') != first.size() - 1) {
    __builtin_trap();  // BUG: encoder emitted a raw newline
  }
  auto again = auton::decode_frame(std::string_view(first).substr(0, first.size() - 1));
  if (!again.message || auton::encode(*again.message) != first) {
    __builtin_trap();  // BUG: encode/decode not stable
  }
  return 0;
}

// ---------------------------------------------------------------------------
// Fuzz target 3: JSON canonicalization
// ---------------------------------------------------------------------------
extern "C" int LLVMFuzzerTestOneInput_Canon(const uint8_t* data, size_t size) {
  const std::string input(reinterpret_cast<const char*>(data), size);
  std::optional<auton::jsonlite::JsonError> err1, err2;
  const std::string c1 = auton::jsonlite::canonicalize_json(input, &err1);
  if (!err1 && !c1.empty()) {
    const std::string c2 = auton::jsonlite::canonicalize_json(c1, &err2);
    if (!err2 && c1 != c2) {
      __builtin_trap();  // BUG: canonicalization not idempotent
    }
  }
  return 0;
}

// ---------------------------------------------------------------------------
// Default libFuzzer entry point: routes on the first byte.
// ---------------------------------------------------------------------------
extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
  if (size == 0) return 0;
  const uint8_t target = data[0] % 3;
  const uint8_t* payload = data + 1;
  const size_t payload_size = size - 1;
  switch (target) {
    case 0: return LLVMFuzzerTestOneInput_Decoder(payload, payload_size);
    case 1: return LLVMFuzzerTestOneInput_Frame(payload, payload_size);
    case 2: return LLVMFuzzerTestOneInput_Canon(payload, payload_size);
    default: return 0;
  }
}
