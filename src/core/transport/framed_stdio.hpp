#pragma once

#include <cstddef>
#include <cstdint>
#include <istream>
#include <ostream>
#include <string>
#include <vector>

namespace transport {

// Frames are capped at 1 MiB
constexpr uint32_t kMaxFrameBytes = 1024u * 1024u;
constexpr std::size_t kHeaderBytes = 4;

enum class ReadStatus {
  Frame, // payload read into out
  Eof,   // stream ended cleanly before a header byte
  Error  // truncated frame or bad length; err describes it
};

uint32_t decode_length(const uint8_t (&hdr)[kHeaderBytes]);
void encode_length(uint32_t len, uint8_t (&hdr)[kHeaderBytes]);

// Reads exactly n bytes into buf. Returns false if the stream ends first.
bool read_exact(std::istream &in, uint8_t *buf, std::size_t n);

// Reads one uint32_le length-prefixed frame.
ReadStatus read_frame(std::istream &in, std::vector<uint8_t> &out,
                      std::string &err, uint32_t max_len = kMaxFrameBytes);

// Writes one length-prefixed frame and flushes. Returns false and sets err
// on failure.
bool write_frame(std::ostream &out, const std::string &payload,
                 std::string &err, uint32_t max_len = kMaxFrameBytes);

} // namespace transport
