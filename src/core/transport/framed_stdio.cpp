#include "core/transport/framed_stdio.hpp"

namespace transport {

uint32_t decode_length(const uint8_t (&hdr)[kHeaderBytes]) {
  return static_cast<uint32_t>(hdr[0]) |
         (static_cast<uint32_t>(hdr[1]) << 8) |
         (static_cast<uint32_t>(hdr[2]) << 16) |
         (static_cast<uint32_t>(hdr[3]) << 24);
}

void encode_length(uint32_t len, uint8_t (&hdr)[kHeaderBytes]) {
  for (std::size_t i = 0; i < kHeaderBytes; ++i) {
    hdr[i] = static_cast<uint8_t>((len >> (8 * i)) & 0xFF);
  }
}

bool read_exact(std::istream &in, uint8_t *buf, std::size_t n) {
  std::size_t got = 0;
  while (got < n) {
    in.read(reinterpret_cast<char *>(buf + got),
            static_cast<std::streamsize>(n - got));
    const std::streamsize r = in.gcount();
    if (r <= 0) {
      return false;
    }
    got += static_cast<std::size_t>(r);
  }
  return true;
}

ReadStatus read_frame(std::istream &in, std::vector<uint8_t> &out,
                      std::string &err, uint32_t max_len) {
  err.clear();
  out.clear();

  // A clean EOF is zero header bytes; anything else short is truncation.
  uint8_t hdr[kHeaderBytes] = {0, 0, 0, 0};
  in.read(reinterpret_cast<char *>(hdr), 1);
  if (in.gcount() == 0) {
    return ReadStatus::Eof;
  }
  if (!read_exact(in, hdr + 1, kHeaderBytes - 1)) {
    err = "unexpected EOF while reading frame header";
    return ReadStatus::Error;
  }

  const uint32_t len = decode_length(hdr);
  if (len == 0) {
    err = "invalid frame length: 0";
    return ReadStatus::Error;
  }
  if (len > max_len) {
    err = "frame length " + std::to_string(len) + " exceeds max " +
          std::to_string(max_len);
    return ReadStatus::Error;
  }

  out.resize(len);
  if (!read_exact(in, out.data(), len)) {
    err = "unexpected EOF while reading frame payload";
    return ReadStatus::Error;
  }
  return ReadStatus::Frame;
}

bool write_frame(std::ostream &out, const std::string &payload,
                 std::string &err, uint32_t max_len) {
  err.clear();

  // An empty message still needs a non-zero frame on the wire.
  if (payload.empty()) {
    err = "invalid frame length: 0";
    return false;
  }
  if (payload.size() > max_len) {
    err = "frame length " + std::to_string(payload.size()) + " exceeds max " +
          std::to_string(max_len);
    return false;
  }

  uint8_t hdr[kHeaderBytes];
  encode_length(static_cast<uint32_t>(payload.size()), hdr);

  out.write(reinterpret_cast<const char *>(hdr), kHeaderBytes);
  if (!out.good()) {
    err = "failed writing frame header";
    return false;
  }
  out.write(payload.data(), static_cast<std::streamsize>(payload.size()));
  if (!out.good()) {
    err = "failed writing frame payload";
    return false;
  }
  out.flush();
  if (!out.good()) {
    err = "failed flushing output";
    return false;
  }
  return true;
}

} // namespace transport
