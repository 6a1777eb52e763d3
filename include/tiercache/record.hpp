#pragma once

#include "tiercache/types.hpp"

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace tiercache {

// Binary envelope for values leaving the process (L2 wire, L3 data files):
//   u32 magic | u8 version | u8 reserved[3] | u32 checksum | u64 length | payload
// All integers little-endian. The checksum is FNV-1a 32 over the payload.
constexpr std::uint32_t kValueMagic = 0x31564354; // "TCV1"
constexpr std::uint8_t kValueVersion = 1;
constexpr std::size_t kValueHeaderSize = 20;

std::string encode_value(const Bytes &value);
bool decode_value(const std::string &blob, Bytes *out,
                  std::string *err = nullptr);

std::uint64_t fnv1a64(const std::string &s);
std::uint32_t fnv1a32(const std::uint8_t *data, std::size_t len);
std::string hash_hex(const std::string &s);

// Access/expiry metadata kept beside a value. expiry_ms < 0 means none.
struct EntryMeta {
  std::string key;
  TagSet tags;
  std::int64_t created_at_ms{0};
  std::int64_t accessed_at_ms{0};
  std::uint64_t access_count{0};
  std::int64_t expiry_ms{-1};

  bool is_expired(std::int64_t now_ms) const {
    return expiry_ms >= 0 && now_ms > expiry_ms;
  }
};

// Line records: one "field=value" per line, values percent-escaped so keys and
// tags may contain any byte. Repeated fields are allowed (tags, members).
using FieldList = std::vector<std::pair<std::string, std::string>>;

std::string encode_fields(const FieldList &fields);
bool parse_fields(const std::string &text, FieldList *out,
                  std::string *err = nullptr);

std::string encode_meta(const EntryMeta &meta);
bool decode_meta(const std::string &text, EntryMeta *out,
                 std::string *err = nullptr);

std::string encode_key_list(const std::vector<std::string> &keys);
bool decode_key_list(const std::string &text, std::vector<std::string> *out,
                     std::string *err = nullptr);

} // namespace tiercache
