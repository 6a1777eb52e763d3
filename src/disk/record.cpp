#include "tiercache/record.hpp"

#include <cstdio>
#include <sstream>

namespace tiercache {
namespace {

void put_u32(std::string &out, std::uint32_t v) {
  for (int i = 0; i < 4; ++i)
    out.push_back(static_cast<char>((v >> (8 * i)) & 0xFF));
}

void put_u64(std::string &out, std::uint64_t v) {
  for (int i = 0; i < 8; ++i)
    out.push_back(static_cast<char>((v >> (8 * i)) & 0xFF));
}

std::uint32_t get_u32(const std::string &in, std::size_t off) {
  std::uint32_t v = 0;
  for (int i = 0; i < 4; ++i)
    v |= static_cast<std::uint32_t>(static_cast<unsigned char>(in[off + i]))
         << (8 * i);
  return v;
}

std::uint64_t get_u64(const std::string &in, std::size_t off) {
  std::uint64_t v = 0;
  for (int i = 0; i < 8; ++i)
    v |= static_cast<std::uint64_t>(static_cast<unsigned char>(in[off + i]))
         << (8 * i);
  return v;
}

int hex_digit(char c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  return -1;
}

std::string escape(const std::string &s) {
  static const char *digits = "0123456789ABCDEF";
  std::string out;
  out.reserve(s.size());
  for (unsigned char c : s) {
    if (c == '%' || c == '\n' || c == '\r' || c == '=' || c < 0x20) {
      out.push_back('%');
      out.push_back(digits[c >> 4]);
      out.push_back(digits[c & 0x0F]);
    } else {
      out.push_back(static_cast<char>(c));
    }
  }
  return out;
}

bool unescape(const std::string &s, std::string *out) {
  out->clear();
  out->reserve(s.size());
  for (std::size_t i = 0; i < s.size(); ++i) {
    if (s[i] != '%') {
      out->push_back(s[i]);
      continue;
    }
    if (i + 2 >= s.size())
      return false;
    const int hi = hex_digit(s[i + 1]);
    const int lo = hex_digit(s[i + 2]);
    if (hi < 0 || lo < 0)
      return false;
    out->push_back(static_cast<char>((hi << 4) | lo));
    i += 2;
  }
  return true;
}

bool parse_i64(const std::string &s, std::int64_t &out) {
  try {
    std::size_t idx = 0;
    out = std::stoll(s, &idx);
    return idx == s.size();
  } catch (const std::exception &) {
    return false;
  }
}

bool parse_u64(const std::string &s, std::uint64_t &out) {
  try {
    std::size_t idx = 0;
    out = std::stoull(s, &idx);
    return idx == s.size();
  } catch (const std::exception &) {
    return false;
  }
}

} // namespace

std::string encode_value(const Bytes &value) {
  std::string out;
  out.reserve(kValueHeaderSize + value.size());
  put_u32(out, kValueMagic);
  out.push_back(static_cast<char>(kValueVersion));
  out.append(3, '\0');
  put_u32(out, fnv1a32(value.data(), value.size()));
  put_u64(out, static_cast<std::uint64_t>(value.size()));
  out.append(value.begin(), value.end());
  return out;
}

bool decode_value(const std::string &blob, Bytes *out, std::string *err) {
  if (blob.size() < kValueHeaderSize) {
    if (err)
      *err = "value envelope truncated";
    return false;
  }
  if (get_u32(blob, 0) != kValueMagic) {
    if (err)
      *err = "value envelope bad magic";
    return false;
  }
  if (static_cast<std::uint8_t>(blob[4]) != kValueVersion) {
    if (err)
      *err = "value envelope unsupported version";
    return false;
  }
  const auto checksum = get_u32(blob, 8);
  const auto len = get_u64(blob, 12);
  if (len != blob.size() - kValueHeaderSize) {
    if (err)
      *err = "value envelope length mismatch";
    return false;
  }
  Bytes value(blob.begin() + static_cast<std::ptrdiff_t>(kValueHeaderSize),
              blob.end());
  if (fnv1a32(value.data(), value.size()) != checksum) {
    if (err)
      *err = "value envelope checksum mismatch";
    return false;
  }
  *out = std::move(value);
  return true;
}

std::uint64_t fnv1a64(const std::string &s) {
  std::uint64_t hash = 14695981039346656037ull;
  for (unsigned char c : s) {
    hash ^= c;
    hash *= 1099511628211ull;
  }
  return hash;
}

std::uint32_t fnv1a32(const std::uint8_t *data, std::size_t len) {
  std::uint32_t sum = 2166136261u;
  for (std::size_t i = 0; i < len; ++i) {
    sum ^= data[i];
    sum *= 16777619u;
  }
  return sum;
}

std::string hash_hex(const std::string &s) {
  char buf[17];
  std::snprintf(buf, sizeof(buf), "%016llx",
                static_cast<unsigned long long>(fnv1a64(s)));
  return std::string(buf, 16);
}

std::string encode_fields(const FieldList &fields) {
  std::string out;
  for (const auto &[name, value] : fields) {
    out += name;
    out += '=';
    out += escape(value);
    out += '\n';
  }
  return out;
}

bool parse_fields(const std::string &text, FieldList *out, std::string *err) {
  out->clear();
  std::istringstream in(text);
  std::string line;
  while (std::getline(in, line)) {
    if (line.empty())
      continue;
    const auto eq = line.find('=');
    if (eq == std::string::npos || eq == 0) {
      if (err)
        *err = "record line without field name";
      return false;
    }
    std::string value;
    if (!unescape(line.substr(eq + 1), &value)) {
      if (err)
        *err = "record value has bad escape";
      return false;
    }
    out->emplace_back(line.substr(0, eq), std::move(value));
  }
  return true;
}

std::string encode_meta(const EntryMeta &meta) {
  FieldList fields;
  fields.emplace_back("key", meta.key);
  fields.emplace_back("created_at_ms", std::to_string(meta.created_at_ms));
  fields.emplace_back("accessed_at_ms", std::to_string(meta.accessed_at_ms));
  fields.emplace_back("access_count", std::to_string(meta.access_count));
  fields.emplace_back("expiry_ms", std::to_string(meta.expiry_ms));
  for (const auto &t : meta.tags)
    fields.emplace_back("tag", t);
  return encode_fields(fields);
}

bool decode_meta(const std::string &text, EntryMeta *out, std::string *err) {
  FieldList fields;
  if (!parse_fields(text, &fields, err))
    return false;
  EntryMeta meta;
  bool have_key = false;
  for (const auto &[name, value] : fields) {
    bool ok = true;
    if (name == "key") {
      meta.key = value;
      have_key = true;
    } else if (name == "created_at_ms") {
      ok = parse_i64(value, meta.created_at_ms);
    } else if (name == "accessed_at_ms") {
      ok = parse_i64(value, meta.accessed_at_ms);
    } else if (name == "access_count") {
      ok = parse_u64(value, meta.access_count);
    } else if (name == "expiry_ms") {
      ok = parse_i64(value, meta.expiry_ms);
    } else if (name == "tag") {
      meta.tags.insert(value);
    }
    if (!ok) {
      if (err)
        *err = "metadata field " + name + " is not a number";
      return false;
    }
  }
  if (!have_key) {
    if (err)
      *err = "metadata missing key";
    return false;
  }
  *out = std::move(meta);
  return true;
}

std::string encode_key_list(const std::vector<std::string> &keys) {
  FieldList fields;
  fields.reserve(keys.size());
  for (const auto &k : keys)
    fields.emplace_back("key", k);
  return encode_fields(fields);
}

bool decode_key_list(const std::string &text, std::vector<std::string> *out,
                     std::string *err) {
  FieldList fields;
  if (!parse_fields(text, &fields, err))
    return false;
  out->clear();
  for (const auto &[name, value] : fields)
    if (name == "key")
      out->push_back(value);
  return true;
}

} // namespace tiercache
