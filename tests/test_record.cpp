#include "tiercache/record.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstdint>

using namespace tiercache;

TEST_CASE("value envelope carries binary payloads", "[record]") {
  const Bytes value{0x00, 0xff, '\r', '\n', 0x7f};
  const auto blob = encode_value(value);
  CHECK(blob.size() == kValueHeaderSize + value.size());
  Bytes out;
  REQUIRE(decode_value(blob, &out));
  CHECK(out == value);

  Bytes empty_out{1, 2};
  REQUIRE(decode_value(encode_value({}), &empty_out));
  CHECK(empty_out.empty());
}

TEST_CASE("value envelope rejects corruption", "[record]") {
  const auto blob = encode_value(Bytes{'h', 'e', 'l', 'l', 'o'});
  Bytes out;
  std::string err;

  CHECK_FALSE(decode_value(blob.substr(0, 10), &out, &err));
  CHECK(err.find("truncated") != std::string::npos);

  auto bad_magic = blob;
  bad_magic[0] ^= 0x01;
  CHECK_FALSE(decode_value(bad_magic, &out, &err));
  CHECK(err.find("magic") != std::string::npos);

  auto bad_version = blob;
  bad_version[4] = 9;
  CHECK_FALSE(decode_value(bad_version, &out, &err));
  CHECK(err.find("version") != std::string::npos);

  auto flipped = blob;
  flipped.back() ^= 0x20;
  CHECK_FALSE(decode_value(flipped, &out, &err));
  CHECK(err.find("checksum") != std::string::npos);

  CHECK_FALSE(decode_value(blob + "x", &out, &err));
  CHECK(err.find("length") != std::string::npos);
}

TEST_CASE("hash digests are stable fixed-width hex", "[record]") {
  CHECK(hash_hex("") == "cbf29ce484222325");
  CHECK(hash_hex("a") == "af63dc4c8601ec8c");
  CHECK(hash_hex("user:42").size() == 16);
  CHECK(hash_hex("user:42") != hash_hex("user:43"));
}

TEST_CASE("metadata record keeps keys and tags with awkward bytes",
          "[record][meta]") {
  EntryMeta meta;
  meta.key = "weird=key\nwith%percent";
  meta.tags = {"tag one", "line\nbreak", ""};
  meta.created_at_ms = 1700000000000;
  meta.accessed_at_ms = 1700000000500;
  meta.access_count = 7;
  meta.expiry_ms = 1700000600000;

  EntryMeta out;
  REQUIRE(decode_meta(encode_meta(meta), &out));
  CHECK(out.key == meta.key);
  CHECK(out.tags == meta.tags);
  CHECK(out.created_at_ms == meta.created_at_ms);
  CHECK(out.accessed_at_ms == meta.accessed_at_ms);
  CHECK(out.access_count == 7);
  CHECK(out.expiry_ms == meta.expiry_ms);
  CHECK(out.is_expired(1700000600001));
  CHECK_FALSE(out.is_expired(1700000600000));

  EntryMeta forever;
  forever.key = "k";
  REQUIRE(decode_meta(encode_meta(forever), &out));
  CHECK(out.expiry_ms == -1);
  CHECK_FALSE(out.is_expired(INT64_MAX));
}

TEST_CASE("metadata decoding rejects damaged records", "[record][meta]") {
  EntryMeta out;
  std::string err;
  CHECK_FALSE(decode_meta("created_at_ms=1\n", &out, &err));
  CHECK(err.find("missing key") != std::string::npos);
  CHECK_FALSE(decode_meta("key=a\naccess_count=many\n", &out, &err));
  CHECK_FALSE(decode_meta("key=a%zz\n", &out, &err));
  CHECK_FALSE(decode_meta("no equals sign\n", &out, &err));
}

TEST_CASE("key lists decode what they encode", "[record]") {
  const std::vector<std::string> keys{"a", "b=c", "d\ne"};
  std::vector<std::string> out;
  REQUIRE(decode_key_list(encode_key_list(keys), &out));
  CHECK(out == keys);
  REQUIRE(decode_key_list("", &out));
  CHECK(out.empty());
}
