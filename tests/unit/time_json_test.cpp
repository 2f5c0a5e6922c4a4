#include <google/protobuf/struct.pb.h>

#include <cassert>
#include <chrono>
#include <cmath>
#include <iostream>
#include <string>
#include <vector>

#include "internal/util/errors.hpp"
#include "internal/util/hash.hpp"
#include "internal/util/json.hpp"
#include "internal/util/time.hpp"

namespace {

namespace util = engram::util;

void TestRfc3339() {
  using namespace std::chrono_literals;

  auto tp = util::ParseRfc3339("2024-01-15T10:30:00Z");
  assert(tp.has_value());
  assert(util::FormatRfc3339(*tp) == "2024-01-15T10:30:00Z");

  // Offsets normalize to UTC; output drops sub-second precision.
  auto offset = util::ParseRfc3339("2024-01-15T12:30:00+02:00");
  assert(offset.has_value() && *offset == *tp);
  assert(util::FormatRfc3339(*tp + 750ms) == "2024-01-15T10:30:00Z");

  auto fractional = util::ParseRfc3339("2024-01-15T10:30:00.250Z");
  assert(fractional.has_value() && *fractional == *tp + 250ms);

  assert(!util::ParseRfc3339("").has_value());
  assert(!util::ParseRfc3339("yesterday").has_value());
  assert(!util::ParseRfc3339("2024-13-45").has_value());

  assert(util::ParseRfc3339(util::NowRfc3339()).has_value());
}

void TestUnixSecondsAndProto() {
  using namespace std::chrono_literals;

  auto tp = *util::ParseRfc3339("1970-01-01T00:00:10.500Z");
  assert(std::abs(util::ToUnixSeconds(tp) - 10.5) < 1e-9);

  // Sub-microsecond parts are dropped.
  auto fine = *util::ParseRfc3339("2024-01-15T10:00:00.0000009Z");
  auto base = *util::ParseRfc3339("2024-01-15T10:00:00Z");
  assert(util::ToUnixSeconds(fine) == util::ToUnixSeconds(base));
  assert(util::ToUnixSeconds(base + 1us) > util::ToUnixSeconds(base));

  auto proto = util::ToProto(tp);
  assert(proto.seconds() == 10);
  assert(proto.nanos() == 500000000);
  assert(util::FromProto(proto) == tp);
}

void TestJsonRoundTrip() {
  google::protobuf::Struct meta;
  (*meta.mutable_fields())["lang"].set_string_value("cpp");
  (*meta.mutable_fields())["count"].set_number_value(2);
  (*meta.mutable_fields())["nested"].mutable_struct_value();

  google::protobuf::Struct parsed;
  util::FromJson(util::ToJson(meta), &parsed);
  assert(util::JsonEquals(meta, parsed));

  bool threw = false;
  try {
    util::FromJson("{not json", &parsed);
  } catch (const util::StoreError&) {
    threw = true;
  }
  assert(threw);
}

void TestTagsJson() {
  const std::vector<std::string> tags = {"go", "Go", "go"};
  assert(util::TagsFromJson(util::TagsToJson(tags)) == tags);
  assert(util::TagsToJson({}) == "[]");

  assert(util::TagsFromJson("").empty());
  assert(util::TagsFromJson("garbage").empty());
  assert((util::TagsFromJson(R"(["a", 1, null, "b"])") == std::vector<std::string>{"a", "b"}));
}

void TestSha256() {
  const auto digest = util::Sha256("abc");
  assert(digest[0] == 0xba && digest[1] == 0x78 && digest[31] == 0xad);

  assert(util::Sha256Prefix64("abc") == 0xba7816bf8f01cfeaULL);
  assert(util::Sha256Prefix64("") == 0xe3b0c44298fc1c14ULL);
  assert(util::Sha256Prefix64("note-1") != util::Sha256Prefix64("note-2"));
}

} // namespace

int main() {
  TestRfc3339();
  TestUnixSecondsAndProto();
  TestJsonRoundTrip();
  TestTagsJson();
  TestSha256();

  std::cout << "engram_unit_time_json: pass\n";
  return 0;
}
