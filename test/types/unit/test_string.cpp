/***
 * Name: test_string
 * Purpose: Typed text wrapper: creation, checked downcast, strict and lossy views, codecs.
 */
#include <gtest/gtest.h>
#include "gilbridge/All.h"
#include "runtime/All.h"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

using namespace gilbridge;

namespace {
// "ascii " + U+1F408 (cat)
const std::string kAsciiCat = "ascii \xF0\x9F\x90\x88";
// U+54C8 U+54C8 U+1F408
const std::string kHanCat = "\xE5\x93\x88\xE5\x93\x88\xF0\x9F\x90\x88";
// U+FFFD
const std::string kReplacement = "\xEF\xBF\xBD";
} // namespace

class StringTest : public ::testing::Test {
 protected:
  void SetUp() override { rt::runtime_reset_for_tests(); }
};

TEST_F(StringTest, CreateDowncastAndViewsAgree) {
  LockGuard guard;
  const Token token = guard.token();
  auto owned = String::create(token, kAsciiCat);
  auto checked = String::tryFrom(owned.asBorrowed(token));
  ASSERT_TRUE(checked.isOk());
  const String s = checked.value();
  EXPECT_EQ(s.asBytes(), kAsciiCat);
  EXPECT_EQ(s.len(), kAsciiCat.size());
  auto text = s.toText();
  ASSERT_TRUE(text.isOk());
  EXPECT_EQ(text.value(), kAsciiCat);
  EXPECT_EQ(owned.get(token).toText().value(), kAsciiCat);
}

TEST_F(StringTest, NonAsciiRoundTripsUnchanged) {
  LockGuard guard;
  const Token token = guard.token();
  auto owned = String::create(token, kHanCat);
  auto text = owned.get(token).toText();
  ASSERT_TRUE(text.isOk());
  EXPECT_EQ(text.value(), kHanCat);
  EXPECT_EQ(owned.get(token).len(), 10u);
}

TEST_F(StringTest, ValidTextRoundTripsThroughConversion) {
  LockGuard guard;
  const Token token = guard.token();
  const std::string samples[] = {"", "plain", kAsciiCat, kHanCat, std::string("nul\0inside", 10),
                                 "\xF4\x8F\xBF\xBF", "\xEF\xBF\xBF"};
  for (const auto& sample : samples) {
    OwnedRef obj = toObject(token, sample);
    auto back = extract<std::string>(obj.asBorrowed(token));
    ASSERT_TRUE(back.isOk()) << back.error().toString();
    EXPECT_EQ(back.value(), sample);
  }
}

TEST_F(StringTest, ToTextIsZeroCopy) {
  LockGuard guard;
  const Token token = guard.token();
  auto owned = String::create(token, "zero copy");
  const String s = owned.get(token);
  EXPECT_EQ(s.toText().value().data(), s.asBytes().data());
}

TEST_F(StringTest, InvalidByteReportsOffset) {
  LockGuard guard;
  const Token token = guard.token();
  auto owned = String::create(token, std::string("ab\xFF" "cd"));
  const String s = owned.get(token);
  auto text = s.toText();
  ASSERT_FALSE(text.isOk());
  EXPECT_EQ(text.error().validUpTo(), 2u);
  EXPECT_EQ(text.error().start(), 2u);
  EXPECT_EQ(text.error().end(), 3u);
  EXPECT_EQ(text.error().reason(), "invalid start byte");
  // Stored as U+DCFF, reported as the byte the caller passed.
  EXPECT_EQ(s.asBytes(), std::string_view("ab\xED\xB3\xBF" "cd"));
  EXPECT_EQ(text.error().offendingBytes(), std::string_view("\xFF"));
  EXPECT_EQ(text.error().input(), std::string("ab\xFF" "cd"));
  EXPECT_EQ(s.toTextLossy(), "ab" + kReplacement + "cd");
}

TEST_F(StringTest, TruncatedSequenceIsOneInvalidUnit) {
  LockGuard guard;
  const Token token = guard.token();
  // E1 80 is the start of a three-byte sequence cut short by 'c'.
  auto owned = String::create(token, std::string("ab\xE1\x80" "cd"));
  const String s = owned.get(token);
  auto text = s.toText();
  ASSERT_FALSE(text.isOk());
  EXPECT_EQ(text.error().start(), 2u);
  EXPECT_EQ(text.error().end(), 4u);
  EXPECT_EQ(text.error().reason(), "invalid continuation byte");
  EXPECT_EQ(text.error().offendingBytes(), std::string_view("\xE1\x80"));
  EXPECT_EQ(s.toTextLossy(), "ab" + kReplacement + "cd");

  auto trailing = String::create(token, std::string("end\xF0\x9F\x90"));
  EXPECT_EQ(trailing.get(token).toTextLossy(), "end" + kReplacement);
  auto twoUnits = String::create(token, std::string("\xC3(\xFF"));
  EXPECT_EQ(twoUnits.get(token).toTextLossy(), kReplacement + "(" + kReplacement);
}

TEST_F(StringTest, InvalidUnitsAtEveryOffset) {
  LockGuard guard;
  const Token token = guard.token();
  for (std::size_t k = 0; k <= 5; ++k) {
    std::string input = "hello";
    input.insert(k, 1, '\x80');
    auto owned = String::create(token, input);
    auto text = owned.get(token).toText();
    ASSERT_FALSE(text.isOk()) << "offset " << k;
    EXPECT_EQ(text.error().validUpTo(), k);
    std::string expected = "hello";
    expected.insert(k, kReplacement);
    EXPECT_EQ(owned.get(token).toTextLossy(), expected);
  }
}

// An encoded surrogate is rejected at its lead byte and each remaining byte is a
// separate invalid unit, matching the foreign runtime's own utf-8 codec.
TEST_F(StringTest, LoneSurrogateIsDecodeError) {
  LockGuard guard;
  const Token token = guard.token();
  const uint32_t cps[] = {'a', 0xD800U, 'b'};
  OwnedRef obj = OwnedRef::fromOwnedPtr(token, rt::string_from_code_points(cps, 3));
  auto s = String::tryFrom(obj.asBorrowed(token));
  ASSERT_TRUE(s.isOk());
  auto text = s.value().toText();
  ASSERT_FALSE(text.isOk());
  EXPECT_EQ(text.error().start(), 1u);
  EXPECT_EQ(text.error().end(), 2u);
  EXPECT_EQ(text.error().reason(), "invalid continuation byte");
  EXPECT_EQ(s.value().toTextLossy(), "a" + kReplacement + kReplacement + kReplacement + "b");

  const Error err = text.error().toError();
  EXPECT_EQ(err.kind(), ErrorKind::Decode);
  EXPECT_EQ(err.typeName(), "UnicodeDecodeError");
  EXPECT_EQ(err.message(), "'utf-8' codec can't decode byte 0xed in position 1: invalid continuation byte");
}

TEST_F(StringTest, DecodeErrorOutlivesTheLock) {
  std::optional<DecodeError> kept;
  {
    LockGuard guard;
    auto owned = String::create(guard.token(), std::string("ok\xC3"));
    auto text = owned.get(guard.token()).toText();
    ASSERT_FALSE(text.isOk());
    kept = text.error();
  }
  EXPECT_EQ(kept->validUpTo(), 2u);
  EXPECT_EQ(kept->encoding(), "utf-8");
  EXPECT_FALSE(kept->message().empty());
}

TEST_F(StringTest, TryFromWrongTypeIsTypeMismatch) {
  LockGuard guard;
  const Token token = guard.token();
  OwnedRef number = toObject(token, std::int64_t{5});
  auto s = String::tryFrom(number.asBorrowed(token));
  ASSERT_FALSE(s.isOk());
  EXPECT_EQ(s.error().kind(), ErrorKind::TypeMismatch);
  EXPECT_EQ(s.error().message(), "'int' object cannot be converted to 'str'");

  auto bytes = Bytes::create(token, "not text");
  EXPECT_FALSE(String::tryFrom(bytes.asBorrowed(token)).isOk());
  EXPECT_FALSE(Owned<String>::tryFrom(token, bytes.ref().clone(token)).isOk());
}

TEST_F(StringTest, OwnedTryFromKeepsReference) {
  LockGuard guard;
  const Token token = guard.token();
  OwnedRef obj = toObject(token, "typed later");
  auto typed = Owned<String>::tryFrom(token, obj.clone(token));
  ASSERT_TRUE(typed.isOk());
  EXPECT_EQ(typed.value().get(token).toText().value(), "typed later");
  EXPECT_EQ(obj.refcount(token), 2u);
}

TEST_F(StringTest, ToOwnedAddsReference) {
  LockGuard guard;
  const Token token = guard.token();
  auto owned = String::create(token, "shared");
  auto second = owned.get(token).toOwned();
  EXPECT_EQ(owned.ref(), second.ref());
  EXPECT_EQ(owned.ref().refcount(token), 2u);
}

TEST_F(StringTest, FromObjectDecodesBytes) {
  LockGuard guard;
  const Token token = guard.token();
  auto raw = Bytes::create(token, "h\xC3\xA9llo");
  auto decoded = String::fromObject(raw.asBorrowed(token), "utf-8", "strict");
  ASSERT_TRUE(decoded.isOk());
  EXPECT_EQ(decoded.value().get(token).toText().value(), "h\xC3\xA9llo");

  auto latin = Bytes::create(token, "caf\xE9");
  auto fromLatin = String::fromObject(latin.asBorrowed(token), "latin-1", "strict");
  ASSERT_TRUE(fromLatin.isOk());
  EXPECT_EQ(fromLatin.value().get(token).toText().value(), "caf\xC3\xA9");
}

TEST_F(StringTest, FromObjectStrictFailureCarriesForeignRange) {
  LockGuard guard;
  const Token token = guard.token();
  auto raw = Bytes::create(token, std::string("ab\xFF" "cd"));
  auto decoded = String::fromObject(raw.asBorrowed(token), "utf-8", "strict");
  ASSERT_FALSE(decoded.isOk());
  const Error& err = decoded.error();
  EXPECT_EQ(err.kind(), ErrorKind::Decode);
  ASSERT_TRUE(err.decodeInfo().has_value());
  EXPECT_EQ(err.decodeInfo()->encoding, "utf-8");
  EXPECT_EQ(err.decodeInfo()->start, 2u);
  EXPECT_EQ(err.decodeInfo()->end, 3u);
  EXPECT_EQ(err.decodeInfo()->reason, "invalid start byte");
  EXPECT_FALSE(ffi::api().errOccurred());
}

TEST_F(StringTest, FromObjectPolicies) {
  LockGuard guard;
  const Token token = guard.token();
  auto raw = Bytes::create(token, std::string("ab\xFF" "cd"));
  auto replaced = String::fromObject(raw.asBorrowed(token), "utf-8", "replace");
  ASSERT_TRUE(replaced.isOk());
  EXPECT_EQ(replaced.value().get(token).toText().value(), "ab" + kReplacement + "cd");

  auto ignored = String::fromObject(raw.asBorrowed(token), "utf-8", "ignore");
  ASSERT_TRUE(ignored.isOk());
  EXPECT_EQ(ignored.value().get(token).toText().value(), "abcd");

  auto escaped = String::fromObject(raw.asBorrowed(token), "utf-8", "surrogateescape");
  ASSERT_TRUE(escaped.isOk());
  EXPECT_FALSE(escaped.value().get(token).toText().isOk());
}

TEST_F(StringTest, FromObjectUnknownEncodingIsLookupError) {
  LockGuard guard;
  const Token token = guard.token();
  auto raw = Bytes::create(token, "abc");
  auto decoded = String::fromObject(raw.asBorrowed(token), "no-such-codec-xyz", "strict");
  ASSERT_FALSE(decoded.isOk());
  EXPECT_EQ(decoded.error().typeName(), "LookupError");
  EXPECT_TRUE(decoded.error().matches(token, "Exception"));

  auto badPolicy = String::fromObject(raw.asBorrowed(token), "utf-8", "no-such-policy");
  ASSERT_FALSE(badPolicy.isOk());
  EXPECT_EQ(badPolicy.error().typeName(), "LookupError");
}

TEST_F(StringTest, FromObjectRejectsText) {
  LockGuard guard;
  const Token token = guard.token();
  auto text = String::create(token, "already text");
  auto decoded = String::fromObject(text.asBorrowed(token));
  ASSERT_FALSE(decoded.isOk());
  EXPECT_EQ(decoded.error().kind(), ErrorKind::ForeignException);
  EXPECT_EQ(decoded.error().typeName(), "TypeError");
}
