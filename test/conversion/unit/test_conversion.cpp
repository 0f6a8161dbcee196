/***
 * Name: test_conversion
 * Purpose: ToForeign / FromForeign / TryDowncast for the built-in host types.
 */
#include <gtest/gtest.h>
#include "gilbridge/All.h"
#include "runtime/All.h"
#include "../../util/CountingApi.h"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

using namespace gilbridge;

class ConversionTest : public ::testing::Test {
 protected:
  void SetUp() override { rt::runtime_reset_for_tests(); }
};

TEST_F(ConversionTest, StringsRoundTrip) {
  LockGuard guard;
  const Token token = guard.token();
  OwnedRef a = toObject(token, std::string("owned"));
  OwnedRef b = toObject(token, std::string_view("view"));
  OwnedRef c = toObject(token, "literal");
  EXPECT_EQ(extract<std::string>(a.asBorrowed(token)).value(), "owned");
  EXPECT_EQ(extract<std::string_view>(b.asBorrowed(token)).value(), "view");
  EXPECT_EQ(extract<std::string>(c.asBorrowed(token)).value(), "literal");
}

TEST_F(ConversionTest, StringViewPointsIntoForeignStorage) {
  LockGuard guard;
  const Token token = guard.token();
  OwnedRef obj = toObject(token, "borrowed text");
  const std::string_view view = extract<std::string_view>(obj.asBorrowed(token)).value();
  EXPECT_EQ(view.data(), downcast<String>(obj.asBorrowed(token)).value().asBytes().data());
}

TEST_F(ConversionTest, ExtractStringFromInvalidTextIsDecodeError) {
  LockGuard guard;
  const Token token = guard.token();
  OwnedRef obj = toObject(token, std::string("x\xFE"));
  auto text = extract<std::string>(obj.asBorrowed(token));
  ASSERT_FALSE(text.isOk());
  EXPECT_EQ(text.error().kind(), ErrorKind::Decode);
  EXPECT_EQ(text.error().decodeInfo()->start, 1u);
}

TEST_F(ConversionTest, ExtractStringFromWrongTypeKeepsTypeMismatch) {
  LockGuard guard;
  const Token token = guard.token();
  OwnedRef obj = toObject(token, 2.5);
  auto text = extract<std::string>(obj.asBorrowed(token));
  ASSERT_FALSE(text.isOk());
  EXPECT_EQ(text.error().kind(), ErrorKind::TypeMismatch);
}

TEST_F(ConversionTest, ByteVectors) {
  LockGuard guard;
  const Token token = guard.token();
  const std::vector<std::uint8_t> data{0, 1, 2, 0, 255};
  OwnedRef obj = toObject(token, data);
  EXPECT_EQ(extract<std::vector<std::uint8_t>>(obj.asBorrowed(token)).value(), data);
  OwnedRef text = toObject(token, "text");
  EXPECT_FALSE(extract<std::vector<std::uint8_t>>(text.asBorrowed(token)).isOk());
}

TEST_F(ConversionTest, Scalars) {
  LockGuard guard;
  const Token token = guard.token();
  OwnedRef t = toObject(token, true);
  OwnedRef i = toObject(token, std::int64_t{-42});
  OwnedRef small = toObject(token, 7);
  OwnedRef f = toObject(token, 0.25);
  EXPECT_TRUE(extract<bool>(t.asBorrowed(token)).value());
  EXPECT_EQ(extract<std::int64_t>(i.asBorrowed(token)).value(), -42);
  EXPECT_EQ(extract<std::int64_t>(small.asBorrowed(token)).value(), 7);
  EXPECT_DOUBLE_EQ(extract<double>(f.asBorrowed(token)).value(), 0.25);
}

TEST_F(ConversionTest, NumericWidening) {
  LockGuard guard;
  const Token token = guard.token();
  OwnedRef i = toObject(token, std::int64_t{3});
  OwnedRef t = toObject(token, true);
  OwnedRef f = toObject(token, 1.0);
  EXPECT_DOUBLE_EQ(extract<double>(i.asBorrowed(token)).value(), 3.0);
  // bool is a subtype of int.
  EXPECT_EQ(extract<std::int64_t>(t.asBorrowed(token)).value(), 1);
  EXPECT_FALSE(extract<std::int64_t>(f.asBorrowed(token)).isOk());
  EXPECT_FALSE(extract<bool>(i.asBorrowed(token)).isOk());
}

TEST_F(ConversionTest, OptionalMapsNone) {
  LockGuard guard;
  const Token token = guard.token();
  OwnedRef none = toObject(token, std::optional<std::string>());
  OwnedRef some = toObject(token, std::optional<std::string>("here"));
  EXPECT_TRUE(none.asBorrowed(token).isNone());
  auto fromNone = extract<std::optional<std::string>>(none.asBorrowed(token));
  ASSERT_TRUE(fromNone.isOk());
  EXPECT_FALSE(fromNone.value().has_value());
  auto fromSome = extract<std::optional<std::string>>(some.asBorrowed(token));
  ASSERT_TRUE(fromSome.isOk());
  EXPECT_EQ(fromSome.value().value(), "here");
  auto wrong = extract<std::optional<std::int64_t>>(some.asBorrowed(token));
  ASSERT_FALSE(wrong.isOk());
  EXPECT_EQ(wrong.error().kind(), ErrorKind::TypeMismatch);
}

TEST_F(ConversionTest, DowncastDoesNotAllocate) {
  testutil::CountingApi counting;
  testutil::ScopedApi installed(&counting);
  {
    LockGuard guard;
    const Token token = guard.token();
    OwnedRef obj = toObject(token, "typed");
    const std::size_t created = counting.newRefs;
    auto s = downcast<String>(obj.asBorrowed(token));
    auto b = downcast<Bytes>(obj.asBorrowed(token));
    EXPECT_TRUE(s.isOk());
    EXPECT_FALSE(b.isOk());
    EXPECT_EQ(counting.newRefs, created);
    EXPECT_EQ(counting.increfs, 0u);
  }
  EXPECT_EQ(counting.balance(), 0);
}

TEST_F(ConversionTest, EveryConversionIsBalanced) {
  testutil::CountingApi counting;
  testutil::ScopedApi installed(&counting);
  {
    LockGuard guard;
    const Token token = guard.token();
    for (int i = 0; i < 20; ++i) {
      OwnedRef s = toObject(token, std::to_string(i));
      OwnedRef n = toObject(token, std::int64_t{i});
      OwnedRef none = toObject(token, std::optional<double>());
      (void)extract<std::string>(s.asBorrowed(token));
      (void)extract<double>(n.asBorrowed(token));
      (void)extract<std::optional<double>>(none.asBorrowed(token));
    }
  }
  EXPECT_EQ(counting.balance(), 0);
}
