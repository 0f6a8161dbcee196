/***
 * Name: test_error_protocol
 * Purpose: Capture, inspection and re-raising of foreign failures.
 */
#include <gtest/gtest.h>
#include "gilbridge/All.h"
#include "runtime/All.h"
#include "../../util/CountingApi.h"

#include <optional>
#include <string>

using namespace gilbridge;

class ErrorProtocolTest : public ::testing::Test {
 protected:
  void SetUp() override { rt::runtime_reset_for_tests(); }
};

TEST_F(ErrorProtocolTest, FetchWithNothingPendingIsSystemError) {
  LockGuard guard;
  const Error err = Error::fetch(guard.token());
  EXPECT_EQ(err.kind(), ErrorKind::ForeignException);
  EXPECT_EQ(err.typeName(), "SystemError");
  EXPECT_EQ(err.toString(), "SystemError: error return without exception set");
}

TEST_F(ErrorProtocolTest, TakeWithNothingPendingIsEmpty) {
  LockGuard guard;
  EXPECT_FALSE(Error::take(guard.token()).has_value());
}

TEST_F(ErrorProtocolTest, FetchClearsPendingException) {
  LockGuard guard;
  auto& api = ffi::api();
  api.errSet(api.exceptionType("ValueError"), "bad value");
  ASSERT_TRUE(api.errOccurred());
  const Error err = Error::fetch(guard.token());
  EXPECT_FALSE(api.errOccurred());
  EXPECT_EQ(err.kind(), ErrorKind::ForeignException);
  EXPECT_EQ(err.typeName(), "ValueError");
  EXPECT_EQ(err.message(), "bad value");
  EXPECT_FALSE(err.decodeInfo().has_value());
}

TEST_F(ErrorProtocolTest, FetchedErrorSurvivesLockRelease) {
  std::optional<Error> kept;
  {
    LockGuard guard;
    auto& api = ffi::api();
    api.errSet(api.exceptionType("LookupError"), "missing");
    kept = Error::fetch(guard.token());
  }
  ASSERT_TRUE(kept.has_value());
  const Error copy = *kept;
  EXPECT_EQ(copy.toString(), "LookupError: missing");
  EXPECT_EQ(copy.kind(), ErrorKind::ForeignException);
}

TEST_F(ErrorProtocolTest, MatchesFollowsHierarchy) {
  LockGuard guard;
  const Token token = guard.token();
  const Error err = Error::decode(DecodeInfo{"utf-8", "\xff", 0, 1, "invalid start byte"});
  EXPECT_TRUE(err.matches(token, "UnicodeDecodeError"));
  EXPECT_TRUE(err.matches(token, "UnicodeError"));
  EXPECT_TRUE(err.matches(token, "ValueError"));
  EXPECT_TRUE(err.matches(token, "Exception"));
  EXPECT_FALSE(err.matches(token, "TypeError"));
  EXPECT_FALSE(err.matches(token, "NoSuchError"));
}

TEST_F(ErrorProtocolTest, TypeMismatchRestoresAsTypeError) {
  LockGuard guard;
  const Token token = guard.token();
  const Error err = Error::typeMismatch("str", "int");
  EXPECT_EQ(err.kind(), ErrorKind::TypeMismatch);
  EXPECT_EQ(err.message(), "'int' object cannot be converted to 'str'");
  err.restore(token);
  ASSERT_TRUE(ffi::api().errOccurred());
  const Error again = Error::fetch(token);
  EXPECT_EQ(again.typeName(), "TypeError");
  EXPECT_EQ(again.message(), err.message());
}

TEST_F(ErrorProtocolTest, DecodeErrorRoundTripsThroughForeignException) {
  LockGuard guard;
  const Token token = guard.token();
  const Error err = Error::decode(DecodeInfo{"utf-8", std::string("ab\xc3(", 4), 2, 3, "invalid continuation byte"});
  EXPECT_EQ(err.message(), "'utf-8' codec can't decode byte 0xc3 in position 2: invalid continuation byte");

  OwnedRef exc = err.toObject(token);
  ffi::DecodeErrorFields fields;
  ASSERT_TRUE(ffi::api().decodeErrorFields(exc.asPtr(), &fields));
  EXPECT_EQ(fields.start, 2u);
  EXPECT_EQ(fields.end, 3u);
  EXPECT_STREQ(fields.reason, "invalid continuation byte");

  err.restore(token);
  const Error again = Error::fetch(token);
  EXPECT_EQ(again.kind(), ErrorKind::Decode);
  ASSERT_TRUE(again.decodeInfo().has_value());
  EXPECT_EQ(again.decodeInfo()->object, std::string("ab\xc3(", 4));
  EXPECT_EQ(again.decodeInfo()->start, 2u);
  EXPECT_EQ(again.message(), err.message());
}

TEST_F(ErrorProtocolTest, MultiByteDecodeRangeMessage) {
  const Error err = Error::decode(DecodeInfo{"utf-8", "a\xe2\x82", 1, 3, "unexpected end of data"});
  EXPECT_EQ(err.message(), "'utf-8' codec can't decode bytes in position 1-2: unexpected end of data");
}

TEST_F(ErrorProtocolTest, UnknownForeignTypeFallsBackToException) {
  LockGuard guard;
  const Token token = guard.token();
  const Error err = Error::foreign("CustomError", "custom");
  err.restore(token);
  const Error again = Error::fetch(token);
  EXPECT_EQ(again.typeName(), "Exception");
  EXPECT_EQ(again.message(), "CustomError: custom");
}

TEST_F(ErrorProtocolTest, RestoreHandsReferenceToRuntime) {
  testutil::CountingApi counting;
  testutil::ScopedApi installed(&counting);
  {
    LockGuard guard;
    const Token token = guard.token();
    Error::foreign("RuntimeError", "handed over").restore(token);
    EXPECT_EQ(counting.stolen, 1u);
    const Error again = Error::fetch(token);
    EXPECT_EQ(again.message(), "handed over");
  }
  EXPECT_EQ(counting.balance(), 0);
}

TEST_F(ErrorProtocolTest, ErrorOperationsNeedLiveToken) {
  std::optional<Token> escaped;
  {
    LockGuard guard;
    escaped = guard.token();
  }
  EXPECT_THROW((void)Error::fetch(*escaped), exceptions::ScopeViolation);
  EXPECT_THROW(Error::typeMismatch("str", "int").restore(*escaped), exceptions::ScopeViolation);
}
