/***
 * Name: test_runtime_exceptions
 * Purpose: Thread-local pending exception state and exception objects.
 */
#include <gtest/gtest.h>
#include "runtime/All.h"
#include <cstring>
#include <thread>

using namespace gilbridge::rt;

TEST(RuntimeExceptions, SetFetchRestoreClear) {
  runtime_reset_for_tests();
  EXPECT_FALSE(err_occurred());
  err_set(exception_type("RuntimeError"), "first");
  ASSERT_TRUE(err_occurred());
  RawObject* exc = err_fetch();
  EXPECT_FALSE(err_occurred());
  EXPECT_STREQ(exception_message(exc), "first");
  err_restore(exc);
  EXPECT_TRUE(err_occurred());
  err_clear();
  EXPECT_FALSE(err_occurred());
}

TEST(RuntimeExceptions, NewExceptionReplacesPending) {
  runtime_reset_for_tests();
  err_set(exception_type("TypeError"), "old");
  err_set(exception_type("ValueError"), "new");
  RawObject* exc = err_fetch();
  EXPECT_STREQ(type_name(type_of(exc)), "ValueError");
  decref(exc);
}

TEST(RuntimeExceptions, NonExceptionTypeBecomesSystemError) {
  runtime_reset_for_tests();
  err_set(builtin_type(TypeTag::Int), "not an exception type");
  RawObject* exc = err_fetch();
  EXPECT_STREQ(type_name(type_of(exc)), "SystemError");
  decref(exc);
  EXPECT_EQ(exception_new(builtin_type(TypeTag::String), "x"), nullptr);
  exc = err_fetch();
  EXPECT_STREQ(type_name(type_of(exc)), "TypeError");
  decref(exc);
}

TEST(RuntimeExceptions, PendingStateIsPerThread) {
  runtime_reset_for_tests();
  err_set(exception_type("RuntimeError"), "main thread");
  bool otherSaw = true;
  std::thread other([&]() { otherSaw = err_occurred(); });
  other.join();
  EXPECT_FALSE(otherSaw);
  EXPECT_TRUE(err_occurred());
  err_clear();
}

TEST(RuntimeExceptions, DecodeErrorCarriesAttributes) {
  runtime_reset_for_tests();
  const unsigned char input[] = {'a', 'b', 0xE2, 0x82};
  RawObject* exc = unicode_decode_error_new("utf-8", input, sizeof(input), 2, 4, "unexpected end of data");
  ASSERT_NE(exc, nullptr);
  EXPECT_STREQ(exception_message(exc), "'utf-8' codec can't decode bytes in position 2-3: unexpected end of data");
  gilbridge::ffi::DecodeErrorFields fields;
  ASSERT_TRUE(unicode_decode_error_fields(exc, &fields));
  EXPECT_STREQ(fields.encoding, "utf-8");
  EXPECT_EQ(fields.objectLen, sizeof(input));
  EXPECT_EQ(std::memcmp(fields.object, input, sizeof(input)), 0);
  EXPECT_STREQ(fields.reason, "unexpected end of data");
  decref(exc);

  RawObject* plain = exception_new(exception_type("ValueError"), "plain");
  EXPECT_FALSE(unicode_decode_error_fields(plain, &fields));
  decref(plain);
}

TEST(RuntimeExceptions, FreeingExceptionReleasesChildren) {
  runtime_reset_for_tests();
  const RuntimeStats before = runtime_stats();
  const unsigned char input[] = {0xFF};
  RawObject* exc = unicode_decode_error_new("utf-8", input, 1, 0, 1, "invalid start byte");
  decref(exc);
  const RuntimeStats after = runtime_stats();
  EXPECT_EQ(after.numAllocated - before.numAllocated, after.numFreed - before.numFreed);
  EXPECT_EQ(after.bytesLive, before.bytesLive);
}
