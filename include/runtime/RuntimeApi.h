/***
 * Name: gilbridge::rt::RuntimeApi
 * Purpose: ffi::Api implementation backed by the bundled runtime.
 * Theory of Operation: Each override forwards to the matching rt:: function.
 *   A single process-wide instance is installed by default in ffi::api().
 */
#pragma once

#include "gilbridge/ffi/Api.h"

namespace gilbridge::rt {

class RuntimeApi final : public ffi::Api {
 public:
  static RuntimeApi& instance();

  ffi::RawObject* textFromUtf8(const char* data, std::size_t len) override;
  ffi::RawObject* bytesFrom(const unsigned char* data, std::size_t len) override;
  ffi::RawObject* intFrom(int64_t value) override;
  ffi::RawObject* floatFrom(double value) override;
  ffi::RawObject* boolFrom(bool value) override;
  ffi::RawObject* none() override;
  void incref(ffi::RawObject* obj) override;
  void decref(ffi::RawObject* obj) override;
  std::size_t refcount(ffi::RawObject* obj) override;

  const ffi::TypeDescriptor* builtinType(ffi::BuiltinType type) override;
  const ffi::TypeDescriptor* exceptionType(const char* name) override;
  bool isInstance(ffi::RawObject* obj, const ffi::TypeDescriptor* type) override;
  bool isSubtype(const ffi::TypeDescriptor* type, const ffi::TypeDescriptor* base) override;
  const ffi::TypeDescriptor* typeOf(ffi::RawObject* obj) override;
  const char* typeName(const ffi::TypeDescriptor* type) override;

  const char* textAsUtf8(ffi::RawObject* text, std::size_t* len) override;
  const unsigned char* bytesData(ffi::RawObject* bytes) override;
  std::size_t bytesSize(ffi::RawObject* bytes) override;
  int64_t intValue(ffi::RawObject* obj) override;
  double floatValue(ffi::RawObject* obj) override;

  ffi::RawObject* textFromEncoded(ffi::RawObject* src, const char* encoding, const char* errors) override;

  bool errOccurred() override;
  ffi::RawObject* errFetch() override;
  void errRestore(ffi::RawObject* exc) override;
  void errSet(const ffi::TypeDescriptor* type, const char* message) override;
  ffi::RawObject* exceptionNew(const ffi::TypeDescriptor* type, const char* message) override;
  const char* exceptionMessage(ffi::RawObject* exc) override;
  ffi::RawObject* decodeErrorNew(const char* encoding, const unsigned char* object, std::size_t len,
                                 std::size_t start, std::size_t end, const char* reason) override;
  bool decodeErrorFields(ffi::RawObject* exc, ffi::DecodeErrorFields* out) override;

 private:
  RuntimeApi() = default;
};

}  // namespace gilbridge::rt
