/***
 * Name: gilbridge::ffi::Api
 * Purpose: Boundary capability through which the bridge reaches the foreign runtime.
 * Inputs: Raw foreign object pointers and host byte ranges
 * Outputs: Raw foreign object pointers, flags, borrowed byte ranges
 * Theory of Operation:
 *   The foreign runtime is opaque: objects are `RawObject*`, types are
 *   `TypeDescriptor*`, and every operation is a virtual call on the installed
 *   Api. Functions returning a new object return an owned reference or nullptr
 *   with a pending foreign exception. None of these functions are synchronized;
 *   callers hold the bridge lock. The only callers are the reference, wrapper,
 *   conversion and error layers of the bridge; user code never sees raw pointers.
 *   api() returns the installed implementation (the bundled runtime unless a
 *   test has installed another one with install()).
 */
#pragma once

#include <cstddef>
#include <cstdint>

namespace gilbridge {
namespace ffi {

struct RawObject;
struct TypeDescriptor;

enum class BuiltinType : uint32_t { Object, Text, Bytes, Int, Bool, Float, NoneType };

// Borrowed view of a UnicodeDecodeError's attributes; valid while the exception object lives.
struct DecodeErrorFields {
  const char* encoding{nullptr};
  const unsigned char* object{nullptr};
  std::size_t objectLen{0};
  std::size_t start{0};
  std::size_t end{0};
  const char* reason{nullptr};
};

class Api {
 public:
  virtual ~Api() = default;

  // Object lifecycle. Creation returns a new reference, or nullptr on failure.
  virtual RawObject* textFromUtf8(const char* data, std::size_t len) = 0;
  virtual RawObject* bytesFrom(const unsigned char* data, std::size_t len) = 0;
  virtual RawObject* intFrom(int64_t value) = 0;
  virtual RawObject* floatFrom(double value) = 0;
  virtual RawObject* boolFrom(bool value) = 0;
  virtual RawObject* none() = 0;
  virtual void incref(RawObject* obj) = 0;
  virtual void decref(RawObject* obj) = 0;
  virtual std::size_t refcount(RawObject* obj) = 0;

  // Types
  virtual const TypeDescriptor* builtinType(BuiltinType type) = 0;
  virtual const TypeDescriptor* exceptionType(const char* name) = 0;
  virtual bool isInstance(RawObject* obj, const TypeDescriptor* type) = 0;
  virtual bool isSubtype(const TypeDescriptor* type, const TypeDescriptor* base) = 0;
  virtual const TypeDescriptor* typeOf(RawObject* obj) = 0;
  virtual const char* typeName(const TypeDescriptor* type) = 0;

  // Accessors; callers have already passed the matching type check.
  virtual const char* textAsUtf8(RawObject* text, std::size_t* len) = 0;
  virtual const unsigned char* bytesData(RawObject* bytes) = 0;
  virtual std::size_t bytesSize(RawObject* bytes) = 0;
  virtual int64_t intValue(RawObject* obj) = 0;
  virtual double floatValue(RawObject* obj) = 0;

  // Codecs: decode src under an encoding and error policy (opaque names).
  virtual RawObject* textFromEncoded(RawObject* src, const char* encoding, const char* errors) = 0;

  // Exceptions
  virtual bool errOccurred() = 0;
  virtual RawObject* errFetch() = 0;            // owned reference or nullptr; clears the pending exception
  virtual void errRestore(RawObject* exc) = 0;  // steals the reference
  virtual void errSet(const TypeDescriptor* type, const char* message) = 0;
  virtual RawObject* exceptionNew(const TypeDescriptor* type, const char* message) = 0;
  virtual const char* exceptionMessage(RawObject* exc) = 0;
  virtual RawObject* decodeErrorNew(const char* encoding, const unsigned char* object, std::size_t len,
                                    std::size_t start, std::size_t end, const char* reason) = 0;
  virtual bool decodeErrorFields(RawObject* exc, DecodeErrorFields* out) = 0;
};

/*** api: The installed foreign runtime implementation. */
Api& api();

/*** install: Replace the installed implementation; nullptr restores the bundled runtime.
 *   Returns the previously installed implementation. Call only while no references are live. */
Api* install(Api* impl);

}  // namespace ffi
}  // namespace gilbridge
