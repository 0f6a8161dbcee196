/***
 * Name: gilbridge::rt::RuntimeApi (impl)
 * Purpose: Forward the ffi::Api boundary to the bundled runtime.
 */
#include "runtime/RuntimeApi.h"
#include "runtime/Runtime.h"

namespace gilbridge::rt {

RuntimeApi& RuntimeApi::instance() {
  static RuntimeApi api;
  return api;
}

ffi::RawObject* RuntimeApi::textFromUtf8(const char* data, std::size_t len) { return string_new_escaped(data, len); }
ffi::RawObject* RuntimeApi::bytesFrom(const unsigned char* data, std::size_t len) { return bytes_new(data, len); }
ffi::RawObject* RuntimeApi::intFrom(int64_t value) { return int_new(value); }
ffi::RawObject* RuntimeApi::floatFrom(double value) { return float_new(value); }
ffi::RawObject* RuntimeApi::boolFrom(bool value) { return bool_from(value); }
ffi::RawObject* RuntimeApi::none() { return rt::none(); }
void RuntimeApi::incref(ffi::RawObject* obj) { rt::incref(obj); }
void RuntimeApi::decref(ffi::RawObject* obj) { rt::decref(obj); }
std::size_t RuntimeApi::refcount(ffi::RawObject* obj) { return rt::refcount(obj); }

const ffi::TypeDescriptor* RuntimeApi::builtinType(ffi::BuiltinType type) {
  switch (type) {
    case ffi::BuiltinType::Object: return builtin_type(TypeTag::Object);
    case ffi::BuiltinType::Text: return builtin_type(TypeTag::String);
    case ffi::BuiltinType::Bytes: return builtin_type(TypeTag::Bytes);
    case ffi::BuiltinType::Int: return builtin_type(TypeTag::Int);
    case ffi::BuiltinType::Bool: return builtin_type(TypeTag::Bool);
    case ffi::BuiltinType::Float: return builtin_type(TypeTag::Float);
    case ffi::BuiltinType::NoneType: return builtin_type(TypeTag::None);
  }
  return nullptr;
}

const ffi::TypeDescriptor* RuntimeApi::exceptionType(const char* name) { return exception_type(name); }
bool RuntimeApi::isInstance(ffi::RawObject* obj, const ffi::TypeDescriptor* type) { return is_instance(obj, type); }
bool RuntimeApi::isSubtype(const ffi::TypeDescriptor* type, const ffi::TypeDescriptor* base) { return is_subtype(type, base); }
const ffi::TypeDescriptor* RuntimeApi::typeOf(ffi::RawObject* obj) { return type_of(obj); }
const char* RuntimeApi::typeName(const ffi::TypeDescriptor* type) { return type_name(type); }

const char* RuntimeApi::textAsUtf8(ffi::RawObject* text, std::size_t* len) {
  if (len != nullptr) { *len = string_len(text); }
  return string_data(text);
}

const unsigned char* RuntimeApi::bytesData(ffi::RawObject* bytes) { return bytes_data(bytes); }
std::size_t RuntimeApi::bytesSize(ffi::RawObject* bytes) { return bytes_len(bytes); }
int64_t RuntimeApi::intValue(ffi::RawObject* obj) { return int_value(obj); }
double RuntimeApi::floatValue(ffi::RawObject* obj) { return float_value(obj); }

ffi::RawObject* RuntimeApi::textFromEncoded(ffi::RawObject* src, const char* encoding, const char* errors) {
  return bytes_decode(src, encoding, errors);
}

bool RuntimeApi::errOccurred() { return err_occurred(); }
ffi::RawObject* RuntimeApi::errFetch() { return err_fetch(); }
void RuntimeApi::errRestore(ffi::RawObject* exc) { err_restore(exc); }
void RuntimeApi::errSet(const ffi::TypeDescriptor* type, const char* message) { err_set(type, message); }

ffi::RawObject* RuntimeApi::exceptionNew(const ffi::TypeDescriptor* type, const char* message) {
  return exception_new(type, message);
}

const char* RuntimeApi::exceptionMessage(ffi::RawObject* exc) { return exception_message(exc); }

ffi::RawObject* RuntimeApi::decodeErrorNew(const char* encoding, const unsigned char* object, std::size_t len,
                                           std::size_t start, std::size_t end, const char* reason) {
  return unicode_decode_error_new(encoding, object, len, start, end, reason);
}

bool RuntimeApi::decodeErrorFields(ffi::RawObject* exc, ffi::DecodeErrorFields* out) {
  return unicode_decode_error_fields(exc, out);
}

} // namespace gilbridge::rt
