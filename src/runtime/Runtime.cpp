/***
 * Name: gilbridge::rt (Runtime impl)
 * Purpose: Reference-counted object heap, built-in types and thread-local exception state.
 */
#include "runtime/All.h"
#include "runtime/detail/EncodingHandlers.h"
#include "gilbridge/support/utf8.h"
#include <algorithm>
#include <cinttypes>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <initializer_list>
#include <new>
#include <string>

namespace gilbridge::rt {

struct TypeObject {
  const char* name;
  TypeTag layout;
  const TypeObject* base;
};

static constexpr uint32_t kImmortal = 1U;

struct ObjectHeader {
  std::size_t refcnt{0};
  uint32_t tag{0};
  uint32_t flags{0};
  std::size_t size{0}; // total allocation size including header
  const TypeObject* type{nullptr};
};

struct StringPayload { std::size_t len{}; /* char data[len + 1] follows */ };
struct BytesPayload  { std::size_t len{}; /* uint8_t data[len + 1] follows */ };
struct IntPayload    { int64_t value{}; };
struct FloatPayload  { double value{}; };
struct NonePayload   { uint64_t unused{}; };
struct ExceptionPayload {
  RawObject* message{nullptr};
  // UnicodeDecodeError attributes; null for other exception types
  RawObject* encoding{nullptr};
  RawObject* object{nullptr};
  RawObject* reason{nullptr};
  std::size_t start{0};
  std::size_t end{0};
};

// Built-in type table
static const TypeObject kObjectType{"object", TypeTag::Object, nullptr};
static const TypeObject kStrType{"str", TypeTag::String, &kObjectType};
static const TypeObject kBytesType{"bytes", TypeTag::Bytes, &kObjectType};
static const TypeObject kIntType{"int", TypeTag::Int, &kObjectType};
static const TypeObject kBoolType{"bool", TypeTag::Bool, &kIntType};
static const TypeObject kFloatType{"float", TypeTag::Float, &kObjectType};
static const TypeObject kNoneType{"NoneType", TypeTag::None, &kObjectType};

static const TypeObject kBaseException{"BaseException", TypeTag::Exception, &kObjectType};
static const TypeObject kException{"Exception", TypeTag::Exception, &kBaseException};
static const TypeObject kTypeError{"TypeError", TypeTag::Exception, &kException};
static const TypeObject kValueError{"ValueError", TypeTag::Exception, &kException};
static const TypeObject kUnicodeError{"UnicodeError", TypeTag::Exception, &kValueError};
static const TypeObject kUnicodeDecodeError{"UnicodeDecodeError", TypeTag::Exception, &kUnicodeError};
static const TypeObject kLookupError{"LookupError", TypeTag::Exception, &kException};
static const TypeObject kSystemError{"SystemError", TypeTag::Exception, &kException};
static const TypeObject kMemoryError{"MemoryError", TypeTag::Exception, &kException};
static const TypeObject kRuntimeError{"RuntimeError", TypeTag::Exception, &kException};
static const TypeObject kOverflowError{"OverflowError", TypeTag::Exception, &kException};

static const TypeObject* const kExceptionTypes[] = {
    &kBaseException, &kException, &kTypeError, &kValueError, &kUnicodeError, &kUnicodeDecodeError,
    &kLookupError, &kSystemError, &kMemoryError, &kRuntimeError, &kOverflowError};

// Immortal singletons laid out exactly like heap objects (header then payload).
template <typename Payload>
struct StaticObject {
  ObjectHeader header;
  Payload payload;
};

static StaticObject<NonePayload> g_none{{1, static_cast<uint32_t>(TypeTag::None), kImmortal, 0, &kNoneType}, {}}; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)
static StaticObject<IntPayload> g_true{{1, static_cast<uint32_t>(TypeTag::Bool), kImmortal, 0, &kBoolType}, {1}}; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)
static StaticObject<IntPayload> g_false{{1, static_cast<uint32_t>(TypeTag::Bool), kImmortal, 0, &kBoolType}, {0}}; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)
// Raised when allocation fails; preallocated because raising must not allocate.
static StaticObject<ExceptionPayload> g_memory_error{{1, static_cast<uint32_t>(TypeTag::Exception), kImmortal, 0, &kMemoryError}, {}}; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)

static RuntimeStats g_stats; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)
static int64_t g_fail_after = -1; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)
static bool g_debug = (std::getenv("GILBRIDGE_RT_DEBUG") != nullptr); // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)

// Thread-local exception state
static thread_local RawObject* t_pending = nullptr; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)

static inline ObjectHeader* header_of(RawObject* obj) {
  return reinterpret_cast<ObjectHeader*>(reinterpret_cast<unsigned char*>(obj) - sizeof(ObjectHeader)); // NOLINT
}

static inline const TypeObject* as_type(const TypeDescriptor* type) { return reinterpret_cast<const TypeObject*>(type); }
static inline const TypeDescriptor* as_descriptor(const TypeObject* type) { return reinterpret_cast<const TypeDescriptor*>(type); }

template <typename Payload>
static inline Payload* payload_of(RawObject* obj) { return reinterpret_cast<Payload*>(obj); }

template <typename Payload>
static inline RawObject* raw_of(StaticObject<Payload>& obj) { return reinterpret_cast<RawObject*>(&obj.payload); }

static RawObject* alloc_object(std::size_t payload, const TypeObject* type) {
  const std::size_t total = sizeof(ObjectHeader) + payload;
  if (g_fail_after == 0) {
    g_stats.failedAllocations++;
    err_no_memory();
    return nullptr;
  }
  if (g_fail_after > 0) { --g_fail_after; }
  auto* mem = static_cast<unsigned char*>(::operator new(total, std::nothrow));
  if (mem == nullptr) {
    g_stats.failedAllocations++;
    err_no_memory();
    return nullptr;
  }
  std::memset(mem, 0, total);
  auto* header = new (mem) ObjectHeader{}; // NOLINT(cppcoreguidelines-owning-memory)
  header->refcnt = 1;
  header->tag = static_cast<uint32_t>(type->layout);
  header->size = total;
  header->type = type;
  g_stats.numAllocated++;
  g_stats.bytesAllocated += total;
  g_stats.bytesLive += total;
  g_stats.peakBytesLive = std::max(g_stats.peakBytesLive, g_stats.bytesLive);
  return reinterpret_cast<RawObject*>(mem + sizeof(ObjectHeader)); // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
}

static void free_obj(ObjectHeader* header, RawObject* obj) {
  if (g_debug) { std::fprintf(stderr, "[runtime] free_obj type=%s size=%zu\n", header->type->name, header->size); }
  if (static_cast<TypeTag>(header->tag) == TypeTag::Exception) {
    auto* exc = payload_of<ExceptionPayload>(obj);
    for (RawObject* child : {exc->message, exc->encoding, exc->object, exc->reason}) {
      if (child != nullptr) { decref(child); }
    }
  }
  g_stats.numFreed++;
  g_stats.bytesLive -= header->size;
  ::operator delete(header);
}

void incref(RawObject* obj) {
  if (obj == nullptr) { return; }
  g_stats.numIncref++;
  ObjectHeader* header = header_of(obj);
  if ((header->flags & kImmortal) != 0U) { return; }
  header->refcnt++;
}

void decref(RawObject* obj) {
  if (obj == nullptr) { return; }
  g_stats.numDecref++;
  ObjectHeader* header = header_of(obj);
  if ((header->flags & kImmortal) != 0U) { return; }
  if (header->refcnt == 0) {
    std::fprintf(stderr, "[runtime] decref of dead object type=%s\n", header->type->name);
    return;
  }
  if (--header->refcnt == 0) { free_obj(header, obj); }
}

std::size_t refcount(RawObject* obj) { return obj == nullptr ? 0 : header_of(obj)->refcnt; }

const TypeDescriptor* builtin_type(TypeTag tag) {
  switch (tag) {
    case TypeTag::String: return as_descriptor(&kStrType);
    case TypeTag::Int: return as_descriptor(&kIntType);
    case TypeTag::Float: return as_descriptor(&kFloatType);
    case TypeTag::Bool: return as_descriptor(&kBoolType);
    case TypeTag::Object: return as_descriptor(&kObjectType);
    case TypeTag::Bytes: return as_descriptor(&kBytesType);
    case TypeTag::None: return as_descriptor(&kNoneType);
    case TypeTag::Exception: return as_descriptor(&kBaseException);
  }
  return nullptr;
}

const TypeDescriptor* exception_type(const char* name) {
  if (name == nullptr) { return nullptr; }
  for (const TypeObject* type : kExceptionTypes) {
    if (std::strcmp(type->name, name) == 0) { return as_descriptor(type); }
  }
  return nullptr;
}

const TypeDescriptor* type_of(RawObject* obj) { return obj == nullptr ? nullptr : as_descriptor(header_of(obj)->type); }

const char* type_name(const TypeDescriptor* type) { return type == nullptr ? "<null>" : as_type(type)->name; }

bool is_subtype(const TypeDescriptor* type, const TypeDescriptor* base) {
  if (type == nullptr || base == nullptr) { return false; }
  for (const TypeObject* t = as_type(type); t != nullptr; t = t->base) {
    if (t == as_type(base)) { return true; }
  }
  return false;
}

bool is_instance(RawObject* obj, const TypeDescriptor* type) { return obj != nullptr && is_subtype(type_of(obj), type); }

TypeTag layout_of(RawObject* obj) { return static_cast<TypeTag>(header_of(obj)->tag); }

static RawObject* string_from_storage(const char* data, std::size_t len) {
  RawObject* obj = alloc_object(sizeof(StringPayload) + len + 1, &kStrType);
  if (obj == nullptr) { return nullptr; }
  auto* payload = payload_of<StringPayload>(obj);
  payload->len = len;
  char* dst = reinterpret_cast<char*>(payload + 1); // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  if (len > 0) { std::memcpy(dst, data, len); }
  dst[len] = '\0';
  if (g_debug) { std::fprintf(stderr, "[runtime] string_new(len=%zu)\n", len); }
  return obj;
}

RawObject* string_new(const char* data, std::size_t len) {
  const auto* bytes = reinterpret_cast<const unsigned char*>(data);
  if (const auto err = support::ValidateUtf8(bytes, len)) {
    const std::size_t unit = err->errorLen == 0 ? len - err->validUpTo : err->errorLen;
    RawObject* exc = unicode_decode_error_new("utf-8", bytes, len, err->validUpTo, err->validUpTo + unit, err->reason);
    if (exc != nullptr) { err_restore(exc); }
    return nullptr;
  }
  return string_from_storage(data, len);
}

RawObject* string_new_escaped(const char* data, std::size_t len) {
  std::string storage;
  detail::DecodeFailure unused;
  (void)detail::decode_utf8_bytes(reinterpret_cast<const unsigned char*>(data), len,
                                  detail::ErrorPolicy::SurrogateEscape, storage, unused); // never fails under surrogateescape
  return string_from_storage(storage.data(), storage.size());
}

RawObject* string_from_code_points(const uint32_t* cps, std::size_t count) {
  std::string storage;
  storage.reserve(count);
  for (std::size_t i = 0; i < count; ++i) {
    if (cps[i] > 0x10FFFFU) {
      err_set(as_descriptor(&kValueError), "code point not in range(0x110000)");
      return nullptr;
    }
    support::AppendCodePoint(storage, cps[i]);
  }
  return string_from_storage(storage.data(), storage.size());
}

const char* string_data(RawObject* str) {
  if (str == nullptr || layout_of(str) != TypeTag::String) { return nullptr; }
  return reinterpret_cast<const char*>(payload_of<StringPayload>(str) + 1); // NOLINT
}

std::size_t string_len(RawObject* str) {
  if (str == nullptr || layout_of(str) != TypeTag::String) { return 0; }
  return payload_of<StringPayload>(str)->len;
}

RawObject* bytes_new(const void* data, std::size_t len) {
  RawObject* obj = alloc_object(sizeof(BytesPayload) + len + 1, &kBytesType);
  if (obj == nullptr) { return nullptr; }
  auto* payload = payload_of<BytesPayload>(obj);
  payload->len = len;
  auto* dst = reinterpret_cast<unsigned char*>(payload + 1); // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  if (len > 0 && data != nullptr) { std::memcpy(dst, data, len); }
  dst[len] = 0;
  return obj;
}

const unsigned char* bytes_data(RawObject* obj) {
  if (obj == nullptr || layout_of(obj) != TypeTag::Bytes) { return nullptr; }
  return reinterpret_cast<const unsigned char*>(payload_of<BytesPayload>(obj) + 1); // NOLINT
}

std::size_t bytes_len(RawObject* obj) {
  if (obj == nullptr || layout_of(obj) != TypeTag::Bytes) { return 0; }
  return payload_of<BytesPayload>(obj)->len;
}

RawObject* int_new(int64_t value) {
  RawObject* obj = alloc_object(sizeof(IntPayload), &kIntType);
  if (obj == nullptr) { return nullptr; }
  payload_of<IntPayload>(obj)->value = value;
  return obj;
}

int64_t int_value(RawObject* obj) {
  if (obj == nullptr) { return 0; }
  const TypeTag tag = layout_of(obj);
  if (tag != TypeTag::Int && tag != TypeTag::Bool) { return 0; }
  return payload_of<IntPayload>(obj)->value;
}

RawObject* float_new(double value) {
  RawObject* obj = alloc_object(sizeof(FloatPayload), &kFloatType);
  if (obj == nullptr) { return nullptr; }
  payload_of<FloatPayload>(obj)->value = value;
  return obj;
}

double float_value(RawObject* obj) {
  if (obj == nullptr || layout_of(obj) != TypeTag::Float) { return 0.0; }
  return payload_of<FloatPayload>(obj)->value;
}

RawObject* bool_from(bool value) {
  RawObject* obj = value ? raw_of(g_true) : raw_of(g_false);
  incref(obj);
  return obj;
}

RawObject* none() {
  RawObject* obj = raw_of(g_none);
  incref(obj);
  return obj;
}

RawObject* bytes_decode(RawObject* src, const char* encoding, const char* errors) {
  if (src == nullptr) {
    err_set(as_descriptor(&kSystemError), "bad argument to bytes_decode");
    return nullptr;
  }
  if (is_instance(src, as_descriptor(&kStrType))) {
    err_set(as_descriptor(&kTypeError), "decoding str is not supported");
    return nullptr;
  }
  if (!is_instance(src, as_descriptor(&kBytesType))) {
    const std::string msg = std::string("decoding to str: need a bytes-like object, ") + header_of(src)->type->name + " found";
    err_set(as_descriptor(&kTypeError), msg.c_str());
    return nullptr;
  }
  detail::ErrorPolicy policy{};
  if (!detail::parse_error_policy(errors, policy)) {
    const std::string msg = std::string("unknown error handler name '") + errors + "'";
    err_set(as_descriptor(&kLookupError), msg.c_str());
    return nullptr;
  }
  const std::string enc = detail::normalize_encoding_name(encoding);
  const unsigned char* p = bytes_data(src);
  const std::size_t nb = bytes_len(src);
  std::string out;
  detail::DecodeFailure failure;
  bool ok = true;
  if (enc == "utf-8" || enc == "utf8") {
    ok = detail::decode_utf8_bytes(p, nb, policy, out, failure);
  } else if (enc == "ascii" || enc == "us-ascii") {
    ok = detail::decode_ascii_bytes(p, nb, policy, out, failure);
  } else if (enc == "latin-1" || enc == "latin1" || enc == "iso-8859-1") {
    detail::decode_latin1_bytes(p, nb, out);
  } else {
    switch (detail::decode_icu_bytes(encoding, p, nb, policy, out, failure)) {
      case detail::IcuDecodeStatus::Ok: break;
      case detail::IcuDecodeStatus::Failed: ok = false; break;
      case detail::IcuDecodeStatus::UnknownEncoding: {
        const std::string msg = std::string("unknown encoding: ") + encoding;
        err_set(as_descriptor(&kLookupError), msg.c_str());
        return nullptr;
      }
      case detail::IcuDecodeStatus::UnsupportedPolicy: {
        const std::string msg = std::string("error handler '") + (errors ? errors : "strict") +
                                "' is not supported by codec '" + enc + "'";
        err_set(as_descriptor(&kLookupError), msg.c_str());
        return nullptr;
      }
    }
  }
  if (!ok) {
    RawObject* exc = unicode_decode_error_new(enc.c_str(), p, nb, failure.start, failure.end, failure.reason);
    if (exc != nullptr) { err_restore(exc); }
    return nullptr;
  }
  return string_from_storage(out.data(), out.size());
}

// Exceptions implementation: per-thread pending exception object
static RawObject* exception_alloc(const TypeObject* type, const char* message) {
  RawObject* exc = alloc_object(sizeof(ExceptionPayload), type);
  if (exc == nullptr) { return nullptr; }
  if (message != nullptr && *message != '\0') {
    RawObject* msg = string_new_escaped(message, std::strlen(message));
    if (msg == nullptr) { decref(exc); return nullptr; }
    payload_of<ExceptionPayload>(exc)->message = msg;
  }
  return exc;
}

void err_set(const TypeDescriptor* type, const char* message) {
  const TypeObject* t = as_type(type);
  if (t == nullptr || !is_subtype(type, as_descriptor(&kBaseException))) { t = &kSystemError; }
  RawObject* exc = exception_alloc(t, message);
  if (exc == nullptr) { return; } // MemoryError is already pending
  err_restore(exc);
}

void err_no_memory() {
  RawObject* exc = raw_of(g_memory_error);
  incref(exc);
  err_restore(exc);
}

bool err_occurred() { return t_pending != nullptr; }

RawObject* err_fetch() {
  RawObject* exc = t_pending;
  t_pending = nullptr;
  return exc;
}

void err_restore(RawObject* exc) {
  RawObject* previous = t_pending;
  t_pending = exc;
  if (previous != nullptr) { decref(previous); }
}

void err_clear() { err_restore(nullptr); }

RawObject* exception_new(const TypeDescriptor* type, const char* message) {
  if (!is_subtype(type, as_descriptor(&kBaseException))) {
    err_set(as_descriptor(&kTypeError), "exceptions must derive from BaseException");
    return nullptr;
  }
  return exception_alloc(as_type(type), message);
}

const char* exception_message(RawObject* exc) {
  if (exc == nullptr || layout_of(exc) != TypeTag::Exception) { return ""; }
  RawObject* msg = payload_of<ExceptionPayload>(exc)->message;
  return msg == nullptr ? "" : string_data(msg);
}

RawObject* unicode_decode_error_new(const char* encoding, const unsigned char* object, std::size_t len,
                                    std::size_t start, std::size_t end, const char* reason) {
  char message[256];
  if (end == start + 1 && start < len) {
    std::snprintf(message, sizeof(message), "'%s' codec can't decode byte 0x%02x in position %zu: %s",
                  encoding, static_cast<unsigned>(object[start]), start, reason);
  } else {
    std::snprintf(message, sizeof(message), "'%s' codec can't decode bytes in position %zu-%zu: %s",
                  encoding, start, end == 0 ? 0 : end - 1, reason);
  }
  RawObject* exc = exception_alloc(&kUnicodeDecodeError, message);
  if (exc == nullptr) { return nullptr; }
  auto* payload = payload_of<ExceptionPayload>(exc);
  payload->encoding = string_new_escaped(encoding, std::strlen(encoding));
  payload->object = bytes_new(object, len);
  payload->reason = string_new_escaped(reason, std::strlen(reason));
  payload->start = start;
  payload->end = end;
  if (payload->encoding == nullptr || payload->object == nullptr || payload->reason == nullptr) {
    decref(exc);
    return nullptr;
  }
  return exc;
}

bool unicode_decode_error_fields(RawObject* exc, ffi::DecodeErrorFields* out) {
  if (out == nullptr || !is_instance(exc, as_descriptor(&kUnicodeDecodeError))) { return false; }
  const auto* payload = payload_of<ExceptionPayload>(exc);
  if (payload->object == nullptr) { return false; }
  out->encoding = string_data(payload->encoding);
  out->object = bytes_data(payload->object);
  out->objectLen = bytes_len(payload->object);
  out->start = payload->start;
  out->end = payload->end;
  out->reason = string_data(payload->reason);
  return true;
}

RuntimeStats runtime_stats() { return g_stats; }

void runtime_fail_allocations_after(int64_t remaining) { g_fail_after = remaining; }

void runtime_reset_for_tests() {
  g_fail_after = -1;
  err_clear();
}

} // namespace gilbridge::rt
