/***
 * Name: gilbridge::rt (Runtime API)
 * Purpose: Minimal reference-counted object runtime bundled as the bridge's foreign side.
 * Theory of Operation:
 *   - Objects carry a header (refcount, type, layout tag, size) followed by a payload;
 *     an object is freed when its refcount reaches zero. None/True/False are immortal.
 *   - Text is stored as generalized UTF-8: lone surrogates are representable as
 *     three-byte sequences so escaped or surrogate-bearing text survives storage.
 *   - Failures return nullptr and leave a pending exception in thread-local state,
 *     mirroring how the bridge expects any foreign runtime to behave.
 *   - Nothing here is synchronized; the embedding serializes all calls (the bridge
 *     lock). Exception state is per thread.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include "gilbridge/ffi/Api.h"
#include "runtime/TypeTag.h"
#include "runtime/RuntimeStats.h"

namespace gilbridge::rt {
    using ffi::RawObject;
    using ffi::TypeDescriptor;

    // Reference counting
    void incref(RawObject *obj);

    void decref(RawObject *obj);

    std::size_t refcount(RawObject *obj);

    // Types
    const TypeDescriptor *builtin_type(TypeTag tag);

    // Built-in exception types by name (nullptr if unknown).
    const TypeDescriptor *exception_type(const char *name);

    const TypeDescriptor *type_of(RawObject *obj);

    const char *type_name(const TypeDescriptor *type);

    bool is_subtype(const TypeDescriptor *type, const TypeDescriptor *base);

    bool is_instance(RawObject *obj, const TypeDescriptor *type);

    TypeTag layout_of(RawObject *obj);

    // Strings. string_new is strict (UnicodeDecodeError on ill-formed input);
    // string_new_escaped maps each invalid byte b to the lone surrogate U+DC00+b.
    RawObject *string_new(const char *data, std::size_t len);

    RawObject *string_new_escaped(const char *data, std::size_t len);

    // Accepts surrogate code points; ValueError above U+10FFFF.
    RawObject *string_from_code_points(const uint32_t *cps, std::size_t count);

    const char *string_data(RawObject *str);

    // String length in bytes of the generalized UTF-8 storage
    std::size_t string_len(RawObject *str);

    // Bytes (immutable, length-delimited; a trailing NUL is kept but not counted)
    RawObject *bytes_new(const void *data, std::size_t len);

    const unsigned char *bytes_data(RawObject *obj);

    std::size_t bytes_len(RawObject *obj);

    // Scalars. bool is a subtype of int; int_value of True is 1.
    RawObject *int_new(int64_t value);

    int64_t int_value(RawObject *obj);

    RawObject *float_new(double value);

    double float_value(RawObject *obj);

    RawObject *bool_from(bool value);

    RawObject *none();

    // Decode bytes under an encoding and error policy.
    // Encodings: utf-8, ascii, latin-1, or any ICU converter name.
    // errors: strict (default), replace, ignore, surrogateescape, surrogatepass (utf-8 only).
    RawObject *bytes_decode(RawObject *src, const char *encoding, const char *errors);

    // Exceptions (thread-local pending state)
    void err_set(const TypeDescriptor *type, const char *message);

    void err_no_memory();

    bool err_occurred();

    RawObject *err_fetch();

    void err_restore(RawObject *exc);

    void err_clear();

    RawObject *exception_new(const TypeDescriptor *type, const char *message);

    const char *exception_message(RawObject *exc);

    RawObject *unicode_decode_error_new(const char *encoding, const unsigned char *object, std::size_t len,
                                        std::size_t start, std::size_t end, const char *reason);

    bool unicode_decode_error_fields(RawObject *exc, ffi::DecodeErrorFields *out);

    // Stats and test hooks
    RuntimeStats runtime_stats();

    // Let the next `remaining` allocations succeed, then fail with MemoryError; -1 disables.
    void runtime_fail_allocations_after(int64_t remaining);

    void runtime_reset_for_tests();
} // namespace gilbridge::rt
