// This file is part of POISE.
// Copyleft 2024-2025, LH_Mouse. All wrongs reserved.

#ifndef POISE_PARSE_ERROR_HPP_
#define POISE_PARSE_ERROR_HPP_

#include <rocket/cow_string.hpp>
#include <cstdint>
namespace poise {

enum Error_Kind : uint8_t
  {
    error_none                = 0,
    error_syntax              = 1,  // malformed grammar at a specific byte
    error_end_of_input        = 2,  // input exhausted inside a construct
    error_invalid_escape      = 3,  // mismatched UTF-16 surrogates
    error_numeric_overflow    = 4,  // number out of range
    error_invalid_key         = 5,  // key rejected by `keys_validated_intern`
    error_missing_dependency  = 6,  // decimal numbers without a backend
    error_nesting_limit       = 7,  // too many nested arrays or objects
  };

// This structure provides storage for the result of a parse operation. It
// need not be initialized before `parse_with()`. If the parse operation
// succeeds, `error` is a null pointer and the other fields are unspecified.
struct Parser_Context
  {
    // byte offset of the error in the input buffer
    int64_t offset;

    // number of Unicode characters in front of `offset`
    int64_t position;

    // if no error, a null pointer; otherwise, a static string about the error
    const char* error;

    // classification of the error
    Error_Kind kind;

    // offending text, for `error_invalid_escape`, `error_numeric_overflow`,
    // `error_invalid_key` and some syntax errors; otherwise empty; for
    // `error_missing_dependency`, the name of the backend
    ::rocket::cow_string fragment;

    // human-readable description
    ::rocket::cow_string message;
  };

// Decodes a UTF-8 character from the beginning of a string, and returns the
// number of bytes that it occupies. Overlong forms, surrogates and values above
// U+10FFFF are rejected. If the string does not start with a valid character,
// zero is returned.
size_t
decode_utf8(char32_t& cp, const char* str, size_t len) noexcept;

// Counts Unicode characters in a UTF-8 string. Each byte that does not form a
// valid character is counted as one character.
int64_t
count_code_points(const char* str, size_t len) noexcept;

// Writes a character string for display. Printable characters are copied as
// is. Quotation marks, backslashes and control characters are escaped, and so
// are bytes that do not form valid UTF-8 sequences.
void
escape_for_display(::rocket::cow_string& out, const char* str, size_t len);

// Fills `position` and `message` of a failed `Parser_Context`, against the
// input buffer that has been parsed. This is called only when an error has
// occurred, so a successful parse operation never pays for it.
void
complete_parser_error(Parser_Context& ctx, const char* str, size_t len);

}  // namespace poise
#endif
