// This file is part of POISE.
// Copyleft 2024-2025, LH_Mouse. All wrongs reserved.

#include "parse_error.hpp"
#include <rocket/ascii_numput.hpp>
#include <algorithm>
#include <cstring>
namespace poise {
namespace {

constexpr ROCKET_ALWAYS_INLINE
bool
is_within(int c, int lo, int hi)
  {
    return (c >= lo) && (c <= hi);
  }

void
do_put_hex_byte(::rocket::cow_string& out, int ch)
  {
    static constexpr char s_xdigits[] = "0123456789ABCDEF";
    char temp[4] = { '\\', 'x', s_xdigits[(ch >> 4) & 15], s_xdigits[ch & 15] };
    out.append(temp, 4);
  }

void
do_put_position(::rocket::cow_string& out, int64_t position)
  {
    ::rocket::ascii_numput nump;
    nump.put_DI(position);
    out.append(nump.data(), nump.size());
  }

}  // namespace

size_t
decode_utf8(char32_t& cp, const char* str, size_t len) noexcept
  {
    if(len == 0)
      return 0;

    int c = static_cast<unsigned char>(str[0]);
    if(c < 0x80) {
      cp = static_cast<char32_t>(c);
      return 1;
    }

    // Reject continuation bytes, and leading bytes of sequences that would be
    // longer than four bytes or exceed U+10FFFF.
    if(is_within(c, 0x80, 0xBF) || (c > 0xF4))
      return 0;

    size_t u8len = static_cast<uint32_t>(ROCKET_LZCNT32(static_cast<uint32_t>(c ^ -1) << 24));
    if(u8len > len)
      return 0;

    c &= (1 << (7 - u8len)) - 1;
    for(size_t k = 1;  k < u8len;  ++k) {
      int next = static_cast<unsigned char>(str[k]);
      if(!is_within(next, 0x80, 0xBF))
        return 0;

      c <<= 6;
      c |= next & 0x3F;
    }

    if((c < 0x80)  // overlong
        || (c < (1 << (u8len * 5 - 4)))  // overlong
        || is_within(c, 0xD800, 0xDFFF)  // surrogates
        || (c > 0x10FFFF))
      return 0;

    cp = static_cast<char32_t>(c);
    return u8len;
  }

int64_t
count_code_points(const char* str, size_t len) noexcept
  {
    int64_t count = 0;
    size_t off = 0;
    while(off != len) {
      char32_t cp;
      size_t u8len = decode_utf8(cp, str + off, len - off);
      off += ::std::max<size_t>(u8len, 1);
      count ++;
    }
    return count;
  }

void
escape_for_display(::rocket::cow_string& out, const char* str, size_t len)
  {
    size_t off = 0;
    while(off != len) {
      char32_t cp;
      size_t u8len = decode_utf8(cp, str + off, len - off);
      if(u8len == 0) {
        // invalid; shown as a byte
        do_put_hex_byte(out, static_cast<unsigned char>(str[off]));
        off ++;
        continue;
      }

      if(cp == '\\')
        out.append("\\\\", 2);
      else if(cp == '\"')
        out.append("\\\"", 2);
      else if(cp == '\b')
        out.append("\\b", 2);
      else if(cp == '\f')
        out.append("\\f", 2);
      else if(cp == '\n')
        out.append("\\n", 2);
      else if(cp == '\r')
        out.append("\\r", 2);
      else if(cp == '\t')
        out.append("\\t", 2);
      else if((cp <= 0x1F) || (cp == 0x7F))
        do_put_hex_byte(out, static_cast<int>(cp));
      else
        out.append(str + off, u8len);

      off += u8len;
    }
  }

void
complete_parser_error(Parser_Context& ctx, const char* str, size_t len)
  {
    ROCKET_ASSERT(ctx.error);
    ROCKET_ASSERT(ctx.offset >= 0);
    ROCKET_ASSERT(static_cast<uint64_t>(ctx.offset) <= len);

    const size_t off = static_cast<size_t>(ctx.offset);

    // A syntax error at the end of input is reported as an incomplete value.
    if((ctx.kind == error_syntax) && ctx.fragment.empty() && (off == len))
      ctx.kind = error_end_of_input;

    ctx.position = count_code_points(str, off);
    ctx.message.clear();

    if(ctx.kind == error_missing_dependency) {
      ctx.message.append("missing optional dependency: ");
      ctx.message.append(ctx.fragment.data(), ctx.fragment.size());
    }
    else if(!ctx.fragment.empty()) {
      ctx.message.append("cannot parse value at position ");
      do_put_position(ctx.message, ctx.position);
      ctx.message.append(": \"");
      escape_for_display(ctx.message, ctx.fragment.data(), ctx.fragment.size());
      ctx.message.push_back('\"');
    }
    else if(off == len) {
      ctx.message.append("unexpected end of input at position ");
      do_put_position(ctx.message, ctx.position);
    }
    else {
      char32_t cp;
      size_t u8len = decode_utf8(cp, str + off, len - off);
      if(u8len != 0) {
        ctx.message.append("unexpected token at position ");
        do_put_position(ctx.message, ctx.position);
        ctx.message.append(": ");
        escape_for_display(ctx.message, str + off, u8len);
      }
      else {
        // The input is not valid UTF-8, so there is no token to show. Show a
        // few bytes instead.
        ctx.message.append("unsupported value: \"");
        escape_for_display(ctx.message, str + off, ::std::min<size_t>(len - off, 16));
        ctx.message.push_back('\"');
      }
    }
  }

}  // namespace poise
