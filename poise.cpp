// This file is part of POISE.
// Copyleft 2024-2025, LH_Mouse. All wrongs reserved.

#define POISE_DETAILS_8E2A6F0C_4D17_4B59_A3C1_96F4E0B7D215_
#include "poise.hpp"
#include <rocket/ascii_numget.hpp>
#include <vector>
#include <cmath>
#include <cfloat>
#include <cstring>
#include <stdexcept>
#if defined __SSE2__
#include <x86intrin.h>
#include <xmmintrin.h>
#endif
#if defined __ARM_NEON
#include <arm_neon.h>
#endif
namespace poise {
namespace {

using variant_type = Variant;

constexpr ROCKET_ALWAYS_INLINE
bool
is_within(int c, int lo, int hi)
  {
    return (c >= lo) && (c <= hi);
  }

template<typename... Ts>
constexpr ROCKET_ALWAYS_INLINE
bool
is_any(int c, Ts... accept_set)
  {
    return (... || (c == accept_set));
  }

ROCKET_ALWAYS_INLINE
void
do_err(Parser_Context& ctx, Error_Kind kind, const char* error, int64_t offset)
  {
    if(ctx.error)
      return;

    ctx.offset = offset;
    ctx.error = error;
    ctx.kind = kind;
  }

void
do_err(Parser_Context& ctx, Error_Kind kind, const char* error, int64_t offset,
       const char* frag, size_t fraglen)
  {
    if(ctx.error)
      return;

    do_err(ctx, kind, error, offset);
    ctx.fragment.assign(frag, fraglen);
  }

struct Memory_Source
  {
    const char* bptr;
    const char* sptr;
    const char* eptr;

    constexpr Memory_Source(const char* s, size_t n) noexcept
      : bptr(s), sptr(s), eptr(s + n)  { }

    // Gets the next byte without consuming it. At the end of input, -1 is
    // returned.
    int
    peekc() const noexcept
      {
        int r = -1;
        if(this->sptr != this->eptr)
          r = static_cast<unsigned char>(*(this->sptr));
        return r;
      }

    size_t
    avail() const noexcept
      {
        return static_cast<size_t>(this->eptr - this->sptr);
      }

    int64_t
    tell() const noexcept
      {
        return this->sptr - this->bptr;
      }

    int64_t
    tell_end() const noexcept
      {
        return this->eptr - this->bptr;
      }
  };

ROCKET_FLATTEN
void
do_skip_space(Memory_Source& src) noexcept
  {
    const char* tptr = src.sptr;
#if defined __SSE2__
    while(src.eptr - tptr >= 16) {
      __m128i t = _mm_loadu_si128(reinterpret_cast<const __m128i*>(tptr));
      t = _mm_or_si128(_mm_or_si128(_mm_cmpeq_epi8(t, _mm_set1_epi8(' ')),
                                    _mm_cmpeq_epi8(t, _mm_set1_epi8('\t'))),
                       _mm_or_si128(_mm_cmpeq_epi8(t, _mm_set1_epi8('\r')),
                                    _mm_cmpeq_epi8(t, _mm_set1_epi8('\n'))));
      int mask = 0xFFFF ^ _mm_movemask_epi8(t);
      if(mask != 0) {
        src.sptr = tptr + __builtin_ctz(static_cast<uint32_t>(mask));
        return;
      }
      tptr += 16;
    }
#elif defined __ARM_NEON
    while(src.eptr - tptr >= 16) {
      uint8x16_t t = vld1q_u8(reinterpret_cast<const uint8_t*>(tptr));
      t = vorrq_u8(vorrq_u8(vceqq_u8(t, vdupq_n_u8(' ')),
                            vceqq_u8(t, vdupq_n_u8('\t'))),
                   vorrq_u8(vceqq_u8(t, vdupq_n_u8('\r')),
                            vceqq_u8(t, vdupq_n_u8('\n'))));
      uint8x8_t vmask = vshrn_n_u16(vreinterpretq_u16_u8(t), 4);
      uint64_t mask = UINT64_MAX ^ vget_lane_u64(vreinterpret_u64_u8(vmask), 0);
      if(mask != 0) {
        src.sptr = tptr + (__builtin_ctzll(mask) >> 2);
        return;
      }
      tptr += 16;
    }
#endif
    while((tptr != src.eptr) && is_any(*tptr, ' ', '\t', '\r', '\n'))
      ++ tptr;

    src.sptr = tptr;
  }

ROCKET_FLATTEN
void
do_skip_plain_chars(Memory_Source& src) noexcept
  {
    // Skip characters that are known to require no special handling in a
    // string, which are printable ASCII characters other than quotation marks
    // and backslashes.
    const char* tptr = src.sptr;
#if defined __SSE2__
    while(src.eptr - tptr >= 16) {
      __m128i t = _mm_loadu_si128(reinterpret_cast<const __m128i*>(tptr));
      t = _mm_or_si128(_mm_or_si128(_mm_cmpeq_epi8(t, _mm_set1_epi8('\\')),
                                    _mm_cmpeq_epi8(t, _mm_set1_epi8('\"'))),
                       _mm_or_si128(_mm_cmplt_epi8(t, _mm_set1_epi8(0x20)),
                                    _mm_cmplt_epi8(_mm_set1_epi8(0x7E), t)));
      int mask = _mm_movemask_epi8(t);
      if(mask != 0) {
        src.sptr = tptr + __builtin_ctz(static_cast<uint32_t>(mask));
        return;
      }
      tptr += 16;
    }
#elif defined __ARM_NEON
    while(src.eptr - tptr >= 16) {
      uint8x16_t t = vld1q_u8(reinterpret_cast<const uint8_t*>(tptr));
      t = vorrq_u8(vorrq_u8(vceqq_u8(t, vdupq_n_u8('\\')),
                            vceqq_u8(t, vdupq_n_u8('\"'))),
                   vorrq_u8(vcltq_u8(t, vdupq_n_u8(0x20)),
                            vcltq_u8(vdupq_n_u8(0x7E), t)));
      uint8x8_t vmask = vshrn_n_u16(vreinterpretq_u16_u8(t), 4);
      uint64_t mask = vget_lane_u64(vreinterpret_u64_u8(vmask), 0);
      if(mask != 0) {
        src.sptr = tptr + (__builtin_ctzll(mask) >> 2);
        return;
      }
      tptr += 16;
    }
#endif
    while(tptr != src.eptr) {
      int c = static_cast<unsigned char>(*tptr);
      if(is_any(c, '\\', '\"') || !is_within(c, 0x20, 0x7E))
        break;
      ++ tptr;
    }

    src.sptr = tptr;
  }

void
do_append_utf8(::rocket::cow_string& str, char32_t cp)
  {
    char mbs[4];
    size_t mblen;

    if(cp < 0x80) {
      str.push_back(static_cast<char>(cp));
      return;
    }
    else if(cp < 0x800) {
      mbs[0] = static_cast<char>(0xC0 | (cp >> 6));
      mbs[1] = static_cast<char>(0x80 | (cp & 0x3F));
      mblen = 2;
    }
    else if(cp < 0x10000) {
      mbs[0] = static_cast<char>(0xE0 | (cp >> 12));
      mbs[1] = static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
      mbs[2] = static_cast<char>(0x80 | (cp & 0x3F));
      mblen = 3;
    }
    else {
      mbs[0] = static_cast<char>(0xF0 | (cp >> 18));
      mbs[1] = static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
      mbs[2] = static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
      mbs[3] = static_cast<char>(0x80 | (cp & 0x3F));
      mblen = 4;
    }
    str.append(mbs, mblen);
  }

void
do_load_utf16_unit(uint32_t& unit, Parser_Context& ctx, Memory_Source& src)
  {
    // Read `\uXXXX`. The backslash and `u` have been checked by the caller.
    ROCKET_ASSERT(src.avail() >= 2);
    const int64_t esc_offset = src.tell();

    unit = 0;
    for(size_t k = 2;  k != 6;  ++k) {
      if(k >= src.avail())
        return do_err(ctx, error_end_of_input, "incomplete escape sequence", src.tell_end());

      int c = static_cast<unsigned char>(src.sptr[k]);
      unit <<= 4;
      if(is_within(c, '0', '9'))
        unit |= static_cast<uint32_t>(c - '0');
      else if(is_within(c, 'A', 'F'))
        unit |= static_cast<uint32_t>(c - 'A' + 10);
      else if(is_within(c, 'a', 'f'))
        unit |= static_cast<uint32_t>(c - 'a' + 10);
      else
        return do_err(ctx, error_syntax, "invalid hexadecimal digit", esc_offset, src.sptr, k + 1);
    }

    src.sptr += 6;
  }

void
do_scan_unicode_escape(::rocket::cow_string& str, Parser_Context& ctx, Memory_Source& src)
  {
    const char* esc_ptr = src.sptr;
    const int64_t esc_offset = src.tell();

    // Read the first UTF-16 code unit.
    uint32_t high;
    do_load_utf16_unit(high, ctx, src);
    if(ctx.error)
      return;

    if(is_within(static_cast<int>(high), 0xDC00, 0xDFFF))
      return do_err(ctx, error_invalid_escape, "dangling UTF-16 trailing surrogate",
                    esc_offset, esc_ptr, 6);

    char32_t cp = high;
    if(is_within(static_cast<int>(high), 0xD800, 0xDBFF)) {
      // Look for a trailing surrogate, which shall follow immediately.
      if((src.avail() < 2) || (src.sptr[0] != '\\') || (src.sptr[1] != 'u'))
        return do_err(ctx, error_invalid_escape, "missing UTF-16 trailing surrogate",
                      esc_offset, esc_ptr, 6);

      uint32_t low;
      do_load_utf16_unit(low, ctx, src);
      if(ctx.error)
        return;

      if(!is_within(static_cast<int>(low), 0xDC00, 0xDFFF))
        return do_err(ctx, error_invalid_escape, "missing UTF-16 trailing surrogate",
                      esc_offset, esc_ptr, 12);

      cp = 0x10000 + ((high & 0x3FF) << 10) + (low & 0x3FF);
    }

    do_append_utf8(str, cp);
  }

void
do_scan_escape(::rocket::cow_string& str, Parser_Context& ctx, Memory_Source& src)
  {
    ROCKET_ASSERT(src.peekc() == '\\');
    if(src.avail() < 2)
      return do_err(ctx, error_end_of_input, "incomplete escape sequence", src.tell_end());

    int next = static_cast<unsigned char>(src.sptr[1]);
    char ch;
    switch(next)
      {
      case '\\':
      case '\"':
      case '/':
        ch = static_cast<char>(next);
        break;

      case 'b':
        ch = '\b';
        break;

      case 'f':
        ch = '\f';
        break;

      case 'n':
        ch = '\n';
        break;

      case 'r':
        ch = '\r';
        break;

      case 't':
        ch = '\t';
        break;

      case 'u':
        return do_scan_unicode_escape(str, ctx, src);

      default:
        return do_err(ctx, error_syntax, "invalid escape sequence", src.tell() + 1);
      }

    str.push_back(ch);
    src.sptr += 2;
  }

void
do_scan_string(::rocket::cow_string& str, Parser_Context& ctx, Memory_Source& src)
  {
    // The opening quotation mark has been consumed. Characters that need no
    // decoding are collected into a run, which is copied only when an escape
    // sequence or the closing quotation mark is encountered, so a string
    // without escape sequences is copied exactly once.
    str.clear();
    const char* rptr = src.sptr;

    for(;;) {
      do_skip_plain_chars(src);

      int c = src.peekc();
      if(c < 0)
        return do_err(ctx, error_end_of_input, "unterminated string", src.tell());

      if(c == '\"') {
        str.append(rptr, src.sptr);
        src.sptr ++;
        return;
      }

      if(c == '\\') {
        str.append(rptr, src.sptr);
        do_scan_escape(str, ctx, src);
        if(ctx.error)
          return;

        rptr = src.sptr;
      }
      else if(c <= 0x1F)
        return do_err(ctx, error_syntax, "control character not allowed in string", src.tell());
      else if(c == 0x7F)
        src.sptr ++;
      else {
        // Take a multibyte UTF-8 character, which must be valid.
        char32_t cp;
        size_t u8len = decode_utf8(cp, src.sptr, src.avail());
        if(u8len == 0)
          return do_err(ctx, error_syntax, "invalid UTF-8 sequence", src.tell());

        src.sptr += u8len;
      }
    }
  }

void
do_scan_number(variant_type& stor, Parser_Context& ctx, Memory_Source& src,
               const Parser_Options& opts, ::rocket::ascii_numget& numg)
  {
    // These are exact in double precision.
    static constexpr double s_pow10[] =
      {
        1e0,  1e1,  1e2,  1e3,  1e4,  1e5,  1e6,  1e7,  1e8,  1e9,  1e10, 1e11,
        1e12, 1e13, 1e14, 1e15, 1e16, 1e17, 1e18, 1e19, 1e20, 1e21, 1e22,
      };

    const char* nptr = src.sptr;
    const int64_t num_offset = src.tell();
    int sign = 1;
    Big_Integer coef;
    int64_t exp = 0;
    bool exp_ovfl = false;

    // Digits are accumulated in groups of nine, so the coefficient is updated
    // once for each group.
    uint32_t group = 0;
    uint32_t group_mul = 1;

    const auto push_digit = [&](int d)
      {
        group = group * 10 + static_cast<uint32_t>(d - '0');
        group_mul *= 10;
        if(group_mul == 1000000000) {
          coef.mul_add(group_mul, group);
          group = 0;
          group_mul = 1;
        }
      };

    if(src.peekc() == '-') {
      sign = -1;
      src.sptr ++;
    }

    // A leading zero is a complete integral part by itself.
    int c = src.peekc();
    if(c == '0')
      src.sptr ++;
    else if(is_within(c, '1', '9')) {
      do {
        push_digit(c);
        src.sptr ++;
        c = src.peekc();
      }
      while(is_within(c, '0', '9'));
    }
    else
      return do_err(ctx, error_syntax, "invalid number", num_offset);

    if(src.peekc() == '.') {
      // fractional part; each digit moves the decimal point
      src.sptr ++;
      c = src.peekc();
      if(!is_within(c, '0', '9'))
        return do_err(ctx, error_syntax, "invalid number", src.tell());

      do {
        push_digit(c);
        exp --;
        src.sptr ++;
        c = src.peekc();
      }
      while(is_within(c, '0', '9'));
    }

    if(is_any(src.peekc(), 'e', 'E')) {
      // exponent part
      src.sptr ++;
      bool exp_neg = false;
      if(is_any(src.peekc(), '+', '-')) {
        exp_neg = src.peekc() == '-';
        src.sptr ++;
      }

      c = src.peekc();
      if(!is_within(c, '0', '9'))
        return do_err(ctx, error_syntax, "invalid number", src.tell());

      int64_t exp_abs = 0;
      do {
        if(exp_abs < 100000000000000000)
          exp_abs = exp_abs * 10 + (c - '0');
        else
          exp_ovfl = true;

        src.sptr ++;
        c = src.peekc();
      }
      while(is_within(c, '0', '9'));

      exp += exp_neg ? -exp_abs : exp_abs;
    }

    if(group_mul != 1)
      coef.mul_add(group_mul, group);

    const size_t nlen = static_cast<size_t>(src.sptr - nptr);
    if(exp_ovfl)
      return do_err(ctx, error_numeric_overflow, "exponent out of range", num_offset, nptr, nlen);

    if(opts.numbers == numbers_decimal) {
      // The backend takes the exact triple. There is no fallback to
      // floating-point numbers.
      const Decimal_Backend& backend = opts.decimal_backend ? *(opts.decimal_backend)
                                                            : missing_decimal_backend();
      if(!backend.construct(stor.emplace<V_decimal>(), sign, coef, exp))
        return do_err(ctx, error_missing_dependency, "missing optional dependency", num_offset,
                      backend.name(), ::strlen(backend.name()));

      return;
    }

    if(exp == 0) {
      // exact integer
      if(sign < 0)
        coef.negate();

      stor.emplace<V_integer>(::std::move(coef));
      return;
    }

    double& value = stor.emplace<V_number>();
    if(coef.is_int64() && (coef.as_int64() <= (INT64_C(1) << 53)) && (exp >= -22) && (exp <= 22)) {
      // Both operands are exact, so there is only one rounding.
      value = static_cast<double>(coef.as_int64());
      if(exp > 0)
        value *= s_pow10[exp];
      else
        value /= s_pow10[-exp];

      if(sign < 0)
        value = - value;
      return;
    }

    // Let the decimal parser do the rounding. The source text includes the
    // sign.
    numg.parse_DD(nptr, nlen);
    numg.cast_D(value, -DBL_MAX, DBL_MAX);
    if(numg.overflowed())
      return do_err(ctx, error_numeric_overflow, "number value out of range", num_offset, nptr, nlen);
  }

ROCKET_ALWAYS_INLINE
bool
do_match_literal(Memory_Source& src, const char* lit, size_t len) noexcept
  {
    if((src.avail() < len) || (::memcmp(src.sptr, lit, len) != 0))
      return false;

    src.sptr += len;
    return true;
  }

variant_type*
do_pack_key(V_object& obj, Parser_Context& ctx, Memory_Source& src, const Parser_Options& opts,
            ::rocket::cow_string& token)
  {
    // We are inside an object, so this must be a key string, followed by a
    // colon, followed by its value.
    if(src.peekc() != '\"') {
      do_err(ctx, error_syntax, "missing key string", src.tell());
      return nullptr;
    }

    src.sptr ++;
    const int64_t key_offset = src.tell();
    do_scan_string(token, ctx, src);
    if(ctx.error)
      return nullptr;

    ::rocket::phcow_string key;
    switch(opts.keys)
      {
      case keys_validated_intern:
        if(auto pkey = opts.symbols->find(token.data(), token.size()))
          key = *pkey;
        else {
          do_err(ctx, error_invalid_key, "unknown key string", key_offset, token.data(), token.size());
          return nullptr;
        }
        break;

      case keys_always_intern:
        key = opts.symbols->intern(token.data(), token.size());
        break;

      default:
        key = token;
        break;
      }

    do_skip_space(src);
    if(src.peekc() != ':') {
      do_err(ctx, error_syntax, "missing colon", src.tell());
      return nullptr;
    }
    src.sptr ++;

    // If the key exists, its value will be overwritten, so the last one wins.
    auto emr = obj.try_emplace(::std::move(key));
    return &(emr.first->second.mf_stor());
  }

void
do_parse_value(variant_type& root, Parser_Context& ctx, Memory_Source& src,
               const Parser_Options& opts)
  {
    // Break deep recursion with a handwritten stack.
    struct xFrame
      {
        variant_type* target;
        V_array* psa;
        V_object* pso;
      };

    ::std::vector<xFrame> stack;
    ::rocket::cow_string token;
    ::rocket::ascii_numget numg;
    variant_type* pstor = &root;
    int64_t open_offset;

  do_pack_value_loop_:
    do_skip_space(src);
    switch(src.peekc())
      {
      case '[':
        open_offset = src.tell();
        src.sptr ++;
        do_skip_space(src);
        if(src.peekc() != ']') {
          // open
          if(opts.max_depth && (stack.size() >= opts.max_depth))
            return do_err(ctx, error_nesting_limit, "nesting limit exceeded", open_offset);

          auto& frm = stack.emplace_back();
          frm.target = pstor;
          frm.psa = &(pstor->emplace<V_array>());
          frm.pso = nullptr;

          // first
          pstor = &(frm.psa->emplace_back().mf_stor());
          goto do_pack_value_loop_;
        }

        // empty
        src.sptr ++;
        pstor->emplace<V_array>();
        break;

      case '{':
        open_offset = src.tell();
        src.sptr ++;
        do_skip_space(src);
        if(src.peekc() != '}') {
          // open
          if(opts.max_depth && (stack.size() >= opts.max_depth))
            return do_err(ctx, error_nesting_limit, "nesting limit exceeded", open_offset);

          auto& frm = stack.emplace_back();
          frm.target = pstor;
          frm.psa = nullptr;
          frm.pso = &(pstor->emplace<V_object>());

          // first
          pstor = do_pack_key(*(frm.pso), ctx, src, opts, token);
          if(ctx.error)
            return;

          goto do_pack_value_loop_;
        }

        // empty
        src.sptr ++;
        pstor->emplace<V_object>();
        break;

      case '-':
      case '0' ... '9':
        do_scan_number(*pstor, ctx, src, opts, numg);
        if(ctx.error)
          return;
        break;

      case '\"':
        src.sptr ++;
        do_scan_string(pstor->emplace<V_string>(), ctx, src);
        if(ctx.error)
          return;
        break;

      case 'f':
        if(!do_match_literal(src, "false", 5))
          return do_err(ctx, error_syntax, "invalid token", src.tell());

        pstor->emplace<V_boolean>(false);
        break;

      case 't':
        if(!do_match_literal(src, "true", 4))
          return do_err(ctx, error_syntax, "invalid token", src.tell());

        pstor->emplace<V_boolean>(true);
        break;

      case 'n':
        if(!do_match_literal(src, "null", 4))
          return do_err(ctx, error_syntax, "invalid token", src.tell());

        pstor->emplace<V_null>();
        break;

      default:
        // This includes the end of input.
        return do_err(ctx, error_syntax, "invalid token", src.tell());
      }

    while(!stack.empty()) {
      const auto& frm = stack.back();
      do_skip_space(src);
      if(frm.psa) {
        // array
        if(src.peekc() == ',') {
          src.sptr ++;

          // next
          pstor = &(frm.psa->emplace_back().mf_stor());
          goto do_pack_value_loop_;
        }

        if(src.peekc() != ']')
          return do_err(ctx, error_syntax, "missing comma or closed bracket", src.tell());
      }
      else {
        // object
        if(src.peekc() == ',') {
          src.sptr ++;
          do_skip_space(src);

          // next
          pstor = do_pack_key(*(frm.pso), ctx, src, opts, token);
          if(ctx.error)
            return;

          goto do_pack_value_loop_;
        }

        if(src.peekc() != '}')
          return do_err(ctx, error_syntax, "missing comma or closed brace", src.tell());
      }

      // close
      src.sptr ++;
      pstor = frm.target;
      stack.pop_back();
    }
  }

void
do_parse_with(variant_type& root, Parser_Context& ctx, const char* str, size_t len,
              const Parser_Options& opts)
  {
    // Initialize parser state.
    ctx.offset = 0;
    ctx.position = 0;
    ctx.error = nullptr;
    ctx.kind = error_none;
    ctx.fragment.clear();
    ctx.message.clear();

    if((opts.keys != keys_raw) && !opts.symbols)
      ::rocket::sprintf_and_throw<::std::invalid_argument>(
            "poise::Value: key policy `%d` requires a symbol table",
            static_cast<int>(opts.keys));

    Memory_Source src(str, len);
    do_parse_value(root, ctx, src, opts);
    if(!ctx.error) {
      // Only whitespace may follow the value.
      do_skip_space(src);
      if(src.sptr != src.eptr)
        do_err(ctx, error_syntax, "trailing characters", src.tell());
    }

    // Attach the input buffer to the error only now.
    if(ctx.error)
      complete_parser_error(ctx, str, len);
  }

}  // namespace

void
Value::
parse_with(Parser_Context& ctx, const ::rocket::cow_string& str, const Parser_Options& opts)
  {
    this->parse_with(ctx, str.data(), str.size(), opts);
  }

void
Value::
parse_with(Parser_Context& ctx, const char* str, size_t len, const Parser_Options& opts)
  {
    // Never leave a partial value behind.
    Value temp;
    do_parse_with(temp.m_stor, ctx, str, len, opts);
    if(ctx.error)
      this->clear();
    else
      this->swap(temp);
  }

void
Value::
parse_with(Parser_Context& ctx, const char* str, const Parser_Options& opts)
  {
    this->parse_with(ctx, str, ::strlen(str), opts);
  }

bool
Value::
parse(const ::rocket::cow_string& str, const Parser_Options& opts)
  {
    Parser_Context ctx;
    this->parse_with(ctx, str.data(), str.size(), opts);
    return !ctx.error;
  }

bool
Value::
parse(const char* str, size_t len, const Parser_Options& opts)
  {
    Parser_Context ctx;
    this->parse_with(ctx, str, len, opts);
    return !ctx.error;
  }

bool
Value::
parse(const char* str, const Parser_Options& opts)
  {
    Parser_Context ctx;
    this->parse_with(ctx, str, ::strlen(str), opts);
    return !ctx.error;
  }

}  // namespace poise
