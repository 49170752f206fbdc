// This file is part of POISE.
// Copyleft 2024-2025, LH_Mouse. All wrongs reserved.

#ifndef POISE_DECIMAL_HPP_
#define POISE_DECIMAL_HPP_

#include "big_integer.hpp"
#include <rocket/cow_string.hpp>
#include <cstdint>
namespace poise {

// This is an exact decimal number `sign * coef * 10^exp`. It is not an
// arithmetic type; it only carries what the parser has seen, so no precision is
// lost before the caller chooses a representation.
struct Decimal
  {
    int sign = 1;  // -1 or 1
    Big_Integer coef;  // never negative
    int64_t exp = 0;

    // Formats this value as `[-]<coef>E<exp>`, with the exponent omitted if it
    // is zero.
    ::rocket::cow_string
    to_string() const;
  };

bool
operator==(const Decimal& lhs, const Decimal& rhs) noexcept;

inline
bool
operator!=(const Decimal& lhs, const Decimal& rhs) noexcept
  {
    return !(lhs == rhs);
  }

// This is the strategy that the parser uses to construct decimal numbers when
// `numbers_decimal` is requested. The default one, `missing_decimal_backend()`,
// always fails, so the parser reports a missing dependency instead of falling
// back to floating-point numbers. Link `poise_decimal` and pass
// `exact_decimal_backend()` to enable decimal numbers.
class Decimal_Backend
  {
  public:
    Decimal_Backend() noexcept = default;
    Decimal_Backend(const Decimal_Backend&) = delete;
    Decimal_Backend& operator=(const Decimal_Backend&) & = delete;
    virtual ~Decimal_Backend();

    // Gets the name of the backend, for error messages.
    virtual
    const char*
    name() const noexcept = 0;

    // Constructs a decimal number from its sign (-1 or 1), its coefficient (not
    // negative) and its exponent. If the backend is not available, `false` is
    // returned and `out` is left unspecified.
    virtual
    bool
    construct(Decimal& out, int sign, const Big_Integer& coef, int64_t exp) const = 0;
  };

// Gets the backend that is always unavailable.
const Decimal_Backend&
missing_decimal_backend() noexcept;

// Gets the backend that stores numbers exactly. This is defined in the
// `poise_decimal` library.
const Decimal_Backend&
exact_decimal_backend() noexcept;

}  // namespace poise
#endif
