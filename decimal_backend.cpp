// This file is part of POISE.
// Copyleft 2024-2025, LH_Mouse. All wrongs reserved.

#include "decimal.hpp"
namespace poise {
namespace {

struct Exact_Decimal_Backend final : Decimal_Backend
  {
    const char*
    name() const noexcept override
      { return "Decimal";  }

    bool
    construct(Decimal& out, int sign, const Big_Integer& coef, int64_t exp) const override
      {
        ROCKET_ASSERT((sign == -1) || (sign == 1));
        ROCKET_ASSERT(coef.sign() >= 0);

        // Trailing zeroes are significant, so `1.50` is kept as `150E-2`, and
        // the sign of zero is kept, too.
        out.sign = sign;
        out.coef = coef;
        out.exp = exp;
        return true;
      }
  };

}  // namespace

const Decimal_Backend&
exact_decimal_backend() noexcept
  {
    static Exact_Decimal_Backend s_backend;
    return s_backend;
  }

}  // namespace poise
