// This file is part of POISE.
// Copyleft 2024-2025, LH_Mouse. All wrongs reserved.

#include "decimal.hpp"
#include <rocket/ascii_numput.hpp>
namespace poise {
namespace {

struct Missing_Decimal_Backend final : Decimal_Backend
  {
    const char*
    name() const noexcept override
      { return "Decimal";  }

    bool
    construct(Decimal& /*out*/, int /*sign*/, const Big_Integer& /*coef*/,
              int64_t /*exp*/) const override
      { return false;  }
  };

}  // namespace

::rocket::cow_string
Decimal::
to_string() const
  {
    ::rocket::cow_string str;
    if(this->sign < 0)
      str.push_back('-');

    ::rocket::cow_string digits = this->coef.to_string();
    str.append(digits.data(), digits.size());

    if(this->exp != 0) {
      ::rocket::ascii_numput nump;
      nump.put_DI(this->exp);
      str.push_back('E');
      str.append(nump.data(), nump.size());
    }
    return str;
  }

bool
operator==(const Decimal& lhs, const Decimal& rhs) noexcept
  {
    return (lhs.sign == rhs.sign) && (lhs.exp == rhs.exp) && (lhs.coef == rhs.coef);
  }

Decimal_Backend::
~Decimal_Backend()
  {
  }

const Decimal_Backend&
missing_decimal_backend() noexcept
  {
    static Missing_Decimal_Backend s_backend;
    return s_backend;
  }

}  // namespace poise
