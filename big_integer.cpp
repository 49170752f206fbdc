// This file is part of POISE.
// Copyleft 2024-2025, LH_Mouse. All wrongs reserved.

#include "big_integer.hpp"
#include <rocket/ascii_numput.hpp>
#include <rocket/ascii_numget.hpp>
#include <cmath>
#include <climits>
#include <stdexcept>
namespace poise {
namespace {

constexpr uint32_t limb_base = 1000000000;

void
do_split_magnitude(::rocket::cow_vector<uint32_t>& mag, uint64_t value)
  {
    mag.clear();
    while(value != 0) {
      mag.push_back(static_cast<uint32_t>(value % limb_base));
      value /= limb_base;
    }
  }

bool
do_join_magnitude(uint64_t& value, const ::rocket::cow_vector<uint32_t>& mag) noexcept
  {
    // Start from the most significant limb, so an overflow is detected as early
    // as possible.
    value = 0;
    for(size_t k = mag.size();  k != 0;  --k) {
      if(__builtin_mul_overflow(value, static_cast<uint64_t>(limb_base), &value))
        return false;

      if(__builtin_add_overflow(value, static_cast<uint64_t>(mag[k - 1]), &value))
        return false;
    }
    return true;
  }

}  // namespace

void
Big_Integer::
do_normalize() noexcept
  {
    while(!this->m_mag.empty() && (this->m_mag.back() == 0))
      this->m_mag.pop_back();

    uint64_t mag;
    if(!do_join_magnitude(mag, this->m_mag))
      return;

    if(this->m_neg && (mag <= static_cast<uint64_t>(INT64_MAX) + 1)) {
      // This includes `INT64_MIN`, whose magnitude is not representable.
      this->m_small = static_cast<int64_t>(0 - mag);
      this->m_neg = false;
      this->m_mag.clear();
    }
    else if(!this->m_neg && (mag <= static_cast<uint64_t>(INT64_MAX))) {
      this->m_small = static_cast<int64_t>(mag);
      this->m_mag.clear();
    }
  }

int64_t
Big_Integer::
as_int64() const
  {
    if(!this->m_mag.empty())
      ::rocket::sprintf_and_throw<::std::out_of_range>(
            "poise::Big_Integer: value `%s` out of range for `int64_t`",
            this->to_string().c_str());

    return this->m_small;
  }

Big_Integer&
Big_Integer::
mul_add(uint32_t mul, uint32_t add)
  {
    ROCKET_ASSERT(this->sign() >= 0);
    ROCKET_ASSERT(mul <= limb_base);
    ROCKET_ASSERT(add <= limb_base);

    if(this->m_mag.empty()) {
      int64_t temp;
      if(!__builtin_mul_overflow(this->m_small, static_cast<int64_t>(mul), &temp)
         && !__builtin_add_overflow(temp, static_cast<int64_t>(add), &temp)) {
        // fast
        this->m_small = temp;
        return *this;
      }

      // Promote this value to the multi-precision form.
      do_split_magnitude(this->m_mag, static_cast<uint64_t>(this->m_small));
      this->m_small = 0;
      this->m_neg = false;
    }

    uint64_t carry = add;
    uint32_t* limbs = this->m_mag.mut_data();
    for(size_t k = 0;  k != this->m_mag.size();  ++k) {
      carry += static_cast<uint64_t>(limbs[k]) * mul;
      limbs[k] = static_cast<uint32_t>(carry % limb_base);
      carry /= limb_base;
    }

    while(carry != 0) {
      this->m_mag.push_back(static_cast<uint32_t>(carry % limb_base));
      carry /= limb_base;
    }

    // A zero multiplier may bring this value back into range.
    this->do_normalize();
    return *this;
  }

Big_Integer&
Big_Integer::
negate()
  {
    if(this->m_mag.empty()) {
      if(this->m_small != INT64_MIN) {
        this->m_small = - this->m_small;
        return *this;
      }

      // The result is 2^63, which is not representable as `int64_t`.
      do_split_magnitude(this->m_mag, static_cast<uint64_t>(INT64_MAX) + 1);
      this->m_small = 0;
      this->m_neg = false;
      return *this;
    }

    // -(2^63) is folded back into `int64_t`.
    this->m_neg = !this->m_neg;
    this->do_normalize();
    return *this;
  }

int
Big_Integer::
compare(const Big_Integer& other) const noexcept
  {
    int lsign = this->sign();
    int rsign = other.sign();
    if(lsign != rsign)
      return (lsign < rsign) ? -1 : 1;

    if(this->m_mag.empty() && other.m_mag.empty())
      return (this->m_small > other.m_small) - (this->m_small < other.m_small);

    // Both values have the same sign. A value in the multi-precision form has a
    // greater magnitude than any value in the inline form.
    if(this->m_mag.empty())
      return - lsign;
    else if(other.m_mag.empty())
      return lsign;

    int mcmp = 0;
    if(this->m_mag.size() != other.m_mag.size())
      mcmp = (this->m_mag.size() < other.m_mag.size()) ? -1 : 1;
    else
      for(size_t k = this->m_mag.size();  k != 0;  --k)
        if(this->m_mag[k - 1] != other.m_mag[k - 1]) {
          mcmp = (this->m_mag[k - 1] < other.m_mag[k - 1]) ? -1 : 1;
          break;
        }

    return mcmp * lsign;
  }

double
Big_Integer::
to_double() const
  {
    if(this->m_mag.empty())
      return static_cast<double>(this->m_small);

    // Let the decimal parser do the rounding.
    ::rocket::cow_string str = this->to_string();
    ::rocket::ascii_numget numg;
    numg.parse_DD(str.data(), str.size());

    double value;
    numg.cast_D(value, -HUGE_VAL, HUGE_VAL);
    return value;
  }

::rocket::cow_string
Big_Integer::
to_string() const
  {
    ::rocket::ascii_numput nump;
    if(this->m_mag.empty()) {
      nump.put_DI(this->m_small);
      return ::rocket::cow_string(nump.data(), nump.size());
    }

    ::rocket::cow_string str;
    str.reserve(this->m_mag.size() * 9 + 1);
    if(this->m_neg)
      str.push_back('-');

    // The most significant limb is written without padding, and all the others
    // are padded to nine digits.
    nump.put_DU(this->m_mag.back());
    str.append(nump.data(), nump.size());

    for(size_t k = this->m_mag.size() - 1;  k != 0;  --k) {
      nump.put_DU(this->m_mag[k - 1], 9);
      str.append(nump.data(), nump.size());
    }
    return str;
  }

}  // namespace poise
