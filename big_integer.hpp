// This file is part of POISE.
// Copyleft 2024-2025, LH_Mouse. All wrongs reserved.

#ifndef POISE_BIG_INTEGER_HPP_
#define POISE_BIG_INTEGER_HPP_

#include <rocket/cow_string.hpp>
#include <rocket/cow_vector.hpp>
#include <cstdint>
namespace poise {

// This is a signed integer of unbounded magnitude. Values that fit in `int64_t`
// are stored inline; larger values are stored as decimal limbs. The
// representation is canonical, so two values are equal if and only if their
// members are equal.
class Big_Integer
  {
  private:
    // If `m_mag` is empty, the value is `m_small`. Otherwise, the value is the
    // magnitude `m_mag` with the sign `m_neg`, and it does not fit in `int64_t`.
    // Limbs are stored in little-endian order in base 10^9.
    int64_t m_small = 0;
    bool m_neg = false;
    ::rocket::cow_vector<uint32_t> m_mag;

  public:
    // Initializes zero.
    Big_Integer() noexcept
      { }

    // Initializes a small integer. Only conversions from signed types are
    // provided. We don't use `int64_t` here due to some nasty overloading rules.
    Big_Integer(int val) noexcept
      : m_small(val)  { }

    Big_Integer(long val) noexcept
      : m_small(val)  { }

    Big_Integer(long long val) noexcept
      : m_small(val)  { }

  private:
    void
    do_normalize() noexcept;

  public:
    Big_Integer&
    swap(Big_Integer& other) noexcept
      {
        ::std::swap(this->m_small, other.m_small);
        ::std::swap(this->m_neg, other.m_neg);
        this->m_mag.swap(other.m_mag);
        return *this;
      }

    // Gets the sign of this value, which is -1, 0 or 1.
    int
    sign() const noexcept
      {
        if(!this->m_mag.empty())
          return this->m_neg ? -1 : 1;
        else
          return (this->m_small > 0) - (this->m_small < 0);
      }

    // Checks whether this value fits in `int64_t`.
    bool
    is_int64() const noexcept
      { return this->m_mag.empty();  }

    // Gets this value as an `int64_t`. If it does not fit, an exception is
    // thrown.
    int64_t
    as_int64() const;

    // Sets this value to `*this * mul + add`. This value shall not be negative,
    // and neither `mul` nor `add` shall exceed 10^9.
    Big_Integer&
    mul_add(uint32_t mul, uint32_t add);

    // Negates this value.
    Big_Integer&
    negate();

    // Compares two values. The result is negative, zero or positive, if this
    // value is less than, equal to, or greater than `other`, respectively.
    int
    compare(const Big_Integer& other) const noexcept;

    // Converts this value to the nearest double-precision number. If the value
    // is out of range, an infinity is returned.
    double
    to_double() const;

    // Formats this value in decimal.
    ::rocket::cow_string
    to_string() const;
  };

inline
void
swap(Big_Integer& lhs, Big_Integer& rhs) noexcept
  {
    lhs.swap(rhs);
  }

inline
bool
operator==(const Big_Integer& lhs, const Big_Integer& rhs) noexcept
  {
    return lhs.compare(rhs) == 0;
  }

inline
bool
operator!=(const Big_Integer& lhs, const Big_Integer& rhs) noexcept
  {
    return lhs.compare(rhs) != 0;
  }

inline
bool
operator<(const Big_Integer& lhs, const Big_Integer& rhs) noexcept
  {
    return lhs.compare(rhs) < 0;
  }

inline
bool
operator>(const Big_Integer& lhs, const Big_Integer& rhs) noexcept
  {
    return lhs.compare(rhs) > 0;
  }

inline
bool
operator<=(const Big_Integer& lhs, const Big_Integer& rhs) noexcept
  {
    return lhs.compare(rhs) <= 0;
  }

inline
bool
operator>=(const Big_Integer& lhs, const Big_Integer& rhs) noexcept
  {
    return lhs.compare(rhs) >= 0;
  }

static_assert(::std::is_nothrow_copy_constructible<Big_Integer>::value, "");
static_assert(::std::is_nothrow_move_constructible<Big_Integer>::value, "");

}  // namespace poise
#endif
