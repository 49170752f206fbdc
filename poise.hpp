// This file is part of POISE.
// Copyleft 2024-2025, LH_Mouse. All wrongs reserved.

#ifndef POISE_POISE_HPP_
#define POISE_POISE_HPP_

#include "big_integer.hpp"
#include "decimal.hpp"
#include "symbol_table.hpp"
#include "parse_error.hpp"
#include <rocket/cow_string.hpp>
#include <rocket/cow_vector.hpp>
#include <rocket/cow_hashmap.hpp>
#include <rocket/phcow_string.hpp>
#include <rocket/variant.hpp>
namespace poise {

class Value;

// Define aliases and enumerators for data types.
using V_null     = ::std::nullptr_t;
using V_array    = ::rocket::cow_vector<Value>;
using V_object   = ::rocket::cow_hashmap<::rocket::phcow_string,
                        Value, ::rocket::phcow_string::hash>;

using V_boolean  = bool;
using V_integer  = Big_Integer;
using V_number   = double;
using V_string   = ::rocket::cow_string;
using V_decimal  = Decimal;

// Expand a sequence of alternatives without a trailing comma. This macro is part of
// the ABI.
#define POISE_TYPES_QU4OHJ2F_(U)  \
    /*  0 */  U##_null  \
    /*  1 */, U##_array  \
    /*  2 */, U##_object  \
    /*  3 */, U##_boolean  \
    /*  4 */, U##_integer  \
    /*  5 */, U##_number  \
    /*  6 */, U##_string  \
    /*  7 */, U##_decimal

// Define type enumerators such as `t_null`, `t_array`, `t_number`, and so on.
enum Type : uint8_t {POISE_TYPES_QU4OHJ2F_(t)};
using Variant = ::rocket::variant<POISE_TYPES_QU4OHJ2F_(V)>;

// How object keys are stored. All keys are `phcow_string`s. With an interning
// policy, a key shares storage with an entry in `Parser_Options::symbols`.
enum Key_Policy : uint8_t
  {
    keys_raw               = 0,  // keep text as is
    keys_validated_intern  = 1,  // reject keys that are not in the table
    keys_always_intern     = 2,  // add keys to the table as needed
  };

// How numbers are stored.
enum Numeric_Mode : uint8_t
  {
    numbers_float    = 0,  // `V_integer` if the exponent is zero, else `V_number`
    numbers_decimal  = 1,  // `V_decimal`, constructed by a `Decimal_Backend`
  };

// These are options for the parser. They are not modified by the parser.
struct Parser_Options
  {
    Key_Policy keys = keys_raw;
    Numeric_Mode numbers = numbers_float;

    // This is required by `keys_validated_intern` and `keys_always_intern`, and
    // is ignored by `keys_raw`. The parser inserts entries with the latter.
    Symbol_Table* symbols = nullptr;

    // If this is a null pointer, `missing_decimal_backend()` is used.
    const Decimal_Backend* decimal_backend = nullptr;

    // Each non-empty array or object adds one level. `[]` and `{}` add none.
    // Zero means no limit. As nested values are parsed without recursion,
    // the limit only guards memory.
    uint32_t max_depth = 1000;
  };

// This is the only value class that is provided by this library. It is
// responsible for storing and parsing all the alternatives above.
class Value
  {
  private:
    Variant m_stor;

  public:
    // Initializes a null value.
    constexpr Value(V_null = nullptr) noexcept { }

    // Destroys this value. The destructor shall take care of a deep recursion, to
    // avoid running out of the system stack.
    ~Value()
      {
        if((this->m_stor.index() == t_array) || (this->m_stor.index() == t_object))
          this->do_nonrecursive_destructor();
      }

  private:
    void
    do_nonrecursive_destructor() noexcept;

  public:
#ifdef POISE_DETAILS_8E2A6F0C_4D17_4B59_A3C1_96F4E0B7D215_
    const Variant&
    mf_stor() const noexcept
      { return this->m_stor;  }

    Variant&
    mf_stor() noexcept
      { return this->m_stor;  }
#endif

    // Gets the type of the stored value.
    constexpr
    Type
    type() const noexcept
      { return static_cast<Type>(this->m_stor.index());  }

    // Swaps two values in a smart way.
    Value&
    swap(Value& other) noexcept
      {
        this->m_stor.swap(other.m_stor);
        return *this;
      }

    // Checks whether the stored value is null.
    bool
    is_null() const noexcept
      { return this->m_stor.index() == t_null;  }

    // Sets a null value.
    void
    clear() noexcept
      { this->m_stor.emplace<V_null>();  }

    // Sets a null value.
    Value&
    operator=(V_null) & noexcept
      {
        this->clear();
        return *this;
      }

    // Initializes an array.
    Value(const V_array& val) noexcept
      {
        this->m_stor.emplace<V_array>(val);
      }

    // Checks whether the stored value is an array.
    bool
    is_array() const noexcept
      { return this->m_stor.index() == t_array;  }

    // Gets an array. If the stored value is not an array, an exception is thrown,
    // and there is no effect.
    const V_array&
    as_array() const
      { return this->m_stor.as<V_array>();  }

    size_t
    as_array_size() const
      { return this->as_array().size();  }

    // Gets or creates an array (list). If the stored value is not an array, it is
    // overwritten with an empty array, and a reference to the new value is
    // returned.
    V_array&
    mut_array() noexcept
      {
        if(auto ptr = this->m_stor.mut_ptr<V_array>())
          return *ptr;
        else
          return this->m_stor.emplace<V_array>();
      }

    // Sets an array.
    Value&
    operator=(const V_array& val) & noexcept
      {
        this->mut_array() = val;
        return *this;
      }

    // Initializes an object.
    Value(const V_object& val) noexcept
      {
        this->m_stor.emplace<V_object>(val);
      }

    // Checks whether the stored value is an object.
    bool
    is_object() const noexcept
      { return this->m_stor.index() == t_object;  }

    // Gets an object. If the stored value is not an object, an exception is thrown,
    // and there is no effect.
    const V_object&
    as_object() const
      { return this->m_stor.as<V_object>();  }

    size_t
    as_object_size() const
      { return this->as_object().size();  }

    // Gets or creates an object (dictionary). If the stored value is not an object,
    // it is overwritten with an empty object, and a reference to the new value is
    // returned.
    V_object&
    mut_object() noexcept
      {
        if(auto ptr = this->m_stor.mut_ptr<V_object>())
          return *ptr;
        else
          return this->m_stor.emplace<V_object>();
      }

    // Sets an object.
    Value&
    operator=(const V_object& val) & noexcept
      {
        this->mut_object() = val;
        return *this;
      }

    // Initializes a boolean value.
    Value(bool val) noexcept
      {
        this->m_stor.emplace<V_boolean>(val);
      }

    // Checks whether the stored value is a boolean value.
    bool
    is_boolean() const noexcept
      { return this->m_stor.index() == t_boolean;  }

    // Gets a boolean value. If the stored value is not a boolean value, an exception
    // is thrown, and there is no effect.
    V_boolean
    as_boolean() const
      { return this->m_stor.as<V_boolean>();  }

    // Gets or creates a boolean value. If the stored value is not a boolean
    // value, it is overwritten with `false`, and a reference to the new value is
    // returned.
    V_boolean&
    mut_boolean() noexcept
      {
        if(auto ptr = this->m_stor.mut_ptr<V_boolean>())
          return *ptr;
        else
          return this->m_stor.emplace<V_boolean>();
      }

    // Sets a boolean value.
    Value&
    operator=(bool val) & noexcept
      {
        this->mut_boolean() = val;
        return *this;
      }

    // Initializes an integer. Only conversions from signed types are provided. We
    // don't use `int64_t` here due to some nasty overloading rules.
    Value(int val) noexcept
      {
        this->m_stor.emplace<V_integer>(val);
      }

    Value(long val) noexcept
      {
        this->m_stor.emplace<V_integer>(val);
      }

    Value(long long val) noexcept
      {
        this->m_stor.emplace<V_integer>(val);
      }

    Value(const Big_Integer& val) noexcept
      {
        this->m_stor.emplace<V_integer>(val);
      }

    // Checks whether the stored value is an integer.
    bool
    is_integer() const noexcept
      { return this->m_stor.index() == t_integer;  }

    // Gets an integer. If the stored value is not an integer, an exception is
    // thrown, and there is no effect.
    const V_integer&
    as_integer() const
      { return this->m_stor.as<V_integer>();  }

    // Gets or creates an integer. If the stored value is not an integer value, it
    // is overwritten with zero, and a reference to the new value is returned.
    V_integer&
    mut_integer() noexcept
      {
        if(auto ptr = this->m_stor.mut_ptr<V_integer>())
          return *ptr;
        else
          return this->m_stor.emplace<V_integer>();
      }

    // Sets an integer. Only conversions from signed types are provided. We don't
    // use `int64_t` here due to some nasty overloading rules.
    Value&
    operator=(int val) & noexcept
      {
        this->mut_integer() = val;
        return *this;
      }

    Value&
    operator=(long val) & noexcept
      {
        this->mut_integer() = val;
        return *this;
      }

    Value&
    operator=(long long val) & noexcept
      {
        this->mut_integer() = val;
        return *this;
      }

    Value&
    operator=(const Big_Integer& val) & noexcept
      {
        this->mut_integer() = val;
        return *this;
      }

    // Initialize a floating-point number.
    Value(float val) noexcept
      {
        this->m_stor.emplace<V_number>(val);
      }

    Value(double val) noexcept
      {
        this->m_stor.emplace<V_number>(val);
      }

    // Checks whether the stored value is an integer or a floating-point number.
    bool
    is_number() const noexcept
      { return (this->m_stor.index() == t_integer) || (this->m_stor.index() == t_number);  }

    // Gets a floating-point number. If the stored value is an integer, it can be
    // converted to a floating-point number implicitly, despite potential precision
    // loss. If the stored value is neither an integer nor a floating-point number,
    // an exception is thrown, and there is no effect.
    V_number
    as_number() const
      {
        if(auto psi = this->m_stor.ptr<V_integer>())
          return psi->to_double();
        else
          return this->m_stor.as<V_number>();
      }

    // Gets or creates a floating-point number. If the stored value is an integer,
    // it can be converted to a floating-point number implicitly, despite potential
    // precision loss. If the stored value is neither an integer nor a floating-point
    // number, it is overwritten with zero, and a reference to the new value is
    // returned.
    V_number&
    mut_number()
      {
        if(auto ptr = this->m_stor.mut_ptr<V_number>())
          return *ptr;
        else if(auto psi = this->m_stor.ptr<V_integer>())
          return this->m_stor.emplace<V_number>(psi->to_double());
        else
          return this->m_stor.emplace<V_number>();
      }

    // Sets a floating-point number.
    Value&
    operator=(float val) & noexcept
      {
        this->m_stor.emplace<V_number>(val);
        return *this;
      }

    Value&
    operator=(double val) & noexcept
      {
        this->m_stor.emplace<V_number>(val);
        return *this;
      }

    // Initialize a character string. The caller shall supply a valid UTF-8 string.
    Value(const ::rocket::cow_string& val) noexcept
      {
        this->m_stor.emplace<V_string>(val);
      }

    template<size_t N>
    Value(const char (*val)[N]) noexcept
      {
        this->m_stor.emplace<V_string>(val);
      }

    // Checks whether the stored value is a character string.
    bool
    is_string() const noexcept
      { return this->m_stor.index() == t_string;  }

    // Gets a character string. If the stored value is not a character string, an
    // exception is thrown, and there is no effect.
    const V_string&
    as_string() const
      { return this->m_stor.as<V_string>();  }

    // Get a read-only range of a character string.
    const char*
    as_string_c_str() const
      { return this->as_string().c_str();  }

    size_t
    as_string_length() const
      { return this->as_string().length();  }

    // Gets or creates a character string. If the stored value is not a character
    // string, it is overwritten with an empty string, and a reference to the new
    // value is returned.
    V_string&
    mut_string() noexcept
      {
        if(auto ptr = this->m_stor.mut_ptr<V_string>())
          return *ptr;
        else
          return this->m_stor.emplace<V_string>();
      }

    // Set a character string.
    Value&
    operator=(const ::rocket::cow_string& val) & noexcept
      {
        this->mut_string() = val;
        return *this;
      }

    template<size_t N>
    Value&
    operator=(const char (*val)[N]) & noexcept
      {
        this->mut_string() = val;
        return *this;
      }

    // Initializes a decimal number.
    Value(const Decimal& val) noexcept
      {
        this->m_stor.emplace<V_decimal>(val);
      }

    // Checks whether the stored value is a decimal number.
    bool
    is_decimal() const noexcept
      { return this->m_stor.index() == t_decimal;  }

    // Gets a decimal number. If the stored value is not a decimal number, an
    // exception is thrown, and there is no effect.
    const V_decimal&
    as_decimal() const
      { return this->m_stor.as<V_decimal>();  }

    // Gets or creates a decimal number. If the stored value is not a decimal
    // number, it is overwritten with zero, and a reference to the new value is
    // returned.
    V_decimal&
    mut_decimal() noexcept
      {
        if(auto ptr = this->m_stor.mut_ptr<V_decimal>())
          return *ptr;
        else
          return this->m_stor.emplace<V_decimal>();
      }

    // Sets a decimal number.
    Value&
    operator=(const Decimal& val) & noexcept
      {
        this->mut_decimal() = val;
        return *this;
      }

    // Compares two values structurally. Integers, floating-point numbers and
    // decimal numbers are distinct types, so `1` does not equal `1.0`. Objects
    // are compared regardless of the order of their keys.
    bool
    equals(const Value& other) const;

    // Parse a buffer for a value, and store it into the current object. Errors are
    // stored into the `Parser_Context`. The context object does not have to be
    // initialized. If an error occurs, the current object is set to null. The
    // input shall be complete; there is no incremental parsing.
    void
    parse_with(Parser_Context& ctx, const ::rocket::cow_string& str,
               const Parser_Options& opts = Parser_Options());

    void
    parse_with(Parser_Context& ctx, const char* str, size_t len,
               const Parser_Options& opts = Parser_Options());

    void
    parse_with(Parser_Context& ctx, const char* str,
               const Parser_Options& opts = Parser_Options());

    bool
    parse(const ::rocket::cow_string& str, const Parser_Options& opts = Parser_Options());

    bool
    parse(const char* str, size_t len, const Parser_Options& opts = Parser_Options());

    bool
    parse(const char* str, const Parser_Options& opts = Parser_Options());
  };

inline
void
swap(Value& lhs, Value& rhs) noexcept
  {
    lhs.swap(rhs);
  }

inline
bool
operator==(const Value& lhs, const Value& rhs)
  {
    return lhs.equals(rhs);
  }

inline
bool
operator!=(const Value& lhs, const Value& rhs)
  {
    return !lhs.equals(rhs);
  }

// Values are reference-counting so all these will not throw exceptions. It is
// recommended that they be passed by value or by const reference.
static_assert(::std::is_nothrow_copy_constructible<Value>::value, "");
static_assert(::std::is_nothrow_copy_assignable<Value>::value, "");
static_assert(::std::is_nothrow_move_constructible<Value>::value, "");
static_assert(::std::is_nothrow_move_assignable<Value>::value, "");

}  // namespace poise

extern template
class ::rocket::variant<POISE_TYPES_QU4OHJ2F_(::poise::V)>;

extern template
class ::rocket::cow_vector<::poise::Value>;

extern template
class ::rocket::cow_hashmap<::rocket::phcow_string,
  ::poise::Value, ::rocket::phcow_string::hash>;
#endif
