// This file is part of POISE.
// Copyleft 2024-2025, LH_Mouse. All wrongs reserved.

#include "test_utils.hpp"
#include <cmath>
#include <cfloat>

int
main(void)
  {
    ::setlocale(LC_ALL, "C.UTF-8");
    delete new int;
    ::alloc_count = 0;

    {
      // integers are exact
      ::poise::Value val;
      assert(val.parse("0"));
      assert(val.type() == ::poise::t_integer);
      assert(val.as_integer() == 0);

      assert(val.parse("-0"));
      assert(val.type() == ::poise::t_integer);
      assert(val.as_integer() == 0);
      assert(val.as_integer().sign() == 0);

      assert(val.parse("42"));
      assert(val.as_integer() == 42);

      assert(val.parse("-1234567890123456789"));
      assert(val.as_integer().is_int64());
      assert(val.as_integer().as_int64() == -1234567890123456789);

      assert(val.parse("9223372036854775807"));
      assert(val.as_integer().is_int64());
      assert(val.as_integer().as_int64() == INT64_MAX);

      assert(val.parse("-9223372036854775808"));
      assert(val.as_integer().is_int64());
      assert(val.as_integer().as_int64() == INT64_MIN);

      assert(val.parse("9223372036854775808"));
      assert(val.type() == ::poise::t_integer);
      assert(!val.as_integer().is_int64());
      assert(val.as_integer().to_string() == "9223372036854775808");

      assert(val.parse("123456789012345678901234567890"));
      assert(val.type() == ::poise::t_integer);
      assert(val.as_integer().to_string() == "123456789012345678901234567890");

      assert(val.parse("-100000000000000000000000000000000000001"));
      assert(val.as_integer().sign() == -1);
      assert(val.as_integer().to_string() == "-100000000000000000000000000000000000001");
    }

    {
      // A zero exponent yields an integer, no matter how it is spelt.
      ::poise::Value val;
      assert(val.parse("1.0e1"));
      assert(val.type() == ::poise::t_integer);
      assert(val.as_integer() == 10);

      assert(val.parse("5E+0"));
      assert(val.type() == ::poise::t_integer);
      assert(val.as_integer() == 5);

      assert(val.parse("-12.5e1"));
      assert(val.type() == ::poise::t_integer);
      assert(val.as_integer() == -125);

      assert(val.parse("100e-2"));
      assert(val.type() == ::poise::t_number);
      assert(val.as_number() == 1.0);
    }

    {
      // floating-point numbers
      ::poise::Value val;
      assert(val.parse("1.50"));
      assert(val.type() == ::poise::t_number);
      assert(val.as_number() == 1.5);

      assert(val.parse("1e10"));
      assert(val.type() == ::poise::t_number);
      assert(val.as_number() == 1e10);

      assert(val.parse("1E+2"));
      assert(val.type() == ::poise::t_number);
      assert(val.as_number() == 100.0);

      assert(val.parse("1.5e3"));
      assert(val.as_number() == 1500.0);

      assert(val.parse("0.1"));
      assert(val.as_number() == 0.1);

      assert(val.parse("-0.0"));
      assert(val.type() == ::poise::t_number);
      assert(val.as_number() == 0);
      assert(::std::signbit(val.as_number()));

      assert(val.parse("3.141592653589793"));
      assert(val.as_number() == 3.141592653589793);

      assert(val.parse("-2.718281828459045e-3"));
      assert(val.as_number() == -2.718281828459045e-3);

      assert(val.parse("0.000000000000000000001"));
      assert(val.as_number() == 1e-21);

      assert(val.parse("1e0000000000000000000000001"));
      assert(val.as_number() == 10.0);
    }

    {
      // numbers that take the slow path
      ::poise::Value val;
      assert(val.parse("12345678901234567890.5"));
      assert(val.as_number() == 12345678901234567890.5);

      assert(val.parse("1.7976931348623157e308"));
      assert(val.as_number() == DBL_MAX);

      assert(val.parse("-1.7976931348623157e308"));
      assert(val.as_number() == -DBL_MAX);

      assert(val.parse("2.2250738585072014e-308"));
      assert(val.as_number() == DBL_MIN);

      assert(val.parse("0.30000000000000000000000000001"));
      assert(val.as_number() == 0.3);

      // Underflow is not an error.
      assert(val.parse("1e-400"));
      assert(val.type() == ::poise::t_number);
      assert(val.as_number() == 0);

      assert(val.parse("-1e-400"));
      assert(val.as_number() == 0);
    }

    {
      // overflow
      ::poise::Value val = 1;
      ::poise::Parser_Context ctx;

      val.parse_with(ctx, "1e309");
      assert(ctx.error);
      assert(ctx.kind == ::poise::error_numeric_overflow);
      assert(ctx.offset == 0);
      assert(ctx.fragment == "1e309");
      assert(ctx.message == R"(cannot parse value at position 0: "1e309")");
      assert(val.is_null());

      val.parse_with(ctx, "[1, -1e400]");
      assert(ctx.kind == ::poise::error_numeric_overflow);
      assert(ctx.offset == 4);
      assert(ctx.position == 4);
      assert(ctx.fragment == "-1e400");

      val.parse_with(ctx, "1e99999999999999999999");
      assert(ctx.kind == ::poise::error_numeric_overflow);
      assert(ctx.offset == 0);
      assert(ctx.fragment == "1e99999999999999999999");

      val.parse_with(ctx, "0.1e-99999999999999999999");
      assert(ctx.kind == ::poise::error_numeric_overflow);

      // Big integers never overflow.
      ::rocket::cow_string str;
      str.append(400, '9');
      val.parse_with(ctx, str);
      assert(!ctx.error);
      assert(val.type() == ::poise::t_integer);
      assert(val.as_integer().to_string() == str);
      assert(val.as_number() == HUGE_VAL);
    }

    {
      // syntax errors
      ::poise::Value val;
      ::poise::Parser_Context ctx;

      val.parse_with(ctx, "-");
      assert(ctx.kind == ::poise::error_syntax);
      assert(ctx.offset == 0);
      assert(::strcmp(ctx.error, "invalid number") == 0);

      val.parse_with(ctx, "-a");
      assert(ctx.kind == ::poise::error_syntax);
      assert(ctx.offset == 0);
      assert(ctx.message == "unexpected token at position 0: -");

      val.parse_with(ctx, "[1, -]");
      assert(ctx.kind == ::poise::error_syntax);
      assert(ctx.offset == 4);

      val.parse_with(ctx, "01");
      assert(ctx.kind == ::poise::error_syntax);
      assert(ctx.offset == 1);
      assert(::strcmp(ctx.error, "trailing characters") == 0);

      val.parse_with(ctx, "-01");
      assert(ctx.kind == ::poise::error_syntax);
      assert(ctx.offset == 2);

      val.parse_with(ctx, "1.");
      assert(ctx.kind == ::poise::error_end_of_input);
      assert(ctx.offset == 2);
      assert(ctx.message == "unexpected end of input at position 2");

      val.parse_with(ctx, "1.x");
      assert(ctx.kind == ::poise::error_syntax);
      assert(ctx.offset == 2);
      assert(ctx.message == "unexpected token at position 2: x");

      val.parse_with(ctx, "1.e5");
      assert(ctx.kind == ::poise::error_syntax);
      assert(ctx.offset == 2);

      val.parse_with(ctx, "1e");
      assert(ctx.kind == ::poise::error_end_of_input);
      assert(ctx.offset == 2);

      val.parse_with(ctx, "1e+");
      assert(ctx.kind == ::poise::error_end_of_input);
      assert(ctx.offset == 3);

      val.parse_with(ctx, "1e+x");
      assert(ctx.kind == ::poise::error_syntax);
      assert(ctx.offset == 3);

      val.parse_with(ctx, ".5");
      assert(ctx.kind == ::poise::error_syntax);
      assert(ctx.offset == 0);

      val.parse_with(ctx, "+1");
      assert(ctx.kind == ::poise::error_syntax);
      assert(ctx.offset == 0);

      val.parse_with(ctx, "0x10");
      assert(ctx.kind == ::poise::error_syntax);
      assert(ctx.offset == 1);

      val.parse_with(ctx, "Infinity");
      assert(ctx.kind == ::poise::error_syntax);
      assert(ctx.offset == 0);

      val.parse_with(ctx, "[NaN]");
      assert(ctx.kind == ::poise::error_syntax);
      assert(ctx.offset == 1);
    }

    {
      // Digits are grouped internally; check every group boundary.
      ::rocket::cow_string str;
      ::poise::Value val;
      for(int k = 1;  k <= 40;  ++k) {
        str.push_back(static_cast<char>('1' + k % 9));
        assert(val.parse(str));
        assert(val.as_integer().to_string() == str);
      }
    }

    // leak check
    assert(::alloc_count == 0);
  }
