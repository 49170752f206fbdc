// This file is part of POISE.
// Copyleft 2024-2025, LH_Mouse. All wrongs reserved.

#include "test_utils.hpp"
#include <climits>
#include <cmath>

int
main(void)
  {
    ::setlocale(LC_ALL, "C.UTF-8");
    delete new int;
    ::alloc_count = 0;

    {
      ::poise::Value val;
      assert(val.type() == ::poise::t_null);
      assert(val.is_null());
    }

    {
      ::poise::Value val = nullptr;
      assert(val.type() == ::poise::t_null);
      assert(val.is_null());
    }

    {
      ::poise::V_array arr = { 1, &"hello", false };
      ::poise::Value val = arr;
      assert(val.type() == ::poise::t_array);
      assert(val.is_array());
      assert(val.as_array().size() == 3);
      assert(val.as_array().at(0).type() == ::poise::t_integer);
      assert(val.as_array().at(0).as_integer() == 1);
      assert(val.as_array().at(1).type() == ::poise::t_string);
      assert(val.as_array().at(1).as_string() == "hello");
      assert(val.as_array().at(2).type() == ::poise::t_boolean);
      assert(val.as_array().at(2).as_boolean() == false);
    }

    {
      ::poise::V_object obj;
      obj.try_emplace(make_key("x")).first->second = 3.5;
      obj.try_emplace(make_key("y")).first->second = &"hello";
      ::poise::Value val = obj;
      assert(val.type() == ::poise::t_object);
      assert(val.is_object());
      assert(val.as_object_size() == 2);
      assert(member(val, "x").type() == ::poise::t_number);
      assert(member(val, "x").as_number() == 3.5);
      assert(member(val, "y").type() == ::poise::t_string);
      assert(member(val, "y").as_string() == "hello");
      assert(!has_member(val, "z"));
    }

    {
      ::poise::Value val = true;
      assert(val.type() == ::poise::t_boolean);
      assert(val.as_boolean() == true);

      val.mut_integer() = 42;
      assert(val.type() == ::poise::t_integer);
      assert(val.as_integer() == 42);
      assert(val.is_number());
      assert(val.as_number() == 42.0);
      assert(val.type() == ::poise::t_integer);

      val.mut_number() += 0.5;
      assert(val.type() == ::poise::t_number);
      assert(val.as_number() == 42.5);
    }

    {
      ::poise::Value val = INT64_MIN;
      assert(val.is_integer());
      assert(val.as_integer().is_int64());
      assert(val.as_integer().as_int64() == INT64_MIN);
      assert(val.as_integer().to_string() == "-9223372036854775808");
    }

    {
      ::poise::Value val = 1.5;
      assert(val.type() == ::poise::t_number);
      assert(val.as_number() == 1.5);

      val = &"world";
      assert(val.type() == ::poise::t_string);
      assert(val.as_string() == "world");
      assert(val.as_string_length() == 5);
      assert(::memcmp(val.as_string_c_str(), "world", 6) == 0);

      val = nullptr;
      assert(val.is_null());
    }

    {
      ::poise::Decimal dec;
      dec.sign = -1;
      dec.coef = 150;
      dec.exp = -2;
      ::poise::Value val = dec;
      assert(val.type() == ::poise::t_decimal);
      assert(val.is_decimal());
      assert(!val.is_number());
      assert(val.as_decimal() == dec);
      assert(val.as_decimal().to_string() == "-150E-2");
    }

    {
      // equality
      assert(::poise::Value(1) == ::poise::Value(1));
      assert(::poise::Value(1) != ::poise::Value(1.0));
      assert(::poise::Value(&"1") != ::poise::Value(1));
      assert(::poise::Value() == ::poise::Value(nullptr));

      ::poise::Value lhs, rhs;
      assert(lhs.parse(R"({"a":[1,2,{"b":null}],"c":"d"})"));
      assert(rhs.parse(R"({"c":"d","a":[1,2,{"b":null}]})"));
      assert(lhs == rhs);
      assert(rhs.parse(R"({"c":"d","a":[1,2,{"b":false}]})"));
      assert(lhs != rhs);
      assert(rhs.parse(R"({"c":"d","a":[2,1,{"b":null}]})"));
      assert(lhs != rhs);
      assert(rhs.parse(R"({"c":"d","e":[1,2,{"b":null}]})"));
      assert(lhs != rhs);
    }

    {
      static constexpr char source[] =
          R"([ "猫", true	, -12.5e-1,{"y"	:1.5, "z" : {}},[1,"x", []] ,null ])";
      ::poise::Value val;
      assert(val.parse(source));
      assert(val.is_array());
      assert(val.as_array_size() == 6);
      assert(val.as_array().at(0).is_string());
      assert(val.as_array().at(0).as_string() == "猫");
      assert(val.as_array().at(1).is_boolean());
      assert(val.as_array().at(1).as_boolean() == true);
      assert(val.as_array().at(2).type() == ::poise::t_number);
      assert(val.as_array().at(2).as_number() == -1.25);
      assert(val.as_array().at(3).is_object());
      assert(val.as_array().at(3).as_object_size() == 2);
      assert(member(val.as_array().at(3), "y").as_number() == 1.5);
      assert(member(val.as_array().at(3), "z").is_object());
      assert(member(val.as_array().at(3), "z").as_object_size() == 0);
      assert(val.as_array().at(4).is_array());
      assert(val.as_array().at(4).as_array_size() == 3);
      assert(val.as_array().at(4).as_array().at(0).as_integer() == 1);
      assert(val.as_array().at(4).as_array().at(1).as_string() == "x");
      assert(val.as_array().at(4).as_array().at(2).as_array_size() == 0);
      assert(val.as_array().at(5).is_null());

      // Parsing the same text again gives the same value.
      ::poise::Value other;
      assert(other.parse(source));
      assert(other == val);
    }

    {
      // whitespace around the value
      ::poise::Value val, other;
      assert(val.parse(" 1 "));
      assert(other.parse("1"));
      assert(val == other);
      assert(val.as_integer() == 1);
      assert(val.parse("\t\r\n[\n1\t,\r2 ]\n\n"));
      assert(val.as_array_size() == 2);
      assert(!val.parse("\f1"));
      assert(!val.parse("\v1"));
    }

    {
      // A failed parse leaves null, without partial values.
      ::poise::Value val = 42;
      ::poise::Parser_Context ctx;
      val.parse_with(ctx, R"([1,2,{"a":[3,4)");
      assert(ctx.error);
      assert(val.is_null());

      val.parse_with(ctx, R"([1,2,{"a":[3,4]}])");
      assert(!ctx.error);
      assert(val.as_array_size() == 3);

      val.parse_with(ctx, "[1] 2");
      assert(ctx.error);
      assert(ctx.kind == ::poise::error_syntax);
      assert(ctx.offset == 4);
      assert(val.is_null());
    }

    {
      // overloads
      ::rocket::cow_string str("[1,2]");
      ::poise::Value val;
      assert(val.parse(str));
      assert(val.as_array_size() == 2);
      assert(val.parse("[1,2,3]junk", 7));
      assert(val.as_array_size() == 3);

      // embedded null characters
      static constexpr char source[] = "\"a\0b\"";
      assert(!val.parse(source));
      assert(!val.parse(source, sizeof(source) - 1));
      assert(val.parse("\"a\\u0000b\"", 10));
      assert(val.as_string().size() == 3);
      assert(::memcmp(val.as_string().data(), "a\0b", 3) == 0);
    }

    {
      // nesting limit
      ::rocket::cow_string str;
      str.append(1000, '[');
      str.append(1000, ']');

      ::poise::Value val;
      ::poise::Parser_Context ctx;
      val.parse_with(ctx, str);
      assert(!ctx.error);

      // An empty array adds no level.
      str.clear();
      str.append(1001, '[');
      str.append(1001, ']');
      val.parse_with(ctx, str);
      assert(!ctx.error);

      str.clear();
      str.append(1001, '[');
      str.append("0", 1);
      str.append(1001, ']');
      val.parse_with(ctx, str);
      assert(ctx.error);
      assert(ctx.kind == ::poise::error_nesting_limit);
      assert(ctx.offset == 1000);
      assert(val.is_null());

      ::poise::Parser_Options opts;
      opts.max_depth = 3;
      val.parse_with(ctx, R"({"a":[{}]})", opts);
      assert(!ctx.error);
      val.parse_with(ctx, R"({"a":[{"b":[]}]})", opts);
      assert(!ctx.error);
      val.parse_with(ctx, R"({"a":[{"b":[0]}]})", opts);
      assert(ctx.kind == ::poise::error_nesting_limit);
      assert(ctx.offset == 11);
      val.parse_with(ctx, R"({"a":[{"b":[ {"c":1}]}]})", opts);
      assert(ctx.kind == ::poise::error_nesting_limit);
      assert(ctx.offset == 11);

      opts.max_depth = 1;
      val.parse_with(ctx, "[[], {}, [ ]]", opts);
      assert(!ctx.error);
      assert(val.as_array_size() == 3);
      val.parse_with(ctx, "[[1]]", opts);
      assert(ctx.kind == ::poise::error_nesting_limit);
      assert(ctx.offset == 1);
    }

    {
      // recursion
      ::poise::Value val;
      constexpr ::std::size_t N = 1000000;
      for(::std::size_t i = 0; i < N; ++i) {
        ::poise::V_array arr;
        arr.emplace_back(::std::move(val));
        val = ::std::move(arr);
      }

      ::rocket::cow_string str;
      str.append(N, '[');
      str.append("null", 4);
      str.append(N, ']');

      ::poise::Value other;
      ::poise::Parser_Options opts;
      opts.max_depth = 0;
      assert(other.parse(str, opts));
      assert(other == val);

      str.clear();
      for(::std::size_t i = 0; i < N; ++i)
        str.append(R"({"k":)", 5);
      str.append("0", 1);
      str.append(N, '}');
      assert(other.parse(str, opts));
      assert(other.is_object());
    }

    // leak check
    assert(::alloc_count == 0);
  }
