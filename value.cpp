// This file is part of POISE.
// Copyleft 2024-2025, LH_Mouse. All wrongs reserved.

#include "poise.hpp"
#include <vector>
#include <cstdio>
#include <stdexcept>
template class ::rocket::variant<POISE_TYPES_QU4OHJ2F_(::poise::V)>;
template class ::rocket::cow_vector<::poise::Value>;
template class ::rocket::cow_hashmap<::rocket::phcow_string,
    ::poise::Value, ::rocket::phcow_string::hash>;
namespace poise {

void
Value::
do_nonrecursive_destructor() noexcept
  {
    // Break deep recursion with a handwritten stack. Nested arrays and objects
    // are moved out of their parent before the parent is destroyed, so no
    // destructor has to destroy more than one level.
    ::std::vector<Value> stack;

  do_unpack_loop_:
    try {
      switch(this->m_stor.index())
        {
        case t_array:
          {
            auto& sa = this->m_stor.mut<V_array>();
            if(sa.unique())
              for(auto it = sa.mut_begin();  it != sa.end();  ++it)
                if(it->is_array() || it->is_object())
                  stack.emplace_back().swap(*it);
          }
          break;

        case t_object:
          {
            auto& so = this->m_stor.mut<V_object>();
            if(so.unique())
              for(auto it = so.mut_begin();  it != so.end();  ++it)
                if(it->second.is_array() || it->second.is_object())
                  stack.emplace_back().swap(it->second);
          }
          break;
        }
    }
    catch(::std::exception& stdex)
      { ::std::fprintf(stderr, "WARNING: %s\n", stdex.what());  }

    this->m_stor.emplace<V_null>();

    if(!stack.empty()) {
      this->m_stor.swap(stack.back().m_stor);
      stack.pop_back();
      goto do_unpack_loop_;
    }
  }

bool
Value::
equals(const Value& other) const
  {
    // Break deep recursion with a handwritten stack.
    struct xPair
      {
        const Value* lhs;
        const Value* rhs;
      };

    ::std::vector<xPair> stack;
    const Value* plhs = this;
    const Value* prhs = &other;

  do_compare_loop_:
    if(plhs->m_stor.index() != prhs->m_stor.index())
      return false;

    switch(static_cast<Type>(plhs->m_stor.index()))
      {
      case t_null:
        break;

      case t_array:
        {
          const auto& lhs = plhs->m_stor.as<V_array>();
          const auto& rhs = prhs->m_stor.as<V_array>();
          if(lhs.size() != rhs.size())
            return false;

          for(size_t k = 0;  k != lhs.size();  ++k)
            stack.push_back({ &(lhs[k]), &(rhs[k]) });
        }
        break;

      case t_object:
        {
          const auto& lhs = plhs->m_stor.as<V_object>();
          const auto& rhs = prhs->m_stor.as<V_object>();
          if(lhs.size() != rhs.size())
            return false;

          for(auto it = lhs.begin();  it != lhs.end();  ++it) {
            auto rit = rhs.find(it->first);
            if(rit == rhs.end())
              return false;

            stack.push_back({ &(it->second), &(rit->second) });
          }
        }
        break;

      case t_boolean:
        if(plhs->m_stor.as<V_boolean>() != prhs->m_stor.as<V_boolean>())
          return false;
        break;

      case t_integer:
        if(plhs->m_stor.as<V_integer>() != prhs->m_stor.as<V_integer>())
          return false;
        break;

      case t_number:
        if(plhs->m_stor.as<V_number>() != prhs->m_stor.as<V_number>())
          return false;
        break;

      case t_string:
        if(plhs->m_stor.as<V_string>() != prhs->m_stor.as<V_string>())
          return false;
        break;

      case t_decimal:
        if(plhs->m_stor.as<V_decimal>() != prhs->m_stor.as<V_decimal>())
          return false;
        break;

      default:
        ::rocket::sprintf_and_throw<::std::invalid_argument>(
              "poise::Value: unknown type enumeration `%d`",
              static_cast<int>(plhs->m_stor.index()));
      }

    if(!stack.empty()) {
      plhs = stack.back().lhs;
      prhs = stack.back().rhs;
      stack.pop_back();
      goto do_compare_loop_;
    }
    return true;
  }

}  // namespace poise
