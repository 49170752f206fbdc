// This file is part of POISE.
// Copyleft 2024-2025, LH_Mouse. All wrongs reserved.

#ifndef POISE_TEST_UTILS_HPP_
#define POISE_TEST_UTILS_HPP_

// This file shall be included by exactly one source file of each test.
#include "poise.hpp"
#include <new>
#include <clocale>
#include <cstdlib>
#include <cstring>
#undef NDEBUG
#include <assert.h>

::std::size_t alloc_count;

void*
operator new(::std::size_t size)
  {
    void* ptr = ::std::malloc(size);
    if(!ptr)
      ::std::abort();

    ::alloc_count ++;
    return ptr;
  }

void
operator delete(void* ptr) noexcept
  {
    if(!ptr)
      return;

    ::alloc_count --;
    ::std::free(ptr);
  }

void
operator delete(void* ptr, ::std::size_t) noexcept
  {
    operator delete(ptr);
  }

void*
operator new[](::std::size_t size)
  {
    return operator new(size);
  }

void
operator delete[](void* ptr) noexcept
  {
    operator delete(ptr);
  }

void
operator delete[](void* ptr, ::std::size_t) noexcept
  {
    operator delete(ptr);
  }

inline
::rocket::phcow_string
make_key(const char* key)
  {
    return ::rocket::cow_string(key);
  }

// Gets a member of an object by name. If the value is not an object or the
// member does not exist, an exception is thrown.
inline
const ::poise::Value&
member(const ::poise::Value& val, const char* key)
  {
    return val.as_object().at(make_key(key));
  }

inline
bool
has_member(const ::poise::Value& val, const char* key)
  {
    const auto& obj = val.as_object();
    return obj.find(make_key(key)) != obj.end();
  }

#endif
