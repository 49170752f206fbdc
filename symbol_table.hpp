// This file is part of POISE.
// Copyleft 2024-2025, LH_Mouse. All wrongs reserved.

#ifndef POISE_SYMBOL_TABLE_HPP_
#define POISE_SYMBOL_TABLE_HPP_

#include <rocket/cow_string.hpp>
#include <rocket/phcow_string.hpp>
#include <unordered_map>
namespace poise {

// This is a set of interned strings. Object keys that are parsed with an
// interning key policy share storage with the entries of the table that is
// passed in `Parser_Options`. The table is owned by the caller, and it is not
// synchronized.
class Symbol_Table
  {
  private:
    // This is keyed by hash values. Strings with equal hashes are compared
    // one by one.
    ::std::unordered_multimap<size_t, ::rocket::phcow_string> m_st;

  public:
    Symbol_Table() noexcept
      { }

    Symbol_Table(const Symbol_Table&) = default;
    Symbol_Table& operator=(const Symbol_Table&) & = default;
    Symbol_Table(Symbol_Table&&) = default;
    Symbol_Table& operator=(Symbol_Table&&) & = default;

  public:
    bool
    empty() const noexcept
      { return this->m_st.empty();  }

    size_t
    size() const noexcept
      { return this->m_st.size();  }

    void
    clear() noexcept
      { this->m_st.clear();  }

    // Searches for a string. If it is not found, a null pointer is returned.
    const ::rocket::phcow_string*
    find(const char* str, size_t len) const noexcept;

    // Searches for a string. If it is not found, a new entry is inserted. The
    // returned reference is valid until the table is cleared or destroyed.
    const ::rocket::phcow_string&
    intern(const char* str, size_t len);

    const ::rocket::phcow_string&
    intern(const ::rocket::cow_string& str)
      { return this->intern(str.data(), str.size());  }
  };

}  // namespace poise
#endif
