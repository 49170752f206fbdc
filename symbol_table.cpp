// This file is part of POISE.
// Copyleft 2024-2025, LH_Mouse. All wrongs reserved.

#include "symbol_table.hpp"
namespace poise {

const ::rocket::phcow_string*
Symbol_Table::
find(const char* str, size_t len) const noexcept
  {
    size_t hval = ::rocket::cow_string::hash()(str, len);
    auto range = this->m_st.equal_range(hval);

    for(auto it = range.first;  it != range.second;  ++it)
      if(it->second.rdstr().equals(str, len))
        return &(it->second);

    return nullptr;
  }

const ::rocket::phcow_string&
Symbol_Table::
intern(const char* str, size_t len)
  {
    size_t hval = ::rocket::cow_string::hash()(str, len);
    auto range = this->m_st.equal_range(hval);

    // String already exists?
    for(auto it = range.first;  it != range.second;  ++it)
      if(it->second.rdstr().equals(str, len))
        return it->second;

    // No. Allocate a new one.
    auto it = this->m_st.emplace(hval, ::rocket::cow_string(str, len));
    ROCKET_ASSERT(it->second.rdhash() == hval);
    return it->second;
  }

}  // namespace poise
