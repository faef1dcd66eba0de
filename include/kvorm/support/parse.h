/// @b License: @n Apache License v2.0
/// @copyright Robert Dunnagan
#pragma once

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <string_view>

#include <kvorm/support/exception.h>

namespace kvorm::parse {

template <typename StringType>
class StringStreamAdapter
{
  public:
    StringStreamAdapter(const StringType& str) : m_str{str} {}

    char peek() const { return m_pos < m_str.size()? m_str[m_pos]: '\0'; }
    void next() { if (m_pos < m_str.size()) ++m_pos; }
    size_t consumed() const { return m_pos; }
    bool done() const { return m_pos == m_str.size(); }

  private:
    StringType m_str;
    size_t m_pos = 0;
};


constexpr int syntax_context = 72;

struct SyntaxError : public KvormException
{
    static std::string make_message(const std::string_view& spec, std::ptrdiff_t offset, const std::string& message) {
        std::ptrdiff_t ctx_end = std::min(offset + syntax_context, (std::ptrdiff_t)spec.size());
        std::ptrdiff_t ctx_begin = std::max(ctx_end - syntax_context, (std::ptrdiff_t)0);
        std::stringstream ss;
        ss << message << " at offset " << offset << std::endl;
        auto it = spec.cbegin();
        auto end = it + ctx_end;
        it += ctx_begin;
        for (; it != end; ++it) ss << *it;
        ss << std::endl;
        ss << std::setfill('-') << std::setw(offset - ctx_begin + 1) << '^';
        return ss.str();
    }

    SyntaxError(const std::string_view& spec, std::ptrdiff_t offset, const std::string& message)
      : KvormException(make_message(spec, offset, message)) {}
};

} // namespace kvorm::parse
