/// @b License: @n Apache License v2.0
/// @copyright Robert Dunnagan
#pragma once

#include <kvorm/core/Value.h>
#include <kvorm/support/parse.h>

#include <fmt/format.h>

#include <ctype.h>
#include <cstdlib>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>

namespace kvorm {
namespace json {

struct ParseError : public parse::SyntaxError
{
    ParseError(const std::string_view& spec, std::ptrdiff_t offset, const std::string& message)
      : parse::SyntaxError(spec, offset, message) {}
};


namespace impl {

/////////////////////////////////////////////////////////////////////////////
/// Recursive descent JSON parser producing a Value.
/// - Single-quoted strings are accepted.
/// - Object keys must be strings, and key order is preserved.
/// - Integers that overflow Int are parsed as UInt.
/////////////////////////////////////////////////////////////////////////////
template <typename StreamType>
struct Parser
{
  public:
    Parser(const StreamType& stream) : m_it{stream} {}

    Parser(Parser&&) =  default;
    Parser(const Parser&) = delete;
    auto operator = (Parser&&) = delete;
    auto operator = (const Parser&) = delete;

    bool parse_object();
    bool parse_value();
    bool parse_number();
    bool parse_string();
    bool parse_map();

    bool expect(const char* seq, const Value& value);

    void consume_whitespace();
    void create_error(const std::string& message);

    StreamType m_it;
    Value m_curr;
    std::string m_scratch;
    std::string m_error_message;
    size_t m_error_offset = 0;
};

template <typename StreamType>
bool Parser<StreamType>::parse_object()
{
    m_curr = nil;
    if (!parse_value()) {
        if (m_error_message.empty()) create_error("No object in json stream");
        return false;
    }
    consume_whitespace();
    if (!m_it.done()) {
        create_error("Unexpected trailing characters");
        return false;
    }
    return true;
}

template <typename StreamType>
bool Parser<StreamType>::parse_value()
{
    for (; !m_it.done(); m_it.next()) {
        switch (m_it.peek())
        {
            case ' ':
            case '\t':
            case '\r':
            case '\n':
                continue;

            case '-':
            case '0':
            case '1':
            case '2':
            case '3':
            case '4':
            case '5':
            case '6':
            case '7':
            case '8':
            case '9':
                return parse_number();

            case '\'':
            case '"':
                return parse_string();

            case '[':
                create_error("Lists are not supported in records");
                return false;

            case '{': return parse_map();

            case 't': return expect("true", true);
            case 'f': return expect("false", false);
            case 'n': return expect("null", nil);

            default:
                create_error(fmt::format("Unexpected character '{}'", m_it.peek()));
                return false;
        }
    }
    return false;
}

template <typename StreamType>
bool Parser<StreamType>::parse_number() {
    m_scratch.clear();

    bool is_done = false;
    bool is_float = false;
    for (; !m_it.done(); m_it.next()) {
        char c = m_it.peek();
        switch (c) {
            case '+':
            case '-':
            case '0':
            case '1':
            case '2':
            case '3':
            case '4':
            case '5':
            case '6':
            case '7':
            case '8':
            case '9':
                break;
            case '.':
            case 'e':
            case 'E':
                is_float = true;
                break;
            default:
                is_done = true;
                break;
        }
        if (is_done) break;
        m_scratch.push_back(c);
    }

    const char* str = m_scratch.c_str();
    const char* scratch_end = str + m_scratch.size();
    char* end = 0;
    errno = 0;
    if (is_float) {
        m_curr = Value{strtod(str, &end)};
    } else {
        m_curr = Value{(Int)strtoll(str, &end, 10)};
        if (errno == ERANGE && m_scratch[0] != '-') {
            errno = 0;
            m_curr = Value{(UInt)strtoull(str, &end, 10)};
        }
    }

    if (errno) {
        create_error(strerror(errno));
        errno = 0;
        return false;
    } else if (end != scratch_end) {
        create_error("Numeric syntax error");
        return false;
    } else {
        return true;
    }
}

template <typename StreamType>
bool Parser<StreamType>::parse_string() {
    char quote = m_it.peek();
    m_it.next();
    bool escape = false;
    std::string str;
    for(; !m_it.done(); m_it.next()) {
        char c = m_it.peek();
        if (!escape) {
            if (c == '\\') { escape = true; continue; }
            if (c == quote) { m_it.next(); quote = 0; break; }
            str.push_back(c);
        } else {
            escape = false;
            switch (c) {
                case 'n': str.push_back('\n'); break;
                case 'r': str.push_back('\r'); break;
                case 't': str.push_back('\t'); break;
                case 'b': str.push_back('\b'); break;
                case 'f': str.push_back('\f'); break;
                case 'u': {
                    std::string hex;
                    for (int i=0; i<4; ++i) {
                        m_it.next();
                        if (m_it.done() || !isxdigit(m_it.peek())) {
                            create_error("Invalid unicode escape");
                            return false;
                        }
                        hex.push_back(m_it.peek());
                    }
                    auto code = std::strtoul(hex.c_str(), nullptr, 16);
                    if (code < 0x80) {
                        str.push_back((char)code);
                    } else if (code < 0x800) {
                        str.push_back((char)(0xC0 | (code >> 6)));
                        str.push_back((char)(0x80 | (code & 0x3F)));
                    } else {
                        str.push_back((char)(0xE0 | (code >> 12)));
                        str.push_back((char)(0x80 | ((code >> 6) & 0x3F)));
                        str.push_back((char)(0x80 | (code & 0x3F)));
                    }
                    break;
                }
                default: str.push_back(c); break;
            }
        }
    }

    if (quote != 0) {
        create_error("Unterminated string");
        return false;
    }

    m_curr = Value{std::move(str)};
    return true;
}

template <typename StreamType>
bool Parser<StreamType>::parse_map() {
    Record map;

    m_it.next();  // consume {
    consume_whitespace();
    if (m_it.peek() == '}') {
        m_it.next();
        m_curr = Value{std::move(map)};
        return true;
    }

    while (!m_it.done()) {
        // key
        if (!parse_value()) {
            if (m_error_message.empty()) create_error("Expected dictionary key");
            return false;
        }

        if (!m_curr.is_str()) {
            create_error("Keys must be strings");
            return false;
        }

        String key = m_curr.as_str();

        consume_whitespace();
        char c = m_it.peek();
        if (c != ':') {
            create_error("Expected token ':'");
            return false;
        }

        // consume :
        m_it.next();

        // value
        if (!parse_value()) {
            if (m_error_message.empty()) create_error("Expected dictionary value or object");
            return false;
        }

        map[key] = std::move(m_curr);
        consume_whitespace();

        c = m_it.peek();
        if (c == '}') {
            m_it.next();
            m_curr = Value{std::move(map)};
            return true;
        } else if (c == ',') {
            m_it.next();
            continue;
        } else {
            create_error("Expected token ',' or '}'");
            return false;
        }
    }

    create_error("Unterminated map");
    return false;
}

template <typename StreamType>
bool Parser<StreamType>::expect(const char* seq, const Value& value) {
    const char* seq_it = seq;
    for (; *seq_it != 0 && !m_it.done(); m_it.next(), seq_it++) {
        if (*seq_it != m_it.peek()) {
            create_error("Invalid literal");
            return false;
        }
    }
    if (*seq_it != 0) {
        create_error("Invalid literal");
        return false;
    }
    m_curr = value;
    return true;
}

template <typename StreamType>
void Parser<StreamType>::consume_whitespace()
{
    while (!m_it.done() && std::isspace(m_it.peek())) m_it.next();
}

template <typename StreamType>
void Parser<StreamType>::create_error(const std::string& message)
{
    m_error_message = message;
    m_error_offset = m_it.consumed();
}

} // namespace impl


/// Parse a JSON document.
/// @throws ParseError if the document is malformed.
inline
Value parse(const std::string_view& str) {
    impl::Parser parser{parse::StringStreamAdapter{str}};
    if (!parser.parse_object())
        throw ParseError(str, parser.m_error_offset, parser.m_error_message);
    return parser.m_curr;
}

/// Parse a JSON document that must be an object.
inline
Record parse_record(const std::string_view& str) {
    auto value = parse(str);
    if (!value.is_map()) throw Value::wrong_type(value.type(), Value::MAP);
    return std::move(value.as_map());
}

inline
Value parse_file(const std::string& file_name) {
    std::ifstream f_in{file_name, std::ios::in};
    if (!f_in.is_open())
        throw KvormException(fmt::format("Error opening file: {}", file_name));
    std::stringstream ss;
    ss << f_in.rdbuf();
    return parse(ss.str());
}

} // namespace json


#ifndef KVORM_NO_JSON_LITERAL

inline
Value operator ""_json (const char* str, size_t size) {
    return json::parse({str, size});
}

#endif

} // namespace kvorm
