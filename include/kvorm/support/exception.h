/// @b License: @n Apache License v2.0
/// @copyright Robert Dunnagan
#pragma once

#include <exception>
#include <string>

#define ASSERT(cond) { if (!(cond)) throw ::kvorm::Assert{#cond}; }

class NoTraceException : public std::exception
{
  public:
    NoTraceException(std::string&& msg) : m_msg{msg} {}
    const char* what() const noexcept override { return m_msg.data(); }
  private:
    std::string m_msg;
};

#if __has_include("cpptrace/cpptrace.hpp")
#include <cpptrace/cpptrace.hpp>
#define KVORM_BASE_EXCEPTION cpptrace::exception_with_message
#else
#define KVORM_BASE_EXCEPTION NoTraceException
#endif

namespace kvorm {

class KvormException : public KVORM_BASE_EXCEPTION
{
  public:
    KvormException(std::string&& msg) : KVORM_BASE_EXCEPTION(std::forward<std::string>(msg)) {}
    KvormException() : KvormException{""} {}
};

class Assert : public KVORM_BASE_EXCEPTION
{
  public:
    Assert(std::string&& msg) : KVORM_BASE_EXCEPTION(std::forward<std::string>(msg)) {}
};

} // kvorm namespace
