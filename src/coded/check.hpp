#pragma once

#include <exception>
#include <iostream>
#include <string_view>
#include <boost/assert/source_location.hpp>
#define BOOST_STACKTRACE_USE_ADDR2LINE
#include <boost/stacktrace.hpp>

namespace coded::impl
{

inline std::ostream& get_logger()
{
    return std::cerr;
}

// Reports a failed check and terminates the process once the whole message has been streamed.
struct FatalStream
{
    FatalStream(std::string_view condition, const boost::source_location& loc)
    {
        get_logger() << "Check failed: \"" << condition << "\""
                     << " function " << loc.function_name() << " at " << loc.file_name() << ":" << loc.line()
                     << " ";
    }

    FatalStream(const FatalStream&) = delete;
    FatalStream& operator=(const FatalStream&) = delete;

    ~FatalStream()
    {
        get_logger() << "\n";
        get_logger() << boost::stacktrace::stacktrace();
        get_logger().flush();
        std::terminate();
    }
};

template <typename T>
const FatalStream& operator<<(const FatalStream& s, const T& t)
{
    get_logger() << t;
    return s;
}

}  // namespace coded::impl

// Checks an expression during runtime. Checks are performed in release builds too.
// Example:
//      CODED_CHECK(coder->code() != 0) << "code 0 is reserved";
#define CODED_CHECK(condition) \
    if (!(condition))          \
    ::coded::impl::FatalStream(#condition, BOOST_CURRENT_LOCATION)

// Checks an expression during runtime. Checks are performed only in debug builds.
#ifdef NDEBUG
#define CODED_DCHECK(condition) CODED_CHECK(true)
#else
#define CODED_DCHECK(condition) CODED_CHECK(condition)
#endif
