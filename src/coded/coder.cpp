#include <coded/coder.hpp>

#include <ostream>
#include <utility>

namespace coded
{

default_coder::default_coder(int code, int http_status, std::string message, std::string reference)
    : _code(code)
    , _http_status(http_status)
    , _message(std::move(message))
    , _reference(std::move(reference))
{}

int default_coder::http_status() const
{
    if (_http_status == 0)
        return 500;
    return _http_status;
}

const coder_ptr& unknown_coder()
{
    static const coder_ptr unknown =
        std::make_shared<default_coder>(unknown_code, unknown_http_status, unknown_message, unknown_reference);
    return unknown;
}

bool operator==(const coder& lhs, const coder& rhs)
{
    return lhs.code() == rhs.code() && lhs.http_status() == rhs.http_status() && lhs.message() == rhs.message() &&
           lhs.reference() == rhs.reference();
}

bool operator!=(const coder& lhs, const coder& rhs)
{
    return !(lhs == rhs);
}

std::ostream& operator<<(std::ostream& out, const coder& c)
{
    out << c.code() << " " << c.http_status() << " " << c.message();
    return out;
}

}  // namespace coded
