#pragma once

#include <iosfwd>
#include <memory>
#include <string>

namespace coded
{

/// \brief describes an error code: the HTTP status to answer with, the external (user facing) text and a reference
/// to the documentation
///
/// Code 0 is reserved as the "unknown" sentinel and can't be registered.
class coder
{
public:
    virtual ~coder() = default;

    /// \brief the integer code, the key of the registry
    [[nodiscard]] virtual int code() const = 0;

    /// \brief HTTP status that should be used for the code
    [[nodiscard]] virtual int http_status() const = 0;

    /// \brief external (user facing) error text
    [[nodiscard]] virtual std::string message() const = 0;

    /// \brief the documents a user could read for the details
    [[nodiscard]] virtual std::string reference() const = 0;
};

using coder_ptr = std::shared_ptr<const coder>;

/// \brief plain value implementation of the coder interface
///
/// Usage:
/// \code
///     coded::register_coder(std::make_shared<coded::default_coder>(
///         100101, 404, "Page not found", "https://example.com/docs/errors#100101"));
/// \endcode
class default_coder : public coder
{
public:
    default_coder(int code, int http_status, std::string message, std::string reference = "");

    [[nodiscard]] int code() const override
    {
        return _code;
    }

    /// \brief returns 500 when the status has been left unset (0)
    [[nodiscard]] int http_status() const override;

    [[nodiscard]] std::string message() const override
    {
        return _message;
    }

    [[nodiscard]] std::string reference() const override
    {
        return _reference;
    }

private:
    int _code;
    int _http_status;
    std::string _message;
    std::string _reference;
};

constexpr int unknown_code = 1;
constexpr int unknown_http_status = 500;
constexpr const char* unknown_message = "An internal server error occurred";
constexpr const char* unknown_reference = "https://github.com/rtmzk/errors/README.md";

/// \brief the built-in fallback coder, returned for every error no registered coder applies to
const coder_ptr& unknown_coder();

bool operator==(const coder& lhs, const coder& rhs);
bool operator!=(const coder& lhs, const coder& rhs);

std::ostream& operator<<(std::ostream& out, const coder& c);

}  // namespace coded
