#pragma once

#include <concepts>
#include <exception>
#include <iosfwd>
#include <memory>
#include <string>
#include <system_error>
#include <type_traits>
#include <utility>

namespace coded
{

/// \brief shared, immutable handle to any error. nullptr stands for "no error"
using error_ptr = std::shared_ptr<const std::exception>;

/// \brief an error carrying a code plus the error it wraps (the cause)
///
/// The cause is set on construction and never changes, so a chain of coded::error is always finite. The code is an
/// integer only. It's resolved against the registry when the error is inspected, so the coder may be registered
/// after the error has been created.
///
/// Usage:
/// \code
///     try
///     {
///         load_config(path);
///     }
///     catch (const std::system_error& e)
///     {
///         throw coded::error(100301, "can't load the configuration", std::make_shared<std::system_error>(e));
///     }
/// \endcode
class error : public std::exception
{
public:
    error(int code, std::string desc);

    error(int code, std::string desc, error_ptr cause);

    error(const error&) = default;
    error& operator=(const error&) = default;

    /// \brief releases the chain below iteratively, so dropping a very long chain doesn't grow the stack
    ~error() override;

    [[nodiscard]] const char* what() const noexcept override
    {
        return _desc.c_str();
    }

    [[nodiscard]] int code() const noexcept
    {
        return _code;
    }

    /// \brief the wrapped error, nullptr for the root of the chain
    [[nodiscard]] const std::exception* cause() const noexcept
    {
        return _cause.get();
    }

    [[nodiscard]] const error_ptr& cause_ptr() const noexcept
    {
        return _cause;
    }

    /// \brief the code as std::error_code of coded::category()
    [[nodiscard]] std::error_code errc() const noexcept;

private:
    int _code;
    std::string _desc;
    // mutable to let the destructor unlink the causes it solely owns
    mutable error_ptr _cause;
};

/// \brief view the error as a chain node. Returns nullptr when err is not a coded::error (or is nullptr)
const error* as_coded(const std::exception* err) noexcept;

/// \brief follows the causes of the chain nodes down to the innermost error. Returns nullptr for nullptr
const std::exception* root_cause(const std::exception* err) noexcept;

/// \brief make a root chain node
error_ptr with_code(int code, std::string desc);

/// \brief wrap an error already held by a shared pointer
error_ptr wrap(error_ptr cause, int code, std::string desc);

/// \brief wrap an error value. The value is copied as its static type, so pass the concrete exception, not a
/// reference to a base class
template <typename E>
requires std::derived_from<std::decay_t<E>, std::exception>
error_ptr wrap(E&& cause, int code, std::string desc)
{
    return wrap(std::make_shared<std::decay_t<E>>(std::forward<E>(cause)), code, std::move(desc));
}

std::ostream& operator<<(std::ostream& out, const coded::error& err);

}  // namespace coded
