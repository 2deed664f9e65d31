#include <coded/error.hpp>

#include <ostream>
#include <utility>
#include <coded/error_category.hpp>

namespace coded
{

error::error(int code, std::string desc)
    : _code(code)
    , _desc(std::move(desc))
{}

error::error(int code, std::string desc, error_ptr cause)
    : _code(code)
    , _desc(std::move(desc))
    , _cause(std::move(cause))
{}

error::~error()
{
    error_ptr next = std::move(_cause);
    while (next != nullptr && next.use_count() == 1)
    {
        const error* node = as_coded(next.get());
        if (node == nullptr)
            break;
        // detach the grandchild first, so releasing the node doesn't recurse
        error_ptr inner = std::move(node->_cause);
        next = std::move(inner);
    }
}

std::error_code error::errc() const noexcept
{
    return make_error_code(_code);
}

const error* as_coded(const std::exception* err) noexcept
{
    return dynamic_cast<const error*>(err);
}

const std::exception* root_cause(const std::exception* err) noexcept
{
    const error* node = as_coded(err);
    while (node != nullptr && node->cause() != nullptr)
    {
        err = node->cause();
        node = as_coded(err);
    }
    return err;
}

error_ptr with_code(int code, std::string desc)
{
    return std::make_shared<error>(code, std::move(desc));
}

error_ptr wrap(error_ptr cause, int code, std::string desc)
{
    return std::make_shared<error>(code, std::move(desc), std::move(cause));
}

std::ostream& operator<<(std::ostream& out, const coded::error& err)
{
    out << err.what() << " (code " << err.code() << ")";

    const std::exception* cause = err.cause();
    while (cause != nullptr)
    {
        out << ": " << cause->what();
        const error* node = as_coded(cause);
        if (node == nullptr)
            break;
        out << " (code " << node->code() << ")";
        cause = node->cause();
    }
    return out;
}

}  // namespace coded
