#include <coded/chain.hpp>

namespace coded
{

coder_ptr parse_coder(const std::exception* err, const registry& reg)
{
    if (err == nullptr)
        return nullptr;

    if (const error* node = as_coded(err))
    {
        if (auto c = reg.lookup(node->code()))
            return c;
    }

    return unknown_coder();
}

coder_ptr parse_coder(const std::exception& err, const registry& reg)
{
    return parse_coder(&err, reg);
}

coder_ptr parse_coder(const error_ptr& err, const registry& reg)
{
    return parse_coder(err.get(), reg);
}

coder_ptr parse_coder(const std::exception_ptr& err, const registry& reg)
{
    if (!err)
        return nullptr;

    try
    {
        std::rethrow_exception(err);
    }
    catch (const std::exception& e)
    {
        return parse_coder(&e, reg);
    }
    catch (...)
    {
        // not a std::exception, so it can't carry a code
        return unknown_coder();
    }
}

bool is_code(const std::exception* err, int code) noexcept
{
    const error* node = as_coded(err);
    while (node != nullptr)
    {
        if (node->code() == code)
            return true;
        node = as_coded(node->cause());
    }
    return false;
}

bool is_code(const std::exception& err, int code) noexcept
{
    return is_code(&err, code);
}

bool is_code(const error_ptr& err, int code) noexcept
{
    return is_code(err.get(), code);
}

bool is_code(const std::exception_ptr& err, int code) noexcept
{
    if (!err)
        return false;

    try
    {
        std::rethrow_exception(err);
    }
    catch (const std::exception& e)
    {
        return is_code(&e, code);
    }
    catch (...)
    {
        // not a std::exception, so it can't carry a code
        return false;
    }
}

}  // namespace coded
