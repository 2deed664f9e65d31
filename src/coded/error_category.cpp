#include <coded/error_category.hpp>

#include <coded/registry.hpp>

namespace coded
{
namespace
{

struct registry_category : std::error_category
{
    const char* name() const noexcept override
    {
        return "coded";
    }

    std::string message(int ev) const override
    {
        if (auto c = lookup(ev))
            return c->message();
        return unknown_coder()->message();
    }
};

const registry_category global_registry_category{};

}  // namespace

const std::error_category& category() noexcept
{
    return global_registry_category;
}

std::error_code make_error_code(int code) noexcept
{
    return { code, global_registry_category };
}

}  // namespace coded
