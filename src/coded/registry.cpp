#include <coded/registry.hpp>

#include <utility>
#include <coded/check.hpp>

namespace coded
{

registry::registry()
{
    const coder_ptr& unknown = unknown_coder();
    CODED_DCHECK(unknown->code() == unknown_code);
    _codes.emplace(unknown->code(), unknown);
}

void registry::register_coder(coder_ptr c)
{
    CODED_CHECK(c != nullptr) << "can't register an empty coder";
    const int code = c->code();
    CODED_CHECK(code != 0) << "code `0` is reserved as the unknown error code";

    std::lock_guard lock(_mutex);
    _codes.insert_or_assign(code, std::move(c));
}

void registry::must_register(coder_ptr c)
{
    CODED_CHECK(c != nullptr) << "can't register an empty coder";
    const int code = c->code();
    CODED_CHECK(code != 0) << "code `0` is reserved as the unknown error code";

    bool inserted = false;
    {
        std::lock_guard lock(_mutex);
        inserted = _codes.try_emplace(code, std::move(c)).second;
    }
    CODED_CHECK(inserted) << "code: " << code << " already exist";
}

coder_ptr registry::lookup(int code) const
{
    std::lock_guard lock(_mutex);
    auto it = _codes.find(code);
    if (it == _codes.end())
        return nullptr;
    return it->second;
}

bool registry::contains(int code) const
{
    std::lock_guard lock(_mutex);
    return _codes.count(code) != 0;
}

std::size_t registry::size() const
{
    std::lock_guard lock(_mutex);
    return _codes.size();
}

registry& get_registry()
{
    static registry global_registry;
    return global_registry;
}

void register_coder(coder_ptr c)
{
    get_registry().register_coder(std::move(c));
}

void register_coder(int code, int http_status, std::string message, std::string reference)
{
    register_coder(std::make_shared<default_coder>(code, http_status, std::move(message), std::move(reference)));
}

void must_register(coder_ptr c)
{
    get_registry().must_register(std::move(c));
}

void must_register(int code, int http_status, std::string message, std::string reference)
{
    must_register(std::make_shared<default_coder>(code, http_status, std::move(message), std::move(reference)));
}

coder_ptr lookup(int code)
{
    return get_registry().lookup(code);
}

}  // namespace coded
