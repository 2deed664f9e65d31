#pragma once

#include <cstddef>
#include <mutex>
#include <string>
#include <unordered_map>
#include <coded/coder.hpp>

namespace coded
{

/// \brief the catalog of code -> coder descriptors
///
/// A fresh registry already holds the unknown coder under code 1. Entries are never removed. All the methods are
/// thread safe.
///
/// Usage:
/// \code
///     coded::registry& reg = coded::get_registry();
///     reg.must_register(std::make_shared<coded::default_coder>(100201, 400, "Validation failed"));
///     if (auto c = reg.lookup(100201))
///         std::cout << c->http_status() << "\n";
/// \endcode
class registry
{
public:
    registry();

    registry(const registry&) = delete;
    registry& operator=(const registry&) = delete;

    /// \brief register the coder, overriding the coder already registered under the same code
    ///
    /// Terminates when the coder is null or its code is 0.
    void register_coder(coder_ptr c);

    /// \brief register the coder. Terminates when the coder is null, its code is 0 or the code is already taken
    void must_register(coder_ptr c);

    /// \brief find the coder registered under the code. Returns nullptr if there is none
    [[nodiscard]] coder_ptr lookup(int code) const;

    [[nodiscard]] bool contains(int code) const;

    /// \brief the number of registered codes, the unknown coder included
    [[nodiscard]] std::size_t size() const;

private:
    mutable std::mutex _mutex;
    std::unordered_map<int, coder_ptr> _codes;
};

/// \brief returns the process-wide registry. It's created (and seeded with the unknown coder) on first use
registry& get_registry();

/// \brief register the coder in the process-wide registry. See registry::register_coder
void register_coder(coder_ptr c);

void register_coder(int code, int http_status, std::string message, std::string reference = "");

/// \brief register the coder in the process-wide registry. See registry::must_register
void must_register(coder_ptr c);

void must_register(int code, int http_status, std::string message, std::string reference = "");

/// \brief find the coder in the process-wide registry
[[nodiscard]] coder_ptr lookup(int code);

}  // namespace coded
