#pragma once

#include <exception>
#include <coded/coder.hpp>
#include <coded/error.hpp>
#include <coded/registry.hpp>

namespace coded
{

/// \brief resolve the coder of an error
///
/// - nullptr ("no error") gives nullptr, never the unknown coder;
/// - a coded::error gives the coder registered under its own (outermost) code;
/// - anything else, an unregistered code included, gives unknown_coder().
///
/// Usage:
/// \code
///     catch (const std::exception& e)
///     {
///         auto c = coded::parse_coder(e);
///         respond(c->http_status(), c->message(), c->reference());
///     }
/// \endcode
[[nodiscard]] coder_ptr parse_coder(const std::exception* err, const registry& reg = get_registry());

[[nodiscard]] coder_ptr parse_coder(const std::exception& err, const registry& reg = get_registry());

[[nodiscard]] coder_ptr parse_coder(const error_ptr& err, const registry& reg = get_registry());

/// \brief exceptions not derived from std::exception parse as unknown_coder()
[[nodiscard]] coder_ptr parse_coder(const std::exception_ptr& err, const registry& reg = get_registry());

/// \brief returns true if any coded::error in the chain of err carries the code
///
/// The chain is walked from the outermost error inwards and stops at the first error that is not a
/// coded::error. Errors which are not coded::error carry no code.
[[nodiscard]] bool is_code(const std::exception* err, int code) noexcept;

[[nodiscard]] bool is_code(const std::exception& err, int code) noexcept;

[[nodiscard]] bool is_code(const error_ptr& err, int code) noexcept;

[[nodiscard]] bool is_code(const std::exception_ptr& err, int code) noexcept;

}  // namespace coded
