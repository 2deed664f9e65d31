#pragma once

#include <system_error>

namespace coded
{

/// \brief std::error_category of the registry codes. The message of a code is the text of its registered coder,
/// the text of the built-in unknown_coder() if there is none (not the coder registered under code 1), same as
/// parse_coder
const std::error_category& category() noexcept;

std::error_code make_error_code(int code) noexcept;

}  // namespace coded
