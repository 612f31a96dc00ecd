#pragma once

#include <source_location>
#include <string_view>

namespace Recode::detail {

/**
 * @brief Readable name of a type, for error and log messages.
 *
 * Extracted from the compiler's pretty function signature, e.g.
 * `TypeName() [with T = MyType; ...]` on GCC or `TypeName() [T = MyType]` on
 * Clang. Falls back to a fixed string on compilers using another layout.
 */
template <typename T>
[[nodiscard]] constexpr std::string_view TypeName() noexcept {
    constexpr std::string_view marker = "T = ";
    const std::string_view signature =
        std::source_location::current().function_name();
    const auto start = signature.find(marker);
    if (start == std::string_view::npos) {
        return "<unnamed type>";
    }
    const auto begin = start + marker.size();
    const auto end = signature.find_first_of(";]", begin);
    return signature.substr(begin, end - begin);
}

}  // namespace Recode::detail
