#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace ctxopt::security {

inline constexpr std::string_view kWorkdirPlaceholder = "<workdir>";
inline constexpr std::string_view kHomePlaceholder = "<home>";

/// Removes host-identifying paths from an error message before it is
/// returned to a caller.
///
/// Every occurrence of the working directory (as given, lexically
/// normalised and canonical) becomes `<workdir>`; the home directory
/// (`$HOME`, `/home/<user>`, `/Users/<user>`, `C:\Users\<user>`) becomes
/// `<home>`. Only the first line survives, which drops stack traces.
[[nodiscard]] auto sanitize_error(std::string_view message,
                                  const std::filesystem::path& working_dir) -> std::string;

} // namespace ctxopt::security
