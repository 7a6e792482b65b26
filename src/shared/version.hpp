// version.hpp (Shared Version Information)
// Centralized definitions for the q3log tool name and build version. The
// version string may be injected by the build system so that `--version` and
// the JSON report name the exact build that produced them.

#pragma once

#include <string_view>

namespace q3log::version {

// Human-friendly name for the tool. Shared between the CLI banner and the
// report writers so text shown to the user remains consistent.
inline constexpr std::string_view kToolTitle{"q3log"};

namespace detail {

#if defined(Q3LOG_VERSION_STRING)
inline constexpr std::string_view kVersionSource{Q3LOG_VERSION_STRING};
#else
// Fallback used when the build system has not injected a version.
inline constexpr std::string_view kVersionSource{"0.1.0 dev"};
#endif

}  // namespace detail

inline constexpr std::string_view kToolVersion = detail::kVersionSource;

}  // namespace q3log::version
