// ==============================================================================
// Layer 0: Core Utility - Configuration Errors
// ==============================================================================
// Offline renders reject malformed configuration before any sample is
// produced. Validation entry points throw ConfigurationError; per-sample
// kernels stay noexcept and assume validated input.
// ==============================================================================

#pragma once

#include <stdexcept>
#include <string>

namespace Hearth {
namespace DSP {

/// @brief Fatal, non-retryable configuration problem (bad cutoff, zero
/// duration, empty mix plan, normalizing silence, ...).
class ConfigurationError : public std::invalid_argument {
public:
    explicit ConfigurationError(const std::string& what)
        : std::invalid_argument(what) {}
};

namespace detail {

/// Throw ConfigurationError with `what` unless `condition` holds.
inline void require(bool condition, const std::string& what) {
    if (!condition) {
        throw ConfigurationError(what);
    }
}

} // namespace detail

} // namespace DSP
} // namespace Hearth
