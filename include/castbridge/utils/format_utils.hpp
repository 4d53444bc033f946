#pragma once

#include <optional>
#include <string>

namespace castbridge::utils {

/**
 * @brief Format duration in seconds to a human-readable string (M:SS or H:MM:SS)
 *
 * Negative input is treated as zero.
 */
std::string format_duration(double seconds);

/**
 * @brief Resolve a user-typed seek target to an absolute position in seconds
 *
 * Accepted forms:
 * - "+N" / "-N": relative to @p current, clamped at zero
 * - "M:SS" and "H:MM:SS"
 * - "N": absolute seconds (fractions allowed)
 *
 * The result is clamped to @p duration when @p duration is positive.
 *
 * @return Target position, or nullopt when the input is not understood
 */
std::optional<double> parse_seek_target(const std::string& input, double current, double duration);

// "1.4 MB" style size string
std::string format_bytes(unsigned long long bytes);

} // namespace castbridge::utils
