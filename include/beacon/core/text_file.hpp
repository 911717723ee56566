#pragma once
#include "beacon/core/result.hpp"
#include "beacon/core/failures.hpp"
#include <cstddef>
#include <filesystem>
#include <string>
namespace beacon::node {

/**
 * @brief Reads a whole text file.
 *
 * Errors are InvalidInput whose message is only the cause (e.g. "No such
 * file or directory"), so callers can embed it in their own report.
 */
[[nodiscard]] Result<std::string, BeaconFailure> ReadTextFile(
    const std::filesystem::path& path,
    size_t max_size);

/// Copy of @p text without leading and trailing ASCII whitespace.
[[nodiscard]] std::string TrimWhitespace(const std::string& text);

}
