#pragma once
#include <string_view>
namespace beacon::node {

/**
 * @brief Reports a broken call sequence and aborts the process.
 *
 * Used for conditions that are programming errors rather than bad input,
 * e.g. publishing the node identity twice. Never returns.
 */
[[noreturn]] void Fatal(std::string_view message) noexcept;

}
