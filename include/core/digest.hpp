#pragma once

#include <string>
#include <string_view>

namespace sentinel {

/**
 * @brief SHA-256 of data as 64 lowercase hex chars
 * @throws std::runtime_error if the OpenSSL digest fails
 */
[[nodiscard]] std::string sha256_hex(std::string_view data);

} // namespace sentinel
