#pragma once

#include <string>
#include <string_view>

namespace audit::util {

// Lowercase hex SHA-256 of data. Throws std::runtime_error if OpenSSL fails.
std::string Sha256Hex(std::string_view data);

// Hash-chain link: SHA-256(previous_hash || payload).
std::string ChainHash(std::string_view previous_hash, std::string_view payload);

} // namespace audit::util
