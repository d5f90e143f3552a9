#pragma once

#include "nexus/core/error.hpp"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace nexus::core {

std::string to_hex(const std::uint8_t* data, std::size_t len);
std::string to_hex(const std::vector<std::uint8_t>& data);

std::vector<std::uint8_t> sha256(const std::string& data);
std::vector<std::uint8_t> sha256(const std::uint8_t* data, std::size_t len);
std::string sha256_hex(const std::string& data);

// Streams the file in 4 KiB blocks. A set cancel flag aborts with Internal.
Result<std::string, Error> sha256_file(const std::filesystem::path& path,
                                       const std::atomic<bool>* cancel = nullptr);

std::vector<std::uint8_t> hmac_sha256(const std::vector<std::uint8_t>& key, const std::string& data);

// Constant-time comparison for credential digests.
bool digest_equals(const std::string& lhs, const std::string& rhs);

std::string base64_encode(const std::string& data);

// Standard alphabet, padded. Returns nullopt for malformed input.
std::optional<std::string> base64_decode(const std::string& text);

// Random lowercase hex identifier of 2 * bytes characters.
std::string random_hex_id(std::size_t bytes = 16);

} // namespace nexus::core
