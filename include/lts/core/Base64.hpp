/**
 * Base64.hpp - Padded base64 for audio payloads
 */

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace lts {

/**
 * Decode a padded base64 string.
 * @return false if the input is not strictly valid base64 (out is cleared)
 */
bool decodeBase64(std::string_view input, std::vector<uint8_t>& out);

std::string encodeBase64(const uint8_t* data, size_t size);

inline std::string encodeBase64(const std::vector<uint8_t>& data) {
    return encodeBase64(data.data(), data.size());
}

} // namespace lts
