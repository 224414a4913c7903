/**
 * Base64.cpp - Thin strict wrapper over Beast's base64 codec
 */

#include "lts/core/Base64.hpp"

#include <boost/beast/core/detail/base64.hpp>

namespace lts {

namespace b64 = boost::beast::detail::base64;

bool decodeBase64(std::string_view input, std::vector<uint8_t>& out) {
    out.clear();
    if (input.empty()) {
        return true;
    }
    if (input.size() % 4 != 0) {
        return false;
    }

    size_t padding = 0;
    if (input.back() == '=') {
        padding = (input[input.size() - 2] == '=') ? 2 : 1;
    }

    out.resize(input.size() / 4 * 3);
    auto [written, consumed] = b64::decode(out.data(), input.data(), input.size());

    // Beast stops at the first character outside the alphabet
    if (consumed + padding != input.size()) {
        out.clear();
        return false;
    }

    out.resize(written);
    return true;
}

std::string encodeBase64(const uint8_t* data, size_t size) {
    std::string encoded(b64::encoded_size(size), '\0');
    size_t written = b64::encode(encoded.data(), data, size);
    encoded.resize(written);
    return encoded;
}

} // namespace lts
