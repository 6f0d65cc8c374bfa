// ZKCOUPON - Hex Encoding/Decoding Utilities
// Copyright (c) 2024 ZKCOUPON Developers
// MIT License

#ifndef ZKCOUPON_CORE_HEX_H
#define ZKCOUPON_CORE_HEX_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace zkcoupon {

/// Convert bytes to lower-case hex
std::string BytesToHex(const uint8_t* data, size_t len);
std::string BytesToHex(const std::vector<uint8_t>& data);

template<size_t N>
std::string BytesToHex(const std::array<uint8_t, N>& data) {
    return BytesToHex(data.data(), N);
}

/// Parse hex; nullopt on odd length or a non-hex character
std::optional<std::vector<uint8_t>> ParseHex(const std::string& hex);

/// Check if string is non-empty, even-length hex
bool IsValidHex(const std::string& str);

} // namespace zkcoupon

#endif // ZKCOUPON_CORE_HEX_H
