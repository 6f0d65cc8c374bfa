// ZKCOUPON - Core Types Implementation
// Copyright (c) 2024 ZKCOUPON Developers
// MIT License

#include "zkcoupon/core/types.h"
#include "zkcoupon/core/hex.h"

namespace zkcoupon {

Hash256::Hash256(const Byte* data, size_t len) noexcept {
    data_.fill(0);
    if (data && len > 0) {
        std::memcpy(data_.data(), data, len < SIZE ? len : SIZE);
    }
}

bool Hash256::IsNull() const noexcept {
    for (auto b : data_) {
        if (b != 0) return false;
    }
    return true;
}

std::string Hash256::ToHex() const {
    return BytesToHex(data_.data(), SIZE);
}

std::string Hash256::ShortHex(size_t chars) const {
    std::string hex = ToHex();
    if (chars >= hex.size()) {
        return hex;
    }
    return hex.substr(0, chars);
}

std::optional<Hash256> Hash256::FromHex(const std::string& hex) {
    if (hex.length() != SIZE * 2) {
        return std::nullopt;
    }
    auto bytes = ParseHex(hex);
    if (!bytes) {
        return std::nullopt;
    }
    return Hash256(bytes->data(), bytes->size());
}

} // namespace zkcoupon
