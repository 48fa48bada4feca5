// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT

#include "augsweep/id_generator.h"

#include <cctype>
#include <climits>
#include <stdexcept>

#include <openssl/err.h>
#include <openssl/rand.h>

namespace augsweep {

namespace {

const char* HEX_DIGITS = "0123456789abcdef";

std::string toHex(const std::vector<unsigned char>& bytes) {
    std::string out;
    out.reserve(bytes.size() * 2);
    for (unsigned char b : bytes) {
        out += HEX_DIGITS[b >> 4];
        out += HEX_DIGITS[b & 0x0F];
    }
    return out;
}

bool isLowerHex(char c) {
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
}

} // namespace

std::vector<unsigned char> randomBytes(std::size_t count) {
    std::vector<unsigned char> buffer(count);
    if (count == 0) {
        return buffer;
    }
    if (count > static_cast<std::size_t>(INT_MAX)) {
        throw std::runtime_error("randomBytes: request too large");
    }
    if (RAND_bytes(buffer.data(), static_cast<int>(count)) != 1) {
        char reason[256] = {0};
        ERR_error_string_n(ERR_get_error(), reason, sizeof(reason));
        throw std::runtime_error(std::string("RAND_bytes failed: ") + reason);
    }
    return buffer;
}

std::string randomHex(std::size_t byteCount) {
    return toHex(randomBytes(byteCount));
}

std::string generateUuidV4() {
    auto bytes = randomBytes(16);
    bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0F) | 0x40); // version 4
    bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3F) | 0x80); // RFC 4122 variant

    std::string hex = toHex(bytes);
    return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" +
           hex.substr(16, 4) + "-" + hex.substr(20, 12);
}

std::string generateMachineId() {
    return randomHex(32);
}

bool isUuidV4(const std::string& s) {
    if (s.size() != 36) return false;
    for (size_t i = 0; i < s.size(); ++i) {
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            if (s[i] != '-') return false;
        } else if (!isLowerHex(s[i])) {
            return false;
        }
    }
    if (s[14] != '4') return false;
    char variant = s[19];
    return variant == '8' || variant == '9' || variant == 'a' || variant == 'b';
}

bool isMachineId(const std::string& s) {
    if (s.size() != 64) return false;
    for (char c : s) {
        if (!isLowerHex(c)) return false;
    }
    return true;
}

} // namespace augsweep
