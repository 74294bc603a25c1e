#include "InstanceUid.hpp"

#include <chrono>
#include <cstdint>
#include <random>
#include <utility>

namespace {
int HexValue(char ch) {
    if (ch >= '0' && ch <= '9') {
        return ch - '0';
    }
    if (ch >= 'a' && ch <= 'f') {
        return ch - 'a' + 10;
    }
    if (ch >= 'A' && ch <= 'F') {
        return ch - 'A' + 10;
    }
    return -1;
}

bool IsCanonicalHyphenPosition(size_t index) {
    return index == 8 || index == 13 || index == 18 || index == 23;
}
} // namespace

InstanceUid::InstanceUid()
    : bytes_(kSize, '\0') {}

InstanceUid InstanceUid::Generate() {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    std::uniform_int_distribution<int> dist(0, 255);

    const auto now = std::chrono::system_clock::now().time_since_epoch();
    const uint64_t millis = static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(now).count());

    InstanceUid uid;
    for (size_t i = 0; i < 6; ++i) {
        uid.bytes_[i] = static_cast<char>((millis >> (8 * (5 - i))) & 0xFF);
    }
    for (size_t i = 6; i < kSize; ++i) {
        uid.bytes_[i] = static_cast<char>(dist(rng));
    }

    // version 7, RFC 4122 variant
    uid.bytes_[6] = static_cast<char>((static_cast<unsigned char>(uid.bytes_[6]) & 0x0F) | 0x70);
    uid.bytes_[8] = static_cast<char>((static_cast<unsigned char>(uid.bytes_[8]) & 0x3F) | 0x80);
    return uid;
}

bool InstanceUid::Parse(const std::string& text, InstanceUid& out) {
    std::string digits;
    if (text.size() == 36) {
        for (size_t i = 0; i < text.size(); ++i) {
            if (IsCanonicalHyphenPosition(i)) {
                if (text[i] != '-') {
                    return false;
                }
                continue;
            }
            digits.push_back(text[i]);
        }
    } else if (text.size() == 2 * kSize) {
        digits = text;
    } else {
        return false;
    }

    std::string bytes(kSize, '\0');
    for (size_t i = 0; i < kSize; ++i) {
        const int high = HexValue(digits[2 * i]);
        const int low = HexValue(digits[2 * i + 1]);
        if (high < 0 || low < 0) {
            return false;
        }
        bytes[i] = static_cast<char>((high << 4) | low);
    }

    out.bytes_ = std::move(bytes);
    return true;
}

bool InstanceUid::FromBytes(const std::string& bytes, InstanceUid& out) {
    if (bytes.size() != kSize) {
        return false;
    }
    out.bytes_ = bytes;
    return true;
}

const std::string& InstanceUid::Bytes() const {
    return bytes_;
}

std::string InstanceUid::ToString() const {
    static constexpr char kDigits[] = "0123456789ABCDEF";
    std::string text;
    text.reserve(2 * kSize);
    for (const char ch : bytes_) {
        const auto value = static_cast<unsigned char>(ch);
        text.push_back(kDigits[value >> 4]);
        text.push_back(kDigits[value & 0x0F]);
    }
    return text;
}

bool InstanceUid::IsNil() const {
    for (const char ch : bytes_) {
        if (ch != '\0') {
            return false;
        }
    }
    return true;
}

bool InstanceUid::operator==(const InstanceUid& other) const {
    return bytes_ == other.bytes_;
}

bool InstanceUid::operator!=(const InstanceUid& other) const {
    return bytes_ != other.bytes_;
}
