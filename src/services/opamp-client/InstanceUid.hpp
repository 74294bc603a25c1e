#pragma once

#include <cstddef>
#include <string>

// 16-byte agent instance identifier. Generated values are UUIDv7; the
// text form is upper-case hex without hyphens.
class InstanceUid {
public:
    static constexpr size_t kSize = 16;

    InstanceUid();

    static InstanceUid Generate();

    // Accepts 32 hex digits with or without the canonical 8-4-4-4-12 hyphens.
    static bool Parse(const std::string& text, InstanceUid& out);

    // Accepts exactly kSize raw bytes.
    static bool FromBytes(const std::string& bytes, InstanceUid& out);

    const std::string& Bytes() const;
    std::string ToString() const;
    bool IsNil() const;

    bool operator==(const InstanceUid& other) const;
    bool operator!=(const InstanceUid& other) const;

private:
    std::string bytes_;
};
