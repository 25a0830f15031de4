#include "suid/uuid.h"
#include "suid/base62.h"
#include "suid/generator.h"
#include <algorithm>
#include <cstring>
#include <ostream>
#include <stdexcept>

namespace suid {

constexpr size_t UUID::SIZE;
constexpr size_t UUID::RANDOM_SIZE;
constexpr int64_t UUID::EPOCH_BASE;

UUID::UUID() {
    bytes_.fill(0);
}

UUID UUID::Generate() {
    return Generator::Default().Generate();
}

UUID UUID::New(int64_t unix_seconds, int64_t nanoseconds,
               const uint8_t* random, size_t random_size) {
    UUID id;

    id.SetTimestamp(static_cast<uint32_t>(unix_seconds - EPOCH_BASE),
                    static_cast<uint16_t>(nanoseconds / 1000000));

    if (random != nullptr) {
        std::memcpy(id.bytes_.data() + TIMESTAMP_SIZE, random,
                    std::min(random_size, RANDOM_SIZE));
    }

    return id;
}

UUID UUID::New(int64_t unix_seconds, int64_t nanoseconds,
               const std::vector<uint8_t>& random) {
    return New(unix_seconds, nanoseconds, random.data(), random.size());
}

UUID UUID::FromBytes(const uint8_t* data, size_t size) {
    if (size < SIZE) {
        throw std::length_error("UUID::FromBytes requires " + std::to_string(SIZE) +
                                " bytes, got " + std::to_string(size));
    }

    UUID id;
    std::memcpy(id.bytes_.data(), data, SIZE);
    return id;
}

UUID UUID::FromBytes(const std::vector<uint8_t>& data) {
    return FromBytes(data.data(), data.size());
}

UUID UUID::FromBytes(const std::string& data) {
    return FromBytes(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

UUID UUID::FromString(std::string_view encoded) {
    UUID id;
    id.DecodeString(encoded);
    return id;
}

const UUID& UUID::Min() {
    static const UUID min_id;
    return min_id;
}

const UUID& UUID::Max() {
    static const UUID max_id = [] {
        UUID id;
        id.bytes_.fill(0xFF);
        return id;
    }();
    return max_id;
}

std::string UUID::ToString() const {
    return Base62::Encode(bytes_.data());
}

void UUID::DecodeString(std::string_view encoded) {
    Base62::Decode(encoded, bytes_.data());
}

UUID::TimestampParts UUID::Timestamp() const {
    TimestampParts parts;
    parts.seconds = static_cast<uint32_t>(bytes_[0]) << 24 |
                    static_cast<uint32_t>(bytes_[1]) << 16 |
                    static_cast<uint32_t>(bytes_[2]) << 8 |
                    static_cast<uint32_t>(bytes_[3]);
    parts.milliseconds = static_cast<uint16_t>(bytes_[4] << 8 | bytes_[5]);
    return parts;
}

std::chrono::system_clock::time_point UUID::Time() const {
    TimestampParts parts = Timestamp();
    auto since_epoch = std::chrono::seconds(static_cast<int64_t>(parts.seconds) + EPOCH_BASE) +
                       std::chrono::milliseconds(parts.milliseconds);
    return std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(since_epoch));
}

void UUID::SetTimestamp(uint32_t seconds, uint16_t milliseconds) {
    // 초 부분
    bytes_[0] = static_cast<uint8_t>(seconds >> 24);
    bytes_[1] = static_cast<uint8_t>(seconds >> 16);
    bytes_[2] = static_cast<uint8_t>(seconds >> 8);
    bytes_[3] = static_cast<uint8_t>(seconds);

    // 밀리초 부분
    bytes_[4] = static_cast<uint8_t>(milliseconds >> 8);
    bytes_[5] = static_cast<uint8_t>(milliseconds);
}

std::ostream& operator<<(std::ostream& os, const UUID& id) {
    return os << id.ToString();
}

} // namespace suid

namespace std {

size_t hash<suid::UUID>::operator()(const suid::UUID& id) const noexcept {
    return hash<string_view>()(
        string_view(reinterpret_cast<const char*>(id.Data()), suid::UUID::SIZE));
}

} // namespace std
