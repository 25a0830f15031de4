#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

namespace suid {

/**
 * 정렬 가능한 16바이트 고유 식별자
 *
 * 바이트 레이아웃 (빅엔디안):
 *   Byte 0-3  EPOCH_BASE 기준 초
 *   Byte 4-5  밀리초 (0~999)
 *   Byte 6-15 난수
 *
 * 예: 00 31 04 39 02 c9 39 ce 14 6c 0b db a1 40 77 78
 *     3212345초 + 713밀리초 = 2020-10-20 16:45:45.713 UTC
 *
 * 원시 바이트 비교 순서와 Base62 문자열 비교 순서가 같다.
 * 문자열 형식: 1~22자 [0-9A-Za-z], URL 안전
 */
class UUID {
public:
    static constexpr size_t SIZE = 16;
    static constexpr size_t TIMESTAMP_SIZE = 6;
    static constexpr size_t RANDOM_SIZE = SIZE - TIMESTAMP_SIZE;
    static constexpr size_t STRING_MAX_LENGTH = 22;

    // 2020-09-13 12:26:40 UTC. 유효 범위: ~ 2156-10-20 18:54:55 UTC
    static constexpr int64_t EPOCH_BASE = 1600000000;

    /**
     * 식별자에 기록된 타임스탬프
     */
    struct TimestampParts {
        uint32_t seconds;       // EPOCH_BASE 기준 초
        uint16_t milliseconds;  // 0~999
    };

    /**
     * 0으로 채워진 식별자 (Min()과 같음)
     */
    UUID();

    /**
     * 현재 시간과 시스템 난수로 새 식별자 생성
     * 강한 난수 소스 실패 시 의사 난수로 대체된다.
     * @return 새 식별자
     */
    static UUID Generate();

    /**
     * 지정한 Unix 시간과 난수 바이트로 식별자 생성
     *
     * nanoseconds의 유효 범위는 [0, 999999999]이지만 범위 밖 값도 허용하며
     * 밀리초 부분만 사용된다. 범위 검사는 하지 않는다 (32/16비트로 잘림).
     * random은 최대 RANDOM_SIZE 바이트까지 사용하고 부족하면 나머지는 0이다.
     *
     * @param unix_seconds Unix 초
     * @param nanoseconds 초 미만 나노초
     * @param random 난수 바이트
     * @param random_size random 길이
     * @return 새 식별자
     */
    static UUID New(int64_t unix_seconds, int64_t nanoseconds,
                    const uint8_t* random, size_t random_size);

    static UUID New(int64_t unix_seconds, int64_t nanoseconds,
                    const std::vector<uint8_t>& random = {});

    /**
     * 원시 바이트에서 앞 16바이트를 복사
     * @param data 원시 바이트
     * @param size data 길이 (SIZE 이상이어야 함)
     * @return 식별자
     * @throws std::length_error size < SIZE (호출자 버그)
     */
    static UUID FromBytes(const uint8_t* data, size_t size);
    static UUID FromBytes(const std::vector<uint8_t>& data);
    static UUID FromBytes(const std::string& data);

    /**
     * 문자열 표현(ToString())에서 식별자 디코딩
     * @param encoded Base62 문자열
     * @return 식별자
     * @throws MalformedEncodingException 잘못된 문자열
     */
    static UUID FromString(std::string_view encoded);

    /**
     * 가장 작은 식별자 (모두 0x00)
     */
    static const UUID& Min();

    /**
     * 가장 큰 식별자 (모두 0xFF)
     */
    static const UUID& Max();

    /**
     * 문자열 표현 반환
     * 원시 바이트와 같은 순서로 정렬되며 URL 안전하다.
     * @return 1~22자 Base62 문자열
     */
    std::string ToString() const;

    /**
     * 인코딩된 문자열을 이 식별자에 디코딩
     * 16바이트 전체를 덮어쓴다. 실패 시 값은 변경되지 않는다.
     * @param encoded Base62 문자열
     * @throws MalformedEncodingException 잘못된 문자열
     */
    void DecodeString(std::string_view encoded);

    TimestampParts Timestamp() const;

    /**
     * 타임스탬프를 절대 시간으로 변환 (밀리초 정밀도)
     */
    std::chrono::system_clock::time_point Time() const;

    const std::array<uint8_t, SIZE>& Bytes() const { return bytes_; }
    const uint8_t* Data() const { return bytes_.data(); }

    bool operator==(const UUID& other) const { return bytes_ == other.bytes_; }
    bool operator!=(const UUID& other) const { return bytes_ != other.bytes_; }
    bool operator<(const UUID& other) const { return bytes_ < other.bytes_; }
    bool operator<=(const UUID& other) const { return bytes_ <= other.bytes_; }
    bool operator>(const UUID& other) const { return bytes_ > other.bytes_; }
    bool operator>=(const UUID& other) const { return bytes_ >= other.bytes_; }

private:
    friend class Generator;

    std::array<uint8_t, SIZE> bytes_;

    void SetTimestamp(uint32_t seconds, uint16_t milliseconds);
};

std::ostream& operator<<(std::ostream& os, const UUID& id);

} // namespace suid

namespace std {

template <>
struct hash<suid::UUID> {
    size_t operator()(const suid::UUID& id) const noexcept;
};

} // namespace std
