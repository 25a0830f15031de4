#include "suid/base62.h"
#include "suid/errors.h"
#include <algorithm>
#include <cstring>

namespace suid {

constexpr char Base62::ENCODING_CHARS[];

namespace {

constexpr uint64_t LIMB_BASE = 0x100000000ULL;  // 2^32
constexpr size_t LIMB_COUNT = Base62::DECODED_LENGTH / 4;

// 문자 범위 오프셋
constexpr int OFFSET_UPPERCASE = 10;
constexpr int OFFSET_LOWERCASE = 36;

} // namespace

size_t Base62::Encode(const uint8_t* src, char* dst) {
    uint32_t limbs[LIMB_COUNT];
    for (size_t i = 0; i < LIMB_COUNT; ++i) {
        const uint8_t* p = src + i * 4;
        limbs[i] = static_cast<uint32_t>(p[0]) << 24 |
                   static_cast<uint32_t>(p[1]) << 16 |
                   static_cast<uint32_t>(p[2]) << 8 |
                   static_cast<uint32_t>(p[3]);
    }

    size_t count = LIMB_COUNT;
    size_t n = ENCODED_MAX_LENGTH;

    while (count != 0) {
        uint64_t remainder = 0;
        count = detail::DivideLimbs(limbs, count, LIMB_BASE, BASE, remainder);

        // 최하위 자리부터 계산되므로 버퍼 끝에서부터 기록
        dst[--n] = ENCODING_CHARS[remainder];
    }

    return n;
}

std::string Base62::Encode(const uint8_t* src) {
    char buffer[ENCODED_MAX_LENGTH];
    size_t start = Encode(src, buffer);
    return std::string(buffer + start, ENCODED_MAX_LENGTH - start);
}

void Base62::Decode(std::string_view src, uint8_t* dst) {
    std::string error;
    if (!TryDecode(src, dst, &error)) {
        throw MalformedEncodingException(error);
    }
}

bool Base62::IsValid(std::string_view src) {
    uint8_t scratch[DECODED_LENGTH];
    return TryDecode(src, scratch, nullptr);
}

int Base62::DigitValue(char c) {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'A' && c <= 'Z') {
        return OFFSET_UPPERCASE + (c - 'A');
    }
    if (c >= 'a' && c <= 'z') {
        return OFFSET_LOWERCASE + (c - 'a');
    }
    return -1;
}

bool Base62::TryDecode(std::string_view src, uint8_t* dst, std::string* error) {
    if (src.empty() || src.size() > ENCODED_MAX_LENGTH) {
        if (error) {
            *error = "length " + std::to_string(src.size()) + " out of range [1, " +
                     std::to_string(ENCODED_MAX_LENGTH) + "]";
        }
        return false;
    }

    uint8_t digits[ENCODED_MAX_LENGTH];
    for (size_t i = 0; i < src.size(); ++i) {
        int value = DigitValue(src[i]);
        if (value < 0) {
            if (error) {
                *error = "invalid character at offset " + std::to_string(i) +
                         " in \"" + std::string(src) + "\"";
            }
            return false;
        }
        digits[i] = static_cast<uint8_t>(value);
    }

    // 실패 시 dst를 보존하기 위해 로컬 버퍼에 먼저 디코딩
    uint8_t result[DECODED_LENGTH];
    size_t count = src.size();
    size_t n = DECODED_LENGTH;

    while (count != 0) {
        if (n == 0) {
            if (error) {
                *error = "value of \"" + std::string(src) + "\" exceeds 128 bits";
            }
            return false;
        }

        uint64_t remainder = 0;
        count = detail::DivideLimbs(digits, count, BASE, LIMB_BASE, remainder);

        result[n - 4] = static_cast<uint8_t>(remainder >> 24);
        result[n - 3] = static_cast<uint8_t>(remainder >> 16);
        result[n - 2] = static_cast<uint8_t>(remainder >> 8);
        result[n - 1] = static_cast<uint8_t>(remainder);
        n -= 4;
    }

    // 도달하지 않은 상위 바이트는 반드시 0으로 채움
    std::fill(result, result + n, static_cast<uint8_t>(0));
    std::memcpy(dst, result, DECODED_LENGTH);
    return true;
}

} // namespace suid
