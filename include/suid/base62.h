#pragma once

#include <string>
#include <string_view>
#include <cstdint>
#include <cstddef>

namespace suid {

namespace detail {

/**
 * 빅엔디안 limb 배열을 작은 정수로 나누는 긴 나눗셈 (제자리 연산)
 *
 * limbs[0..count)는 radix 진법의 자릿수이며 최상위 자리가 먼저 온다.
 * 몫은 limbs 앞쪽에 다시 기록되고 선행 0 limb는 버려진다.
 *
 * @param limbs 입력 자릿수 배열 (몫으로 덮어씀)
 * @param count 입력 자릿수 개수
 * @param radix 입력 자릿수의 진법
 * @param divisor 나누는 수 (몫의 각 자릿수가 Limb에 들어가야 함)
 * @param remainder 출력 나머지
 * @return 몫의 자릿수 개수 (0이면 몫이 0)
 */
template <typename Limb>
size_t DivideLimbs(Limb* limbs, size_t count, uint64_t radix, uint64_t divisor,
                   uint64_t& remainder) {
    size_t quotient_count = 0;
    remainder = 0;

    for (size_t i = 0; i < count; ++i) {
        // remainder < divisor 이므로 radix * divisor 가 64비트를 넘지 않는 한 안전
        uint64_t value = static_cast<uint64_t>(limbs[i]) + remainder * radix;
        uint64_t digit = value / divisor;
        remainder = value % divisor;

        if (quotient_count != 0 || digit != 0) {
            limbs[quotient_count++] = static_cast<Limb>(digit);
        }
    }

    return quotient_count;
}

} // namespace detail

/**
 * 16바이트 값의 Base62 인코딩/디코딩
 *
 * 알파벳: 0-9 (0~9), A-Z (10~35), a-z (36~61)
 * ASCII 순서와 자릿값 순서가 같으므로 같은 길이의 인코딩 문자열은
 * 원본 바이트와 동일한 순서로 정렬된다.
 */
class Base62 {
public:
    static constexpr size_t ENCODED_MAX_LENGTH = 22;
    static constexpr size_t DECODED_LENGTH = 16;
    static constexpr uint64_t BASE = 62;

    /**
     * 16바이트를 dst 끝에서부터 역방향으로 인코딩
     * dst의 시작 오프셋 이전 바이트는 건드리지 않는다.
     * @param src 16바이트 입력
     * @param dst ENCODED_MAX_LENGTH 크기의 출력 버퍼
     * @return 유효한 데이터의 시작 오프셋
     */
    static size_t Encode(const uint8_t* src, char* dst);

    /**
     * 16바이트를 인코딩한 문자열 반환 (1~22자)
     * @param src 16바이트 입력
     * @return 인코딩 문자열
     */
    static std::string Encode(const uint8_t* src);

    /**
     * Base62 문자열을 16바이트로 디코딩
     * 성공하면 dst 16바이트 전체를 덮어쓰고 (짧은 입력은 앞쪽을 0으로 채움),
     * 실패하면 dst를 변경하지 않는다.
     * @param src 인코딩 문자열 (1~22자)
     * @param dst 16바이트 출력 버퍼
     * @throws MalformedEncodingException 알파벳 외 문자, 길이 오류, 128비트 초과
     */
    static void Decode(std::string_view src, uint8_t* dst);

    /**
     * 디코딩 가능한 문자열인지 검증
     * @param src 검증할 문자열
     * @return 유효하면 true
     */
    static bool IsValid(std::string_view src);

    /**
     * 문자의 자릿값 반환
     * @param c 문자
     * @return 0~61, 알파벳 외 문자는 -1
     */
    static int DigitValue(char c);

private:
    static constexpr char ENCODING_CHARS[] =
        "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz";

    static bool TryDecode(std::string_view src, uint8_t* dst, std::string* error);
};

} // namespace suid
