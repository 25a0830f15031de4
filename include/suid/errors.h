#pragma once

#include <string>
#include <stdexcept>

namespace suid {

/**
 * suid 예외 기본 클래스
 * 호출자가 복구 가능한 오류만 이 계층으로 보고한다.
 */
class SuidException : public std::runtime_error {
public:
    explicit SuidException(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * 잘못된 Base62 문자열 디코딩 예외
 * 알파벳 외 문자, 길이 오류, 128비트 초과 값
 */
class MalformedEncodingException : public SuidException {
public:
    explicit MalformedEncodingException(const std::string& message)
        : SuidException("Malformed encoding: " + message) {}
};

/**
 * 엄격 모드에서 난수 소스를 사용할 수 없는 경우 예외
 */
class EntropyUnavailableException : public SuidException {
public:
    explicit EntropyUnavailableException(const std::string& message)
        : SuidException("Entropy unavailable: " + message) {}
};

} // namespace suid
