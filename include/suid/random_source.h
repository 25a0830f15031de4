#pragma once

#include <cstddef>
#include <cstdint>
#include <random>

namespace suid {

/**
 * 난수 바이트 소스 인터페이스
 */
class IRandomSource {
public:
    virtual ~IRandomSource() = default;

    /**
     * dst를 난수 바이트로 채움
     * @param dst 출력 버퍼
     * @param size 채울 바이트 수
     * @return 성공시 true
     */
    virtual bool Fill(uint8_t* dst, size_t size) = 0;
};

/**
 * 운영체제 엔트로피 기반 난수 소스 (std::random_device)
 * 상태를 공유하지 않으므로 여러 스레드에서 동시에 사용할 수 있다.
 */
class SystemRandomSource : public IRandomSource {
public:
    bool Fill(uint8_t* dst, size_t size) override;
};

/**
 * 의사 난수 소스 (mt19937_64)
 * 암호학적으로 안전하지 않으며 강한 난수 소스 실패 시 대체용이다.
 * 스레드 안전하지 않으므로 스레드마다 하나씩 사용한다.
 */
class PseudoRandomSource : public IRandomSource {
public:
    PseudoRandomSource();
    explicit PseudoRandomSource(uint64_t seed);

    bool Fill(uint8_t* dst, size_t size) override;

private:
    std::mt19937_64 generator_;
};

} // namespace suid
