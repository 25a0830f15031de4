#pragma once

#include "suid/clock.h"
#include "suid/random_source.h"
#include "suid/uuid.h"

namespace suid {

/**
 * 식별자 생성기
 *
 * 시계와 난수 소스에서 16바이트 식별자를 만든다.
 *   Byte 0-5  타임스탬프 (초, 밀리초)
 *   Byte 6-7  나노초의 중간 바이트 (밀리초 이하 해상도 보강)
 *   Byte 8-15 난수
 *
 * 시계와 난수 소스는 소유하지 않으며 생성기보다 오래 살아야 한다.
 */
class Generator {
public:
    static constexpr size_t RANDOM_OFFSET = 8;

    /**
     * 생성자
     * @param clock 시계 소스
     * @param random 강한 난수 소스
     * @param fallback random 실패 시 사용할 대체 소스 (nullptr 가능)
     */
    Generator(IClock* clock, IRandomSource* random, IRandomSource* fallback);
    ~Generator() = default;

    /**
     * 새 식별자 생성
     * 시계 문제로는 실패하지 않는다.
     * @return 새 식별자
     * @throws EntropyUnavailableException 엄격 모드에서 강한 난수 소스 실패,
     *         또는 대체 소스까지 실패
     */
    UUID Generate();

    /**
     * 엄격 모드 설정
     * 켜면 강한 난수 소스 실패를 대체하지 않고 예외로 전달한다.
     * @param strict 엄격 모드 여부
     */
    void SetStrictEntropy(bool strict) { strict_entropy_ = strict; }

    bool IsStrictEntropy() const { return strict_entropy_; }

    /**
     * 현재 스레드의 기본 생성기
     * SystemClock, SystemRandomSource, 스레드별 PseudoRandomSource 사용
     */
    static Generator& Default();

private:
    IClock* clock_;
    IRandomSource* random_;
    IRandomSource* fallback_;
    bool strict_entropy_ = false;

    void FillRandom(uint8_t* dst, size_t size);
};

} // namespace suid
