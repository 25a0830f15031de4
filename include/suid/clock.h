#pragma once

#include <cstdint>

namespace suid {

/**
 * 시계 읽기 결과
 */
struct ClockReading {
    int64_t unix_seconds = 0;   // Unix 초
    int64_t nanoseconds = 0;    // 초 미만 나노초 (0~999999999)
};

/**
 * 시계 소스 인터페이스
 * 식별자 생성기는 두 정수만 사용한다.
 */
class IClock {
public:
    virtual ~IClock() = default;

    /**
     * 현재 시간 반환
     * @return Unix 초와 나노초
     */
    virtual ClockReading Now() = 0;
};

/**
 * std::chrono::system_clock 기반 시계
 */
class SystemClock : public IClock {
public:
    ClockReading Now() override;
};

} // namespace suid
