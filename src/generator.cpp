#include "suid/generator.h"
#include "suid/errors.h"
#include "suid/logging.h"

namespace suid {

Generator::Generator(IClock* clock, IRandomSource* random, IRandomSource* fallback)
    : clock_(clock)
    , random_(random)
    , fallback_(fallback) {
}

UUID Generator::Generate() {
    ClockReading now = clock_->Now();
    uint64_t ns = static_cast<uint64_t>(now.nanoseconds);

    UUID id;
    id.SetTimestamp(static_cast<uint32_t>(now.unix_seconds - UUID::EPOCH_BASE),
                    static_cast<uint16_t>(ns / 1000000));

    // 호스트 엔디안과 무관하도록 나노초의 중간 바이트 사용
    id.bytes_[6] = static_cast<uint8_t>(ns >> 24);
    id.bytes_[7] = static_cast<uint8_t>(ns >> 16);

    FillRandom(id.bytes_.data() + RANDOM_OFFSET, UUID::SIZE - RANDOM_OFFSET);
    return id;
}

Generator& Generator::Default() {
    static SystemClock clock;
    static SystemRandomSource random;
    thread_local PseudoRandomSource fallback;
    thread_local Generator generator(&clock, &random, &fallback);
    return generator;
}

void Generator::FillRandom(uint8_t* dst, size_t size) {
    if (random_ && random_->Fill(dst, size)) {
        return;
    }

    if (strict_entropy_) {
        GetLogger()->error("primary random source failed in strict mode");
        throw EntropyUnavailableException("primary random source failed");
    }

    // 식별자 유일성은 보안 요구가 아니므로 의사 난수로 대체
    GetLogger()->warn("primary random source failed, falling back to pseudo-random source");

    if (!fallback_ || !fallback_->Fill(dst, size)) {
        throw EntropyUnavailableException("primary and fallback random sources failed");
    }
}

} // namespace suid
