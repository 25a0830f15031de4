#include "suid/random_source.h"
#include "suid/logging.h"
#include <chrono>
#include <exception>

namespace suid {

bool SystemRandomSource::Fill(uint8_t* dst, size_t size) {
    try {
        thread_local std::random_device device;

        size_t i = 0;
        while (i < size) {
            // random_device는 32비트 값을 반환
            uint32_t value = static_cast<uint32_t>(device());
            for (int shift = 0; shift < 32 && i < size; shift += 8) {
                dst[i++] = static_cast<uint8_t>(value >> shift);
            }
        }
        return true;
    } catch (const std::exception& e) {
        GetLogger()->debug("std::random_device failed: {}", e.what());
        return false;
    }
}

PseudoRandomSource::PseudoRandomSource()
    : generator_(static_cast<uint64_t>(
          std::chrono::steady_clock::now().time_since_epoch().count())) {
}

PseudoRandomSource::PseudoRandomSource(uint64_t seed)
    : generator_(seed) {
}

bool PseudoRandomSource::Fill(uint8_t* dst, size_t size) {
    size_t i = 0;
    while (i < size) {
        uint64_t value = generator_();
        for (int shift = 0; shift < 64 && i < size; shift += 8) {
            dst[i++] = static_cast<uint8_t>(value >> shift);
        }
    }
    return true;
}

} // namespace suid
