#include <gtest/gtest.h>
#include "suid/uuid.h"
#include "suid/base62.h"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <iostream>
#include <random>
#include <string>
#include <thread>
#include <vector>

#ifdef _WIN32
#include <windows.h>
#endif

using namespace suid;
using namespace std::chrono;

// Windows에서 콘솔 출력 인코딩을 UTF-8로 설정
namespace {
    struct ConsoleEncodingSetter {
        ConsoleEncodingSetter() {
#ifdef _WIN32
            SetConsoleOutputCP(65001);
            SetConsoleCP(65001);
#endif
        }
    };
    ConsoleEncodingSetter g_console_encoding_setter;

    double OpsPerSecond(size_t operations, int64_t duration_us) {
        return static_cast<double>(operations) * 1000000.0 / std::max<int64_t>(duration_us, 1);
    }
}

class PerformanceTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::mt19937_64 rng(20201020);
        ids_.reserve(num_ids_);
        for (size_t i = 0; i < num_ids_; ++i) {
            std::vector<uint8_t> random(UUID::RANDOM_SIZE);
            for (auto& b : random) {
                b = static_cast<uint8_t>(rng());
            }
            ids_.push_back(UUID::New(UUID::EPOCH_BASE + static_cast<int64_t>(rng() % 100000000),
                                     static_cast<int64_t>(rng() % 1000000000), random));
        }
    }

    const size_t num_ids_ = 100000;
    std::vector<UUID> ids_;
};

/**
 * 단일 스레드 인코딩 성능 측정
 */
TEST_F(PerformanceTest, EncodeThroughput) {
    std::vector<std::string> encoded;
    encoded.reserve(ids_.size());

    auto start = high_resolution_clock::now();

    for (const auto& id : ids_) {
        encoded.push_back(id.ToString());
    }

    auto end = high_resolution_clock::now();
    auto duration = duration_cast<microseconds>(end - start).count();
    double throughput = OpsPerSecond(ids_.size(), duration);

    std::cout << "\n=== 인코딩 성능 ===" << std::endl;
    std::cout << "작업 수: " << ids_.size() << std::endl;
    std::cout << "소요 시간: " << duration << " us" << std::endl;
    std::cout << "처리량: " << throughput << " ops/sec" << std::endl;

    EXPECT_EQ(encoded.size(), ids_.size());
    EXPECT_GT(throughput, 10000); // 최소 10,000 ops/sec 이상
}

/**
 * 단일 스레드 디코딩 성능 측정
 */
TEST_F(PerformanceTest, DecodeThroughput) {
    std::vector<std::string> encoded;
    encoded.reserve(ids_.size());
    for (const auto& id : ids_) {
        encoded.push_back(id.ToString());
    }

    size_t mismatches = 0;

    auto start = high_resolution_clock::now();

    for (size_t i = 0; i < encoded.size(); ++i) {
        if (UUID::FromString(encoded[i]) != ids_[i]) {
            mismatches++;
        }
    }

    auto end = high_resolution_clock::now();
    auto duration = duration_cast<microseconds>(end - start).count();
    double throughput = OpsPerSecond(encoded.size(), duration);

    std::cout << "\n=== 디코딩 성능 ===" << std::endl;
    std::cout << "작업 수: " << encoded.size() << std::endl;
    std::cout << "소요 시간: " << duration << " us" << std::endl;
    std::cout << "처리량: " << throughput << " ops/sec" << std::endl;

    EXPECT_EQ(mismatches, 0u);
    EXPECT_GT(throughput, 10000); // 최소 10,000 ops/sec 이상
}

/**
 * 단일 스레드 생성 성능 측정
 */
TEST_F(PerformanceTest, GenerateThroughput) {
    const size_t num_operations = 100000;
    std::vector<UUID> generated;
    generated.reserve(num_operations);

    auto start = high_resolution_clock::now();

    for (size_t i = 0; i < num_operations; ++i) {
        generated.push_back(UUID::Generate());
    }

    auto end = high_resolution_clock::now();
    auto duration = duration_cast<microseconds>(end - start).count();
    double throughput = OpsPerSecond(num_operations, duration);

    std::cout << "\n=== 생성 성능 ===" << std::endl;
    std::cout << "작업 수: " << num_operations << std::endl;
    std::cout << "소요 시간: " << duration << " us" << std::endl;
    std::cout << "처리량: " << throughput << " ops/sec" << std::endl;

    std::sort(generated.begin(), generated.end());
    EXPECT_TRUE(std::adjacent_find(generated.begin(), generated.end()) == generated.end());
    EXPECT_GT(throughput, 1000); // 최소 1,000 ops/sec 이상
}

/**
 * 동시 생성 성능 측정 (멀티스레드)
 */
TEST_F(PerformanceTest, ConcurrentGenerateThroughput) {
    const size_t num_threads = 4;
    const size_t operations_per_thread = 25000;

    std::atomic<size_t> generated_count(0);
    std::atomic<size_t> roundtrip_failures(0);

    auto worker = [&]() {
        for (size_t i = 0; i < operations_per_thread; ++i) {
            UUID id = UUID::Generate();
            if (UUID::FromString(id.ToString()) != id) {
                roundtrip_failures++;
            }
            generated_count++;
        }
    };

    auto start = high_resolution_clock::now();

    std::vector<std::thread> threads;
    for (size_t i = 0; i < num_threads; ++i) {
        threads.emplace_back(worker);
    }

    for (auto& t : threads) {
        t.join();
    }

    auto end = high_resolution_clock::now();
    auto duration = duration_cast<microseconds>(end - start).count();
    double throughput = OpsPerSecond(generated_count.load(), duration);

    std::cout << "\n=== 동시 생성 성능 (멀티스레드) ===" << std::endl;
    std::cout << "스레드 수: " << num_threads << std::endl;
    std::cout << "스레드당 작업 수: " << operations_per_thread << std::endl;
    std::cout << "소요 시간: " << duration << " us" << std::endl;
    std::cout << "처리량: " << throughput << " ops/sec" << std::endl;

    EXPECT_EQ(generated_count.load(), num_threads * operations_per_thread);
    EXPECT_EQ(roundtrip_failures.load(), 0u);
    EXPECT_GT(throughput, 1000); // 최소 1,000 ops/sec 이상
}
