#include <algorithm>
#include <atomic>
#include <chrono>
#include <iostream>
#include <thread>
#include <utility>
#include <vector>

#include <catch2/catch.hpp>

#include "lib/snowflake/snowflake.h"
#include "lib/snowflake/snowflake_id.h"

namespace {

const int kIdsPerThread = 1000000;

unsigned num_threads() {
    return std::max(1u, std::thread::hardware_concurrency());
}

double seconds_since(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}

bool all_distinct(std::vector<uint64_t> ids) {
    std::sort(ids.begin(), ids.end());
    return std::adjacent_find(ids.begin(), ids.end()) == ids.end();
}

} // namespace

// ====================== TESTS ======================

TEST_CASE("Single-threaded generation is strictly increasing and unique", "[snowflake][benchmark]") {
    Snowflake gen(9, 29);
    const size_t iterations = static_cast<size_t>(num_threads()) * kIdsPerThread;

    std::vector<uint64_t> ids;
    ids.reserve(iterations);

    auto start = std::chrono::steady_clock::now();
    for (size_t i = 0; i < iterations; ++i) {
        ids.push_back(gen.next_id());
    }
    double elapsed = seconds_since(start);

    bool increasing = true;
    for (size_t i = 1; i < ids.size(); ++i) {
        if (ids[i] <= ids[i - 1]) {
            increasing = false;
            break;
        }
    }
    REQUIRE(increasing);
    REQUIRE(all_distinct(std::move(ids)));

    std::cout << "Generated " << iterations << " unique IDs in " << elapsed
              << " seconds." << std::endl;
}

TEST_CASE("Concurrent generation on one instance never repeats an ID", "[snowflake][concurrency][stress]") {
    Snowflake gen(9, 29);
    const unsigned threads_count = num_threads();

    std::vector<std::vector<uint64_t>> per_thread(threads_count);
    std::atomic<bool> ordered{true};

    auto start = std::chrono::steady_clock::now();

    std::vector<std::thread> threads;
    for (unsigned t = 0; t < threads_count; ++t) {
        threads.emplace_back([&gen, &per_thread, &ordered, t] {
            std::vector<uint64_t>& ids = per_thread[t];
            ids.reserve(kIdsPerThread);
            uint64_t last_delta = 0;
            for (int j = 0; j < kIdsPerThread; ++j) {
                uint64_t id = gen.next_id();
                // Program order is completion order within one thread
                uint64_t delta = decode_id(id).timestamp_delta;
                if (delta < last_delta || (!ids.empty() && id <= ids.back())) {
                    ordered = false;
                }
                last_delta = delta;
                ids.push_back(id);
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }

    double elapsed = seconds_since(start);

    std::vector<uint64_t> all;
    all.reserve(static_cast<size_t>(threads_count) * kIdsPerThread);
    for (auto& ids : per_thread) {
        all.insert(all.end(), ids.begin(), ids.end());
        std::vector<uint64_t>().swap(ids);
    }

    REQUIRE(ordered);
    REQUIRE(all.size() == static_cast<size_t>(threads_count) * kIdsPerThread);

    std::sort(all.begin(), all.end());
    REQUIRE(std::unique(all.begin(), all.end()) == all.end());

    std::cout << "Generated " << all.size() << " unique IDs concurrently in "
              << elapsed << " seconds." << std::endl;
}

TEST_CASE("Every concurrent ID decodes to the generator's configuration", "[snowflake][concurrency]") {
    Snowflake gen(31, 0);
    const unsigned threads_count = std::min(4u, num_threads());
    std::atomic<int> mismatches{0};

    std::vector<std::thread> threads;
    for (unsigned t = 0; t < threads_count; ++t) {
        threads.emplace_back([&gen, &mismatches] {
            for (int j = 0; j < 100000; ++j) {
                SnowflakeFields f = decode_id(gen.next_id());
                if (f.data_center_id != 31 || f.machine_id != 0) {
                    ++mismatches;
                }
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }

    REQUIRE(mismatches.load() == 0);
}
