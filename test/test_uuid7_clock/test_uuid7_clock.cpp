#include <unity.h>
#include <string.h>

#include <algorithm>
#include <mutex>
#include <thread>
#include <vector>

#include "UUIDKit.h"

void setUp(void) {}
void tearDown(void) {}

static const uint64_t NS_PER_MS = 1000000ULL;

// Mock time, in milliseconds plus a nanosecond offset
static uint64_t mock_time_ms = 1000;
static uint64_t mock_time_sub_ns = 0;
static uint64_t mock_now_ns(void*) { return mock_time_ms * NS_PER_MS + mock_time_sub_ns; }

// Deterministic vectors
static uint8_t mock_rng_val = 0;
static void deterministic_rng(uint8_t* dest, size_t len, void*) {
    for (size_t i = 0; i < len; i++) dest[i] = mock_rng_val++;
}

static void failing_rng(uint8_t* dest, size_t len, void*) {
    memset(dest, 0, len);
}

static void overflow_rng(uint8_t* dest, size_t len, void*) {
    memset(dest, 0xFF, len);
}

static uint64_t read_ts_ms(const UUID128& u) {
    uint64_t ts = 0;
    for (int i = 0; i < 6; i++) ts = (ts << 8) | u.data()[i];
    return ts;
}

// --- TEST CASES ---

void test_version_and_variant() {
    mock_time_ms = 1000;
    mock_time_sub_ns = 0;
    UUID7Clock g(deterministic_rng, nullptr, mock_now_ns, nullptr);
    UUID128 u;
    TEST_ASSERT_TRUE(g.generate(u));
    TEST_ASSERT_EQUAL_UINT8(7, u.version());
    TEST_ASSERT_EQUAL_UINT8(2, u.variant());
    TEST_ASSERT_TRUE(read_ts_ms(u) == 1000);
}

void test_requires_rng() {
    UUID7Clock g(nullptr);
    UUID128 u = UUID128::max();
    TEST_ASSERT_FALSE(g.generate(u));
    TEST_ASSERT_TRUE(u == UUID128::max());
}

void test_deterministic_vectors() {
    mock_rng_val = 0;
    mock_time_ms = 0x01856E83F300ULL;
    mock_time_sub_ns = 0;

    UUID7Clock g(deterministic_rng, nullptr, mock_now_ns, nullptr);
    UUID128 u;
    TEST_ASSERT_TRUE(g.generate(u));
    TEST_ASSERT_EQUAL_STRING("01856e83-f300-7000-8809-0a0b0c0d0e0f", u.toString().c_str());
}

void test_sub_millisecond_precision() {
    mock_rng_val = 0;
    mock_time_ms = 0x01856E83F300ULL;
    mock_time_sub_ns = 500000;

    UUID7Clock g(deterministic_rng, nullptr, mock_now_ns, nullptr);
    UUID128 u;
    TEST_ASSERT_TRUE(g.generate(u));
    TEST_ASSERT_EQUAL_STRING("01856e83-f300-7800-8809-0a0b0c0d0e0f", u.toString().c_str());

    // 300ns later is a new tick: fresh randomness, still ordered.
    mock_time_sub_ns = 500300;
    UUID128 next;
    TEST_ASSERT_TRUE(g.generate(next));
    TEST_ASSERT_TRUE(u < next);
    TEST_ASSERT_EQUAL_UINT8(0x01, next.data()[7]);
}

void test_monotonicity() {
    mock_time_ms = 1000;
    mock_time_sub_ns = 0;
    mock_rng_val = 0;
    UUID7Clock g(deterministic_rng, nullptr, mock_now_ns, nullptr);

    UUID128 u1, u2;
    TEST_ASSERT_TRUE(g.generate(u1));
    TEST_ASSERT_TRUE(g.generate(u2));

    TEST_ASSERT_TRUE(u1 < u2);
    TEST_ASSERT_EQUAL_MEMORY(u1.data(), u2.data(), 8);
    // Same tick: rand_b incremented, 0x0F -> 0x10
    TEST_ASSERT_EQUAL_UINT8(0x10, u2.data()[15]);
}

void test_rng_health_check() {
    mock_time_ms = 1000;
    UUID7Clock g(failing_rng, nullptr, mock_now_ns, nullptr);
    UUID128 u;
    TEST_ASSERT_FALSE(g.generate(u));
}

void test_time_zero() {
    mock_time_ms = 0;
    mock_time_sub_ns = 0;
    UUID7Clock g(deterministic_rng, nullptr, mock_now_ns, nullptr);
    UUID128 u;
    TEST_ASSERT_FALSE(g.generate(u));
}

void test_small_clock_regression() {
    mock_time_ms = 10000;
    mock_time_sub_ns = 0;
    UUID7Clock g(deterministic_rng, nullptr, mock_now_ns, nullptr);

    UUID128 u1, u2;
    TEST_ASSERT_TRUE(g.generate(u1));
    TEST_ASSERT_TRUE(read_ts_ms(u1) == 10000);

    mock_time_ms = 5000; // Regression within threshold
    TEST_ASSERT_TRUE(g.generate(u2));
    TEST_ASSERT_TRUE(read_ts_ms(u2) == 10000); // Should stay at last_ts
    TEST_ASSERT_TRUE(u1 < u2);
}

void test_major_clock_regression_fallback() {
    mock_time_ms = 20000;
    mock_time_sub_ns = 0;
    UUID7Clock g(deterministic_rng, nullptr, mock_now_ns, nullptr);

    UUID128 u;
    TEST_ASSERT_TRUE(g.generate(u));
    TEST_ASSERT_EQUAL_UINT8(7, u.version());

    mock_time_ms = 20000 - UUIDKIT_REGRESSION_THRESHOLD_MS - 1;
    TEST_ASSERT_TRUE(g.generate(u));
    TEST_ASSERT_EQUAL_UINT8(4, u.version());
    TEST_ASSERT_EQUAL_UINT8(2, u.variant());

    // Exactly at the threshold is still a small regression.
    mock_time_ms = 20000 - UUIDKIT_REGRESSION_THRESHOLD_MS;
    TEST_ASSERT_TRUE(g.generate(u));
    TEST_ASSERT_EQUAL_UINT8(7, u.version());
    TEST_ASSERT_TRUE(read_ts_ms(u) == 20000);
}

void test_overflow_fail_fast() {
    mock_time_ms = 3000;
    mock_time_sub_ns = 0;
    UUID7Clock g(overflow_rng, nullptr, mock_now_ns, nullptr);

    UUID128 u;
    TEST_ASSERT_TRUE(g.generate(u));
    TEST_ASSERT_EQUAL_STRING("00000000-0bb8-7000-bfff-ffffffffffff", u.toString().c_str());

    UUID128 again = UUID128::nil();
    TEST_ASSERT_FALSE(g.generate(again));
    TEST_ASSERT_TRUE(again == UUID128::nil());

    // Next tick recovers.
    mock_time_ms = 3001;
    TEST_ASSERT_TRUE(g.generate(again));
    TEST_ASSERT_TRUE(u < again);
}

void test_overflow_frozen_clock_returns() {
    mock_time_ms = 5000;
    mock_time_sub_ns = 0;
    UUID7Clock g(overflow_rng, nullptr, mock_now_ns, nullptr);

    UUID128 u;
    TEST_ASSERT_TRUE(g.generate(u));

    // The clock never moves: every call reports overflow instead of spinning.
    for (int i = 0; i < 100; i++) {
        TEST_ASSERT_FALSE(g.generate(u));
    }

    // Inside the small-regression window the counter is still exhausted.
    mock_time_ms = 4000;
    TEST_ASSERT_FALSE(g.generate(u));

    mock_time_ms = 5001;
    TEST_ASSERT_TRUE(g.generate(u));
    TEST_ASSERT_TRUE(read_ts_ms(u) == 5001);
}

void test_counter_mask_preservation() {
    // rand_b one below its 62-bit maximum
    static uint8_t almost_full[16];
    memset(almost_full, 0xFF, 16);
    almost_full[8] = 0x3F;
    almost_full[15] = 0xFE;

    auto special_rng = [](uint8_t* dest, size_t len, void*) {
        memcpy(dest, almost_full, len);
    };

    mock_time_ms = 1000;
    mock_time_sub_ns = 0;
    UUID7Clock g(special_rng, nullptr, mock_now_ns, nullptr);

    UUID128 u;
    TEST_ASSERT_TRUE(g.generate(u));
    TEST_ASSERT_EQUAL_UINT8(0xBF, u.data()[8]);
    TEST_ASSERT_EQUAL_UINT8(0xFE, u.data()[15]);

    // Carry reaches the last counter value without touching version/variant.
    TEST_ASSERT_TRUE(g.generate(u));
    TEST_ASSERT_EQUAL_UINT8(7, u.version());
    TEST_ASSERT_EQUAL_UINT8(2, u.variant());
    TEST_ASSERT_EQUAL_UINT8(0xFF, u.data()[15]);

    TEST_ASSERT_FALSE(g.generate(u));
}

void test_default_clock_ordering() {
    mock_rng_val = 0;
    UUID7Clock g(deterministic_rng);

    TEST_ASSERT_TRUE(UUID7Clock::default_now_ns(nullptr) > 0);

    UUID128 prev;
    TEST_ASSERT_TRUE(g.generate(prev));
    // 2020-01-01T00:00:00Z
    TEST_ASSERT_TRUE(read_ts_ms(prev) > 1577836800000ULL);

    for (int i = 0; i < 1000; i++) {
        UUID128 cur;
        TEST_ASSERT_TRUE(g.generate(cur));
        TEST_ASSERT_TRUE(prev < cur);
        prev = cur;
    }
}

static void locked_rng(uint8_t* dest, size_t len, void* ctx) {
    std::lock_guard<std::mutex> lock(*(std::mutex*)ctx);
    deterministic_rng(dest, len, nullptr);
    // Keep the draw non-zero whatever the counter wrapped to.
    dest[0] |= 0x01;
}

void test_concurrent_generate_unique() {
    const int THREADS = 4;
    const int PER_THREAD = 5000;

    mock_rng_val = 0;
    std::mutex rng_mutex;
    UUID7Clock g(locked_rng, &rng_mutex);

    std::vector<std::vector<UUID128> > results(THREADS);
    std::vector<int> failures(THREADS, 0);
    std::vector<std::thread> workers;
    for (int t = 0; t < THREADS; t++) {
        workers.push_back(std::thread([&g, &results, &failures, t, PER_THREAD]() {
            results[t].reserve(PER_THREAD);
            for (int i = 0; i < PER_THREAD; i++) {
                UUID128 u;
                if (g.generate(u)) {
                    results[t].push_back(u);
                } else {
                    failures[t]++;
                }
            }
        }));
    }
    for (size_t t = 0; t < workers.size(); t++) workers[t].join();

    std::vector<UUID128> all;
    for (int t = 0; t < THREADS; t++) {
        TEST_ASSERT_EQUAL_INT(0, failures[t]);
        // Each thread sees its own values in strictly increasing order.
        for (size_t i = 1; i < results[t].size(); i++) {
            TEST_ASSERT_TRUE(results[t][i - 1] < results[t][i]);
        }
        all.insert(all.end(), results[t].begin(), results[t].end());
    }
    TEST_ASSERT_EQUAL_INT(THREADS * PER_THREAD, (int)all.size());

    std::sort(all.begin(), all.end());
    TEST_ASSERT_TRUE(std::adjacent_find(all.begin(), all.end()) == all.end());
}

// --- TEST RUNNER ---

int run_tests() {
    UNITY_BEGIN();
    RUN_TEST(test_version_and_variant);
    RUN_TEST(test_requires_rng);
    RUN_TEST(test_deterministic_vectors);
    RUN_TEST(test_sub_millisecond_precision);
    RUN_TEST(test_monotonicity);
    RUN_TEST(test_rng_health_check);
    RUN_TEST(test_time_zero);
    RUN_TEST(test_small_clock_regression);
    RUN_TEST(test_major_clock_regression_fallback);
    RUN_TEST(test_overflow_fail_fast);
    RUN_TEST(test_overflow_frozen_clock_returns);
    RUN_TEST(test_counter_mask_preservation);
    RUN_TEST(test_default_clock_ordering);
    RUN_TEST(test_concurrent_generate_unique);
    return UNITY_END();
}

int main(int argc, char **argv) {
    (void)argc; (void)argv;
    return run_tests();
}
