#pragma once

#include <stdint.h>
#include <stddef.h>

#include <mutex>

#include "UUID128.h"

#ifndef UUIDKIT_REGRESSION_THRESHOLD_MS
    #define UUIDKIT_REGRESSION_THRESHOLD_MS 10000
#endif

/**
 * Monotonic version 7 generator driven by a clock.
 *
 * Timestamps carry sub-millisecond precision (UUIDGen::v7ns layout). When
 * the clock does not advance between two calls the previous timestamp is
 * kept and the 62-bit rand_b field is incremented, so successive values
 * from one instance always compare strictly greater.
 */
class UUID7Clock {
public:
    typedef void (*fill_random_fn)(uint8_t* dest, size_t len, void* ctx);
    typedef uint64_t (*now_ns_fn)(void* ctx);

    /**
     * @brief Initialize generator with a random source and optional clock.
     * @param rng Random fill function. Required, generate() fails without it.
     * @param rng_ctx User context for RNG.
     * @param now Nanosecond Unix time function (nullptr for system clock).
     * @param now_ctx User context for time.
     */
    explicit UUID7Clock(fill_random_fn rng, void* rng_ctx = nullptr,
                        now_ns_fn now = nullptr, void* now_ctx = nullptr) noexcept;

    UUID7Clock(const UUID7Clock&) = delete;
    UUID7Clock& operator=(const UUID7Clock&) = delete;

    /**
     * @brief Generate the next UUID.
     *
     * A backward clock jump larger than UUIDKIT_REGRESSION_THRESHOLD_MS
     * produces a version 4 UUID for this call. The call never blocks: once
     * rand_b is exhausted within a tick it returns false until the clock
     * advances, and the caller decides whether to try again.
     *
     * @param out Destination, unchanged on failure.
     * @return false if no RNG is set, the RNG returned all zeros, the clock
     *         returned 0, or rand_b overflowed.
     */
    bool generate(UUID128& out);

    static uint64_t default_now_ns(void* ctx) noexcept;

private:
    fill_random_fn _rng;
    void* _rng_ctx;
    now_ns_fn _now;
    void* _now_ctx;

    std::mutex _mutex;

    // State for Monotonicity: (unix_ts_ms << 12 | rand_a) and rand_b of the
    // last value handed out.
    bool _initialized;
    uint64_t _last_tick;
    uint64_t _last_rand_b;
};
