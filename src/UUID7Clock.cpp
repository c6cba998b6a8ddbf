#include "UUID7Clock.h"

#include <chrono>

#include "UUIDGen.h"

static const uint64_t RAND_B_MASK = 0x3FFFFFFFFFFFFFFFULL;

static inline uint64_t load_be64(const uint8_t* src) {
    uint64_t v = 0;
    for (int i = 0; i < 8; i++) v = (v << 8) | src[i];
    return v;
}

UUID7Clock::UUID7Clock(fill_random_fn rng, void* rng_ctx, now_ns_fn now, void* now_ctx) noexcept
    : _rng(rng), _rng_ctx(rng_ctx), _now(now), _now_ctx(now_ctx),
      _initialized(false), _last_tick(0), _last_rand_b(0)
{
}

uint64_t UUID7Clock::default_now_ns(void* ctx) noexcept {
    (void)ctx;
    using namespace std::chrono;
    auto ns = duration_cast<nanoseconds>(system_clock::now().time_since_epoch()).count();
    return ns > 0 ? (uint64_t)ns : 0;
}

bool UUID7Clock::generate(UUID128& out) {
    if (!_rng) return false;
    now_ns_fn now_func = _now ? _now : &UUID7Clock::default_now_ns;

    // Draw outside the lock, only the clock read and state update are
    // serialised.
    uint8_t temp_rand[16];
    _rng(temp_rand, sizeof(temp_rand), _rng_ctx);

    uint8_t sum = 0;
    for (size_t i = 0; i < sizeof(temp_rand); i++) sum |= temp_rand[i];
    if (sum == 0) return false;

    std::lock_guard<std::mutex> lock(_mutex);
    uint64_t now_ns = now_func(_now_ctx);
    if (now_ns == 0) return false;

    uint64_t now_ms = now_ns / 1000000ULL;

    if (_initialized && now_ms + UUIDKIT_REGRESSION_THRESHOLD_MS < (_last_tick >> 12)) {
        return UUIDGen::v4(temp_rand, sizeof(temp_rand), out);
    }

    uint64_t tick = ((now_ms & 0x0000FFFFFFFFFFFFULL) << 12) | UUIDGen::subMillisecond(now_ns);

    if (!_initialized || tick > _last_tick) {
        _initialized = true;
        _last_tick = tick;
        _last_rand_b = load_be64(temp_rand + 8) & RAND_B_MASK;
        out = UUIDGen::v7(_last_tick >> 12, (uint16_t)(_last_tick & 0x0FFF), _last_rand_b);
        return true;
    }

    // Same tick or small regression: stay on the last timestamp.
    if (_last_rand_b == RAND_B_MASK) return false;

    _last_rand_b++;
    out = UUIDGen::v7(_last_tick >> 12, (uint16_t)(_last_tick & 0x0FFF), _last_rand_b);
    return true;
}
