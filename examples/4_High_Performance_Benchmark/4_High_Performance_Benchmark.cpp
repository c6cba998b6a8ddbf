/*
 * EXAMPLE 4: High Performance Benchmark & Overflow Handling
 *
 * Demonstrates:
 * 1. Generating UUIDs in a tight loop.
 * 2. Throughput measurement (UUIDs per second).
 * 3. Handling counter overflow in the caller by retrying on the next tick.
 */

#include <stdio.h>

#include <chrono>

#include "UUIDKit.h"

static uint64_t xorshift_state = 0x9E3779B97F4A7C15ULL;

// Benchmark-only filler, not suitable for real identifiers.
static void fast_rng(uint8_t* dest, size_t len, void*) {
    for (size_t i = 0; i < len; i++) {
        xorshift_state ^= xorshift_state << 13;
        xorshift_state ^= xorshift_state >> 7;
        xorshift_state ^= xorshift_state << 17;
        dest[i] = (uint8_t)(xorshift_state >> 56);
    }
}

static void run_benchmark(UUID7Clock& gen, const char* name) {
    printf("Benchmarking: %s\n", name);

    using namespace std::chrono;
    steady_clock::time_point start = steady_clock::now();
    uint32_t count = 0;
    uint32_t failed = 0;
    UUID128 u;

    while (steady_clock::now() - start < seconds(1)) {
        if (gen.generate(u)) {
            count++;
        } else {
            failed++;
        }
    }

    printf("Result: %u UUIDs/sec (%u failed)\n", count, failed);
    if (count > 0) printf("Time per UUID: %.3f us\n", 1000000.0 / count);
    printf("-----------------------------\n");
}

static void run_sequence_benchmark() {
    printf("Benchmarking: UUID4Sequence\n");

    using namespace std::chrono;
    UUID4Sequence seq(1);
    const uint32_t N = 1000000;
    unsigned sink = 0;

    steady_clock::time_point start = steady_clock::now();
    for (uint32_t i = 0; i < N; i++) sink ^= seq.next().data()[15];
    double us = duration_cast<duration<double, std::micro> >(steady_clock::now() - start).count();

    printf("Result: %u UUIDs in %.0f us (sink %u)\n", N, us, sink);
    printf("-----------------------------\n");
}

int main() {
    printf("--- UUIDKit Performance Benchmark ---\n");

    UUID7Clock gen(fast_rng);

    // If the 62-bit counter overflows within one clock tick, generate() returns
    // false. Counting failures here is the caller's retry decision.
    run_benchmark(gen, "UUID7Clock");

    run_sequence_benchmark();
    return 0;
}
