/*
 * EXAMPLE 3: Custom Entropy Strategy (Dependency Injection)
 *
 * PROBLEM:
 * UUIDKit never picks a random source for you. v4 and v7 values expose
 * most of their random input literally, so the source decides whether the
 * result is guessable.
 *
 * SOLUTION:
 * Inject a CSPRNG (here OpenSSL RAND_bytes) wherever randomness is needed.
 * UUID4Sequence is fine for test data but predictable.
 */

#include <stdio.h>
#include <string.h>

#include <openssl/rand.h>

#include "UUIDKit.h"

// --- CUSTOM RNG IMPLEMENTATION ---
// Must fill 'dest' with 'len' random bytes. On failure leave zeros so the
// generator's health check rejects the draw.
static void openssl_rng(uint8_t* dest, size_t len, void* ctx) {
    (void)ctx;
    if (RAND_bytes(dest, (int)len) != 1) {
        memset(dest, 0, len);
    }
}

int main() {
    printf("--- Custom Entropy ---\n");

    // v4 from caller-provided bytes
    uint8_t random[16];
    openssl_rng(random, sizeof(random), nullptr);
    UUID128 u4;
    if (UUIDGen::v4(random, sizeof(random), u4)) {
        printf("v4 (CSPRNG):    %s\n", u4.toString().c_str());
    } else {
        printf("Error: insufficient randomness\n");
        return 1;
    }

    // v7 from the system clock, randomness injected via constructor
    UUID7Clock clock(openssl_rng);
    UUID128 u7;
    if (clock.generate(u7)) {
        printf("v7 (CSPRNG):    %s\n", u7.toString().c_str());
    } else {
        printf("Error: RNG health check failed\n");
        return 1;
    }

    // Reproducible sequence: same seed, same UUIDs
    UUID4Sequence seq(2024);
    for (int i = 0; i < 3; i++) {
        printf("v4 (seed 2024): %s\n", seq.next().toString().c_str());
    }
    return 0;
}
