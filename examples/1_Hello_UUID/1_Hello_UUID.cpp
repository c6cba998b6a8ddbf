/*
 * EXAMPLE 1: Hello UUID (Basics)
 *
 * Demonstrates:
 * 1. Building a UUID v7 from explicit timestamp and random fields.
 * 2. Text conversion and parsing.
 * 3. Raw byte access.
 * 4. Comparison operators and the fixed constants.
 */

#include <stdio.h>

#include "UUIDKit.h"

int main() {
    printf("--- UUIDKit %s Basics ---\n", UUIDKIT_LIB_VERSION);

    // 1. GENERATION
    // v7 packs 48 bits of Unix milliseconds ahead of the random fields, so
    // values sort by creation time.
    UUID128 first = UUIDGen::v7(1700000000000ULL, 0x123, 0x0123456789ABCDEFULL);
    UUID128 second = UUIDGen::v7(1700000000001ULL, 0x000, 0x0000000000000000ULL);

    // 2. CONVERSION TO STRING
    // Buffer must be >= 37 bytes (36 chars + null terminator).
    char uuidStr[37];
    first.toString(uuidStr, sizeof(uuidStr));
    printf("Generated UUID: %s\n", uuidStr);
    printf("Uppercase:      %s\n", first.toString(true).c_str());

    // 3. ACCESSING RAW BYTES
    const uint8_t* raw = first.data();
    printf("Raw Bytes:      ");
    for (int i = 0; i < 16; i++) printf("%02x", raw[i]);
    printf("\n");
    printf("Version %u, variant %u\n", (unsigned)first.version(), (unsigned)first.variant());

    // 4. PARSING BACK
    // Parse failures leave the destination untouched and return false.
    UUID128 parsed;
    if (UUID128::parseFromString(uuidStr, parsed) && parsed == first) {
        printf("Parsing: OK\n");
    } else {
        printf("Parsing: FAILED\n");
        return 1;
    }

    if (!UUID128::parseFromString("not-a-uuid", parsed)) {
        printf("Rejected malformed input\n");
    }

    // 5. ORDERING
    printf("first < second: %s\n", first < second ? "yes" : "no");
    printf("nil < max:      %s\n", UUID128::nil() < UUID128::max() ? "yes" : "no");
    return 0;
}
