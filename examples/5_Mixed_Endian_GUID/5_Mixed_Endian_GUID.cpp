/*
 * EXAMPLE 5: Mixed-Endian (UEFI / Microsoft GUID) Encoding
 *
 * GPT partition tables, UEFI variables and Windows GUID structs store the
 * first three fields little-endian. Decode those bytes with
 * fromMixedEndianBytes, never with fromBytes.
 */

#include <stdio.h>

#include "UUIDKit.h"

static void dump(const char* label, const uint8_t* b) {
    printf("%-10s", label);
    for (int i = 0; i < 16; i++) printf("%02x%s", b[i], (i == 3 || i == 5 || i == 7 || i == 9) ? " " : "");
    printf("\n");
}

int main() {
    printf("--- Mixed-Endian GUID ---\n");

    // EFI System Partition type GUID as stored on disk.
    static const uint8_t on_disk[16] = {
        0x28, 0x73, 0x2a, 0xc1, 0x1f, 0xf8, 0xd2, 0x11,
        0xba, 0x4b, 0x00, 0xa0, 0xc9, 0x3e, 0xc9, 0x3b
    };

    UUID128 esp;
    if (!UUID128::fromMixedEndianBytes(on_disk, sizeof(on_disk), esp)) {
        printf("Error: short buffer\n");
        return 1;
    }
    printf("ESP type GUID: %s\n", esp.toString().c_str());

    uint8_t standard[16];
    uint8_t mixed[16];
    esp.toBytes(standard);
    esp.toMixedEndianBytes(mixed);
    dump("standard", standard);
    dump("mixed", mixed);

    // Decoding the disk bytes as standard gives a different UUID.
    UUID128 wrong;
    if (UUID128::fromBytes(on_disk, sizeof(on_disk), wrong)) {
        printf("misread:       %s\n", wrong.toString().c_str());
    }
    return 0;
}
