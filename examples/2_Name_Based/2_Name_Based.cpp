/*
 * EXAMPLE 2: Name-Based UUIDs (v3 / v5)
 *
 * The same namespace and name always give the same UUID, which makes these
 * suitable as stable keys derived from existing identifiers (hostnames,
 * URLs, OIDs, X.500 DNs).
 *
 * Prefer v5 (SHA-1) for new data; v3 (MD5) exists for compatibility.
 */

#include <stdio.h>

#include <stdexcept>

#include "UUIDKit.h"

static void show(const char* label, const UUID128& ns, const char* name) {
    UUID128 u3 = UUIDGen::v3(ns, name);
    UUID128 u5 = UUIDGen::v5(ns, name);
    printf("%-5s %-28s v3=%s v5=%s\n", label, name, u3.toString().c_str(), u5.toString().c_str());
}

int main() {
    printf("--- Name-Based UUIDs ---\n");

    try {
        show("DNS", UUID128::nsDNS(), "www.example.com");
        show("URL", UUID128::nsURL(), "https://example.org/");
        show("OID", UUID128::nsOID(), "1.3.6.1.4.1");
        show("X500", UUID128::nsX500(), "cn=John Doe");

        // A UUID can itself serve as the namespace of a sub-tree.
        UUID128 app = UUIDGen::v5(UUID128::nsURL(), "https://example.org/app");
        printf("user 42 in app namespace: %s\n", UUIDGen::v5(app, "user/42").toString().c_str());
    } catch (const std::runtime_error& e) {
        // Only raised when the crypto provider cannot supply the digest.
        printf("Error: %s\n", e.what());
        return 1;
    }
    return 0;
}
