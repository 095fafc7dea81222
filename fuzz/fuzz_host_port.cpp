// Fuzz target for endpoint parsing
// Tests ParseHostPort, FormatHostPort, ValidateAndNormalizeIP and ParsePort
//
// Endpoints come from the command line, the config file and the /connect
// command. A parser bug would dial the wrong peer or register one peer under
// two keys.
//
// Target code:
// - src/util/netaddress.cpp

#include "util/netaddress.hpp"
#include <cstdint>
#include <cstddef>
#include <string>

using namespace peerlink::util;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    if (size < 1) return 0;

    uint8_t mode = data[0];
    std::string input(reinterpret_cast<const char*>(data + 1), size - 1);

    // TEST 1: accepted endpoints survive a format/parse round trip
    if ((mode & 0x03) == 0) {
        std::string host;
        uint16_t port = 0;
        if (ParseHostPort(input, host, port)) {
            if (host.empty()) {
                __builtin_trap();
            }
            std::string host2;
            uint16_t port2 = 0;
            if (!ParseHostPort(FormatHostPort(host, port), host2, port2)) {
                __builtin_trap();
            }
            if (host != host2 || port != port2) {
                __builtin_trap();
            }
        }
    }

    // TEST 2: normalization is idempotent and agrees with IsValidIPAddress
    if ((mode & 0x03) == 1) {
        auto normalized = ValidateAndNormalizeIP(input);
        if (normalized.has_value() != IsValidIPAddress(input)) {
            __builtin_trap();
        }
        if (normalized) {
            auto again = ValidateAndNormalizeIP(*normalized);
            if (!again || *again != *normalized) {
                __builtin_trap();
            }
            // Self classification must not depend on the spelling
            if (IsSelfAddress(input) != IsSelfAddress(*normalized)) {
                __builtin_trap();
            }
        }
    }

    // TEST 3: ParsePort only accepts plain decimal digits
    if ((mode & 0x03) == 2) {
        auto port = ParsePort(input);
        if (port) {
            if (input.empty() || input.size() > 5) {
                __builtin_trap();
            }
            for (char c : input) {
                if (c < '0' || c > '9') {
                    __builtin_trap();
                }
            }
        }
    }

    // TEST 4: unbracketed IPv6 is always rejected
    if ((mode & 0x03) == 3) {
        auto normalized = ValidateAndNormalizeIP(input);
        if (normalized && normalized->find(':') != std::string::npos) {
            std::string host;
            uint16_t port = 0;
            if (ParseHostPort(*normalized + ":9590", host, port)) {
                __builtin_trap();
            }
        }
    }

    return 0;
}
