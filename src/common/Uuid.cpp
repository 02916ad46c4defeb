#include "traceproxy/common/Uuid.h"

#include <openssl/err.h>
#include <openssl/rand.h>

#include <stdexcept>

namespace traceproxy {
namespace common {

std::string GenerateUuidV4() {
    unsigned char b[16];
    if (RAND_bytes(b, sizeof b) != 1) {
        char err[256];
        ERR_error_string_n(ERR_get_error(), err, sizeof err);
        throw std::runtime_error(std::string("RAND_bytes failed: ") + err);
    }
    b[6] = static_cast<unsigned char>((b[6] & 0x0F) | 0x40);
    b[8] = static_cast<unsigned char>((b[8] & 0x3F) | 0x80);

    static const char kHex[] = "0123456789abcdef";
    std::string out;
    out.reserve(36);
    for (int i = 0; i < 16; ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) out.push_back('-');
        out.push_back(kHex[b[i] >> 4]);
        out.push_back(kHex[b[i] & 0x0F]);
    }
    return out;
}

} // namespace common
} // namespace traceproxy
