#include "state/identity.hpp"

#include "log/log.hpp"

#include <array>
#include <atomic>
#include <cstdint>
#include <openssl/err.h>
#include <openssl/rand.h>

namespace argrun::state {

namespace {

std::atomic<uint64_t> fallback_counter{0};
std::atomic<bool> fallback_warned{false};

std::string format_uuid(const std::array<unsigned char, 16>& bytes) {
    static constexpr char HEX[] = "0123456789abcdef";
    std::string out;
    out.reserve(36);
    for (size_t i = 0; i < bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            out.push_back('-');
        }
        out.push_back(HEX[bytes[i] >> 4]);
        out.push_back(HEX[bytes[i] & 0x0F]);
    }
    return out;
}

} // namespace

std::string new_identity() {
    std::array<unsigned char, 16> bytes{};
    if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
        unsigned long err = ERR_get_error();
        if (!fallback_warned.exchange(true)) {
            char buf[256];
            ERR_error_string_n(err, buf, sizeof(buf));
            ARGRUN_LOG_WARN("state", "RAND_bytes failed (" << buf
                                                          << "), using counter identities");
        }
        return "local-" + std::to_string(fallback_counter.fetch_add(1) + 1);
    }

    bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0F) | 0x40); // version 4
    bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3F) | 0x80); // RFC 4122 variant
    return format_uuid(bytes);
}

} // namespace argrun::state
