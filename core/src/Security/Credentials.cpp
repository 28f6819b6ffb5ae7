// Credentials.cpp — Pairing код и QR payload
// Криптография через OpenSSL

#include "adbee/Credentials.h"
#include <spdlog/spdlog.h>
#include <openssl/rand.h>
#include <stdexcept>
#include <limits>

namespace Adbee {

// ═══════════════════════════════════════════════════════════
// Crypto namespace implementation
// ═══════════════════════════════════════════════════════════

namespace Crypto {

std::vector<uint8_t> randomBytes(size_t count) {
    std::vector<uint8_t> result(count);
    if (count == 0) return result;
    if (RAND_bytes(result.data(), static_cast<int>(count)) != 1) {
        spdlog::error("Crypto::randomBytes: RAND_bytes failed");
        throw std::runtime_error("Failed to generate random bytes");
    }
    return result;
}

uint32_t randomUniform(uint32_t minValue, uint32_t maxValue) {
    if (minValue > maxValue) {
        throw std::invalid_argument("randomUniform: minValue > maxValue");
    }

    const uint64_t range = static_cast<uint64_t>(maxValue) - minValue + 1;
    // Отбрасываем хвост, который не делится на range
    const uint64_t space = static_cast<uint64_t>(std::numeric_limits<uint32_t>::max()) + 1;
    const uint64_t limit = space - (space % range);

    while (true) {
        auto bytes = randomBytes(4);
        uint64_t value = 0;
        for (int i = 0; i < 4; i++) {
            value = (value << 8) | bytes[i];
        }
        if (value < limit) {
            return minValue + static_cast<uint32_t>(value % range);
        }
    }
}

std::string generatePairingCode() {
    return std::to_string(randomUniform(PAIRING_CODE_MIN, PAIRING_CODE_MAX));
}

} // namespace Crypto

// ═══════════════════════════════════════════════════════════
// Credentials
// ═══════════════════════════════════════════════════════════

PairingSession generateCredentials(const std::string& serviceName) {
    PairingSession session;
    session.serviceName = serviceName;
    session.pairingCode = Crypto::generatePairingCode();
    session.isActive = false;
    return session;
}

bool isValidPairingCode(const std::string& code) {
    if (code.size() != PAIRING_CODE_LENGTH) return false;
    for (char c : code) {
        if (c < '0' || c > '9') return false;
    }
    auto value = std::stoul(code);
    return value >= PAIRING_CODE_MIN && value <= PAIRING_CODE_MAX;
}

static std::string escapeQrField(const std::string& value) {
    std::string result;
    result.reserve(value.size());
    for (char c : value) {
        if (c == '\\' || c == ';' || c == ',' || c == ':' || c == '"') {
            result.push_back('\\');
        }
        result.push_back(c);
    }
    return result;
}

std::string qrPayload(const PairingSession& session) {
    return "WIFI:T:ADB;S:" + escapeQrField(session.serviceName) +
           ";P:" + escapeQrField(session.pairingCode) + ";;";
}

} // namespace Adbee
