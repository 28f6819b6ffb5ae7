// Credentials.h — Генерация учётных данных для QR pairing
// Формат QR: WIFI:T:ADB;S:<serviceName>;P:<pairingCode>;;

#pragma once

#include "export.h"
#include "Models.h"
#include <string>
#include <vector>
#include <cstdint>

namespace Adbee {

// ═══════════════════════════════════════════════════════════
// Константы
// ═══════════════════════════════════════════════════════════

constexpr size_t PAIRING_CODE_LENGTH = 6;
constexpr uint32_t PAIRING_CODE_MIN = 100000;
constexpr uint32_t PAIRING_CODE_MAX = 999999;

// ═══════════════════════════════════════════════════════════
// Генерация
// ═══════════════════════════════════════════════════════════

/// Создать новую сессию: фиксированное имя сервиса + случайный код
/// Каждый вызов даёт независимую сессию (isActive = false)
ADBEE_API PairingSession generateCredentials(const std::string& serviceName = DEFAULT_SERVICE_NAME);

/// Строка для QR-кода, который сканирует телефон
ADBEE_API std::string qrPayload(const PairingSession& session);

/// Корректен ли код: ровно 6 ASCII цифр в диапазоне [100000, 999999]
ADBEE_API bool isValidPairingCode(const std::string& code);

namespace Crypto {

/// Криптографически стойкие случайные байты (OpenSSL RAND_bytes)
/// @throws std::runtime_error если RAND_bytes не смог
ADBEE_API std::vector<uint8_t> randomBytes(size_t count);

/// Равномерное число в [minValue, maxValue] без modulo bias
ADBEE_API uint32_t randomUniform(uint32_t minValue, uint32_t maxValue);

/// Случайный 6-значный код pairing
ADBEE_API std::string generatePairingCode();

} // namespace Crypto

} // namespace Adbee
