// Config.h — Настройки ADBee (JSON)

#pragma once

#include "export.h"
#include "Models.h"
#include <string>
#include <chrono>

namespace Adbee {

// ═══════════════════════════════════════════════════════════
// Значения по умолчанию
// ═══════════════════════════════════════════════════════════

constexpr int DEFAULT_PAIR_TIMEOUT_MS = 30000;          // adb pair
constexpr int DEFAULT_CONNECT_TIMEOUT_MS = 5000;        // adb connect, на попытку
constexpr int DEFAULT_RESOLVE_TIMEOUT_MS = 3000;        // DNS-SD resolve
constexpr int DEFAULT_CONNECT_ATTEMPTS = 3;
constexpr int DEFAULT_RETRY_DELAY_MS = 2000;
constexpr int DEFAULT_OPPORTUNISTIC_RETRY_DELAY_MS = 1000;

// ═══════════════════════════════════════════════════════════
// AdbeeConfig
// ═══════════════════════════════════════════════════════════

struct ADBEE_API AdbeeConfig {
    std::string adbPath = "adb";                        // Имя в PATH или абсолютный путь
    std::string serviceName = DEFAULT_SERVICE_NAME;
    std::string pairingServiceType = PAIRING_SERVICE_TYPE;
    std::string connectServiceType = CONNECT_SERVICE_TYPE;

    std::chrono::milliseconds pairTimeout{DEFAULT_PAIR_TIMEOUT_MS};
    std::chrono::milliseconds connectTimeout{DEFAULT_CONNECT_TIMEOUT_MS};
    std::chrono::milliseconds resolveTimeout{DEFAULT_RESOLVE_TIMEOUT_MS};
    int connectAttempts = DEFAULT_CONNECT_ATTEMPTS;
    std::chrono::milliseconds retryDelay{DEFAULT_RETRY_DELAY_MS};
    std::chrono::milliseconds opportunisticRetryDelay{DEFAULT_OPPORTUNISTIC_RETRY_DELAY_MS};

    /// Забывать подключённый endpoint, когда его connect-сервис пропадает
    /// false = устройство, отключившееся и появившееся снова, не переподключается
    bool reconnectOnReappearance = false;

    std::string logLevel = "info";

    /// Парсинг из JSON. Отсутствующие ключи берут значения по умолчанию.
    /// @throws std::runtime_error при невалидном JSON или значениях
    static AdbeeConfig fromJson(const std::string& jsonText);

    /// Загрузка из файла
    /// @throws std::runtime_error если файл не читается или невалиден
    static AdbeeConfig fromFile(const std::string& path);

    std::string toJson() const;

    /// Проверить значения
    /// @throws std::runtime_error с описанием первого невалидного поля
    void validate() const;

    /// Применить logLevel к spdlog
    void applyLogLevel() const;
};

} // namespace Adbee
