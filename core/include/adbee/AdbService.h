// AdbService.h — Оркестратор беспроводного pairing
// Высокоуровневый API для UI: учётные данные, запуск/остановка discovery, hooks

#pragma once

#include "export.h"
#include "Models.h"
#include "Config.h"
#include "Network/Discovery.h"
#include "Process/ProcessRunner.h"
#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <optional>

namespace Adbee {

// ═══════════════════════════════════════════════════════════
// AdbService — одна pairing сессия за раз
// ═══════════════════════════════════════════════════════════

class ADBEE_API AdbService {
public:
    /// Hooks вызываются из рабочих потоков, никогда для отменённой сессии.
    /// Из hook можно уничтожить сам сервис.
    struct Callbacks {
        std::function<void(const std::string& address)> onPaired;       // IP без порта
        std::function<void(const std::string& endpoint)> onConnected;   // "ip:port"
    };

    /// @param config Настройки (проверяются, std::runtime_error при ошибке)
    /// @param discoveryFactory Новый IServiceDiscovery на каждый start()
    /// @param runner Исполнитель adb; nullptr = PosixProcessRunner
    AdbService(AdbeeConfig config,
               Callbacks callbacks,
               DiscoveryFactory discoveryFactory,
               std::shared_ptr<IProcessRunner> runner = nullptr);
    ~AdbService();

    // Запрет копирования
    AdbService(const AdbService&) = delete;
    AdbService& operator=(const AdbService&) = delete;

    // ═══════════════════════════════════════════════════════════
    // Lifecycle
    // ═══════════════════════════════════════════════════════════

    /// Новые serviceName + pairingCode. Работающая сессия останавливается.
    /// Discovery не запускает.
    PairingSession generateCredentials();

    /// Запустить discovery с текущими учётными данными
    /// Если работает — сначала stop(). Если данных нет — генерирует.
    /// @return false если adb не найден или DNS-SD недоступен (см. getLastError)
    bool start();

    /// Остановить discovery. Не ждёт выполняющихся adb команд. Идемпотентен.
    void stop();

    ServiceState getState() const;
    bool isRunning() const;

    // ═══════════════════════════════════════════════════════════
    // Info
    // ═══════════════════════════════════════════════════════════

    /// Текущие учётные данные (nullopt до первой генерации)
    std::optional<PairingSession> getSession() const;

    /// Подключённые в текущей сессии endpoints; пусто в Idle
    std::vector<std::string> getConnectedEndpoints() const;

    /// Причина последнего неудачного start()
    std::string getLastError() const;
    AdbError getLastErrorKind() const;

    const AdbeeConfig& getConfig() const;

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace Adbee
