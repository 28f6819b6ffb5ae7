// ConnectHandler.h — Реакция на _adb-tls-connect анонсы: adb connect с повторами

#pragma once

#include "../export.h"
#include "../Models.h"
#include "../Config.h"
#include "../Adb/AdbTool.h"
#include "CancellationToken.h"
#include "Discovery.h"
#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <optional>

namespace Adbee {

// ═══════════════════════════════════════════════════════════
// ConnectHandler — один экземпляр на сессию discovery
// ═══════════════════════════════════════════════════════════

class ADBEE_API ConnectHandler {
public:
    /// @param endpointKey "ip:port" подключённого устройства
    using ConnectedCallback = std::function<void(const std::string& endpointKey)>;

    ConnectHandler(std::shared_ptr<AdbTool> tool,
                   const AdbeeConfig& config,
                   ServiceResolver resolver,
                   ConnectedCallback onConnected,
                   std::shared_ptr<CancellationToken> token = nullptr);
    ~ConnectHandler();

    // Запрет копирования
    ConnectHandler(const ConnectHandler&) = delete;
    ConnectHandler& operator=(const ConnectHandler&) = delete;

    /// Событие браузера connect-сервиса (added / removed / updated)
    void handleEvent(const ServiceEvent& event);

    /// Уже разрезолвленный анонс (шаги 2-6 без резолва)
    /// @return true если подключились в этом вызове
    bool handleAnnouncement(const ServiceAnnouncement& announcement);

    /// Немедленная попытка по последнему увиденному endpoint (после pairing)
    /// Задержка между попытками — opportunisticRetryDelay
    /// @return true если подключились; false если endpoint неизвестен или не вышло
    bool connectOpportunistic();

    /// Последний увиденный connect endpoint
    std::optional<Endpoint> getLastSeenEndpoint() const;

    /// Подключённые в этой сессии endpoints ("ip:port")
    std::vector<std::string> getConnectedEndpoints() const;

    bool isConnected(const std::string& endpointKey) const;

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace Adbee
