// PairingHandler.h — Реакция на _adb-tls-pairing анонсы: adb pair с кодом сессии

#pragma once

#include "../export.h"
#include "../Models.h"
#include "../Config.h"
#include "../Adb/AdbTool.h"
#include "CancellationToken.h"
#include "ConnectHandler.h"
#include "Discovery.h"
#include <string>
#include <memory>
#include <functional>

namespace Adbee {

class ADBEE_API PairingHandler {
public:
    /// @param address IP телефона без порта
    using PairedCallback = std::function<void(const std::string& address)>;

    /// @param pairingCode Код текущей сессии, передаётся в adb как есть
    /// @param connectHandler Для opportunistic подключения после pairing (может быть nullptr)
    PairingHandler(std::shared_ptr<AdbTool> tool,
                   std::string pairingCode,
                   const AdbeeConfig& config,
                   ServiceResolver resolver,
                   PairedCallback onPaired,
                   std::shared_ptr<ConnectHandler> connectHandler,
                   std::shared_ptr<CancellationToken> token = nullptr);

    // Запрет копирования
    PairingHandler(const PairingHandler&) = delete;
    PairingHandler& operator=(const PairingHandler&) = delete;

    /// Событие браузера pairing-сервиса. Реагирует только на added.
    void handleEvent(const ServiceEvent& event);

    /// Один вызов adb pair. Повторов нет.
    /// @return true если устройство сопряжено
    bool handleAnnouncement(const ServiceAnnouncement& announcement);

    const std::string& pairingCode() const { return m_pairingCode; }

private:
    std::shared_ptr<AdbTool> m_tool;
    const std::string m_pairingCode;
    const std::chrono::milliseconds m_pairTimeout;
    ServiceResolver m_resolver;
    PairedCallback m_onPaired;
    std::shared_ptr<ConnectHandler> m_connectHandler;
    std::shared_ptr<CancellationToken> m_token;
};

} // namespace Adbee
