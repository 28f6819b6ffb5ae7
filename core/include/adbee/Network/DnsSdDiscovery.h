// DnsSdDiscovery.h — IServiceDiscovery поверх dns_sd.h (mDNSResponder / Bonjour)

#pragma once

#include "Discovery.h"
#include <memory>

namespace Adbee {

class ADBEE_API DnsSdDiscovery : public IServiceDiscovery {
public:
    DnsSdDiscovery();
    ~DnsSdDiscovery() override;

    // Запрет копирования
    DnsSdDiscovery(const DnsSdDiscovery&) = delete;
    DnsSdDiscovery& operator=(const DnsSdDiscovery&) = delete;

    bool start(const std::string& pairingServiceType,
               const std::string& connectServiceType,
               ServiceEventCallback pairingListener,
               ServiceEventCallback connectListener) override;

    void stop() override;

    bool isRunning() const override;

    std::optional<ServiceAnnouncement> resolve(const ServiceEvent& event,
                                               std::chrono::milliseconds timeout) override;

    std::string getLastError() const override;

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

/// Фабрика для AdbService: новый экземпляр на каждую сессию
ADBEE_API DiscoveryFactory dnsSdDiscoveryFactory();

} // namespace Adbee
