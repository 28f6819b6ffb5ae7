// TestFakes.h — Подменные adb и DNS-SD для тестов обработчиков и AdbService

#pragma once

#include "adbee/Process/ProcessRunner.h"
#include "adbee/Network/Discovery.h"
#include "adbee/Models.h"
#include <algorithm>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace AdbeeTest {

using namespace Adbee;
using namespace std::chrono_literals;

// ═══════════════════════════════════════════════════════════
// Helpers
// ═══════════════════════════════════════════════════════════

/// Ждать выполнения условия (опрос каждые 5 мс)
template <typename Predicate>
bool waitUntil(Predicate predicate, std::chrono::milliseconds timeout = 3000ms) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) return true;
        std::this_thread::sleep_for(5ms);
    }
    return predicate();
}

inline ProcessResult exitedWith(int exitCode, std::string out, std::string err = "") {
    ProcessResult result;
    result.started = true;
    result.exitCode = exitCode;
    result.stdoutData = std::move(out);
    result.stderrData = std::move(err);
    return result;
}

inline ProcessResult timedOutResult() {
    ProcessResult result;
    result.started = true;
    result.timedOut = true;
    result.error = "timed out";
    return result;
}

inline ServiceAnnouncement makeAnnouncement(ServiceType type, const std::string& name,
                                            std::vector<std::string> addresses, uint16_t port) {
    ServiceAnnouncement announcement;
    announcement.serviceType = type;
    announcement.name = name;
    announcement.resolvedAddresses = std::move(addresses);
    announcement.port = port;
    announcement.hostTarget = name + ".local.";
    return announcement;
}

inline ServiceEvent makeEvent(ServiceType type, ServiceEventKind kind, const std::string& name) {
    ServiceEvent event;
    event.kind = kind;
    event.serviceType = type;
    event.name = name;
    event.regType = type == ServiceType::Pairing ? "_adb-tls-pairing._tcp." : "_adb-tls-connect._tcp.";
    event.domain = "local.";
    return event;
}

// ═══════════════════════════════════════════════════════════
// FakeProcessRunner — записывает вызовы, отвечает по сценарию
// ═══════════════════════════════════════════════════════════

class FakeProcessRunner : public IProcessRunner {
public:
    struct Call {
        std::vector<std::string> argv;
        std::chrono::milliseconds timeout;
        std::chrono::steady_clock::time_point at;
    };

    /// Ответ на вызов; call index считается отдельно для каждой подкоманды adb
    using Script = std::function<ProcessResult(const std::vector<std::string>& argv, size_t callIndex)>;

    void setScript(Script script) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_script = std::move(script);
    }

    void setAvailable(bool available) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_available = available;
    }

    ProcessResult run(const std::vector<std::string>& argv,
                      std::chrono::milliseconds timeout) override {
        Script script;
        size_t index = 0;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_calls.push_back({argv, timeout, std::chrono::steady_clock::now()});
            const std::string sub = argv.size() > 1 ? argv[1] : "";
            index = m_perCommand[sub]++;
            script = m_script;
        }
        if (!script) return exitedWith(1, "", "no script");
        return script(argv, index);
    }

    std::optional<std::string> findExecutable(const std::string& name) const override {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_available) return std::nullopt;
        return "/usr/bin/" + name;
    }

    std::vector<Call> calls() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_calls;
    }

    /// Вызовы конкретной подкоманды ("pair" / "connect")
    std::vector<Call> calls(const std::string& subcommand) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::vector<Call> result;
        for (const auto& call : m_calls) {
            if (call.argv.size() > 1 && call.argv[1] == subcommand) {
                result.push_back(call);
            }
        }
        return result;
    }

    size_t callCount(const std::string& subcommand) const {
        return calls(subcommand).size();
    }

private:
    mutable std::mutex m_mutex;
    Script m_script;
    bool m_available = true;
    std::vector<Call> m_calls;
    std::map<std::string, size_t> m_perCommand;
};

// ═══════════════════════════════════════════════════════════
// FakeDiscovery — общий реестр вместо демона DNS-SD
// ═══════════════════════════════════════════════════════════

class FakeDiscoveryRegistry;
inline DiscoveryFactory fakeDiscoveryFactory(std::shared_ptr<FakeDiscoveryRegistry> registry);

class FakeDiscoveryRegistry {
public:
    void setFailStart(bool fail) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_failStart = fail;
    }

    /// Что вернёт resolve() для экземпляра с этим именем
    void announce(const ServiceAnnouncement& announcement) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_announcements[announcement.name] = announcement;
    }

    /// Доставить событие активному браузеру (как поток DNS-SD)
    /// @return false если активного браузера нет
    bool emit(const ServiceEvent& event) {
        ServiceEventCallback listener;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            listener = event.serviceType == ServiceType::Pairing ? m_pairingListener : m_connectListener;
        }
        if (!listener) return false;
        listener(event);
        return true;
    }

    int activeCount() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_active;
    }

    int maxActiveCount() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_maxActive;
    }

    int createdCount() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_created;
    }

    std::string lastPairingType() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_lastPairingType;
    }

private:
    friend class FakeDiscovery;
    friend DiscoveryFactory fakeDiscoveryFactory(std::shared_ptr<FakeDiscoveryRegistry> registry);

    mutable std::mutex m_mutex;
    bool m_failStart = false;
    int m_active = 0;
    int m_maxActive = 0;
    int m_created = 0;
    uint64_t m_owner = 0;
    std::string m_lastPairingType;
    ServiceEventCallback m_pairingListener;
    ServiceEventCallback m_connectListener;
    std::map<std::string, ServiceAnnouncement> m_announcements;
};

class FakeDiscovery : public IServiceDiscovery {
public:
    FakeDiscovery(std::shared_ptr<FakeDiscoveryRegistry> registry, uint64_t id)
        : m_registry(std::move(registry)), m_id(id) {}

    ~FakeDiscovery() override { stop(); }

    bool start(const std::string& pairingServiceType,
               const std::string& connectServiceType,
               ServiceEventCallback pairingListener,
               ServiceEventCallback connectListener) override {
        (void)connectServiceType;
        std::lock_guard<std::mutex> lock(m_registry->m_mutex);
        if (m_registry->m_failStart) {
            m_lastError = "daemon not running";
            return false;
        }
        m_registry->m_active++;
        m_registry->m_maxActive = std::max(m_registry->m_maxActive, m_registry->m_active);
        m_registry->m_owner = m_id;
        m_registry->m_lastPairingType = pairingServiceType;
        m_registry->m_pairingListener = std::move(pairingListener);
        m_registry->m_connectListener = std::move(connectListener);
        m_running = true;
        return true;
    }

    void stop() override {
        std::lock_guard<std::mutex> lock(m_registry->m_mutex);
        if (!m_running) return;
        m_running = false;
        m_registry->m_active--;
        if (m_registry->m_owner == m_id) {
            m_registry->m_pairingListener = nullptr;
            m_registry->m_connectListener = nullptr;
        }
    }

    bool isRunning() const override {
        std::lock_guard<std::mutex> lock(m_registry->m_mutex);
        return m_running;
    }

    std::optional<ServiceAnnouncement> resolve(const ServiceEvent& event,
                                               std::chrono::milliseconds) override {
        std::lock_guard<std::mutex> lock(m_registry->m_mutex);
        auto it = m_registry->m_announcements.find(event.name);
        if (it == m_registry->m_announcements.end()) return std::nullopt;
        return it->second;
    }

    std::string getLastError() const override { return m_lastError; }

private:
    std::shared_ptr<FakeDiscoveryRegistry> m_registry;
    const uint64_t m_id;
    bool m_running = false;
    std::string m_lastError;
};

/// Новый FakeDiscovery на каждый start() сервиса
inline DiscoveryFactory fakeDiscoveryFactory(std::shared_ptr<FakeDiscoveryRegistry> registry) {
    return [registry]() -> std::unique_ptr<IServiceDiscovery> {
        uint64_t id;
        {
            std::lock_guard<std::mutex> lock(registry->m_mutex);
            id = static_cast<uint64_t>(++registry->m_created);
        }
        return std::make_unique<FakeDiscovery>(registry, id);
    };
}

} // namespace AdbeeTest
