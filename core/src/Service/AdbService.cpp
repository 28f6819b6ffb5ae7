// AdbService.cpp — Оркестратор: discovery + обработчики + рабочие потоки

#include "adbee/AdbService.h"
#include "adbee/Credentials.h"
#include "adbee/Adb/AdbTool.h"
#include "adbee/Network/CancellationToken.h"
#include "adbee/Network/ConnectHandler.h"
#include "adbee/Network/PairingHandler.h"
#include <spdlog/spdlog.h>
#include <atomic>
#include <mutex>
#include <stdexcept>
#include <thread>

namespace Adbee {

// ═══════════════════════════════════════════════════════════
// AdbService::Impl
// ═══════════════════════════════════════════════════════════

class AdbService::Impl {
public:
    Impl(AdbeeConfig config, Callbacks callbacks, DiscoveryFactory discoveryFactory,
         std::shared_ptr<IProcessRunner> runner)
        : m_config(std::move(config))
        , m_callbacks(std::move(callbacks))
        , m_discoveryFactory(std::move(discoveryFactory)) {
        m_config.validate();
        m_config.applyLogLevel();
        if (!m_discoveryFactory) {
            throw std::invalid_argument("AdbService: discovery factory is empty");
        }
        if (!runner) {
            runner = std::make_shared<PosixProcessRunner>();
        }
        m_tool = std::make_shared<AdbTool>(std::move(runner), m_config.adbPath);
    }

    ~Impl() {
        stop();

        std::vector<Worker> workers;
        {
            std::lock_guard<std::mutex> lock(m_workersMutex);
            m_shuttingDown = true;
            workers = std::move(m_workers);
            m_workers.clear();
        }
        // adb команды дорабатывают до своего timeout
        const auto self = std::this_thread::get_id();
        for (auto& worker : workers) {
            if (!worker.thread.joinable()) continue;
            if (worker.thread.get_id() == self) {
                // Сервис уничтожают из hook: поток завершится сам
                worker.thread.detach();
                continue;
            }
            worker.thread.join();
        }
    }

    PairingSession generateCredentials() {
        std::lock_guard<std::mutex> lock(m_lifecycleMutex);
        if (m_active) {
            spdlog::info("AdbService: New credentials requested, stopping current session");
            stopLocked();
        }
        m_session = Adbee::generateCredentials(m_config.serviceName);
        spdlog::info("AdbService: Credentials generated for service '{}'", m_session->serviceName);
        return *m_session;
    }

    bool start() {
        std::lock_guard<std::mutex> lock(m_lifecycleMutex);

        if (m_active) {
            spdlog::info("AdbService: Already running, restarting discovery");
            stopLocked();
        }

        if (!m_tool->isAvailable()) {
            setError(AdbError::ToolUnavailable, "adb not found: " + m_config.adbPath);
            spdlog::warn("AdbService: {}, wireless pairing disabled", m_lastError);
            return false;
        }

        if (!m_session) {
            m_session = Adbee::generateCredentials(m_config.serviceName);
            spdlog::info("AdbService: No credentials yet, generated new ones");
        }

        auto session = std::make_shared<Session>();
        session->token = std::make_shared<CancellationToken>();

        std::shared_ptr<IServiceDiscovery> discovery = m_discoveryFactory();
        if (!discovery) {
            setError(AdbError::DiscoveryUnavailable, "Discovery factory returned null");
            spdlog::warn("AdbService: {}", m_lastError);
            return false;
        }

        // weak_ptr: discovery держит обработчики через callbacks
        std::weak_ptr<IServiceDiscovery> weakDiscovery = discovery;
        const auto resolveTimeout = m_config.resolveTimeout;
        ServiceResolver resolver = [weakDiscovery, resolveTimeout](const ServiceEvent& event)
            -> std::optional<ServiceAnnouncement> {
            auto active = weakDiscovery.lock();
            if (!active) return std::nullopt;
            return active->resolve(event, resolveTimeout);
        };

        auto token = session->token;
        session->connectHandler = std::make_shared<ConnectHandler>(
            m_tool, m_config, resolver,
            [this, token](const std::string& endpoint) {
                if (token->isCancelled()) return;
                // Копия: hook может уничтожить сервис вместе с m_callbacks
                auto hook = m_callbacks.onConnected;
                if (hook) hook(endpoint);
            },
            token);

        session->pairingHandler = std::make_shared<PairingHandler>(
            m_tool, m_session->pairingCode, m_config, resolver,
            [this, token](const std::string& address) {
                if (token->isCancelled()) return;
                auto hook = m_callbacks.onPaired;
                if (hook) hook(address);
            },
            session->connectHandler, token);

        auto pairingHandler = session->pairingHandler;
        auto connectHandler = session->connectHandler;

        bool started = discovery->start(
            m_config.pairingServiceType,
            m_config.connectServiceType,
            [this, token, pairingHandler](const ServiceEvent& event) {
                if (shouldDispatch(*token, event)) {
                    dispatch([pairingHandler, event]() { pairingHandler->handleEvent(event); });
                }
            },
            [this, token, connectHandler](const ServiceEvent& event) {
                if (shouldDispatch(*token, event)) {
                    dispatch([connectHandler, event]() { connectHandler->handleEvent(event); });
                }
            });

        if (!started) {
            setError(AdbError::DiscoveryUnavailable,
                     "DNS-SD unavailable: " + discovery->getLastError());
            spdlog::warn("AdbService: {}, staying idle", m_lastError);
            return false;
        }

        session->discovery = std::move(discovery);
        m_active = std::move(session);
        m_session->isActive = true;
        setError(AdbError::None, "");

        spdlog::info("AdbService: Started, watching {} and {}",
                     m_config.pairingServiceType, m_config.connectServiceType);
        return true;
    }

    void stop() {
        std::lock_guard<std::mutex> lock(m_lifecycleMutex);
        stopLocked();
    }

    ServiceState getState() const {
        std::lock_guard<std::mutex> lock(m_lifecycleMutex);
        return m_active ? ServiceState::Running : ServiceState::Idle;
    }

    std::optional<PairingSession> getSession() const {
        std::lock_guard<std::mutex> lock(m_lifecycleMutex);
        return m_session;
    }

    std::vector<std::string> getConnectedEndpoints() const {
        std::lock_guard<std::mutex> lock(m_lifecycleMutex);
        if (!m_active) return {};
        return m_active->connectHandler->getConnectedEndpoints();
    }

    std::string getLastError() const {
        std::lock_guard<std::mutex> lock(m_lifecycleMutex);
        return m_lastError;
    }

    AdbError getLastErrorKind() const {
        std::lock_guard<std::mutex> lock(m_lifecycleMutex);
        return m_lastErrorKind;
    }

    const AdbeeConfig& getConfig() const { return m_config; }

private:
    /// Всё, что живёт ровно одну сессию discovery
    struct Session {
        std::shared_ptr<CancellationToken> token;
        std::shared_ptr<IServiceDiscovery> discovery;
        std::shared_ptr<ConnectHandler> connectHandler;
        std::shared_ptr<PairingHandler> pairingHandler;
    };

    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    AdbeeConfig m_config;
    const Callbacks m_callbacks;
    DiscoveryFactory m_discoveryFactory;
    std::shared_ptr<AdbTool> m_tool;

    mutable std::mutex m_lifecycleMutex;
    std::optional<PairingSession> m_session;
    std::shared_ptr<Session> m_active;
    std::string m_lastError;
    AdbError m_lastErrorKind = AdbError::None;

    std::mutex m_workersMutex;
    std::vector<Worker> m_workers;
    bool m_shuttingDown = false;

    void setError(AdbError kind, const std::string& message) {
        m_lastErrorKind = kind;
        m_lastError = message;
    }

    void stopLocked() {
        if (!m_active) return;

        auto session = std::move(m_active);
        m_active.reset();

        // Сначала отмена: рабочие потоки перестают вызывать hooks
        session->token->cancel();
        session->discovery->stop();

        if (m_session) {
            m_session->isActive = false;
        }
        spdlog::info("AdbService: Stopped");
    }

    static bool shouldDispatch(const CancellationToken& token, const ServiceEvent& event) {
        if (token.isCancelled()) return false;
        if (event.kind == ServiceEventKind::Updated) {
            spdlog::debug("AdbService: {} service updated: {}",
                          serviceTypeToString(event.serviceType), event.name);
            return false;
        }
        return true;
    }

    /// Поток DNS-SD не выполняет логику обработчиков
    void dispatch(std::function<void()> task) {
        std::vector<std::thread> finished;
        {
            std::lock_guard<std::mutex> lock(m_workersMutex);
            if (m_shuttingDown) return;

            for (auto it = m_workers.begin(); it != m_workers.end();) {
                if (it->done->load()) {
                    finished.push_back(std::move(it->thread));
                    it = m_workers.erase(it);
                } else {
                    ++it;
                }
            }

            auto done = std::make_shared<std::atomic<bool>>(false);
            std::thread thread([task = std::move(task), done]() {
                try {
                    task();
                } catch (const std::exception& e) {
                    spdlog::error("AdbService: Worker failed: {}", e.what());
                }
                done->store(true);
            });
            m_workers.push_back(Worker{std::move(thread), std::move(done)});
        }

        for (auto& t : finished) {
            if (t.joinable()) {
                t.join();
            }
        }
    }
};

// ═══════════════════════════════════════════════════════════
// AdbService Public Interface
// ═══════════════════════════════════════════════════════════

AdbService::AdbService(AdbeeConfig config,
                       Callbacks callbacks,
                       DiscoveryFactory discoveryFactory,
                       std::shared_ptr<IProcessRunner> runner)
    : m_impl(std::make_unique<Impl>(std::move(config), std::move(callbacks),
                                    std::move(discoveryFactory), std::move(runner))) {}

AdbService::~AdbService() = default;

PairingSession AdbService::generateCredentials() {
    return m_impl->generateCredentials();
}

bool AdbService::start() {
    return m_impl->start();
}

void AdbService::stop() {
    m_impl->stop();
}

ServiceState AdbService::getState() const {
    return m_impl->getState();
}

bool AdbService::isRunning() const {
    return m_impl->getState() == ServiceState::Running;
}

std::optional<PairingSession> AdbService::getSession() const {
    return m_impl->getSession();
}

std::vector<std::string> AdbService::getConnectedEndpoints() const {
    return m_impl->getConnectedEndpoints();
}

std::string AdbService::getLastError() const {
    return m_impl->getLastError();
}

AdbError AdbService::getLastErrorKind() const {
    return m_impl->getLastErrorKind();
}

const AdbeeConfig& AdbService::getConfig() const {
    return m_impl->getConfig();
}

} // namespace Adbee
