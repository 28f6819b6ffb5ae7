// ConnectHandler.cpp — adb connect с дедупликацией и повторами

#include "adbee/Network/ConnectHandler.h"
#include <spdlog/spdlog.h>
#include <map>
#include <mutex>
#include <set>

namespace Adbee {

// ═══════════════════════════════════════════════════════════
// ConnectHandler::Impl
// ═══════════════════════════════════════════════════════════

class ConnectHandler::Impl {
public:
    Impl(std::shared_ptr<AdbTool> tool,
         const AdbeeConfig& config,
         ServiceResolver resolver,
         ConnectedCallback onConnected,
         std::shared_ptr<CancellationToken> token)
        : m_tool(std::move(tool))
        , m_resolver(std::move(resolver))
        , m_onConnected(std::move(onConnected))
        , m_token(token ? std::move(token) : std::make_shared<CancellationToken>())
        , m_connectTimeout(config.connectTimeout)
        , m_attempts(config.connectAttempts)
        , m_retryDelay(config.retryDelay)
        , m_opportunisticDelay(config.opportunisticRetryDelay)
        , m_reconnectOnReappearance(config.reconnectOnReappearance) {}

    void handleEvent(const ServiceEvent& event) {
        if (m_token->isCancelled()) return;

        switch (event.kind) {
            case ServiceEventKind::Added: {
                auto announcement = m_resolver ? m_resolver(event) : std::nullopt;
                if (!announcement) {
                    spdlog::warn("ConnectHandler: Could not resolve '{}', dropping event", event.name);
                    return;
                }
                handleAnnouncement(*announcement);
                break;
            }
            case ServiceEventKind::Removed:
                handleRemoved(event.name);
                break;
            case ServiceEventKind::Updated:
                spdlog::debug("ConnectHandler: Service updated: {}", event.name);
                break;
        }
    }

    bool handleAnnouncement(const ServiceAnnouncement& announcement) {
        auto endpoint = selectEndpoint(announcement);
        if (!endpoint) {
            spdlog::warn("ConnectHandler: No address for '{}' (port {}), dropping event",
                         announcement.name, announcement.port);
            return false;
        }

        // Запоминаем даже если подключаться не будем
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_lastSeen = *endpoint;
            m_lastSeenName = announcement.name;
        }

        spdlog::info("ConnectHandler: Connect service found: {}", endpoint->toString());
        return connectWithRetry(*endpoint, announcement.name, m_retryDelay, false);
    }

    bool connectOpportunistic() {
        std::optional<Endpoint> endpoint;
        std::string instanceName;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            endpoint = m_lastSeen;
            instanceName = m_lastSeenName;
        }

        if (!endpoint) {
            spdlog::debug("ConnectHandler: No connect service seen yet, waiting for announcement");
            return false;
        }

        spdlog::info("ConnectHandler: Opportunistic connection attempt to {}...", endpoint->toString());
        // Серия, начатая до pairing, может ещё идти: её попытки обречены
        return connectWithRetry(*endpoint, instanceName, m_opportunisticDelay, true);
    }

    std::optional<Endpoint> getLastSeenEndpoint() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_lastSeen;
    }

    std::vector<std::string> getConnectedEndpoints() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return std::vector<std::string>(m_connected.begin(), m_connected.end());
    }

    bool isConnected(const std::string& endpointKey) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_connected.count(endpointKey) > 0;
    }

private:
    std::shared_ptr<AdbTool> m_tool;
    ServiceResolver m_resolver;
    ConnectedCallback m_onConnected;
    std::shared_ptr<CancellationToken> m_token;

    const std::chrono::milliseconds m_connectTimeout;
    const int m_attempts;
    const std::chrono::milliseconds m_retryDelay;
    const std::chrono::milliseconds m_opportunisticDelay;
    const bool m_reconnectOnReappearance;

    mutable std::mutex m_mutex;
    std::set<std::string> m_connected;                      // Не очищается до конца сессии
    std::map<std::string, int> m_inFlight;                  // endpoint -> число идущих серий
    std::map<std::string, std::string> m_instanceEndpoints; // имя экземпляра -> "ip:port"
    std::optional<Endpoint> m_lastSeen;
    std::string m_lastSeenName;

    /// Снимает отметку "в процессе" при любом выходе из серии, включая исключение
    class InFlightGuard {
    public:
        InFlightGuard(Impl& owner, std::string key)
            : m_owner(owner), m_key(std::move(key)) {}

        ~InFlightGuard() {
            std::lock_guard<std::mutex> lock(m_owner.m_mutex);
            auto it = m_owner.m_inFlight.find(m_key);
            if (it != m_owner.m_inFlight.end() && --it->second <= 0) {
                m_owner.m_inFlight.erase(it);
            }
        }

        InFlightGuard(const InFlightGuard&) = delete;
        InFlightGuard& operator=(const InFlightGuard&) = delete;

    private:
        Impl& m_owner;
        const std::string m_key;
    };

    /// @param ignoreInFlight true для opportunistic: не ждать чужую серию
    bool connectWithRetry(const Endpoint& endpoint, const std::string& instanceName,
                          std::chrono::milliseconds retryDelay, bool ignoreInFlight) {
        const std::string key = endpoint.toString();

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_connected.count(key)) {
                spdlog::debug("ConnectHandler: {} already connected, skipping", key);
                return false;
            }
            if (!ignoreInFlight && m_inFlight.count(key)) {
                spdlog::debug("ConnectHandler: Connection to {} already in progress, skipping", key);
                return false;
            }
            m_inFlight[key]++;
        }
        InFlightGuard guard(*this, key);

        bool connected = false;
        for (int attempt = 1; attempt <= m_attempts; ++attempt) {
            if (m_token->isCancelled()) break;
            if (isConnected(key)) {
                spdlog::debug("ConnectHandler: {} connected by another attempt, stopping", key);
                return false;
            }

            spdlog::info("ConnectHandler: Connecting to {} (attempt {}/{})...", key, attempt, m_attempts);
            auto result = m_tool->connect(endpoint, m_connectTimeout);
            if (AdbTool::isConnectSuccess(result)) {
                connected = true;
                break;
            }

            spdlog::warn("ConnectHandler: Connection to {} failed: {}", key, AdbTool::describe(result));
            if (attempt < m_attempts && !m_token->waitFor(retryDelay)) {
                break;  // Сессия отменена во время ожидания
            }
        }

        bool firstSuccess = false;
        if (connected) {
            std::lock_guard<std::mutex> lock(m_mutex);
            firstSuccess = m_connected.insert(key).second;
            if (!instanceName.empty()) {
                m_instanceEndpoints[instanceName] = key;
            }
        }

        if (m_token->isCancelled()) {
            spdlog::info("ConnectHandler: Session superseded, dropping result for {}", key);
            return false;
        }

        if (!connected) {
            if (isConnected(key)) {
                spdlog::debug("ConnectHandler: {} connected by another attempt", key);
            } else {
                spdlog::warn("ConnectHandler: Gave up connecting to {} after {} attempts.", key, m_attempts);
            }
            return false;
        }

        // Параллельная серия уже сообщила об этом endpoint
        if (!firstSuccess) return false;

        spdlog::info("ConnectHandler: Connected to {}", key);
        if (m_onConnected) {
            m_onConnected(key);
        }
        return true;
    }

    void handleRemoved(const std::string& instanceName) {
        if (!m_reconnectOnReappearance) {
            spdlog::info("ConnectHandler: Service removed: {}", instanceName);
            return;
        }

        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_instanceEndpoints.find(instanceName);
        if (it == m_instanceEndpoints.end()) {
            spdlog::info("ConnectHandler: Service removed: {}", instanceName);
            return;
        }
        spdlog::info("ConnectHandler: Service removed: {}, forgetting {}", instanceName, it->second);
        m_connected.erase(it->second);
        m_instanceEndpoints.erase(it);
    }
};

// ═══════════════════════════════════════════════════════════
// ConnectHandler Public Interface
// ═══════════════════════════════════════════════════════════

ConnectHandler::ConnectHandler(std::shared_ptr<AdbTool> tool,
                               const AdbeeConfig& config,
                               ServiceResolver resolver,
                               ConnectedCallback onConnected,
                               std::shared_ptr<CancellationToken> token)
    : m_impl(std::make_unique<Impl>(std::move(tool), config, std::move(resolver),
                                    std::move(onConnected), std::move(token))) {}

ConnectHandler::~ConnectHandler() = default;

void ConnectHandler::handleEvent(const ServiceEvent& event) {
    m_impl->handleEvent(event);
}

bool ConnectHandler::handleAnnouncement(const ServiceAnnouncement& announcement) {
    return m_impl->handleAnnouncement(announcement);
}

bool ConnectHandler::connectOpportunistic() {
    return m_impl->connectOpportunistic();
}

std::optional<Endpoint> ConnectHandler::getLastSeenEndpoint() const {
    return m_impl->getLastSeenEndpoint();
}

std::vector<std::string> ConnectHandler::getConnectedEndpoints() const {
    return m_impl->getConnectedEndpoints();
}

bool ConnectHandler::isConnected(const std::string& endpointKey) const {
    return m_impl->isConnected(endpointKey);
}

} // namespace Adbee
