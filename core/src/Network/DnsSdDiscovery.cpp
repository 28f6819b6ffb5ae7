// DnsSdDiscovery.cpp — Браузеры DNS-SD для _adb-tls-pairing / _adb-tls-connect
// Требует полный API dns_sd.h (DNSServiceCreateConnection, DNSServiceGetAddrInfo)

#include "adbee/Network/DnsSdDiscovery.h"
#include <spdlog/spdlog.h>
#include <dns_sd.h>
#include <algorithm>
#include <atomic>
#include <cerrno>
#include <cstring>
#include <map>
#include <mutex>
#include <thread>
#include <vector>

#include <arpa/inet.h>
#include <net/if.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>

namespace Adbee {

using Clock = std::chrono::steady_clock;

namespace {

constexpr int EVENT_POLL_INTERVAL_MS = 100;     // Проверка m_running в потоке событий
constexpr int ADDRESS_GRACE_MS = 200;           // Ждём второе семейство адресов

// ═══════════════════════════════════════════════════════════
// Контекст браузера (один на тип сервиса)
// ═══════════════════════════════════════════════════════════

struct BrowserContext {
    ServiceType serviceType;
    ServiceEventCallback listener;
    KnownInstances known;
};

// ═══════════════════════════════════════════════════════════
// Состояние одного resolve
// ═══════════════════════════════════════════════════════════

struct ResolveState {
    bool resolved = false;
    bool failed = false;
    std::string hostTarget;
    uint16_t port = 0;
    uint32_t interfaceIndex = 0;
    std::map<std::string, std::string> txt;

    std::vector<std::string> addresses;
    bool batchComplete = false;     // Пришёл ответ без kDNSServiceFlagsMoreComing
    bool addrFailed = false;
};

std::string formatAddress(const sockaddr* address, uint32_t interfaceIndex) {
    char buffer[INET6_ADDRSTRLEN] = {0};
    if (address->sa_family == AF_INET) {
        auto* sin = reinterpret_cast<const sockaddr_in*>(address);
        if (!inet_ntop(AF_INET, &sin->sin_addr, buffer, sizeof(buffer))) return "";
        return buffer;
    }
    if (address->sa_family == AF_INET6) {
        auto* sin6 = reinterpret_cast<const sockaddr_in6*>(address);
        if (!inet_ntop(AF_INET6, &sin6->sin6_addr, buffer, sizeof(buffer))) return "";
        std::string result = buffer;
        // Для link-local нужен scope, иначе adb не достучится
        if (IN6_IS_ADDR_LINKLOCAL(&sin6->sin6_addr) && interfaceIndex != 0) {
            char ifName[IF_NAMESIZE] = {0};
            if (if_indextoname(interfaceIndex, ifName)) {
                result += "%";
                result += ifName;
            }
        }
        return result;
    }
    return "";
}

std::map<std::string, std::string> parseTxt(uint16_t txtLen, const unsigned char* txtRecord) {
    std::map<std::string, std::string> result;
    if (!txtRecord || txtLen == 0) return result;

    uint16_t count = TXTRecordGetCount(txtLen, txtRecord);
    for (uint16_t i = 0; i < count; ++i) {
        char key[256] = {0};
        uint8_t valueLen = 0;
        const void* value = nullptr;
        if (TXTRecordGetItemAtIndex(txtLen, txtRecord, i, sizeof(key), key,
                                    &valueLen, &value) != kDNSServiceErr_NoError) {
            continue;
        }
        result[key] = value ? std::string(static_cast<const char*>(value), valueLen) : "";
    }
    return result;
}

/// Обрабатывать ответы ref до done() или deadline
/// @return true если done() выполнилось
template<typename Predicate>
bool processUntil(DNSServiceRef ref, Clock::time_point deadline, Predicate done) {
    int fd = DNSServiceRefSockFD(ref);
    if (fd < 0) return false;

    while (!done()) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - Clock::now()).count();
        if (remaining <= 0) return false;

        pollfd pfd{fd, POLLIN, 0};
        int rc = poll(&pfd, 1, static_cast<int>(remaining));
        if (rc < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        if (rc == 0) return false;
        if (DNSServiceProcessResult(ref) != kDNSServiceErr_NoError) return false;
    }
    return true;
}

void DNSSD_API onResolveReply(DNSServiceRef, DNSServiceFlags, uint32_t interfaceIndex,
                              DNSServiceErrorType errorCode, const char*,
                              const char* hostTarget, uint16_t port,
                              uint16_t txtLen, const unsigned char* txtRecord,
                              void* context) {
    auto* state = static_cast<ResolveState*>(context);
    if (errorCode != kDNSServiceErr_NoError) {
        state->failed = true;
        return;
    }
    state->resolved = true;
    state->hostTarget = hostTarget ? hostTarget : "";
    state->port = ntohs(port);
    state->interfaceIndex = interfaceIndex;
    state->txt = parseTxt(txtLen, txtRecord);
}

void DNSSD_API onAddrInfoReply(DNSServiceRef, DNSServiceFlags flags, uint32_t interfaceIndex,
                               DNSServiceErrorType errorCode, const char*,
                               const sockaddr* address, uint32_t, void* context) {
    auto* state = static_cast<ResolveState*>(context);
    if (errorCode != kDNSServiceErr_NoError) {
        state->addrFailed = true;
        return;
    }
    if (address && (flags & kDNSServiceFlagsAdd)) {
        auto text = formatAddress(address, interfaceIndex);
        if (!text.empty()) {
            state->addresses.push_back(text);
        }
    }
    if (!(flags & kDNSServiceFlagsMoreComing)) {
        state->batchComplete = true;
    }
}

} // anonymous namespace

// ═══════════════════════════════════════════════════════════
// DnsSdDiscovery::Impl
// ═══════════════════════════════════════════════════════════

class DnsSdDiscovery::Impl {
public:
    Impl() = default;

    ~Impl() {
        stop();
    }

    bool start(const std::string& pairingServiceType,
               const std::string& connectServiceType,
               ServiceEventCallback pairingListener,
               ServiceEventCallback connectListener) {
        std::lock_guard<std::mutex> lifecycle(m_lifecycleMutex);
        if (m_running) return true;

        DNSServiceErrorType err = DNSServiceCreateConnection(&m_connection);
        if (err != kDNSServiceErr_NoError) {
            m_connection = nullptr;
            setLastError("DNSServiceCreateConnection failed: " + std::to_string(err));
            spdlog::warn("Discovery: {} (is the mDNS daemon running?)", getLastError());
            return false;
        }

        m_contexts.push_back(std::make_unique<BrowserContext>(
            BrowserContext{ServiceType::Pairing, std::move(pairingListener), {}}));
        m_contexts.push_back(std::make_unique<BrowserContext>(
            BrowserContext{ServiceType::Connect, std::move(connectListener), {}}));

        const std::string* types[] = {&pairingServiceType, &connectServiceType};
        for (size_t i = 0; i < m_contexts.size(); ++i) {
            auto parts = splitServiceType(*types[i]);
            DNSServiceRef browseRef = m_connection;
            err = DNSServiceBrowse(&browseRef, kDNSServiceFlagsShareConnection,
                                   kDNSServiceInterfaceIndexAny,
                                   parts.regType.c_str(),
                                   parts.domain.empty() ? nullptr : parts.domain.c_str(),
                                   &Impl::onBrowseReply, m_contexts[i].get());
            if (err != kDNSServiceErr_NoError) {
                setLastError("DNSServiceBrowse(" + parts.regType + ") failed: " + std::to_string(err));
                spdlog::error("Discovery: {}", getLastError());
                releaseRefs();
                return false;
            }
            m_browseRefs.push_back(browseRef);
            spdlog::debug("Discovery: Browsing {} in '{}'", parts.regType,
                          parts.domain.empty() ? "default" : parts.domain);
        }

        m_running = true;
        m_eventThread = std::thread([this]() { eventLoop(); });

        spdlog::info("Discovery: Watching for pairing and connection services...");
        return true;
    }

    void stop() {
        std::lock_guard<std::mutex> lifecycle(m_lifecycleMutex);
        bool wasRunning = m_running.exchange(false);

        // Поток первым: DNSServiceProcessResult не должен видеть освобождённые ref
        if (m_eventThread.joinable()) m_eventThread.join();

        releaseRefs();

        if (wasRunning) {
            spdlog::info("Discovery: Stopped");
        }
    }

    bool isRunning() const {
        return m_running;
    }

    std::optional<ServiceAnnouncement> resolve(const ServiceEvent& event,
                                               std::chrono::milliseconds timeout) {
        const auto deadline = Clock::now() + timeout;
        ResolveState state;

        // Отдельное соединение: поток событий не блокируется на resolve
        DNSServiceRef resolveRef = nullptr;
        DNSServiceErrorType err = DNSServiceResolve(
            &resolveRef, 0, event.interfaceIndex,
            event.name.c_str(), event.regType.c_str(), event.domain.c_str(),
            &onResolveReply, &state);
        if (err != kDNSServiceErr_NoError) {
            spdlog::warn("Discovery: DNSServiceResolve('{}') failed: {}", event.name, err);
            return std::nullopt;
        }

        bool ok = processUntil(resolveRef, deadline,
                               [&state]() { return state.resolved || state.failed; });
        DNSServiceRefDeallocate(resolveRef);

        if (!ok || !state.resolved) {
            spdlog::warn("Discovery: Could not resolve '{}'", event.name);
            return std::nullopt;
        }

        DNSServiceRef addrRef = nullptr;
        err = DNSServiceGetAddrInfo(
            &addrRef, 0, state.interfaceIndex,
            kDNSServiceProtocol_IPv4 | kDNSServiceProtocol_IPv6,
            state.hostTarget.c_str(), &onAddrInfoReply, &state);
        if (err != kDNSServiceErr_NoError) {
            spdlog::warn("Discovery: DNSServiceGetAddrInfo('{}') failed: {}", state.hostTarget, err);
            return std::nullopt;
        }

        processUntil(addrRef, deadline, [&state]() {
            return state.addrFailed || (state.batchComplete && !state.addresses.empty());
        });

        // IPv4 и IPv6 приходят отдельными ответами
        bool haveIpv4 = false;
        for (const auto& address : state.addresses) {
            if (isIpv4Address(address)) haveIpv4 = true;
        }
        if (!state.addresses.empty() && !haveIpv4) {
            auto grace = std::min(deadline, Clock::now() + std::chrono::milliseconds(ADDRESS_GRACE_MS));
            size_t before = state.addresses.size();
            processUntil(addrRef, grace, [&state, before]() {
                return state.addresses.size() > before;
            });
        }
        DNSServiceRefDeallocate(addrRef);

        ServiceAnnouncement announcement;
        announcement.serviceType = event.serviceType;
        announcement.name = event.name;
        announcement.port = state.port;
        announcement.hostTarget = state.hostTarget;
        announcement.txt = std::move(state.txt);
        announcement.resolvedAddresses = std::move(state.addresses);

        spdlog::debug("Discovery: Resolved '{}' -> {} ({} addresses), port {}",
                      event.name, announcement.hostTarget,
                      announcement.resolvedAddresses.size(), announcement.port);
        return announcement;
    }

    std::string getLastError() const {
        std::lock_guard<std::mutex> lock(m_errorMutex);
        return m_lastError;
    }

private:
    std::atomic<bool> m_running{false};
    std::mutex m_lifecycleMutex;

    DNSServiceRef m_connection = nullptr;
    std::vector<DNSServiceRef> m_browseRefs;
    std::vector<std::unique_ptr<BrowserContext>> m_contexts;

    std::thread m_eventThread;

    mutable std::mutex m_errorMutex;
    std::string m_lastError;

    void setLastError(const std::string& error) {
        std::lock_guard<std::mutex> lock(m_errorMutex);
        m_lastError = error;
    }

    void releaseRefs() {
        for (auto ref : m_browseRefs) {
            DNSServiceRefDeallocate(ref);
        }
        m_browseRefs.clear();

        if (m_connection) {
            DNSServiceRefDeallocate(m_connection);
            m_connection = nullptr;
        }
        m_contexts.clear();
    }

    void eventLoop() {
        spdlog::debug("Discovery: Event thread started");

        int fd = DNSServiceRefSockFD(m_connection);
        while (m_running) {
            pollfd pfd{fd, POLLIN, 0};
            int rc = poll(&pfd, 1, EVENT_POLL_INTERVAL_MS);
            if (rc < 0) {
                if (errno == EINTR) continue;
                spdlog::error("Discovery: poll failed: {}", std::strerror(errno));
                break;
            }
            if (rc == 0) continue;

            DNSServiceErrorType err = DNSServiceProcessResult(m_connection);
            if (err != kDNSServiceErr_NoError) {
                setLastError("DNSServiceProcessResult failed: " + std::to_string(err));
                spdlog::error("Discovery: {}", getLastError());
                break;
            }
        }

        // После ошибки демона браузеры мертвы
        m_running = false;
        spdlog::debug("Discovery: Event thread stopped");
    }

    static void DNSSD_API onBrowseReply(DNSServiceRef, DNSServiceFlags flags,
                                        uint32_t interfaceIndex,
                                        DNSServiceErrorType errorCode,
                                        const char* serviceName, const char* regType,
                                        const char* replyDomain, void* context) {
        auto* browser = static_cast<BrowserContext*>(context);
        if (errorCode != kDNSServiceErr_NoError) {
            spdlog::error("Discovery: Browse error {} for {} service",
                          errorCode, serviceTypeToString(browser->serviceType));
            return;
        }

        ServiceEvent event;
        event.serviceType = browser->serviceType;
        event.name = serviceName ? serviceName : "";
        event.regType = regType ? regType : "";
        event.domain = replyDomain ? replyDomain : "";
        event.interfaceIndex = interfaceIndex;

        event.kind = classifyBrowseReply(browser->known, event.name, interfaceIndex,
                                         (flags & kDNSServiceFlagsAdd) != 0);

        spdlog::info("Discovery: Service {} ({}): {}", serviceEventKindToString(event.kind),
                     serviceTypeToString(event.serviceType), event.name);

        if (browser->listener) {
            browser->listener(event);
        }
    }
};

// ═══════════════════════════════════════════════════════════
// DnsSdDiscovery Public Interface
// ═══════════════════════════════════════════════════════════

DnsSdDiscovery::DnsSdDiscovery() : m_impl(std::make_unique<Impl>()) {}
DnsSdDiscovery::~DnsSdDiscovery() = default;

bool DnsSdDiscovery::start(const std::string& pairingServiceType,
                           const std::string& connectServiceType,
                           ServiceEventCallback pairingListener,
                           ServiceEventCallback connectListener) {
    return m_impl->start(pairingServiceType, connectServiceType,
                         std::move(pairingListener), std::move(connectListener));
}

void DnsSdDiscovery::stop() {
    m_impl->stop();
}

bool DnsSdDiscovery::isRunning() const {
    return m_impl->isRunning();
}

std::optional<ServiceAnnouncement> DnsSdDiscovery::resolve(const ServiceEvent& event,
                                                           std::chrono::milliseconds timeout) {
    return m_impl->resolve(event, timeout);
}

std::string DnsSdDiscovery::getLastError() const {
    return m_impl->getLastError();
}

DiscoveryFactory dnsSdDiscoveryFactory() {
    return []() -> std::unique_ptr<IServiceDiscovery> {
        return std::make_unique<DnsSdDiscovery>();
    };
}

} // namespace Adbee
