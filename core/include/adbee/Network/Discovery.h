// Discovery.h — Наблюдение за DNS-SD анонсами телефона
// Два браузера (pairing и connect) на одном соединении с демоном

#pragma once

#include "../export.h"
#include "../Models.h"
#include <string>
#include <functional>
#include <optional>
#include <chrono>
#include <memory>
#include <map>
#include <set>

namespace Adbee {

// ═══════════════════════════════════════════════════════════
// Callbacks
// ═══════════════════════════════════════════════════════════

/// Слушатель браузера: added / removed / updated в одном событии
using ServiceEventCallback = std::function<void(const ServiceEvent&)>;

/// Резолв события в адреса (используется обработчиками)
using ServiceResolver = std::function<std::optional<ServiceAnnouncement>(const ServiceEvent&)>;

// ═══════════════════════════════════════════════════════════
// IServiceDiscovery
// ═══════════════════════════════════════════════════════════

class ADBEE_API IServiceDiscovery {
public:
    virtual ~IServiceDiscovery() = default;

    /// Зарегистрировать оба браузера
    /// Callbacks вызываются из фонового потока discovery
    /// @return false если демон недоступен (см. getLastError)
    virtual bool start(const std::string& pairingServiceType,
                       const std::string& connectServiceType,
                       ServiceEventCallback pairingListener,
                       ServiceEventCallback connectListener) = 0;

    /// Отменить браузеры и закрыть соединение. Безопасно вызывать повторно.
    virtual void stop() = 0;

    virtual bool isRunning() const = 0;

    /// Получить адреса, порт и TXT для события
    /// Блокирует до timeout. Можно вызывать из любого потока.
    virtual std::optional<ServiceAnnouncement> resolve(const ServiceEvent& event,
                                                       std::chrono::milliseconds timeout) = 0;

    virtual std::string getLastError() const = 0;
};

using DiscoveryFactory = std::function<std::unique_ptr<IServiceDiscovery>()>;

// ═══════════════════════════════════════════════════════════
// Helpers
// ═══════════════════════════════════════════════════════════

struct ServiceTypeParts {
    std::string regType;    // "_adb-tls-pairing._tcp"
    std::string domain;     // "local." или пусто (домен по умолчанию)
};

/// "_adb-tls-pairing._tcp.local." -> {"_adb-tls-pairing._tcp", "local."}
/// Принимает и форму без домена
ADBEE_API ServiceTypeParts splitServiceType(const std::string& serviceType);

/// Экземпляры, которые браузер видит сейчас: имя -> интерфейсы
using KnownInstances = std::map<std::string, std::set<uint32_t>>;

/// Классифицировать ответ браузера и обновить known.
/// Экземпляр идентифицируется именем: added только для первого интерфейса,
/// removed только когда пропал последний, иначе updated.
ADBEE_API ServiceEventKind classifyBrowseReply(KnownInstances& known,
                                               const std::string& name,
                                               uint32_t interfaceIndex,
                                               bool isAdd);

} // namespace Adbee
