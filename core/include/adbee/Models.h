#pragma once

#include "export.h"
#include "Types.h"
#include <string>
#include <vector>
#include <map>
#include <optional>
#include <cstdint>

namespace Adbee {

// ═══════════════════════════════════════════════════════════
// Сервисы DNS-SD, которые анонсирует телефон
// ═══════════════════════════════════════════════════════════

constexpr const char* PAIRING_SERVICE_TYPE = "_adb-tls-pairing._tcp.local.";
constexpr const char* CONNECT_SERVICE_TYPE = "_adb-tls-connect._tcp.local.";
constexpr const char* DEFAULT_SERVICE_NAME = "adbee";

// ═══════════════════════════════════════════════════════════
// Pairing сессия — учётные данные для QR-кода
// ═══════════════════════════════════════════════════════════

struct PairingSession {
    std::string serviceName;
    std::string pairingCode;    // 6 цифр, неизменяем в течение сессии
    bool isActive = false;      // Discovery запущен с этими данными
};

// ═══════════════════════════════════════════════════════════
// Endpoint — адрес устройства для adb
// ═══════════════════════════════════════════════════════════

struct Endpoint {
    std::string address;
    uint16_t port = 0;

    /// "ip:port"; IPv6 оборачивается в скобки ("[fe80::1%wlan0]:port")
    std::string toString() const;

    bool isIpv6() const { return address.find(':') != std::string::npos; }

    bool operator==(const Endpoint& other) const {
        return address == other.address && port == other.port;
    }
    bool operator!=(const Endpoint& other) const { return !(*this == other); }
};

// ═══════════════════════════════════════════════════════════
// Событие браузера (до резолва)
// ═══════════════════════════════════════════════════════════

struct ServiceEvent {
    ServiceEventKind kind = ServiceEventKind::Added;
    ServiceType serviceType = ServiceType::Pairing;
    std::string name;           // Имя экземпляра, например "adb-XYZ-abc123"
    std::string regType;        // "_adb-tls-pairing._tcp."
    std::string domain;         // "local."
    uint32_t interfaceIndex = 0;
};

// ═══════════════════════════════════════════════════════════
// Анонс после резолва
// ═══════════════════════════════════════════════════════════

struct ServiceAnnouncement {
    ServiceType serviceType = ServiceType::Pairing;
    std::string name;
    std::vector<std::string> resolvedAddresses;     // В порядке получения
    uint16_t port = 0;
    std::string hostTarget;
    std::map<std::string, std::string> txt;
};

/// Выбрать адрес для adb: первый IPv4, иначе первый любой
/// @return nullopt если адресов нет или порт не известен
ADBEE_API std::optional<Endpoint> selectEndpoint(const ServiceAnnouncement& announcement);

/// Является ли строка IPv4 адресом в точечной нотации
ADBEE_API bool isIpv4Address(const std::string& address);

} // namespace Adbee
