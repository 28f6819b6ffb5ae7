// Types.h — Базовые перечисления ADBee

#pragma once

#include <cstdint>
#include <string>

namespace Adbee {

// ═══════════════════════════════════════════════════════════
// Тип анонсируемого сервиса
// ═══════════════════════════════════════════════════════════

enum class ServiceType : int32_t {
    Pairing = 0,    // _adb-tls-pairing._tcp — телефон ждёт adb pair
    Connect = 1     // _adb-tls-connect._tcp — телефон принимает adb connect
};

const char* serviceTypeToString(ServiceType type);

// ═══════════════════════════════════════════════════════════
// События браузера DNS-SD
// ═══════════════════════════════════════════════════════════

enum class ServiceEventKind : int32_t {
    Added = 0,
    Removed = 1,
    Updated = 2
};

const char* serviceEventKindToString(ServiceEventKind kind);

// ═══════════════════════════════════════════════════════════
// Категории ошибок (никогда не выходят за API как исключения)
// ═══════════════════════════════════════════════════════════

enum class AdbError : int32_t {
    None = 0,
    ResolutionFailure = 1,      // Анонс без адреса — событие отбрасывается
    ToolInvocationFailure = 2,  // adb вернул ошибку или timeout
    ToolUnavailable = 3,        // adb не найден в PATH
    DiscoveryUnavailable = 4    // DNS-SD демон недоступен
};

const char* adbErrorToString(AdbError error);

// ═══════════════════════════════════════════════════════════
// Состояние оркестратора
// ═══════════════════════════════════════════════════════════

enum class ServiceState : int32_t {
    Idle = 0,
    Running = 1
};

const char* serviceStateToString(ServiceState state);

} // namespace Adbee
