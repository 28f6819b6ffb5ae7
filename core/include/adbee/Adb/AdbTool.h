// AdbTool.h — Вызовы `adb pair` и `adb connect` и разбор их вывода

#pragma once

#include "../export.h"
#include "../Models.h"
#include "../Process/ProcessRunner.h"
#include <string>
#include <memory>
#include <optional>
#include <chrono>

namespace Adbee {

// ═══════════════════════════════════════════════════════════
// Маркеры успеха в выводе adb
// ═══════════════════════════════════════════════════════════

constexpr const char* PAIR_SUCCESS_MARKER = "Successfully paired";
constexpr const char* CONNECT_SUCCESS_MARKER = "connected";
constexpr const char* CONNECT_ALREADY_MARKER = "already connected";

// ═══════════════════════════════════════════════════════════
// AdbTool
// ═══════════════════════════════════════════════════════════

class ADBEE_API AdbTool {
public:
    /// @param runner Исполнитель процессов (общий для всех вызовов)
    /// @param adbPath Имя в PATH или абсолютный путь к adb
    AdbTool(std::shared_ptr<IProcessRunner> runner, std::string adbPath = "adb");

    /// Найден ли adb
    bool isAvailable() const;

    /// Полный путь к adb или nullopt
    std::optional<std::string> locate() const;

    /// adb pair <endpoint> <code>
    ProcessResult pair(const Endpoint& endpoint, const std::string& pairingCode,
                       std::chrono::milliseconds timeout);

    /// adb connect <endpoint>
    ProcessResult connect(const Endpoint& endpoint, std::chrono::milliseconds timeout);

    /// exit 0 и "Successfully paired" в stdout
    static bool isPairSuccess(const ProcessResult& result);

    /// exit 0 и "connected"/"already connected" в stdout+stderr (без учёта регистра)
    static bool isConnectSuccess(const ProcessResult& result);

    /// Вывод adb в одну строку для логов
    static std::string describe(const ProcessResult& result);

private:
    std::shared_ptr<IProcessRunner> m_runner;
    std::string m_adbPath;
};

} // namespace Adbee
