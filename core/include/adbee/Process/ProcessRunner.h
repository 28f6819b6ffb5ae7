// ProcessRunner.h — Запуск внешних программ (adb) с жёстким timeout

#pragma once

#include "../export.h"
#include <string>
#include <vector>
#include <optional>
#include <chrono>
#include <memory>

namespace Adbee {

// ═══════════════════════════════════════════════════════════
// Результат запуска
// ═══════════════════════════════════════════════════════════

struct ProcessResult {
    bool started = false;       // Процесс удалось запустить (exec прошёл)
    bool timedOut = false;      // Убит по timeout
    int exitCode = -1;          // -1 если процесс не завершился сам
    std::string stdoutData;
    std::string stderrData;
    std::string error;          // Описание ошибки запуска

    /// Запущен, не убит, exit 0
    bool succeeded() const { return started && !timedOut && exitCode == 0; }

    /// stdout + stderr
    std::string combinedOutput() const { return stdoutData + stderrData; }
};

// ═══════════════════════════════════════════════════════════
// IProcessRunner — точка подмены для тестов
// ═══════════════════════════════════════════════════════════

class ADBEE_API IProcessRunner {
public:
    virtual ~IProcessRunner() = default;

    /// Запустить argv[0] с аргументами, дождаться завершения или timeout
    /// Блокирует вызывающий поток
    virtual ProcessResult run(const std::vector<std::string>& argv,
                              std::chrono::milliseconds timeout) = 0;

    /// Найти исполняемый файл (как `which`)
    /// @return Полный путь или nullopt
    virtual std::optional<std::string> findExecutable(const std::string& name) const = 0;
};

// ═══════════════════════════════════════════════════════════
// PosixProcessRunner — fork/execvp + pipe + poll
// ═══════════════════════════════════════════════════════════

class ADBEE_API PosixProcessRunner : public IProcessRunner {
public:
    PosixProcessRunner() = default;

    ProcessResult run(const std::vector<std::string>& argv,
                      std::chrono::milliseconds timeout) override;

    std::optional<std::string> findExecutable(const std::string& name) const override;

    /// Поиск по PATH без экземпляра
    static std::optional<std::string> which(const std::string& name);
};

} // namespace Adbee
