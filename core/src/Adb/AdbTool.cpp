#include "adbee/Adb/AdbTool.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace Adbee {

namespace {

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return value;
}

std::string trim(const std::string& value) {
    auto begin = value.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return "";
    auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(begin, end - begin + 1);
}

} // anonymous namespace

AdbTool::AdbTool(std::shared_ptr<IProcessRunner> runner, std::string adbPath)
    : m_runner(std::move(runner))
    , m_adbPath(std::move(adbPath)) {
    if (!m_runner) {
        throw std::invalid_argument("AdbTool: runner is null");
    }
}

bool AdbTool::isAvailable() const {
    return locate().has_value();
}

std::optional<std::string> AdbTool::locate() const {
    return m_runner->findExecutable(m_adbPath);
}

ProcessResult AdbTool::pair(const Endpoint& endpoint, const std::string& pairingCode,
                            std::chrono::milliseconds timeout) {
    // Код в лог не пишем
    spdlog::info("AdbTool: Executing: adb pair {} ******", endpoint.toString());
    return m_runner->run({m_adbPath, "pair", endpoint.toString(), pairingCode}, timeout);
}

ProcessResult AdbTool::connect(const Endpoint& endpoint, std::chrono::milliseconds timeout) {
    spdlog::debug("AdbTool: Executing: adb connect {}", endpoint.toString());
    return m_runner->run({m_adbPath, "connect", endpoint.toString()}, timeout);
}

bool AdbTool::isPairSuccess(const ProcessResult& result) {
    return result.succeeded() &&
           result.stdoutData.find(PAIR_SUCCESS_MARKER) != std::string::npos;
}

bool AdbTool::isConnectSuccess(const ProcessResult& result) {
    if (!result.succeeded()) return false;
    auto output = toLower(result.combinedOutput());
    return output.find(CONNECT_SUCCESS_MARKER) != std::string::npos ||
           output.find(CONNECT_ALREADY_MARKER) != std::string::npos;
}

std::string AdbTool::describe(const ProcessResult& result) {
    if (!result.started) {
        return result.error.empty() ? "not started" : result.error;
    }
    if (result.timedOut) {
        return "timeout";
    }
    auto output = trim(result.stderrData.empty() ? result.stdoutData
                                                 : result.stderrData);
    if (output.empty()) output = trim(result.combinedOutput());
    return "exit " + std::to_string(result.exitCode) +
           (output.empty() ? "" : ": " + output);
}

} // namespace Adbee
