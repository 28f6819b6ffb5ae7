// Config.cpp — Чтение/запись AdbeeConfig через nlohmann::json

#include "adbee/Config.h"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace Adbee {

using json = nlohmann::json;

namespace {

std::chrono::milliseconds readMs(const json& j, const char* key, std::chrono::milliseconds fallback) {
    if (!j.contains(key)) return fallback;
    const auto& value = j.at(key);
    if (!value.is_number_integer()) {
        throw std::runtime_error(std::string("Config: '") + key + "' must be an integer (milliseconds)");
    }
    return std::chrono::milliseconds(value.get<int64_t>());
}

} // anonymous namespace

AdbeeConfig AdbeeConfig::fromJson(const std::string& jsonText) {
    json j;
    try {
        j = json::parse(jsonText);
    } catch (const json::parse_error& e) {
        throw std::runtime_error(std::string("Config: invalid JSON: ") + e.what());
    }

    if (!j.is_object()) {
        throw std::runtime_error("Config: top-level value must be an object");
    }

    AdbeeConfig config;
    try {
        config.adbPath = j.value("adbPath", config.adbPath);
        config.serviceName = j.value("serviceName", config.serviceName);
        config.pairingServiceType = j.value("pairingServiceType", config.pairingServiceType);
        config.connectServiceType = j.value("connectServiceType", config.connectServiceType);
        config.connectAttempts = j.value("connectAttempts", config.connectAttempts);
        config.reconnectOnReappearance = j.value("reconnectOnReappearance", config.reconnectOnReappearance);
        config.logLevel = j.value("logLevel", config.logLevel);
    } catch (const json::type_error& e) {
        throw std::runtime_error(std::string("Config: wrong value type: ") + e.what());
    }

    config.pairTimeout = readMs(j, "pairTimeoutMs", config.pairTimeout);
    config.connectTimeout = readMs(j, "connectTimeoutMs", config.connectTimeout);
    config.resolveTimeout = readMs(j, "resolveTimeoutMs", config.resolveTimeout);
    config.retryDelay = readMs(j, "retryDelayMs", config.retryDelay);
    config.opportunisticRetryDelay = readMs(j, "opportunisticRetryDelayMs", config.opportunisticRetryDelay);

    config.validate();
    return config;
}

AdbeeConfig AdbeeConfig::fromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Config: cannot open " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    spdlog::debug("Config: Loading {}", path);
    return fromJson(buffer.str());
}

std::string AdbeeConfig::toJson() const {
    json j = {
        {"adbPath", adbPath},
        {"serviceName", serviceName},
        {"pairingServiceType", pairingServiceType},
        {"connectServiceType", connectServiceType},
        {"pairTimeoutMs", pairTimeout.count()},
        {"connectTimeoutMs", connectTimeout.count()},
        {"resolveTimeoutMs", resolveTimeout.count()},
        {"connectAttempts", connectAttempts},
        {"retryDelayMs", retryDelay.count()},
        {"opportunisticRetryDelayMs", opportunisticRetryDelay.count()},
        {"reconnectOnReappearance", reconnectOnReappearance},
        {"logLevel", logLevel}
    };
    return j.dump(2);
}

void AdbeeConfig::validate() const {
    if (adbPath.empty()) {
        throw std::runtime_error("Config: 'adbPath' must not be empty");
    }
    if (serviceName.empty()) {
        throw std::runtime_error("Config: 'serviceName' must not be empty");
    }
    if (pairingServiceType.empty() || connectServiceType.empty()) {
        throw std::runtime_error("Config: service types must not be empty");
    }
    if (pairTimeout.count() <= 0) {
        throw std::runtime_error("Config: 'pairTimeoutMs' must be positive");
    }
    if (connectTimeout.count() <= 0) {
        throw std::runtime_error("Config: 'connectTimeoutMs' must be positive");
    }
    if (resolveTimeout.count() <= 0) {
        throw std::runtime_error("Config: 'resolveTimeoutMs' must be positive");
    }
    if (connectAttempts < 1) {
        throw std::runtime_error("Config: 'connectAttempts' must be at least 1");
    }
    if (retryDelay.count() < 0 || opportunisticRetryDelay.count() < 0) {
        throw std::runtime_error("Config: retry delays must not be negative");
    }
    if (spdlog::level::from_str(logLevel) == spdlog::level::off && logLevel != "off") {
        throw std::runtime_error("Config: unknown 'logLevel' " + logLevel);
    }
}

void AdbeeConfig::applyLogLevel() const {
    spdlog::set_level(spdlog::level::from_str(logLevel));
}

} // namespace Adbee
