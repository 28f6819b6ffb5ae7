// ffi_service.cpp — C API for AdbService

#include "adbee/adbee_c.h"
#include "adbee/AdbService.h"
#include "adbee/Credentials.h"
#include "adbee/Network/DnsSdDiscovery.h"
#include "ffi_internal.h"

#include <memory>
#include <string>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

using namespace Adbee;
using json = nlohmann::json;

// ═══════════════════════════════════════════════════════════
// AdbService Wrapper
// ═══════════════════════════════════════════════════════════

namespace {

enum class ServiceEventCode : int32_t {
    Paired = 0,
    Connected = 1
};

struct ServiceWrapper {
    AdbeeEventCallback callback = nullptr;
    void* userData = nullptr;
    std::unique_ptr<AdbService> service;  // Последним: рабочие потоки используют callback

    void emit(ServiceEventCode event, const json& payload) {
        if (!callback) return;
        // Caller must call adbee_free_string after reading
        char* data = alloc_string(payload.dump());
        callback(static_cast<int32_t>(event), data, userData);
    }
};

AdbeeError toCError(AdbError error) {
    switch (error) {
        case AdbError::None: return ADBEE_OK;
        case AdbError::ToolUnavailable: return ADBEE_ERROR_TOOL_UNAVAILABLE;
        case AdbError::DiscoveryUnavailable: return ADBEE_ERROR_DISCOVERY_UNAVAILABLE;
        default: return ADBEE_ERROR_INTERNAL;
    }
}

} // anonymous namespace

// ═══════════════════════════════════════════════════════════
// Service
// ═══════════════════════════════════════════════════════════

ADBEE_API AdbeeService adbee_service_create(const char* config_json,
                                            AdbeeEventCallback callback,
                                            void* user_data) {
    clearLastError();

    AdbeeConfig config;
    try {
        if (config_json && *config_json) {
            config = AdbeeConfig::fromJson(config_json);
        }
    } catch (const std::exception& e) {
        setLastError(ADBEE_ERROR_CONFIG, e.what());
        return nullptr;
    }
    config.applyLogLevel();

    try {
        auto wrapper = std::make_unique<ServiceWrapper>();
        wrapper->callback = callback;
        wrapper->userData = user_data;

        ServiceWrapper* raw = wrapper.get();
        AdbService::Callbacks callbacks;
        callbacks.onPaired = [raw](const std::string& address) {
            raw->emit(ServiceEventCode::Paired, json{{"address", address}});
        };
        callbacks.onConnected = [raw](const std::string& endpoint) {
            raw->emit(ServiceEventCode::Connected, json{{"endpoint", endpoint}});
        };

        wrapper->service = std::make_unique<AdbService>(config, std::move(callbacks),
                                                        dnsSdDiscoveryFactory());
        spdlog::debug("AdbService created");
        return reinterpret_cast<AdbeeService>(wrapper.release());
    } catch (const std::exception& e) {
        setLastError(ADBEE_ERROR_INTERNAL, e.what());
        return nullptr;
    }
}

ADBEE_API void adbee_service_destroy(AdbeeService service) {
    if (!service) return;

    auto* wrapper = reinterpret_cast<ServiceWrapper*>(service);
    if (wrapper->service) {
        wrapper->service->stop();
    }
    delete wrapper;
    spdlog::debug("AdbService destroyed");
}

ADBEE_API char* adbee_service_generate_credentials(AdbeeService service) {
    clearLastError();

    if (!service) {
        setLastError(ADBEE_ERROR_INVALID_ARGUMENT, "AdbService is null");
        return nullptr;
    }

    try {
        auto* wrapper = reinterpret_cast<ServiceWrapper*>(service);
        auto session = wrapper->service->generateCredentials();
        json j = {
            {"serviceName", session.serviceName},
            {"pairingCode", session.pairingCode},
            {"qrPayload", qrPayload(session)}
        };
        return alloc_string(j.dump());
    } catch (const std::exception& e) {
        setLastError(ADBEE_ERROR_INTERNAL, e.what());
        return nullptr;
    }
}

ADBEE_API AdbeeError adbee_service_start(AdbeeService service) {
    clearLastError();

    if (!service) {
        setLastError(ADBEE_ERROR_INVALID_ARGUMENT, "AdbService is null");
        return ADBEE_ERROR_INVALID_ARGUMENT;
    }

    try {
        auto* wrapper = reinterpret_cast<ServiceWrapper*>(service);
        if (!wrapper->service->start()) {
            AdbeeError error = toCError(wrapper->service->getLastErrorKind());
            setLastError(error, wrapper->service->getLastError());
            return error;
        }
        return ADBEE_OK;
    } catch (const std::exception& e) {
        setLastError(ADBEE_ERROR_INTERNAL, e.what());
        return ADBEE_ERROR_INTERNAL;
    }
}

ADBEE_API void adbee_service_stop(AdbeeService service) {
    if (!service) return;

    auto* wrapper = reinterpret_cast<ServiceWrapper*>(service);
    wrapper->service->stop();
}

ADBEE_API int32_t adbee_service_is_running(AdbeeService service) {
    if (!service) return 0;

    auto* wrapper = reinterpret_cast<ServiceWrapper*>(service);
    return wrapper->service->isRunning() ? 1 : 0;
}

ADBEE_API char* adbee_service_get_connected(AdbeeService service) {
    clearLastError();

    if (!service) {
        setLastError(ADBEE_ERROR_INVALID_ARGUMENT, "AdbService is null");
        return nullptr;
    }

    try {
        auto* wrapper = reinterpret_cast<ServiceWrapper*>(service);
        json arr = wrapper->service->getConnectedEndpoints();
        return alloc_string(arr.dump());
    } catch (const std::exception& e) {
        setLastError(ADBEE_ERROR_INTERNAL, e.what());
        return nullptr;
    }
}
