// adbee_c.cpp — реализация общих функций C API

#include "ffi_internal.h"
#include "adbee/adbee_c.h"
#include "adbee/core.h"
#include "adbee/Credentials.h"

#include <spdlog/spdlog.h>
#include <cstdlib>

using namespace Adbee;

// ═══════════════════════════════════════════════════════════
// Thread-local error state
// ═══════════════════════════════════════════════════════════

// Shared across ffi_*.cpp files
thread_local AdbeeError g_lastError = ADBEE_OK;
thread_local std::string g_lastErrorMessage;

void setLastError(AdbeeError error, const std::string& message) {
    g_lastError = error;
    g_lastErrorMessage = message;
    if (error != ADBEE_OK) {
        spdlog::error("FFI error (code {}): {}", static_cast<int>(error), message);
    }
}

char* alloc_string(const std::string& str) {
    return adbee_strdup(str.c_str());
}

// ═══════════════════════════════════════════════════════════
// Общие функции
// ═══════════════════════════════════════════════════════════

const char* adbee_version(void) {
    return Adbee::VERSION;
}

const char* adbee_error_message(AdbeeError error) {
    switch (error) {
        case ADBEE_OK: return "Success";
        case ADBEE_ERROR_INVALID_ARGUMENT: return "Invalid argument";
        case ADBEE_ERROR_TOOL_UNAVAILABLE: return "adb not found";
        case ADBEE_ERROR_DISCOVERY_UNAVAILABLE: return "DNS-SD unavailable";
        case ADBEE_ERROR_CONFIG: return "Invalid configuration";
        case ADBEE_ERROR_INTERNAL:
        default: return "Internal error";
    }
}

AdbeeError adbee_last_error(void) {
    return g_lastError;
}

const char* adbee_last_error_message(void) {
    return g_lastErrorMessage.c_str();
}

void adbee_clear_error(void) {
    g_lastError = ADBEE_OK;
    g_lastErrorMessage.clear();
}

void adbee_free_string(char* str) {
    std::free(str);
}

char* adbee_qr_payload(const char* service_name, const char* pairing_code) {
    clearLastError();

    if (!service_name || !pairing_code) {
        setLastError(ADBEE_ERROR_INVALID_ARGUMENT, "service_name or pairing_code is null");
        return nullptr;
    }

    PairingSession session;
    session.serviceName = service_name;
    session.pairingCode = pairing_code;
    return alloc_string(qrPayload(session));
}
