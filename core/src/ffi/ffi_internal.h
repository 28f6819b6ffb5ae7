// ffi_internal.h — Internal shared declarations for FFI implementation

#ifndef ADBEE_FFI_INTERNAL_H
#define ADBEE_FFI_INTERNAL_H

#include "adbee/adbee_c.h"
#include <string>
#include <cstring>

#ifdef _WIN32
    #define adbee_strdup _strdup
#else
    #define adbee_strdup strdup
#endif

// Thread-local error state
extern thread_local AdbeeError g_lastError;
extern thread_local std::string g_lastErrorMessage;

// Error handling functions (defined in adbee_c.cpp)
// Note: default argument only in declaration, not in definition
void setLastError(AdbeeError error, const std::string& message = "");
inline void clearLastError() { setLastError(ADBEE_OK); }

// String allocation (defined in adbee_c.cpp)
char* alloc_string(const std::string& str);

#endif // ADBEE_FFI_INTERNAL_H
