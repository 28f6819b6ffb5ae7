#pragma once

#ifdef _WIN32
    #ifdef ADBEE_EXPORTS
        #define ADBEE_API __declspec(dllexport)
    #else
        #define ADBEE_API __declspec(dllimport)
    #endif
#else
    #define ADBEE_API __attribute__((visibility("default")))
#endif
