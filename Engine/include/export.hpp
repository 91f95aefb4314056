#pragma once

#if defined(_WIN32)
    #if defined(COALESCE_EXPORT)
        #define COALESCE_API __declspec(dllexport)
    #else
        #define COALESCE_API __declspec(dllimport)
    #endif
#else
    #define COALESCE_API __attribute__((visibility("default")))
#endif
