#pragma once

#ifdef _WIN32
    #ifdef COSMICCONNECT_EXPORTS
        #define CC_API __declspec(dllexport)
    #else
        #define CC_API __declspec(dllimport)
    #endif
#else
    #define CC_API __attribute__((visibility("default")))
#endif
