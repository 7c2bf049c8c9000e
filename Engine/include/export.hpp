#pragma once

#if defined(_WIN32)
    #if defined(BROADSHEET_EXPORT)
        #define BROADSHEET_API __declspec(dllexport)
    #else
        #define BROADSHEET_API __declspec(dllimport)
    #endif
#else
    #define BROADSHEET_API __attribute__((visibility("default")))
#endif
