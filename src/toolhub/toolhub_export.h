#pragma once

#ifdef _WIN32
    #ifdef TOOLHUB_BUILDING_DLL
        #define TOOLHUB_API __declspec(dllexport)
    #else
        #define TOOLHUB_API __declspec(dllimport)
    #endif
#else
    #define TOOLHUB_API
#endif
