#pragma once

#if defined(_WIN32) || defined(_WIN64)

  #if defined(FAULTSCAN_BUILD_DLL)
    #define FAULTSCAN_API __declspec(dllexport)

  #else
    #define FAULTSCAN_API __declspec(dllimport)

  #endif

#else
  #define FAULTSCAN_API __attribute__((visibility("default")))

#endif
