#pragma once

#define FAULTSCAN_VERSION_MAJOR 0
#define FAULTSCAN_VERSION_MINOR 1
#define FAULTSCAN_VERSION_PATCH 0
#define FAULTSCAN_VERSION_STR   "0.1.0"
#define FAULTSCAN_C_ABI_VER     1


namespace faultscan {
    constexpr int  kVersionMajor = FAULTSCAN_VERSION_MAJOR;
    constexpr int  kVersionMinor = FAULTSCAN_VERSION_MINOR;
    constexpr int  kVersionPatch = FAULTSCAN_VERSION_PATCH;
    constexpr char kVersionStr[] = FAULTSCAN_VERSION_STR;
    constexpr int  kCAbiVersion  = FAULTSCAN_C_ABI_VER;
} // namespace faultscan

#if defined(__cplusplus)
extern "C"{
#endif
    const char* faultscan_version_string() noexcept;
    int         faultscan_c_abi_version() noexcept;
#if defined(__cplusplus)
}
#endif
