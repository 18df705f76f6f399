#include "faultscan/version.hpp"
#include "faultscan/visibility.hpp"

extern "C"{
    FAULTSCAN_API const char* faultscan_version_string() noexcept {
        return faultscan::kVersionStr;
    }

    FAULTSCAN_API int faultscan_c_abi_version() noexcept{
        return faultscan::kCAbiVersion;
    }
}
