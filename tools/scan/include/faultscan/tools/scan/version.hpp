#pragma once
#include "faultscan/version.hpp"

#define FAULTSCAN_SCAN_VERSION_MAJOR FAULTSCAN_VERSION_MAJOR
#define FAULTSCAN_SCAN_VERSION_MINOR 1
#define FAULTSCAN_SCAN_VERSION_PATCH 0
#define FAULTSCAN_SCAN_VERSION_STR   "0.1.0"

namespace faultscan::tools::scan{
    constexpr int kVersionMajor = FAULTSCAN_SCAN_VERSION_MAJOR;
    constexpr int kVersionMinor = FAULTSCAN_SCAN_VERSION_MINOR;
    constexpr int kVersionPatch = FAULTSCAN_SCAN_VERSION_PATCH;
    constexpr char kVersionStr[] = FAULTSCAN_SCAN_VERSION_STR;
} // faultscan::tools::scan
