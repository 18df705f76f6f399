#pragma once

#include "faultscan/version.hpp"
#include "faultscan/visibility.hpp"
#include "faultscan/core/time.hpp"
#include "faultscan/core/types.hpp"
#include "faultscan/core/status.hpp"
#include "faultscan/core/expected.hpp"
#include "faultscan/core/summary.hpp"
#include "faultscan/core/device_state.hpp"
#include "faultscan/io/logger.hpp"
#include "faultscan/io/ingest_counters.hpp"
#include "faultscan/parse/line_parser.hpp"
#include "faultscan/decode/fault_decoder.hpp"
#include "faultscan/aggregate/device_aggregator.hpp"
