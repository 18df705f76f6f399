#pragma once
#include <string>
#include <vector>

#include "faultscan/io/logger.hpp"

namespace faultscan_test{
    // // keeps every message at or above min for later inspection
    struct CaptureSink final : faultscan::LoggerSink{
        explicit CaptureSink(faultscan::LogLevel min = faultscan::LogLevel::kTrace) : min_(min){}

        bool enabled(faultscan::LogLevel lvl) const noexcept override{
            return static_cast<int>(lvl) >= static_cast<int>(min_);
        }

        void log(faultscan::LogLevel lvl, const char* msg, faultscan::t_ns) noexcept override{
            lines.emplace_back(lvl, msg);
        }

        bool contains(faultscan::LogLevel lvl, const std::string& needle) const{
            for (const auto& l : lines){
                if (l.first == lvl && l.second.find(needle) != std::string::npos) return true;
            }
            return false;
        }

        std::vector<std::pair<faultscan::LogLevel, std::string>> lines;

        private:
            faultscan::LogLevel min_;
    };
} // namespace faultscan_test
