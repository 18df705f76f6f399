#pragma once

#include <string>
#include <vector>
#include <cstdio>
#include <cstddef>
#include <cstdint>
#include <variant>
#include <algorithm>
#include <string_view>
#include <unordered_map>

#include "faultscan/core/time.hpp"
#include "faultscan/core/types.hpp"
#include "faultscan/core/summary.hpp"
#include "faultscan/core/device_state.hpp"
#include "faultscan/decode/fault_decoder.hpp"
#include "faultscan/io/logger.hpp"

namespace faultscan::aggregate{

    // // what a single fold() did; state is never affected by how the caller uses this
    enum class FoldOutcome : std::uint8_t{
        kHealthyCounted = 0,
        kFaultRecorded,
        kIgnoredSticky,         // "02" for a sensor already Faulty
        kIgnoredDuplicateFault, // "DD" for a sensor already Faulty
        kIgnoredState           // neither "02" nor "DD"
    };

    [[nodiscard]] inline constexpr std::string_view to_string(FoldOutcome o) noexcept{
        switch (o){
            case FoldOutcome::kHealthyCounted:        return "healthy counted";
            case FoldOutcome::kFaultRecorded:         return "fault recorded";
            case FoldOutcome::kIgnoredSticky:         return "ignored (sticky fault)";
            case FoldOutcome::kIgnoredDuplicateFault: return "ignored (duplicate fault)";
            case FoldOutcome::kIgnoredState:          return "ignored (state)";
        }
        return "unknown";
    }

    // // Single-pass fold of Records into per-sensor DeviceState.
    // // Owns all state for one run; not thread safe.
    class DeviceAggregator{
        public:
            explicit DeviceAggregator(LoggerSink* log = nullptr) noexcept : log_(log){}

            FoldOutcome fold(const Record& r){
                const bool dd = (r.state == kStateFaulty);
                const bool ok = (r.state == kStateHealthy);
                if (!dd && !ok) return FoldOutcome::kIgnoredState;

                auto it = index_.find(r.sensor_id);

                if (dd){
                    if (it != index_.end() && is_faulty(entries_[it->second].state)){
                        return FoldOutcome::kIgnoredDuplicateFault;
                    }

                    const Faulty f{decode_reason_(r), faulty_++};

                    if (it == index_.end()){
                        index_.emplace(r.sensor_id, entries_.size());
                        entries_.push_back(Entry{r.sensor_id, f});
                    }else{
                        // Healthy -> Faulty: earlier "02" counts stop mattering
                        --healthy_;
                        entries_[it->second].state = f;
                    }
                    return FoldOutcome::kFaultRecorded;
                }

                if (it == index_.end()){
                    index_.emplace(r.sensor_id, entries_.size());
                    entries_.push_back(Entry{r.sensor_id, Healthy{1}});
                    ++healthy_;
                    return FoldOutcome::kHealthyCounted;
                }

                DeviceState& st = entries_[it->second].state;
                if (auto* h = std::get_if<Healthy>(&st)){
                    ++h->count;
                    return FoldOutcome::kHealthyCounted;
                }
                return FoldOutcome::kIgnoredSticky;
            }

            // // Materialize the end-of-stream view. Healthy in first-seen order, Faulty in first "DD" order
            [[nodiscard]] Summary summary() const{
                Summary s{};
                s.faulty_devices.resize(faulty_);
                s.healthy_devices.reserve(healthy_);

                for (const auto& e : entries_){
                    if (const auto* f = std::get_if<Faulty>(&e.state)){
                        s.faulty_devices[f->fault_seq] = FaultyDevice{e.sensor_id, f->reason};
                    }else{
                        s.healthy_devices.push_back(HealthyDevice{e.sensor_id, std::get<Healthy>(e.state).count});
                    }
                }

                s.healthy_count = s.healthy_devices.size();
                s.faulty_count = s.faulty_devices.size();
                s.total_devices = s.healthy_count + s.faulty_count;
                return s;
            }

            // null if the sensor was never seen with "02" or "DD"
            [[nodiscard]] const DeviceState* find(std::string_view sensor_id) const{
                const auto it = index_.find(std::string(sensor_id));
                return it == index_.end() ? nullptr : &entries_[it->second].state;
            }

            [[nodiscard]] std::size_t device_count() const noexcept{
                return entries_.size();
            }

            void reset() noexcept{
                entries_.clear();
                index_.clear();
                healthy_ = 0;
                faulty_ = 0;
            }

        private:
            struct Entry{
                std::string sensor_id;
                DeviceState state;
            };

            FaultReason decode_reason_(const Record& r) const{
                const FaultReason reason = decode::decode_fault(r.sp1, r.sp2);

                if (log_ && log_->enabled(LogLevel::kDebug)){
                    const auto fp = decode::decode_pairs(r.sp1, r.sp2);
                    char msg[256];
                    if (fp){
                        std::snprintf(msg, sizeof(msg), "fault %s: flags=%02u/%02u/%02u -> %s",
                            r.sensor_id.c_str(),
                            static_cast<unsigned>(fp.value().value[0]),
                            static_cast<unsigned>(fp.value().value[1]),
                            static_cast<unsigned>(fp.value().value[2]),
                            std::string(faultscan::to_string(reason)).c_str());
                    }else{
                        std::snprintf(msg, sizeof(msg), "fault %s: sp1='%s' sp2='%s' not fully decodable (%s) -> %s",
                            r.sensor_id.c_str(), r.sp1.c_str(), r.sp2.c_str(), faultscan::to_string(fp.status()),
                            std::string(faultscan::to_string(reason)).c_str());
                    }
                    log_->log(LogLevel::kDebug, msg, now_mono_ns());
                }
                return reason;
            }

            // first-seen order; index_ maps sensor id -> slot
            std::vector<Entry> entries_;
            std::unordered_map<std::string, std::size_t> index_;

            std::uint64_t healthy_{0};
            std::uint64_t faulty_{0};

            LoggerSink* log_{nullptr};
    };

    // // Fold a whole sequence with a fresh aggregator
    template <class Records>
    [[nodiscard]] Summary aggregate(const Records& records, LoggerSink* log = nullptr){
        DeviceAggregator agg(log);
        for (const Record& r : records) (void)agg.fold(r);
        return agg.summary();
    }

} // namespace faultscan::aggregate
