#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>

#include "faultscan/core/types.hpp"
#include "faultscan/core/status.hpp"
#include "faultscan/core/expected.hpp"

namespace faultscan::decode{

    // // width of the combined sp1/sp2 digit window
    inline constexpr std::size_t kWindow = 6;

    // // bit index 4 counted from the MSB of an 8 bit value
    inline constexpr std::uint8_t kFlagMask = 0x08;

    // // The three flag bytes decoded from the digit window, in priority order
    struct FlagPairs{
        std::array<std::uint8_t, 3> value{};

        [[nodiscard]] constexpr bool flagged(std::size_t i) const noexcept{
            return (value[i] & kFlagMask) != 0;
        }
    };

    namespace detail{
        /*
        Builds the 6 char window:
            sp1 without its last char (checksum), then sp2 without leading '-'
            left pad with '0' up to 6, keep the first 6
        */
        [[nodiscard]] inline constexpr std::array<char, kWindow> make_window(std::string_view sp1, std::string_view sp2) noexcept{
            if (!sp1.empty()) sp1.remove_suffix(1);
            while (!sp2.empty() && sp2.front() == '-') sp2.remove_prefix(1);

            const std::size_t len = sp1.size() + sp2.size();
            const std::size_t pad = (len < kWindow) ? kWindow - len : 0;

            std::array<char, kWindow> w{};
            std::size_t i = 0;
            for (; i < pad; ++i) w[i] = '0';

            // copy from the concatenation until the window is full
            for (char c : sp1){
                if (i == kWindow) return w;
                w[i++] = c;
            }
            for (char c : sp2){
                if (i == kWindow) return w;
                w[i++] = c;
            }
            return w;
        }

        [[nodiscard]] inline constexpr bool is_digit(char c) noexcept{
            return c >= '0' && c <= '9';
        }
    } // namespace detail

    namespace detail{
        // pair p of the window as 0..99, or -1 when it is not two decimal digits
        [[nodiscard]] inline constexpr int pair_at(const std::array<char, kWindow>& w, std::size_t p) noexcept{
            const char hi = w[2 * p];
            const char lo = w[2 * p + 1];
            if (!is_digit(hi) || !is_digit(lo)) return -1;
            return (hi - '0') * 10 + (lo - '0');
        }
    } // namespace detail

    // // pair index -> reason, in priority order
    inline constexpr std::array<FaultReason, 3> kPairReason{
        FaultReason::Battery, FaultReason::Temperature, FaultReason::Threshold
    };

    /// @brief decode all three flag bytes out of sp1/sp2, for diagnostics
    /// @return kInvalidArg for an empty input, kDecodeFault when any pair is not two decimal digits
    [[nodiscard]] inline Expected<FlagPairs> decode_pairs(std::string_view sp1, std::string_view sp2) noexcept{
        if (sp1.empty() || sp2.empty()) return Expected<FlagPairs>::failure(Status::kInvalidArg);

        const auto w = detail::make_window(sp1, sp2);

        FlagPairs fp{};
        for (std::size_t p = 0; p < fp.value.size(); ++p){
            const int v = detail::pair_at(w, p);
            if (v < 0) return Expected<FlagPairs>::failure(Status::kDecodeFault);

            // two decimal digits are at most 99 -> always a valid 8 bit value
            fp.value[p] = static_cast<std::uint8_t>(v);
        }
        return Expected<FlagPairs>::success(fp);
    }

    // // strict priority: pair 1 (battery) > pair 2 (temperature) > pair 3 (threshold)
    [[nodiscard]] inline constexpr FaultReason reason_from(const FlagPairs& fp) noexcept{
        for (std::size_t p = 0; p < fp.value.size(); ++p){
            if (fp.flagged(p)) return kPairReason[p];
        }
        return FaultReason::Unknown;
    }

    /*
    Name the dominant fault for a "DD" record.
        sp1: raw status field 1 (trailing checksum char included)
        sp2: raw status field 2
    Pairs are read in priority order and the first flagged one wins, so a malformed pair
    only yields Unknown when no earlier pair is flagged. Never fails.
    */
    [[nodiscard]] inline constexpr FaultReason decode_fault(std::string_view sp1, std::string_view sp2) noexcept{
        if (sp1.empty() || sp2.empty()) return FaultReason::Unknown;

        const auto w = detail::make_window(sp1, sp2);
        for (std::size_t p = 0; p < kPairReason.size(); ++p){
            const int v = detail::pair_at(w, p);
            if (v < 0) return FaultReason::Unknown;
            if ((static_cast<unsigned>(v) & kFlagMask) != 0) return kPairReason[p];
        }
        return FaultReason::Unknown;
    }

} // namespace faultscan::decode
