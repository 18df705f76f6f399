#pragma once

#include <array>
#include <string>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

#include "faultscan/core/types.hpp"

namespace faultscan::parse{

    // // why a line was (not) turned into a Record
    enum class LineVerdict : std::uint8_t{
        kAccepted = 0,
        kNoMarker,          // no "> " anywhere
        kTooFewFields,      // < 18 ';' separated fields
        kWrongHandler,      // field 0 != "BIG"
        kEmptySensorId      // field 2 blank
    };

    [[nodiscard]] inline constexpr std::string_view to_string(LineVerdict v) noexcept{
        switch (v){
            case LineVerdict::kAccepted:      return "accepted";
            case LineVerdict::kNoMarker:      return "no marker";
            case LineVerdict::kTooFewFields:  return "too few fields";
            case LineVerdict::kWrongHandler:  return "wrong handler";
            case LineVerdict::kEmptySensorId: return "empty sensor id";
        }
        return "unknown";
    }

    namespace detail{
        // same set as the C locale isspace, without the locale lookup
        [[nodiscard]] inline constexpr bool is_space(char c) noexcept{
            return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
        }

        [[nodiscard]] inline constexpr bool is_quote(char c) noexcept{
            return c == '\'' || c == '"';
        }

        [[nodiscard]] inline constexpr std::string_view trim(std::string_view s) noexcept{
            std::size_t b = 0;
            std::size_t e = s.size();
            while (b < e && is_space(s[b])) ++b;
            while (e > b && is_space(s[e - 1])) --e;
            return s.substr(b, e - b);
        }

        // one leading and one trailing quote, each only if present
        [[nodiscard]] inline constexpr std::string_view strip_one_quote_layer(std::string_view s) noexcept{
            if (!s.empty() && is_quote(s.front())) s.remove_prefix(1);
            if (!s.empty() && is_quote(s.back())) s.remove_suffix(1);
            return s;
        }

        [[nodiscard]] inline std::string to_upper_ascii(std::string_view s){
            std::string out(s);
            for (char& c : out){
                if (c >= 'a' && c <= 'z') c = static_cast<char>(c - 'a' + 'A');
            }
            return out;
        }

        // // Views of the fields a BIG message is read from, gathered in one pass over the payload
        struct FieldScan{
            std::size_t count{0};
            std::array<std::string_view, 4> picked{};   // handler, sensor id, sp1, sp2
            std::string_view second_to_last{};
        };

        [[nodiscard]] inline constexpr FieldScan scan_fields(std::string_view payload) noexcept{
            FieldScan fs{};
            std::string_view prev{};
            std::string_view cur{};
            std::size_t start = 0;

            while (true){
                const std::size_t semi = payload.find(';', start);
                const std::size_t end = (semi == std::string_view::npos) ? payload.size() : semi;
                prev = cur;
                cur = payload.substr(start, end - start);

                switch (fs.count){
                    case kFieldHandler:  fs.picked[0] = cur; break;
                    case kFieldSensorId: fs.picked[1] = cur; break;
                    case kFieldSp1:      fs.picked[2] = cur; break;
                    case kFieldSp2:      fs.picked[3] = cur; break;
                    default: break;
                }
                ++fs.count;

                if (semi == std::string_view::npos) break;
                start = semi + 1;
            }

            fs.second_to_last = prev;
            return fs;
        }
    } // namespace detail

    /// @brief parse one raw log line into a Record
    /// @param line raw text, any content
    /// @param out filled only when the verdict is kAccepted
    /// @return verdict; never throws for malformed input
    [[nodiscard]] inline LineVerdict parse_line(std::string_view line, Record& out){
        const std::size_t at = line.find(kLineMarker);
        if (at == std::string_view::npos) return LineVerdict::kNoMarker;

        std::string_view payload = line.substr(at + kLineMarker.size());
        payload = detail::strip_one_quote_layer(detail::trim(payload));

        const detail::FieldScan fs = detail::scan_fields(payload);
        if (fs.count < kMinFields) return LineVerdict::kTooFewFields;
        if (detail::trim(fs.picked[0]) != kBigHandler) return LineVerdict::kWrongHandler;

        const std::string_view id = detail::trim(fs.picked[1]);
        if (id.empty()) return LineVerdict::kEmptySensorId;

        out.sensor_id = detail::to_upper_ascii(id);
        out.sp1 = std::string(detail::trim(fs.picked[2]));
        out.sp2 = std::string(detail::trim(fs.picked[3]));
        out.state = std::string(detail::trim(fs.second_to_last));
        return LineVerdict::kAccepted;
    }

    // // Record or nullopt; the rejection reason is dropped
    [[nodiscard]] inline std::optional<Record> parse_line(std::string_view line){
        Record r;
        if (parse_line(line, r) != LineVerdict::kAccepted) return std::nullopt;
        return r;
    }

} // namespace faultscan::parse
