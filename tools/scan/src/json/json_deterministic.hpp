#pragma once

#include <array>
#include <string>
#include <cstdint>
#include <charconv>
#include <string_view>

// // Byte-stable JSON emission: fixed member order, no whitespace, locale independent numbers
namespace faultscan::tools::scan::jsond{
    inline void hex2(std::string& out, unsigned v){
        static constexpr char kHex[] = "0123456789abcdef";
        out.push_back(kHex[(v >> 4) & 0xF]);
        out.push_back(kHex[v & 0xF]);
    }

    inline void esc(std::string& out, std::string_view s){
        for (unsigned char c : s){
            switch (c){
            case '\"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b";  break;
            case '\f': out += "\\f";  break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '\t': out += "\\t";  break;
            default:
                if (c < 0x20){
                    out += "\\u00";
                    hex2(out, c);
                }else{
                    out.push_back(static_cast<char>(c));
                }
            }
        }
    }

    inline void str(std::string& out, std::string_view v){
        out.push_back('"');
        esc(out, v);
        out.push_back('"');
    }

    // "k":
    inline void key(std::string& out, std::string_view k){
        str(out, k);
        out.push_back(':');
    }

    inline void unum(std::string& out, std::uint64_t v){
        std::array<char, 24> buf{};
        auto r = std::to_chars(buf.data(), buf.data() + buf.size(), v);
        out.append(buf.data(), r.ptr);
    }

    inline void null(std::string& out){
        out += "null";
    }

    template <class F>
    inline void array(std::string& out, F emit_elems){
        out.push_back('[');
        emit_elems();
        out.push_back(']');
    }

    template <class F>
    inline void object(std::string& out, F emit_members){
        out.push_back('{');
        emit_members();
        out.push_back('}');
    }

    inline void comma(std::string& out){
        out.push_back(',');
    }
} // namespace faultscan::tools::scan::jsond
