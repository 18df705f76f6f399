#include <array>

#include "hash/payload_digest.hpp"

namespace faultscan::tools::scan::hash{
    std::string to_hex(const std::uint8_t* p, std::size_t n){
        static constexpr char kHex[] = "0123456789abcdef";
        std::string out;
        out.reserve(2 * n);
        for (std::size_t i = 0; i < n; ++i){
            out.push_back(kHex[(p[i] >> 4) & 0xF]);
            out.push_back(kHex[p[i] & 0xF]);
        }
        return out;
    }

#if FAULTSCAN_WITH_BLAKE3
    PayloadDigest::PayloadDigest() noexcept{
        blake3_hasher_init(&h_);
    }

    void PayloadDigest::update(const void* data, std::size_t len) noexcept{
        bytes_ += len;
        blake3_hasher_update(&h_, data, len);
    }

    std::optional<std::string> PayloadDigest::hex() const{
        // finalize does not consume the hasher, so hex() may be called mid stream
        std::array<std::uint8_t, BLAKE3_OUT_LEN> out{};
        blake3_hasher_finalize(&h_, out.data(), out.size());
        return to_hex(out.data(), out.size());
    }
#else
    PayloadDigest::PayloadDigest() noexcept = default;

    void PayloadDigest::update(const void*, std::size_t len) noexcept{
        bytes_ += len;
    }

    std::optional<std::string> PayloadDigest::hex() const{
        return std::nullopt;
    }
#endif

} // namespace faultscan::tools::scan::hash
