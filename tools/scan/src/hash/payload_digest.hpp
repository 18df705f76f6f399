#pragma once

#include <string>
#include <cstddef>
#include <cstdint>
#include <optional>

#if FAULTSCAN_WITH_BLAKE3
extern "C"{
    #include "blake3.h"
}
#endif

namespace faultscan::tools::scan::hash{
    // 32 bytes => 64 hex chars
    inline constexpr std::size_t kBlake3_256_HexLen = 64;

    // // Streaming BLAKE3-256 over the raw input bytes, fed chunk by chunk while scanning.
    // // Without BLAKE3 support compiled in, no digest is produced.
    class PayloadDigest{
        public:
            PayloadDigest() noexcept;

            void update(const void* data, std::size_t len) noexcept;

            // lowercase hex, or nullopt when the build has no BLAKE3
            [[nodiscard]] std::optional<std::string> hex() const;

            [[nodiscard]] std::uint64_t bytes() const noexcept{
                return bytes_;
            }

        private:
            std::uint64_t bytes_{0};
        #if FAULTSCAN_WITH_BLAKE3
            blake3_hasher h_;
        #endif
    };

    [[nodiscard]] std::string to_hex(const std::uint8_t* p, std::size_t n);

} // namespace faultscan::tools::scan::hash
