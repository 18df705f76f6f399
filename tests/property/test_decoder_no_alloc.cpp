#include <string>
#include <vector>

#include "faultscan/decode/fault_decoder.hpp"
#include "util/alloc_interposer.hpp"

using namespace faultscan;
using namespace faultscan::decode;

int main(){
    // inputs built before counting starts
    const std::vector<std::pair<std::string, std::string>> inputs{
        {"99", "-50"}, {"081", "0808"}, {"", "1"}, {"ab1", "23"},
        {"123456789", "99"}, {std::string(4096, '9'), std::string(4096, '-')},
    };

    faultscan_test::reset_alloc_stats();

    unsigned flagged = 0;
    for (int rep = 0; rep < 1000; ++rep){
        for (const auto& [sp1, sp2] : inputs){
            if (decode_fault(sp1, sp2) != FaultReason::Unknown) ++flagged;
            (void)decode_pairs(sp1, sp2);
        }
    }

    if (faultscan_test::new_count() != 0) return 1;
    if (faultscan_test::delete_count() != 0) return 2;

    // 99/-50, 081/0808 and 123456789/99 decode to a real reason
    if (flagged != 3000) return 3;
    return 0;
}
