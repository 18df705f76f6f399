#include <cassert>

#include "faultscan/core/types.hpp"
#include "faultscan/core/status.hpp"
#include "faultscan/decode/fault_decoder.hpp"

using namespace faultscan;
using namespace faultscan::decode;

int main(){
    // Case 1: empty inputs short circuit
    {
        if (decode_fault("", "123") != FaultReason::Unknown) return 1;
        if (decode_fault("123", "") != FaultReason::Unknown) return 2;
        if (decode_fault("", "") != FaultReason::Unknown) return 3;
        if (decode_pairs("", "1").status() != Status::kInvalidArg) return 4;
    }

    // Case 2: "99","-50" -> "9" + "50" -> "000950" -> 0 / 9 / 50 -> only 9 has 0x08 set
    {
        const auto fp = decode_pairs("99", "-50");
        if (!fp) return 5;
        if (fp.value().value[0] != 0 || fp.value().value[1] != 9 || fp.value().value[2] != 50) return 6;
        if (decode_fault("99", "-50") != FaultReason::Temperature) return 7;
    }

    // Case 3: one flag per pair position
    {
        if (decode_fault("081", "0000") != FaultReason::Battery) return 8;      // 08|00|00
        if (decode_fault("001", "0800") != FaultReason::Temperature) return 9;  // 00|08|00
        if (decode_fault("001", "0008") != FaultReason::Threshold) return 10;   // 00|00|08
        if (decode_fault("001", "0000") != FaultReason::Unknown) return 11;     // 00|00|00
    }

    // Case 4: pair 1 outranks pairs 2 and 3 even when all are flagged
    {
        if (decode_fault("081", "0808") != FaultReason::Battery) return 12;
        if (decode_fault("001", "0808") != FaultReason::Temperature) return 13;
    }

    // Case 5: checksum char of sp1 is always dropped, even a 1 char sp1
    {
        // "1" -> "" ; "08" -> "000008"
        if (decode_fault("1", "08") != FaultReason::Threshold) return 14;
        // "08" -> "0" ; "0" + "0000" -> "000000"; the 8 was the checksum
        if (decode_fault("08", "0000") != FaultReason::Unknown) return 15;
    }

    // Case 6: every leading '-' of sp2 is stripped, only leading ones
    {
        if (decode_fault("1", "--09") != FaultReason::Threshold) return 16;
        if (decode_fault("1", "-") != FaultReason::Unknown) return 17;      // window "000000"
        // "0-9" keeps its inner '-' -> pair "-9" is not two digits
        if (decode_pairs("1", "0-9").status() != Status::kDecodeFault) return 18;
    }

    // Case 7: long input keeps the first six chars of the concatenation
    {
        // "12345678" + "99" -> "123456": 12 = 0b00001100 -> battery
        if (decode_fault("123456789", "99") != FaultReason::Battery) return 19;
        // garbage past the window does not matter
        if (decode_fault("7777777", "zz") != FaultReason::Battery) return 20;
        // "443" + "0815" -> "443081": 44 = 0b00101100 -> battery
        if (decode_fault("4431", "-0815") != FaultReason::Battery) return 21;
    }

    // Case 8: non digit inside the window -> Unknown, unless an earlier pair is flagged
    {
        if (decode_pairs("ab1", "23").status() != Status::kDecodeFault) return 22;
        if (decode_fault("ab1", "23") != FaultReason::Unknown) return 23;
        // a flagged pair 1 wins before the bad pair 3 is ever read
        if (decode_fault("0812a1", "0") != FaultReason::Battery) return 24;   // 08|12|a0
        if (decode_pairs("0812a1", "0").status() != Status::kDecodeFault) return 27;
        // same for a flagged pair 2 ahead of a bad pair 3
        if (decode_fault("001", "08zz") != FaultReason::Temperature) return 28;   // 00|08|zz
        // bad pair 2 ahead of a flagged pair 3 stops the scan
        if (decode_fault("00a1", "08") != FaultReason::Unknown) return 29;   // 00|a0|08
        if (decode_fault("-1", "5") != FaultReason::Unknown) return 25;   // "0000-5"
        if (decode_fault(" 91", "0") != FaultReason::Unknown) return 26;   // " 9" is not a pair
    }

    // Case 9: reason strings
    assert(to_string(FaultReason::Battery) == "Battery device error");
    assert(to_string(FaultReason::Temperature) == "Temperature device error");
    assert(to_string(FaultReason::Threshold) == "Threshold central error");
    assert(to_string(FaultReason::Unknown) == "Unknown device error");

    // Case 10: the decoder is usable at compile time for the window step
    static_assert(detail::make_window("99", "-50")[3] == '9');
    static_assert(reason_from(FlagPairs{{8, 0, 0}}) == FaultReason::Battery);
    static_assert(decode_fault("001", "08zz") == FaultReason::Temperature);

    return 0;
}
