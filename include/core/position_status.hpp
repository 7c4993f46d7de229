// position_status.hpp
// Position status of the traded pair

#pragma once

#include <string>

namespace distbt {

// Integer values are the 0/1/2 encoding used in recorded status series.
enum class PositionStatus : int {
    Flat = 0,
    ShortSpread = 1,  // short instrument0, long instrument1
    LongSpread = 2    // long instrument0, short instrument1
};

inline int toInt(PositionStatus status) {
    return static_cast<int>(status);
}

inline const char* toString(PositionStatus status) {
    switch (status) {
        case PositionStatus::Flat:        return "FLAT";
        case PositionStatus::ShortSpread: return "SHORT_SPREAD";
        case PositionStatus::LongSpread:  return "LONG_SPREAD";
    }
    return "UNKNOWN";
}

} // namespace distbt
