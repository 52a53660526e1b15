// bar.hpp
// Bar record and field enumeration for the Market Replay Engine
// Field names are resolved once into a BarField and read through barFieldValue()

#pragma once

#include <array>
#include <chrono>
#include <string>
#include "exceptions.hpp"

namespace replay {

// ============================================================================
// Bar - one OHLCV (+ adjusted close) observation
// ============================================================================

struct Bar {
    std::chrono::nanoseconds timestamp{0};
    double open = 0.0;
    double high = 0.0;
    double low = 0.0;
    double close = 0.0;
    double volume = 0.0;
    double adj_close = 0.0;

    bool validate() const {
        return high >= low &&
               high >= open && high >= close &&
               low <= open && low <= close &&
               volume >= 0;
    }
};

enum class BarField { OPEN, HIGH, LOW, CLOSE, VOLUME, ADJ_CLOSE };

inline const char* barFieldName(BarField field) {
    switch (field) {
        case BarField::OPEN: return "open";
        case BarField::HIGH: return "high";
        case BarField::LOW: return "low";
        case BarField::CLOSE: return "close";
        case BarField::VOLUME: return "volume";
        case BarField::ADJ_CLOSE: return "adj_close";
    }
    return "unknown";
}

// Throws InvalidFieldException for names outside the enumeration
inline BarField parseBarField(const std::string& name) {
    static const std::array<BarField, 6> fields = {
        BarField::OPEN, BarField::HIGH, BarField::LOW,
        BarField::CLOSE, BarField::VOLUME, BarField::ADJ_CLOSE
    };
    for (BarField field : fields) {
        if (name == barFieldName(field)) {
            return field;
        }
    }
    throw InvalidFieldException(name);
}

inline double barFieldValue(const Bar& bar, BarField field) {
    switch (field) {
        case BarField::OPEN: return bar.open;
        case BarField::HIGH: return bar.high;
        case BarField::LOW: return bar.low;
        case BarField::CLOSE: return bar.close;
        case BarField::VOLUME: return bar.volume;
        case BarField::ADJ_CLOSE: return bar.adj_close;
    }
    return 0.0;
}

} // namespace replay
