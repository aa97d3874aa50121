#pragma once

#include <string>

enum class CircuitState {
    CLOSED,
    OPEN,
    HALF_OPEN
};

inline std::string to_string(CircuitState state) {
    switch (state) {
        case CircuitState::CLOSED: return "CLOSED";
        case CircuitState::OPEN: return "OPEN";
        case CircuitState::HALF_OPEN: return "HALF_OPEN";
    }
    return "UNKNOWN";
}
