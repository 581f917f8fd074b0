#pragma once

#include <string>
#include "errors.hpp"

namespace scorebook {
namespace validation {

/**
 * Require that a string is not empty.
 */
inline void require_not_empty(const std::string& value, const std::string& field_name = "value") {
    if (value.empty()) {
        throw InvalidActionError::invalid_argument(field_name + " must not be empty");
    }
}

/**
 * Require that a value lies in the closed range [low, high].
 */
template<typename T>
void require_in_range(T value, T low, T high, const std::string& field_name = "value") {
    if (value < low || value > high) {
        throw InvalidActionError::invalid_argument(
            field_name + " must be between " + std::to_string(low) + " and " + std::to_string(high));
    }
}

/**
 * Require that a game-state condition holds.
 */
inline void require_state(bool condition, const std::string& message) {
    if (!condition) {
        throw InvalidActionError::precondition_failed(message);
    }
}

} // namespace validation
} // namespace scorebook
