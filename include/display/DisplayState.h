#pragma once

/**
 * @brief Rotation state machine states.
 */
enum class DisplayState {
    NORMAL_ROTATION, ///< Dwelling on a card
    TRANSITIONING,   ///< Blending between two cards
    EVENT_ACTIVE,    ///< A show owns the screen, rotation frozen
    EMPTY            ///< No cards to show
};

constexpr const char *toString(DisplayState state) {
    switch (state) {
        case DisplayState::NORMAL_ROTATION: return "NORMAL_ROTATION";
        case DisplayState::TRANSITIONING: return "TRANSITIONING";
        case DisplayState::EVENT_ACTIVE: return "EVENT_ACTIVE";
        case DisplayState::EMPTY: return "EMPTY";
        default: return "UNKNOWN";
    }
}
