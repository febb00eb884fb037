#pragma once

#include <termios.h>

/**
 * @brief Non-blocking single-key input from the controlling terminal.
 *
 * Puts stdin into raw mode for the object's lifetime and restores the
 * previous settings on destruction. Without a terminal (service mode)
 * poll() always returns Key::NONE.
 */
class KeyboardInput {
public:
    enum class Key {
        NONE,
        QUIT,
        SKIP
    };

    KeyboardInput();
    ~KeyboardInput();

    KeyboardInput(const KeyboardInput &) = delete;
    KeyboardInput &operator=(const KeyboardInput &) = delete;

    /** Drain pending input; the last recognised key wins, QUIT beats SKIP. */
    Key poll();

    bool active() const { return active_; }

private:
    static constexpr auto tag_{"Keyboard"};

    bool active_{false};
    termios saved_{};
};
