#include "utils/KeyboardInput.h"
#include "logging/Logger.h"

#include <poll.h>
#include <unistd.h>

namespace {
    constexpr char ESCAPE{27};
}

KeyboardInput::KeyboardInput() {
    if (!isatty(STDIN_FILENO) || tcgetattr(STDIN_FILENO, &saved_) == -1) {
        Logger::debug(Logger::Source::Other, tag_, "stdin is not a terminal, keyboard disabled");
        return;
    }
    termios raw = saved_;
    raw.c_lflag &= ~static_cast<tcflag_t>(ICANON | ECHO);
    raw.c_cc[VMIN] = 0;
    raw.c_cc[VTIME] = 0;
    if (tcsetattr(STDIN_FILENO, TCSANOW, &raw) == -1) {
        Logger::perror(Logger::Source::Other, tag_, "tcsetattr");
        return;
    }
    active_ = true;
}

KeyboardInput::~KeyboardInput() {
    if (active_) {
        tcsetattr(STDIN_FILENO, TCSANOW, &saved_);
    }
}

KeyboardInput::Key KeyboardInput::poll() {
    if (!active_) {
        return Key::NONE;
    }
    Key result = Key::NONE;
    pollfd pfd{STDIN_FILENO, POLLIN, 0};
    while (::poll(&pfd, 1, 0) > 0 && (pfd.revents & POLLIN)) {
        char c = 0;
        if (read(STDIN_FILENO, &c, 1) != 1) {
            break;
        }
        if (c == 'q' || c == 'Q' || c == ESCAPE) {
            result = Key::QUIT;
        } else if (c == ' ' && result != Key::QUIT) {
            result = Key::SKIP;
        }
    }
    return result;
}
