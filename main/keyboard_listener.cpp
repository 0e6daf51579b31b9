// =============================================================================
// Keyboard Listener - Implementation
// =============================================================================

#include "keyboard_listener.h"
#include "config.h"
#include "debug_log.h"

#include <errno.h>
#include <poll.h>
#include <string.h>
#include <unistd.h>

static const char* TAG = "Keys";

KeyboardListener::~KeyboardListener() {
    end();
}

bool KeyboardListener::begin(const KeyHandler& handler) {
    if (_running) {
        return true;
    }
    if (!isatty(STDIN_FILENO)) {
        LOG_DEBUG(TAG, "stdin is not a terminal, keyboard commands disabled");
        return false;
    }

    if (tcgetattr(STDIN_FILENO, &_saved) != 0) {
        LOG_WARN(TAG, "tcgetattr failed: %s", strerror(errno));
        return false;
    }
    _termiosSaved = true;

    struct termios raw = _saved;
    raw.c_lflag &= ~(ICANON | ECHO);
    raw.c_cc[VMIN] = 0;
    raw.c_cc[VTIME] = 0;
    if (tcsetattr(STDIN_FILENO, TCSANOW, &raw) != 0) {
        LOG_WARN(TAG, "tcsetattr failed: %s", strerror(errno));
        _termiosSaved = false;
        return false;
    }

    _handler = handler;
    _running = true;
    _thread = std::thread(&KeyboardListener::run, this);
    return true;
}

void KeyboardListener::end() {
    if (_running) {
        _running = false;
        if (_thread.joinable()) {
            _thread.join();
        }
    }
    if (_termiosSaved) {
        if (tcsetattr(STDIN_FILENO, TCSANOW, &_saved) != 0) {
            LOG_WARN(TAG, "Failed to restore terminal mode: %s", strerror(errno));
        }
        _termiosSaved = false;
    }
}

void KeyboardListener::run() {
    while (_running) {
        struct pollfd pfd;
        pfd.fd = STDIN_FILENO;
        pfd.events = POLLIN;
        pfd.revents = 0;

        int ready = poll(&pfd, 1, KEYBOARD_POLL_MS);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            LOG_WARN(TAG, "poll failed: %s", strerror(errno));
            break;
        }
        if (ready == 0 || !(pfd.revents & POLLIN)) {
            continue;
        }

        char c = 0;
        ssize_t n = read(STDIN_FILENO, &c, 1);
        if (n == 1) {
            if (_handler) {
                _handler(c);
            }
        } else if (n == 0) {
            // EOF
            break;
        } else if (errno != EAGAIN && errno != EINTR) {
            LOG_WARN(TAG, "read failed: %s", strerror(errno));
            break;
        }
    }
}
