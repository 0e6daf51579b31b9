#pragma once

// =============================================================================
// Keyboard Listener
// =============================================================================
// Single-key commands from the terminal without waiting for ENTER. Runs on
// its own thread, polling stdin every KEYBOARD_POLL_MS so end() returns
// promptly. The terminal's original mode is restored on end().
//
// Ctrl-C still raises SIGINT (ISIG is left on).
//
// Usage:
//   KeyboardListener keys;
//   keys.begin([&](char c) { if (c == 's') remapQueue.post(0, 1); });
//   ...
//   keys.end();
// =============================================================================

#include <termios.h>

#include <atomic>
#include <functional>
#include <thread>

class KeyboardListener {
public:
    typedef std::function<void(char)> KeyHandler;

    ~KeyboardListener();

    // Returns false (and does nothing) when stdin is not a terminal.
    bool begin(const KeyHandler& handler);
    void end();

    bool isRunning() const { return _running; }

private:
    KeyHandler _handler;
    std::thread _thread;
    std::atomic<bool> _running{false};
    struct termios _saved;
    bool _termiosSaved = false;

    void run();
};
