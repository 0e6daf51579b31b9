#pragma once

// =============================================================================
// Display Manager Module
// =============================================================================
// Full-screen terminal status view: one table row per arm with each joint as
// raw ticks and percent of range, the current mapping, loop counters and the
// most recent log lines. Redraws at DISPLAY_UPDATE_MS; console logging is
// muted while the display owns the terminal (lines still go to the ring).
//
// Usage:
//   DisplayManager display;
//   display.begin();                 // Mutes console logging, clears screen
//   if (display.due()) { display.render(frame); }
//   display.end();                   // Restores console logging
// =============================================================================

#include "motor_channel.h"

#include <stdio.h>
#include <string>
#include <vector>

struct ArmRow {
    std::string label;
    PositionMap positions;
    int resolution = 0;
};

struct DisplayFrame {
    std::string title;
    std::vector<ArmRow> arms;
    std::string mapping;                    // Empty to hide
    std::vector<std::string> stats;         // Free-form "key: value" lines
    std::string hint;                       // e.g. "[s] swap  [q] quit"
};

// pct = 100 * raw / (resolution - 1)
double positionPercent(int raw, int resolution);

class DisplayManager {
public:
    explicit DisplayManager(FILE* out = stdout);

    void begin();
    void end();

    bool isActive() const { return _active; }

    // True when DISPLAY_UPDATE_MS has elapsed since the last render
    bool due() const;

    void render(const DisplayFrame& frame);

    // Text of one frame (no escape codes). Used by render() and tests.
    static std::string formatFrame(const DisplayFrame& frame);

private:
    FILE* _out;
    bool _active = false;
    unsigned long _lastUpdateMs = 0;
    bool _drawn = false;

    static void drawArm(std::string& out, const ArmRow& arm);
    static void drawLogTail(std::string& out);
};
