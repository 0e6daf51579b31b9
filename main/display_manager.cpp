// =============================================================================
// Display Manager Module - Implementation
// =============================================================================

#include "display_manager.h"
#include "config.h"
#include "debug_log.h"

static const char* TAG = "Display";

// ANSI sequences
static const char* ESC_HOME_CLEAR = "\x1b[H\x1b[2J";
static const char* ESC_BOLD       = "\x1b[1m";
static const char* ESC_RESET      = "\x1b[0m";

double positionPercent(int raw, int resolution) {
    if (resolution <= 1) {
        return 0.0;
    }
    return 100.0 * (double)raw / (double)(resolution - 1);
}

DisplayManager::DisplayManager(FILE* out)
    : _out(out) {
}

void DisplayManager::begin() {
    if (_active) {
        return;
    }
    LOG_INFO(TAG, "Terminal display on (%d Hz), console log muted", 1000 / DISPLAY_UPDATE_MS);
    debugLogSetConsole(false);
    _active = true;
    _drawn = false;
    _lastUpdateMs = 0;
}

void DisplayManager::end() {
    if (!_active) {
        return;
    }
    _active = false;
    debugLogSetConsole(true);
    if (_drawn) {
        fprintf(_out, "\n");
        fflush(_out);
    }
}

bool DisplayManager::due() const {
    if (!_active) {
        return false;
    }
    if (!_drawn) {
        return true;
    }
    return (logMillis() - _lastUpdateMs) >= DISPLAY_UPDATE_MS;
}

void DisplayManager::render(const DisplayFrame& frame) {
    if (!_active) {
        return;
    }
    _lastUpdateMs = logMillis();
    _drawn = true;

    std::string text = formatFrame(frame);
    drawLogTail(text);

    fputs(ESC_HOME_CLEAR, _out);
    fputs(text.c_str(), _out);
    fflush(_out);
}

std::string DisplayManager::formatFrame(const DisplayFrame& frame) {
    std::string out;
    out += ESC_BOLD;
    out += frame.title;
    out += ESC_RESET;
    out += "\n";
    out += std::string(frame.title.size(), '=') + "\n";

    for (const ArmRow& arm : frame.arms) {
        drawArm(out, arm);
    }

    if (!frame.mapping.empty()) {
        out += "\nMapping: " + frame.mapping + "\n";
    }
    if (!frame.stats.empty()) {
        out += "\n";
        for (const std::string& line : frame.stats) {
            out += "  " + line + "\n";
        }
    }
    if (!frame.hint.empty()) {
        out += "\n" + frame.hint + "\n";
    }
    return out;
}

void DisplayManager::drawArm(std::string& out, const ArmRow& arm) {
    char buf[64];
    snprintf(buf, sizeof(buf), "%-10s", arm.label.c_str());
    out += buf;
    if (arm.positions.empty()) {
        out += " (no data)\n";
        return;
    }
    for (const auto& entry : arm.positions) {
        snprintf(buf, sizeof(buf), " %d:%4d %5.1f%%", entry.first, entry.second,
                 positionPercent(entry.second, arm.resolution));
        out += buf;
    }
    out += "\n";
}

void DisplayManager::drawLogTail(std::string& out) {
    LogEntry entries[DISPLAY_LOG_LINES];
    uint32_t head = logRingGetHead();
    uint32_t since = head > DISPLAY_LOG_LINES ? head - DISPLAY_LOG_LINES : 0;
    int count = logRingGetSince(since, entries, DISPLAY_LOG_LINES);
    if (count == 0) {
        return;
    }
    out += "\n-- log --\n";
    for (int i = 0; i < count; i++) {
        out += entries[i].text;
        out += "\n";
    }
}
