/*
 * Readout Implementation
 */

#include "logic/readout.hpp"

#include <cstdio>

Calibration calibration_at(uint8_t index) {
    return static_cast<Calibration>(index % CALIBRATION_COUNT);
}

uint8_t calibration_cycle(uint8_t index) {
    return static_cast<uint8_t>((index + 1U) % CALIBRATION_COUNT);
}

const char *calibration_label(Calibration cal) {
    switch (cal) {
        case Calibration::Range_32V_2A:    return "32V - 2A";
        case Calibration::Range_32V_1A:    return "32V - 1A";
        case Calibration::Range_16V_400mA: return "16V - 400mA";
    }
    return "?";
}

DisplayMode display_mode_next(DisplayMode mode) {
    uint8_t idx = static_cast<uint8_t>(mode);
    if (idx + 1U >= DISPLAY_MODE_COUNT) {
        return mode;
    }
    return static_cast<DisplayMode>(idx + 1U);
}

DisplayMode display_mode_previous(DisplayMode mode) {
    uint8_t idx = static_cast<uint8_t>(mode);
    if (idx == 0U) {
        return mode;
    }
    return static_cast<DisplayMode>(idx - 1U);
}

const char *display_mode_unit(DisplayMode mode) {
    switch (mode) {
        case DisplayMode::Voltage: return "V ";
        case DisplayMode::Current: return "mA";
        case DisplayMode::Power:   return "mW";
    }
    return "  ";
}

void format_readout(DisplayMode mode, const PowerSnapshot &snap, char *buf, size_t len) {
    bool live = (snap.current_ma != 0.0f);

    switch (mode) {
        case DisplayMode::Voltage:
            snprintf(buf, len, "%.3f", live ? static_cast<double>(snap.bus_v) : 0.0);
            break;
        case DisplayMode::Current:
            snprintf(buf, len, "%6.1f", live ? static_cast<double>(snap.current_ma) : 0.0);
            break;
        case DisplayMode::Power:
            snprintf(buf, len, "%6.1f", live ? static_cast<double>(snap.power_mw) : 0.0);
            break;
    }
}
