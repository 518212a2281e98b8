/*
 * Readout - Calibration/display-mode cycling and value formatting
 * Pure logic, no SDK dependency. Testable on host.
 */

#ifndef READOUT_HPP
#define READOUT_HPP

#include "types.h"

#include <cstddef>
#include <cstdint>

static constexpr uint8_t READOUT_TEXT_LEN = 16;

/* Preset at index (taken modulo CALIBRATION_COUNT) */
Calibration calibration_at(uint8_t index);

/* Next preset index; wraps from the last preset to the first */
uint8_t calibration_cycle(uint8_t index);

/* "32V - 2A", "32V - 1A", "16V - 400mA" */
const char *calibration_label(Calibration cal);

/* Step the display mode; holds at the first/last mode instead of wrapping */
DisplayMode display_mode_next(DisplayMode mode);
DisplayMode display_mode_previous(DisplayMode mode);

/* Two-character unit: "V ", "mA", "mW" */
const char *display_mode_unit(DisplayMode mode);

/*
 * Format the value shown for mode.
 *   Voltage: "%.3f" volts
 *   Current: "%6.1f" mA, right-justified
 *   Power:   "%6.1f" mW, right-justified
 * A snapshot with zero current formats as zero in every mode.
 */
void format_readout(DisplayMode mode, const PowerSnapshot &snap, char *buf, size_t len);

#endif /* READOUT_HPP */
