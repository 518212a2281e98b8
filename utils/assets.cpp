/*
 * Assets Implementation - 16x16 icons and font cell sizes
 */

#include "utils/assets.hpp"

/* Cell sizes of the LVGL unscii fonts mapped in lvgl_draw_target.cpp */
static const Mono_Font FONT_SMALL = {8U, 8U};
static const Mono_Font FONT_LARGE = {16U, 16U};

static const uint8_t ICON_INFO_ROWS[32] = {
    0x07, 0xE0, 0x18, 0x18, 0x20, 0x04, 0x41, 0x82,
    0x41, 0x82, 0x80, 0x01, 0x81, 0xC1, 0x80, 0xC1,
    0x80, 0xC1, 0x80, 0xC1, 0x80, 0xC1, 0x40, 0xC2,
    0x41, 0xE2, 0x20, 0x04, 0x18, 0x18, 0x07, 0xE0,
};

static const uint8_t ICON_BATTERY_ROWS[32] = {
    0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x7F, 0xF8,
    0x40, 0x08, 0x5F, 0xE8, 0x5F, 0xEE, 0x5F, 0xEA,
    0x5F, 0xEA, 0x5F, 0xEE, 0x5F, 0xE8, 0x40, 0x08,
    0x7F, 0xF8, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
};

static const uint8_t ICON_CALIBRATE_ROWS[32] = {
    0x00, 0x00, 0x30, 0x00, 0x30, 0x18, 0x30, 0x18,
    0x78, 0x18, 0x78, 0x18, 0x30, 0x18, 0x30, 0x3C,
    0x30, 0x3C, 0x30, 0x18, 0x30, 0x18, 0x30, 0x18,
    0x30, 0x18, 0x30, 0x18, 0x00, 0x00, 0x00, 0x00,
};

static const uint8_t ICON_PREVIOUS_ROWS[32] = {
    0x00, 0x00, 0x01, 0x00, 0x03, 0x00, 0x07, 0x00,
    0x0F, 0x00, 0x1F, 0xFF, 0x3F, 0xFF, 0x7F, 0xFF,
    0x3F, 0xFF, 0x1F, 0xFF, 0x0F, 0x00, 0x07, 0x00,
    0x03, 0x00, 0x01, 0x00, 0x00, 0x00, 0x00, 0x00,
};

static const uint8_t ICON_NEXT_ROWS[32] = {
    0x00, 0x00, 0x00, 0x80, 0x00, 0xC0, 0x00, 0xE0,
    0x00, 0xF0, 0xFF, 0xF8, 0xFF, 0xFC, 0xFF, 0xFE,
    0xFF, 0xFC, 0xFF, 0xF8, 0x00, 0xF0, 0x00, 0xE0,
    0x00, 0xC0, 0x00, 0x80, 0x00, 0x00, 0x00, 0x00,
};

static const Bitmap ICONS[] = {
    {16U, 16U, ICON_INFO_ROWS},
    {16U, 16U, ICON_BATTERY_ROWS},
    {16U, 16U, ICON_CALIBRATE_ROWS},
    {16U, 16U, ICON_PREVIOUS_ROWS},
    {16U, 16U, ICON_NEXT_ROWS},
};

const Mono_Font &font_metrics(Font_Id font) {
    switch (font) {
        case Font_Id::Small: return FONT_SMALL;
        case Font_Id::Large: return FONT_LARGE;
    }
    return FONT_SMALL;
}

const Bitmap &icon_bitmap(Icon_Id icon) {
    uint8_t idx = static_cast<uint8_t>(icon);
    if (idx >= (sizeof(ICONS) / sizeof(ICONS[0]))) {
        idx = 0;
    }
    return ICONS[idx];
}
