/*
 * Draw_Target - Abstract RGB565 pixel surface for the widget toolkit
 * Implemented by LVGL_Draw_Target on hardware and by a recorder in host tests
 */

#ifndef DRAW_TARGET_HPP
#define DRAW_TARGET_HPP

#include "types.h"

#include <cstdint>

using Color565 = uint16_t;

constexpr Color565 rgb565(uint8_t r, uint8_t g, uint8_t b) {
    return static_cast<Color565>(((r & 0xF8U) << 8U) | ((g & 0xFCU) << 3U) | (b >> 3U));
}

static constexpr Color565 COLOR_BLACK  = rgb565(0x00, 0x00, 0x00);
static constexpr Color565 COLOR_WHITE  = rgb565(0xFF, 0xFF, 0xFF);
static constexpr Color565 COLOR_RED    = rgb565(0xFF, 0x00, 0x00);
static constexpr Color565 COLOR_CYAN   = rgb565(0x00, 0xFF, 0xFF);
static constexpr Color565 COLOR_DKGRAY = rgb565(0x30, 0x30, 0x30);
static constexpr Color565 COLOR_BLUE   = rgb565(0x20, 0x40, 0xC0);

struct Point {
    int32_t x = 0;
    int32_t y = 0;
};

struct Size {
    uint32_t width = 0;
    uint32_t height = 0;
};

struct Rect {
    Point top_left = {};
    Size size = {};

    bool contains(const Point &p) const {
        return p.x >= top_left.x && p.y >= top_left.y &&
               p.x < top_left.x + static_cast<int32_t>(size.width) &&
               p.y < top_left.y + static_cast<int32_t>(size.height);
    }
};

/* 1bpp image, rows MSB-first, (width + 7) / 8 bytes per row */
struct Bitmap {
    uint32_t width;
    uint32_t height;
    const uint8_t *rows;

    bool pixel(uint32_t x, uint32_t y) const {
        uint32_t stride = (width + 7U) / 8U;
        return (rows[y * stride + x / 8U] & (0x80U >> (x % 8U))) != 0U;
    }
};

/* Monospace fonts registered with the draw target */
enum class Font_Id : uint8_t {
    Small,  /* 8x8 */
    Large   /* 16x16 */
};

class Draw_Target {
public:
    virtual ~Draw_Target() = default;

    virtual Size size() const = 0;

    /* Solid fill, clipped to the surface */
    virtual HwError fill_rect(const Rect &area, Color565 color) = 0;

    /* Set pixels of a 1bpp bitmap to color; clear bits are left untouched */
    virtual HwError blit(const Point &top_left, const Bitmap &bitmap, Color565 color) = 0;

    /* Glyph run with its cell origin at top_left, no background */
    virtual HwError draw_glyphs(const Point &top_left, const char *text, Font_Id font,
                                Color565 color) = 0;
};

#endif // DRAW_TARGET_HPP
