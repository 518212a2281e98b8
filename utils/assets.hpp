/*
 * Assets - Fixed font metrics and icon tables
 * Widgets store ids, never pointers into asset storage
 */

#ifndef ASSETS_HPP
#define ASSETS_HPP

#include "utils/draw_target.hpp"

#include <cstdint>

struct Mono_Font {
    uint32_t char_width;
    uint32_t char_height;
};

enum class Icon_Id : uint8_t {
    Info,
    Battery,
    Calibrate,
    Previous,
    Next
};

const Mono_Font &font_metrics(Font_Id font);
const Bitmap &icon_bitmap(Icon_Id icon);

#endif // ASSETS_HPP
