/*
 * LVGL_Draw_Target Implementation
 */

#include "utils/lvgl_draw_target.hpp"
#include "utils/assets.hpp"
#include "config.h"

#include <cstring>

static lv_color_t s_canvas_buf[LV_CANVAS_BUF_SIZE_TRUE_COLOR(DISPLAY_WIDTH, DISPLAY_HEIGHT) /
                               sizeof(lv_color_t)];

static lv_color_t to_lv_color(Color565 c) {
    uint8_t r = static_cast<uint8_t>((c >> 11U) & 0x1FU);
    uint8_t g = static_cast<uint8_t>((c >> 5U) & 0x3FU);
    uint8_t b = static_cast<uint8_t>(c & 0x1FU);
    return lv_color_make(static_cast<uint8_t>(r << 3U), static_cast<uint8_t>(g << 2U),
                         static_cast<uint8_t>(b << 3U));
}

static const lv_font_t *to_lv_font(Font_Id font) {
    switch (font) {
        case Font_Id::Small: return &lv_font_unscii_8;
        case Font_Id::Large: return &lv_font_unscii_16;
    }
    return &lv_font_unscii_8;
}

bool LVGL_Draw_Target::init() {
    lv_obj_t *scr = lv_scr_act();
    lv_obj_set_style_bg_color(scr, lv_color_black(), LV_PART_MAIN);
    lv_obj_set_style_bg_opa(scr, LV_OPA_COVER, LV_PART_MAIN);

    canvas_ = lv_canvas_create(scr);
    if (canvas_ == nullptr) {
        return false;
    }
    lv_canvas_set_buffer(canvas_, s_canvas_buf, static_cast<lv_coord_t>(DISPLAY_WIDTH),
                         static_cast<lv_coord_t>(DISPLAY_HEIGHT), LV_IMG_CF_TRUE_COLOR);
    lv_obj_set_pos(canvas_, 0, 0);
    lv_canvas_fill_bg(canvas_, lv_color_black(), LV_OPA_COVER);
    return true;
}

Size LVGL_Draw_Target::size() const {
    return {DISPLAY_WIDTH, DISPLAY_HEIGHT};
}

HwError LVGL_Draw_Target::fill_rect(const Rect &area, Color565 color) {
    if (canvas_ == nullptr) {
        return HwError::DrawFailed;
    }

    /* Clip to the canvas */
    int32_t x0 = area.top_left.x < 0 ? 0 : area.top_left.x;
    int32_t y0 = area.top_left.y < 0 ? 0 : area.top_left.y;
    int32_t x1 = area.top_left.x + static_cast<int32_t>(area.size.width);
    int32_t y1 = area.top_left.y + static_cast<int32_t>(area.size.height);
    if (x1 > static_cast<int32_t>(DISPLAY_WIDTH)) {
        x1 = static_cast<int32_t>(DISPLAY_WIDTH);
    }
    if (y1 > static_cast<int32_t>(DISPLAY_HEIGHT)) {
        y1 = static_cast<int32_t>(DISPLAY_HEIGHT);
    }
    if (x1 <= x0 || y1 <= y0) {
        return HwError::None;
    }

    lv_draw_rect_dsc_t dsc;
    lv_draw_rect_dsc_init(&dsc);
    dsc.bg_color = to_lv_color(color);
    dsc.bg_opa = LV_OPA_COVER;
    dsc.radius = 0;
    dsc.border_width = 0;
    lv_canvas_draw_rect(canvas_, static_cast<lv_coord_t>(x0), static_cast<lv_coord_t>(y0),
                        static_cast<lv_coord_t>(x1 - x0), static_cast<lv_coord_t>(y1 - y0), &dsc);
    return HwError::None;
}

HwError LVGL_Draw_Target::blit(const Point &top_left, const Bitmap &bitmap, Color565 color) {
    if (canvas_ == nullptr) {
        return HwError::DrawFailed;
    }

    lv_color_t c = to_lv_color(color);
    for (uint32_t y = 0; y < bitmap.height; ++y) {
        int32_t py = top_left.y + static_cast<int32_t>(y);
        if (py < 0 || py >= static_cast<int32_t>(DISPLAY_HEIGHT)) {
            continue;
        }
        for (uint32_t x = 0; x < bitmap.width; ++x) {
            int32_t px = top_left.x + static_cast<int32_t>(x);
            if (px < 0 || px >= static_cast<int32_t>(DISPLAY_WIDTH) || !bitmap.pixel(x, y)) {
                continue;
            }
            lv_canvas_set_px_color(canvas_, static_cast<lv_coord_t>(px),
                                   static_cast<lv_coord_t>(py), c);
        }
    }
    return HwError::None;
}

HwError LVGL_Draw_Target::draw_glyphs(const Point &top_left, const char *text, Font_Id font,
                                      Color565 color) {
    if (canvas_ == nullptr || text == nullptr) {
        return HwError::DrawFailed;
    }

    lv_draw_label_dsc_t dsc;
    lv_draw_label_dsc_init(&dsc);
    dsc.color = to_lv_color(color);
    dsc.font = to_lv_font(font);

    lv_coord_t max_w = static_cast<lv_coord_t>(font_metrics(font).char_width * strlen(text));
    lv_canvas_draw_text(canvas_, static_cast<lv_coord_t>(top_left.x),
                        static_cast<lv_coord_t>(top_left.y), max_w, &dsc, text);
    return HwError::None;
}
