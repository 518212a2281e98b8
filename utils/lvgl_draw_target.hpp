/*
 * LVGL_Draw_Target - Draw_Target backed by a full-screen LVGL canvas
 * Font_Id::Small maps to unscii 8, Font_Id::Large to unscii 16.
 */

#ifndef LVGL_DRAW_TARGET_HPP
#define LVGL_DRAW_TARGET_HPP

#include "utils/draw_target.hpp"

#include "lvgl.h"

class LVGL_Draw_Target final : public Draw_Target {
public:
    /* Create the canvas on the active screen; call after lvgl_port_init() */
    bool init();

    Size size() const override;
    HwError fill_rect(const Rect &area, Color565 color) override;
    HwError blit(const Point &top_left, const Bitmap &bitmap, Color565 color) override;
    HwError draw_glyphs(const Point &top_left, const char *text, Font_Id font,
                        Color565 color) override;

private:
    lv_obj_t *canvas_ = nullptr;
};

#endif // LVGL_DRAW_TARGET_HPP
