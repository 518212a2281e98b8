/*
 * LVGL Port Implementation
 * Two partial band buffers; each flushed area goes to the panel over DMA and
 * the flush completes once the transfer has drained.
 */

#include "utils/lvgl_port.hpp"
#include "drivers/st7789_driver.hpp"
#include "config.h"

#include "lvgl.h"
#include "pico/stdlib.h"

#include <cstdio>

static constexpr uint32_t BAND_PIXELS = DISPLAY_WIDTH * DISPLAY_BUF_LINES;

struct Port_State {
    ST7789_Driver *panel = nullptr;
    lv_disp_draw_buf_t draw_buf;
    lv_disp_drv_t disp_drv;
    struct repeating_timer tick;
    uint32_t flushes = 0;
};

static Port_State s_port;
static lv_color_t s_band_a[BAND_PIXELS];
static lv_color_t s_band_b[BAND_PIXELS];

static bool on_tick(struct repeating_timer * /* t */) {
    lv_tick_inc(LVGL_TICK_MS);
    return true;
}

static void on_flush(lv_disp_drv_t *drv, const lv_area_t *area, lv_color_t *pixels) {
    /* LVGL area is inclusive; the panel window end is exclusive */
    uint16_t x0 = static_cast<uint16_t>(area->x1);
    uint16_t y0 = static_cast<uint16_t>(area->y1);
    uint16_t x1 = static_cast<uint16_t>(area->x2 + 1);
    uint16_t y1 = static_cast<uint16_t>(area->y2 + 1);
    uint32_t count = static_cast<uint32_t>(x1 - x0) * static_cast<uint32_t>(y1 - y0);

    s_port.panel->set_window(x0, y0, x1, y1);
    s_port.panel->transfer_pixels(reinterpret_cast<const uint8_t *>(pixels),
                                  count * sizeof(lv_color_t));
    s_port.flushes++;
    lv_disp_flush_ready(drv);
}

bool lvgl_port_init(ST7789_Driver &panel) {
    s_port.panel = &panel;
    lv_init();

    lv_disp_draw_buf_init(&s_port.draw_buf, s_band_a, s_band_b, BAND_PIXELS);
    lv_disp_drv_init(&s_port.disp_drv);
    s_port.disp_drv.hor_res = static_cast<lv_coord_t>(DISPLAY_WIDTH);
    s_port.disp_drv.ver_res = static_cast<lv_coord_t>(DISPLAY_HEIGHT);
    s_port.disp_drv.draw_buf = &s_port.draw_buf;
    s_port.disp_drv.flush_cb = on_flush;

    if (lv_disp_drv_register(&s_port.disp_drv) == nullptr) {
        printf("[LVGL] display driver registration failed\n");
        return false;
    }
    if (!add_repeating_timer_ms(static_cast<int32_t>(LVGL_TICK_MS), on_tick, nullptr,
                                &s_port.tick)) {
        printf("[LVGL] tick timer unavailable\n");
        return false;
    }
    printf("[LVGL] %ux%u, %u-line bands, %u ms tick\n", DISPLAY_WIDTH, DISPLAY_HEIGHT,
           DISPLAY_BUF_LINES, LVGL_TICK_MS);
    return true;
}

void lvgl_port_task_handler() {
    lv_timer_handler();
}

uint32_t lvgl_port_flush_count() {
    return s_port.flushes;
}
