/*
 * LVGL Port - Registers the ST7789 panel as the LVGL display
 * Owns the draw buffers, the flush callback and the LVGL tick timer.
 */

#ifndef LVGL_PORT_HPP
#define LVGL_PORT_HPP

#include <cstdint>

class ST7789_Driver;

/* Call once after the panel is up; false if LVGL could not be registered */
bool lvgl_port_init(ST7789_Driver &panel);

/* Runs LVGL timers and flushes dirty areas; call from the main loop */
void lvgl_port_task_handler();

/* Areas flushed to the panel since init */
uint32_t lvgl_port_flush_count();

#endif // LVGL_PORT_HPP
