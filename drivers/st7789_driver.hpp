/*
 * ST7789_Driver - SPI + DMA driver for the 1.14" 240x135 TFT
 * Interface: 4-wire SPI (DC pin) on SPI1, DMA pixel transfer, PWM backlight
 */

#ifndef ST7789_DRIVER_HPP
#define ST7789_DRIVER_HPP

#include "config.h"

#include "hardware/spi.h"
#include "hardware/dma.h"

#include <cstddef>
#include <cstdint>

class ST7789_Driver {
public:
    bool init();

    /* Window end coordinates are exclusive */
    void set_window(uint16_t x0, uint16_t y0, uint16_t x1, uint16_t y1);
    void transfer_pixels(const uint8_t *data, uint32_t len);
    void set_brightness(uint8_t percent);

private:
    static constexpr uint8_t CMD_SWRESET = 0x01;
    static constexpr uint8_t CMD_SLPOUT = 0x11;
    static constexpr uint8_t CMD_NORON = 0x13;
    static constexpr uint8_t CMD_INVON = 0x21;
    static constexpr uint8_t CMD_DISPON = 0x29;
    static constexpr uint8_t CMD_CASET = 0x2A;
    static constexpr uint8_t CMD_RASET = 0x2B;
    static constexpr uint8_t CMD_RAMWR = 0x2C;
    static constexpr uint8_t CMD_MADCTL = 0x36;
    static constexpr uint8_t CMD_COLMOD = 0x3A;

    static constexpr uint8_t MADCTL_LANDSCAPE = 0x60;  /* MX | MV */
    static constexpr uint8_t COLMOD_RGB565 = 0x55;
    static constexpr uint16_t BACKLIGHT_WRAP = 255;

    spi_inst_t *spi_ = nullptr;
    int dma_chan_ = -1;
    dma_channel_config dma_cfg_ = {};
    uint bl_slice_ = 0;

    void hardware_reset();
    void init_registers();
    void cs_select();
    void cs_deselect();
    void write_command(uint8_t cmd);
    void write_data(const uint8_t *data, size_t len);
    void command_with_data(uint8_t cmd, const uint8_t *data, size_t len);
};

#endif // ST7789_DRIVER_HPP
