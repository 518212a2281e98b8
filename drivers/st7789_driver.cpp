/*
 * ST7789_Driver Implementation - SPI + DMA for the 240x135 TFT
 */

#include "drivers/st7789_driver.hpp"

#include "pico/stdlib.h"
#include "hardware/gpio.h"
#include "hardware/pwm.h"

bool ST7789_Driver::init() {
    spi_ = (DISPLAY_SPI_NUM == 0U) ? spi0 : spi1;
    spi_init(spi_, DISPLAY_SPI_BAUD);
    spi_set_format(spi_, 8, SPI_CPOL_0, SPI_CPHA_0, SPI_MSB_FIRST);
    gpio_set_function(DISPLAY_SCLK_PIN, GPIO_FUNC_SPI);
    gpio_set_function(DISPLAY_MOSI_PIN, GPIO_FUNC_SPI);

    /* CS pin - active low */
    gpio_init(DISPLAY_CS_PIN);
    gpio_set_dir(DISPLAY_CS_PIN, GPIO_OUT);
    gpio_put(DISPLAY_CS_PIN, 1);

    /* DC pin - low = command, high = data */
    gpio_init(DISPLAY_DC_PIN);
    gpio_set_dir(DISPLAY_DC_PIN, GPIO_OUT);
    gpio_put(DISPLAY_DC_PIN, 1);

    /* RST pin - active low */
    gpio_init(DISPLAY_RST_PIN);
    gpio_set_dir(DISPLAY_RST_PIN, GPIO_OUT);

    /* Backlight off until the first frame is ready */
    gpio_set_function(DISPLAY_BL_PIN, GPIO_FUNC_PWM);
    bl_slice_ = pwm_gpio_to_slice_num(DISPLAY_BL_PIN);
    pwm_set_wrap(bl_slice_, BACKLIGHT_WRAP);
    pwm_set_gpio_level(DISPLAY_BL_PIN, 0);
    pwm_set_enabled(bl_slice_, true);

    hardware_reset();

    dma_chan_ = dma_claim_unused_channel(false);
    if (dma_chan_ < 0) {
        return false;
    }
    dma_cfg_ = dma_channel_get_default_config(static_cast<uint>(dma_chan_));
    channel_config_set_transfer_data_size(&dma_cfg_, DMA_SIZE_8);
    channel_config_set_read_increment(&dma_cfg_, true);
    channel_config_set_write_increment(&dma_cfg_, false);
    channel_config_set_dreq(&dma_cfg_, spi_get_dreq(spi_, true));

    init_registers();

    return true;
}

void ST7789_Driver::hardware_reset() {
    gpio_put(DISPLAY_RST_PIN, 1);
    sleep_ms(10);
    gpio_put(DISPLAY_RST_PIN, 0);
    sleep_ms(10);
    gpio_put(DISPLAY_RST_PIN, 1);
    sleep_ms(120);
}

void ST7789_Driver::cs_select() {
    gpio_put(DISPLAY_CS_PIN, 0);
}

void ST7789_Driver::cs_deselect() {
    gpio_put(DISPLAY_CS_PIN, 1);
}

void ST7789_Driver::write_command(uint8_t cmd) {
    gpio_put(DISPLAY_DC_PIN, 0);
    spi_write_blocking(spi_, &cmd, 1);
    gpio_put(DISPLAY_DC_PIN, 1);
}

void ST7789_Driver::write_data(const uint8_t *data, size_t len) {
    spi_write_blocking(spi_, data, len);
}

void ST7789_Driver::command_with_data(uint8_t cmd, const uint8_t *data, size_t len) {
    cs_select();
    write_command(cmd);
    if (len > 0U) {
        write_data(data, len);
    }
    cs_deselect();
}

void ST7789_Driver::init_registers() {
    command_with_data(CMD_SWRESET, nullptr, 0);
    sleep_ms(150);

    command_with_data(CMD_SLPOUT, nullptr, 0);
    sleep_ms(120);

    const uint8_t colmod = COLMOD_RGB565;
    command_with_data(CMD_COLMOD, &colmod, 1);

    const uint8_t madctl = MADCTL_LANDSCAPE;
    command_with_data(CMD_MADCTL, &madctl, 1);

    /* Panel is wired for inverted colours */
    command_with_data(CMD_INVON, nullptr, 0);
    command_with_data(CMD_NORON, nullptr, 0);
    sleep_ms(10);

    command_with_data(CMD_DISPON, nullptr, 0);
    sleep_ms(10);
}

void ST7789_Driver::set_window(uint16_t x0, uint16_t y0, uint16_t x1, uint16_t y1) {
    uint16_t xa = static_cast<uint16_t>(x0 + DISPLAY_X_OFFSET);
    uint16_t xb = static_cast<uint16_t>(x1 + DISPLAY_X_OFFSET - 1U);
    uint16_t ya = static_cast<uint16_t>(y0 + DISPLAY_Y_OFFSET);
    uint16_t yb = static_cast<uint16_t>(y1 + DISPLAY_Y_OFFSET - 1U);

    const uint8_t caset[4] = {static_cast<uint8_t>(xa >> 8U), static_cast<uint8_t>(xa & 0xFFU),
                              static_cast<uint8_t>(xb >> 8U), static_cast<uint8_t>(xb & 0xFFU)};
    command_with_data(CMD_CASET, caset, sizeof(caset));

    const uint8_t raset[4] = {static_cast<uint8_t>(ya >> 8U), static_cast<uint8_t>(ya & 0xFFU),
                              static_cast<uint8_t>(yb >> 8U), static_cast<uint8_t>(yb & 0xFFU)};
    command_with_data(CMD_RASET, raset, sizeof(raset));
}

void ST7789_Driver::transfer_pixels(const uint8_t *data, uint32_t len) {
    cs_select();
    write_command(CMD_RAMWR);

    dma_channel_configure(
        static_cast<uint>(dma_chan_),
        &dma_cfg_,
        &spi_get_hw(spi_)->dr,  /* Destination: SPI TX FIFO */
        data,                   /* Source: pixel buffer */
        len,                    /* Transfer count (bytes) */
        true                    /* Start immediately */
    );

    /* Busy-wait for DMA completion */
    dma_channel_wait_for_finish_blocking(static_cast<uint>(dma_chan_));

    /* Wait for the SPI shifter to drain before releasing CS */
    while (spi_is_busy(spi_)) {
        tight_loop_contents();
    }

    cs_deselect();
}

void ST7789_Driver::set_brightness(uint8_t percent) {
    if (percent > 100U) {
        percent = 100U;
    }
    uint16_t level = static_cast<uint16_t>(static_cast<uint32_t>(percent) * BACKLIGHT_WRAP / 100U);
    pwm_set_gpio_level(DISPLAY_BL_PIN, level);
}
