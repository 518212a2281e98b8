/*
 * Hardware Configuration for RP2350 Power Meter Firmware
 * Pins, bus addresses, display geometry, and task timing
 */

#ifndef POWERMETER_CONFIG_H
#define POWERMETER_CONFIG_H

/*============================================================================
 * I2C0 - Shared Sensor Bus (INA219 + MAX17048)
 *============================================================================*/
#define SENSOR_I2C_NUM          0U       /* I2C instance 0: use i2c_get_inst() */
#define SENSOR_SDA_PIN          4U
#define SENSOR_SCL_PIN          5U
#define SENSOR_I2C_FREQ_HZ      100000U  /* 100kHz Standard Mode */
#define SENSOR_I2C_TIMEOUT_US   5000U    /* Per-transfer timeout */
#define SENSOR_POWER_PIN        7U       /* STEMMA QT power switch, active high */

#define INA219_I2C_ADDR         0x40U
#define MAX17048_I2C_ADDR       0x36U

/*============================================================================
 * ST7789 Display - SPI1 (240x135 landscape)
 *============================================================================*/
#define DISPLAY_SPI_NUM         1U
#define DISPLAY_DC_PIN          8U
#define DISPLAY_CS_PIN          9U
#define DISPLAY_SCLK_PIN        10U
#define DISPLAY_MOSI_PIN        11U
#define DISPLAY_RST_PIN         12U
#define DISPLAY_BL_PIN          13U      /* PWM backlight */
#define DISPLAY_SPI_BAUD        40000000U
#define DISPLAY_WIDTH           240U
#define DISPLAY_HEIGHT          135U
#define DISPLAY_X_OFFSET        40U      /* Panel RAM column offset in landscape */
#define DISPLAY_Y_OFFSET        53U      /* Panel RAM row offset in landscape */
#define DISPLAY_DEFAULT_BRIGHTNESS  50U  /* Percent */
#define DISPLAY_BUF_LINES       45U      /* LVGL partial buffer height, two buffers */
#define LVGL_TICK_MS            5U

/*============================================================================
 * Buttons
 *============================================================================*/
#define BUTTON_CALIBRATE_PIN    0U       /* Pull-up, falling edge */
#define BUTTON_PREVIOUS_PIN     1U       /* Pull-down, rising edge */
#define BUTTON_NEXT_PIN         2U       /* Pull-down, rising edge */
#define BUTTON_COOLDOWN_MS      500U     /* Edges ignored after an emitted press */

/*============================================================================
 * Task Timing
 *============================================================================*/
#define SENSOR_POLL_INTERVAL_MS     1000U   /* INA219 sample tick */
#define SENSOR_SETTLE_MS            2000U   /* Wait after applying a new calibration */
#define GAUGE_POLL_INTERVAL_MS      30000U  /* MAX17048 cell voltage check */
#define BATTERY_SPLASH_MS           5000U   /* Boot battery voltage screen */
#define BOOT_REPORT_MS              2000U   /* Boot device list screen */
#define MAIN_LOOP_IDLE_US           500U    /* Sleep between cooperative rounds */

/*============================================================================
 * Battery
 *============================================================================*/
#define BATTERY_LOW_VOLTAGE     3.4f     /* Below = publish low battery status */

#endif /* POWERMETER_CONFIG_H */
