/*
 * RP2350 Power Meter Firmware - Main Entry Point
 * Brings up display and sensor bus, shows boot screens, runs the
 * cooperative task loop
 */

#include "config.h"
#include "types.h"

#include "drivers/bus_arbiter.hpp"
#include "drivers/gpio_input.hpp"
#include "drivers/ina219.hpp"
#include "drivers/max17048.hpp"
#include "drivers/pico_i2c.hpp"
#include "drivers/st7789_driver.hpp"
#include "logic/button_monitor.hpp"
#include "logic/fuel_gauge_poller.hpp"
#include "logic/input_channel.hpp"
#include "logic/render_loop.hpp"
#include "logic/sensor_poller.hpp"
#include "logic/task_runner.hpp"
#include "utils/lvgl_draw_target.hpp"
#include "utils/lvgl_port.hpp"
#include "utils/readout_screen.hpp"
#include "utils/widgets.hpp"

#include "pico/stdlib.h"
#include "pico/stdio_usb.h"
#include "hardware/gpio.h"
#include "hardware/i2c.h"

#include <cstdio>

static const Theme POWERMETER_THEME = {
    COLOR_DKGRAY,  /* button_background */
    COLOR_CYAN,    /* button_foreground */
    COLOR_BLACK,   /* screen_background */
    COLOR_WHITE,   /* text_primary */
    COLOR_BLUE,    /* highlight */
    COLOR_RED      /* error */
};

static uint32_t now_ms() {
    return to_ms_since_boot(get_absolute_time());
}

/* Keep LVGL flushing while a boot screen stays up */
static void hold_screen(uint32_t duration_ms) {
    uint32_t start = now_ms();
    while ((now_ms() - start) < duration_ms) {
        lvgl_port_task_handler();
        sleep_ms(5);
    }
}

static void report_draw(const char *what, HwError err) {
    if (err != HwError::None) {
        printf("[BOOT] %s draw failed: %s\n", what, hw_error_name(err));
    }
}

static void start_task(Task_Runner &runner, Task &task) {
    if (!runner.add(task)) {
        printf("[BOOT] task table full, %s not started\n", task.name());
    }
}

int main() {
    stdio_init_all();

    /* Wait for USB host serial connection (up to 2s), then proceed regardless */
    for (int i = 0; i < 20 && !stdio_usb_connected(); i++) {
        sleep_ms(100);
    }

    printf("\n========================================\n");
    printf("RP2350 Power Meter Firmware\n");
    printf("Build: %s %s\n", __DATE__, __TIME__);
    printf("Board: %s\n", PICO_BOARD);
    printf("SDK:   %s\n", PICO_SDK_VERSION_STRING);
    printf("========================================\n\n");
    stdio_flush();

    /* Display */
    static ST7789_Driver panel;
    static LVGL_Draw_Target target;
    bool display_ok = panel.init() && lvgl_port_init(panel) && target.init();
    if (display_ok) {
        panel.set_brightness(DISPLAY_DEFAULT_BRIGHTNESS);
        printf("[BOOT] ST7789 display initialized OK\n");
    } else {
        printf("[BOOT] ST7789 display init FAILED - continuing without display\n");
    }
    stdio_flush();

    static Readout_Screen screen(target, POWERMETER_THEME);

    /* Sensor bus: STEMMA QT power on, then I2C0 */
    gpio_init(SENSOR_POWER_PIN);
    gpio_set_dir(SENSOR_POWER_PIN, GPIO_OUT);
    gpio_put(SENSOR_POWER_PIN, 1);
    sleep_ms(10);

    static Pico_I2C_Bus sensor_bus;
    if (!sensor_bus.init(i2c_get_instance(SENSOR_I2C_NUM), SENSOR_SDA_PIN, SENSOR_SCL_PIN,
                         SENSOR_I2C_FREQ_HZ, SENSOR_I2C_TIMEOUT_US)) {
        printf("[BOOT] sensor bus init FAILED\n");
    }
    static Bus_Arbiter arbiter(sensor_bus);
    static Bus_Device ina219_dev(arbiter, INA219_I2C_ADDR);
    static Bus_Device gauge_dev(arbiter, MAX17048_I2C_ADDR);

    /* Probe both sensors */
    bool has_ina219 = ina219_dev.probe() == HwError::None;
    bool has_lipo_monitor = gauge_dev.probe() == HwError::None;
    printf("[BOOT] has_ina219=%d has_lipo_monitor=%d\n", has_ina219, has_lipo_monitor);
    stdio_flush();

    {
        char line[LIST_ITEM_TEXT_LEN];
        List_Item report[2];
        snprintf(line, sizeof(line), "INA219 0x%02X %s", INA219_I2C_ADDR,
                 has_ina219 ? "ok" : "missing");
        report[0] = make_list_item(line, Readout_Screen::REPORT_ROW_HEIGHT, Font_Id::Small);
        snprintf(line, sizeof(line), "MAX17048 0x%02X %s", MAX17048_I2C_ADDR,
                 has_lipo_monitor ? "ok" : "missing");
        report[1] = make_list_item(line, Readout_Screen::REPORT_ROW_HEIGHT, Font_Id::Small);

        report_draw("device report", screen.show_device_report(report, 2));
        hold_screen(BOOT_REPORT_MS);
    }

    /* Fuel gauge: default compensation, then the battery splash */
    static MAX17048_Driver gauge(gauge_dev);
    if (has_lipo_monitor) {
        HwError err = gauge.init();
        if (err != HwError::None) {
            printf("[GAUGE] init failed: %s\n", hw_error_name(err));
        }
        float volts = 0.0f;
        err = gauge.read_cell_voltage(volts);
        if (err == HwError::None) {
            printf("[GAUGE] battery %.2f V\n", static_cast<double>(volts));
            report_draw("battery splash", screen.show_battery(volts));
            hold_screen(BATTERY_SPLASH_MS);
        } else {
            printf("[GAUGE] cell voltage read failed: %s\n", hw_error_name(err));
        }
    }

    /* Channel and signal shared by every task */
    static Input_Channel input_channel;
    static Calibration_Signal calibration_signal;

    static Task_Runner runner;

    static Render_Loop render(input_channel, calibration_signal, screen, has_ina219);
    report_draw("readout", render.start());
    start_task(runner, render);

    static INA219_Driver ina219(ina219_dev);
    static Sensor_Poller sensor_poller(ina219, input_channel, calibration_signal,
                                       SENSOR_POLL_INTERVAL_MS, SENSOR_SETTLE_MS);
    if (has_ina219) {
        start_task(runner, sensor_poller);
    } else {
        printf("[BOOT] No ina219 found, sampling disabled\n");
    }

    static Fuel_Gauge_Poller gauge_poller(gauge, input_channel, GAUGE_POLL_INTERVAL_MS,
                                          BATTERY_LOW_VOLTAGE);
    if (has_lipo_monitor) {
        start_task(runner, gauge_poller);
    }

    /* Buttons: D0 idles high (pull-up), D1/D2 idle low (pull-down) */
    static Gpio_Input calibrate_pin;
    static Gpio_Input previous_pin;
    static Gpio_Input next_pin;
    /* A pin that fails here reports PinFault and stops its own task */
    bool pins_ok = calibrate_pin.init(BUTTON_CALIBRATE_PIN, Gpio_Input::Pull::Up);
    pins_ok = previous_pin.init(BUTTON_PREVIOUS_PIN, Gpio_Input::Pull::Down) && pins_ok;
    pins_ok = next_pin.init(BUTTON_NEXT_PIN, Gpio_Input::Pull::Down) && pins_ok;
    if (!pins_ok) {
        printf("[BOOT] button pin init FAILED\n");
    }

    static Button_Monitor calibrate_button(
        calibrate_pin, input_channel,
        Button_Config{ButtonId::Calibrate, EdgeKind::Falling, BUTTON_COOLDOWN_MS});
    static Button_Monitor previous_button(
        previous_pin, input_channel,
        Button_Config{ButtonId::Previous, EdgeKind::Rising, BUTTON_COOLDOWN_MS});
    static Button_Monitor next_button(
        next_pin, input_channel,
        Button_Config{ButtonId::Next, EdgeKind::Rising, BUTTON_COOLDOWN_MS});
    start_task(runner, calibrate_button);
    start_task(runner, previous_button);
    start_task(runner, next_button);

    printf("[BOOT] %u tasks, %lu display flushes, entering main loop\n", runner.task_count(),
           static_cast<unsigned long>(lvgl_port_flush_count()));
    stdio_flush();

    while (true) {
        runner.run_once(now_ms());
        lvgl_port_task_handler();
        sleep_us(MAIN_LOOP_IDLE_US);
    }
}
