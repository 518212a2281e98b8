/*
 * Readout_Screen Implementation
 */

#include "utils/readout_screen.hpp"
#include "utils/assets.hpp"

#include <cstdio>

static constexpr const char *FALLBACK_TEXT = "No ina219 found";

Readout_Screen::Readout_Screen(Draw_Target &target, const Theme &theme)
    : target_(target), theme_(theme),
      header_("", HEADER_TEXT_POS, target.size().width - 8U, theme.highlight,
              Font_Id::Large, theme),
      unit_("", UNIT_POS, UNIT_WIDTH, theme.screen_background, Font_Id::Large, theme),
      buttons_{Button(Icon_Id::Calibrate, {0, BUTTON_BAR_Y}, theme, BAR_BUTTON_SIZE),
               Button(Icon_Id::Previous, {80, BUTTON_BAR_Y}, theme, BAR_BUTTON_SIZE),
               Button(Icon_Id::Next, {160, BUTTON_BAR_Y}, theme, BAR_BUTTON_SIZE)} {}

Rect Readout_Screen::screen_rect() const {
    return {{0, 0}, target_.size()};
}

Font_Id Readout_Screen::font_for(const char *text) const {
    /* Large font when the text fits on one line, small otherwise */
    if (text_width(font_metrics(Font_Id::Large), text) <= target_.size().width) {
        return Font_Id::Large;
    }
    return Font_Id::Small;
}

HwError Readout_Screen::draw_frame() {
    HwError err = target_.fill_rect(screen_rect(), theme_.screen_background);
    if (err != HwError::None) {
        return err;
    }

    Rect strip = {{0, 0}, {target_.size().width, static_cast<uint32_t>(HEADER_HEIGHT)}};
    if ((err = target_.fill_rect(strip, theme_.highlight)) != HwError::None) {
        return err;
    }
    if ((err = header_.draw(target_)) != HwError::None) {
        return err;
    }

    for (const Button &button : buttons_) {
        if ((err = button.draw(target_, theme_.button_background)) != HwError::None) {
            return err;
        }
    }
    return HwError::None;
}

HwError Readout_Screen::draw_readout(const char *value, const char *unit) {
    Seven_Segment_Style style = VALUE_STYLE;
    style.color = theme_.text_primary;
    HwError err = render_seven_segment(target_, style, VALUE_POS, value,
                                       theme_.screen_background, VALUE_WIDTH);
    if (err != HwError::None) {
        return err;
    }
    return unit_.update_text(target_, unit);
}

HwError Readout_Screen::show_overlay(const char *message) {
    Progress overlay(Icon_Id::Info, message, screen_rect(), theme_.screen_background,
                     font_for(message), theme_);
    return overlay.draw(target_);
}

void Readout_Screen::set_header_text(const char *text) {
    header_.set_text(text);
}

HwError Readout_Screen::show_fallback() {
    HwError err = target_.fill_rect(screen_rect(), theme_.screen_background);
    if (err != HwError::None) {
        return err;
    }

    Text_Style style;
    style.font = font_for(FALLBACK_TEXT);
    style.color = theme_.error;
    style.align = Text_Align::Center;
    style.baseline = Text_Baseline::Middle;

    Size size = target_.size();
    Point center = {static_cast<int32_t>(size.width / 2U), static_cast<int32_t>(size.height / 2U)};
    return render_text(target_, style, center, FALLBACK_TEXT);
}

HwError Readout_Screen::show_battery(float volts) {
    char text[WIDGET_TEXT_LEN];
    snprintf(text, sizeof(text), "Battery %.1f V", static_cast<double>(volts));

    Progress splash(Icon_Id::Battery, text, screen_rect(), theme_.screen_background,
                    font_for(text), theme_);
    return splash.draw(target_);
}

HwError Readout_Screen::show_device_report(const List_Item *items, uint8_t count) {
    HwError err = target_.fill_rect(screen_rect(), theme_.screen_background);
    if (err != HwError::None) {
        return err;
    }
    List report(items, count, screen_rect(), theme_);
    return report.draw(target_);
}
