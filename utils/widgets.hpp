/*
 * Widgets - Stateful List, Button, Label and Progress over a Draw_Target
 * Pure logic, no SDK dependency. Testable on host.
 *
 * All widgets of a screen share one immutable Theme by reference. Fonts and
 * icons are held as ids into the asset tables.
 */

#ifndef WIDGETS_HPP
#define WIDGETS_HPP

#include "utils/assets.hpp"
#include "utils/draw_target.hpp"
#include "utils/graphics.hpp"
#include "types.h"

#include <cstdint>

struct Theme {
    Color565 button_background;
    Color565 button_foreground;
    Color565 screen_background;
    Color565 text_primary;
    Color565 highlight;
    Color565 error;
};

/*============================================================================
 * List
 *============================================================================*/

static constexpr uint8_t LIST_MAX_ITEMS = 16;
static constexpr uint8_t LIST_ITEM_TEXT_LEN = 32;

struct List_Item {
    char text[LIST_ITEM_TEXT_LEN] = {};
    uint32_t height = 0;
    Font_Id font = Font_Id::Small;
};

List_Item make_list_item(const char *text, uint32_t height, Font_Id font);

/*
 * Scrollable single-selection list with a virtual window.
 *
 * Only rows [window_start, window_start + visible_lines) are drawn.
 * Invariants after every call:
 *   selected_index < item_count (0 when empty)
 *   window_start <= selected_index <= window_start + visible_lines - 1
 */
class List {
public:
    static constexpr uint32_t SCROLLBAR_WIDTH = 20;
    static constexpr uint32_t ROW_MARGIN = 10;        /* Right margin without scrollbar */
    static constexpr uint32_t TRACK_BOTTOM_MARGIN = 10;

    /* Copies up to LIST_MAX_ITEMS items */
    List(const List_Item *items, uint8_t count, const Rect &bounds, const Theme &theme);

    HwError draw(Draw_Target &target) const;

    /* Move selection one row, scroll the window by at most one line, redraw */
    HwError scroll_down(Draw_Target &target);
    HwError scroll_up(Draw_Target &target);

    /* Select the first visible row containing pos, redraw, report the selection */
    HwError select_at_pos(Draw_Target &target, const Point &pos, uint8_t &selected);

    /* Ignored when index is out of range; window follows the selection */
    void set_selected_index(uint8_t index);

    uint8_t selected_index() const { return selected_; }
    uint8_t window_start() const { return window_start_; }
    uint8_t visible_lines() const { return visible_lines_; }
    uint8_t item_count() const { return count_; }
    const List_Item &item(uint8_t index) const { return items_[index]; }
    Rect bounding_box() const { return bounds_; }

    bool shows_scrollbar() const { return count_ > visible_lines_; }
    Rect scrollbar_track() const;
    Rect scrollbar_indicator() const;

private:
    List_Item items_[LIST_MAX_ITEMS];
    uint8_t count_ = 0;
    Rect bounds_;
    const Theme &theme_;
    uint8_t selected_ = 0;
    uint8_t window_start_ = 0;
    uint8_t visible_lines_ = 1;

    Point row_origin(uint8_t index) const;
    uint8_t window_end() const;
};

/*============================================================================
 * Button
 *============================================================================*/

class Button {
public:
    static constexpr uint32_t INSET = 5;
    static constexpr uint32_t CORNER_RADIUS = 10;
    static constexpr Size DEFAULT_SIZE = {90, 50};

    Button(Icon_Id icon, const Point &pos, const Theme &theme, const Size &size = DEFAULT_SIZE)
        : icon_(icon), pos_(pos), size_(size), theme_(theme) {}

    void set_icon(Icon_Id icon) { icon_ = icon; }
    Icon_Id icon() const { return icon_; }

    /* Rounded background inset from the bounding box, icon centred inside */
    HwError draw(Draw_Target &target, Color565 background) const;

    Rect bounding_box() const { return {pos_, size_}; }

private:
    Icon_Id icon_;
    Point pos_;
    Size size_;
    const Theme &theme_;
};

/*============================================================================
 * Label
 *============================================================================*/

static constexpr uint8_t WIDGET_TEXT_LEN = STATUS_TEXT_LEN;

class Label {
public:
    Label(const char *text, const Point &pos, uint32_t width, Color565 background,
          Font_Id font, const Theme &theme);

    HwError draw(Draw_Target &target) const;

    /* Replace the text and redraw only this label's strip */
    HwError update_text(Draw_Target &target, const char *text);

    /* Replace the text without drawing */
    void set_text(const char *text);
    const char *text() const { return text_; }

private:
    char text_[WIDGET_TEXT_LEN] = {};
    Point pos_;
    uint32_t width_;
    Color565 background_;
    Font_Id font_;
    const Theme &theme_;
};

/*============================================================================
 * Progress
 *============================================================================*/

/* Centred icon with one line of centred text below it */
class Progress {
public:
    Progress(Icon_Id icon, const char *text, const Rect &bounds, Color565 background,
             Font_Id font, const Theme &theme);

    HwError draw(Draw_Target &target) const;

    /* Replace the text and redraw only this widget's region */
    HwError update_text(Draw_Target &target, const char *text);

    void set_text(const char *text);
    const char *text() const { return text_; }
    Rect bounding_box() const { return bounds_; }

private:
    Icon_Id icon_;
    char text_[WIDGET_TEXT_LEN] = {};
    Rect bounds_;
    Color565 background_;
    Font_Id font_;
    const Theme &theme_;
};

#endif // WIDGETS_HPP
