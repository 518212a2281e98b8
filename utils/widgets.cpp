/*
 * Widgets Implementation
 */

#include "utils/widgets.hpp"

#include <cstdio>

static void copy_text(char *dst, size_t dst_len, const char *src) {
    snprintf(dst, dst_len, "%s", src);
}

List_Item make_list_item(const char *text, uint32_t height, Font_Id font) {
    List_Item item;
    copy_text(item.text, sizeof(item.text), text);
    item.height = height;
    item.font = font;
    return item;
}

/*============================================================================
 * List
 *============================================================================*/

List::List(const List_Item *items, uint8_t count, const Rect &bounds, const Theme &theme)
    : bounds_(bounds), theme_(theme) {
    count_ = (count > LIST_MAX_ITEMS) ? LIST_MAX_ITEMS : count;
    for (uint8_t i = 0; i < count_; ++i) {
        items_[i] = items[i];
    }

    /* Rows are laid out with the first item's height; never zero lines */
    if (count_ > 0U && items_[0].height > 0U) {
        uint32_t lines = bounds_.size.height / items_[0].height;
        if (lines > 255U) {
            lines = 255U;
        }
        visible_lines_ = (lines > 0U) ? static_cast<uint8_t>(lines) : 1U;
    }
}

Point List::row_origin(uint8_t index) const {
    uint32_t offset = static_cast<uint32_t>(index - window_start_) * items_[index].height;
    return {bounds_.top_left.x, bounds_.top_left.y + static_cast<int32_t>(offset)};
}

uint8_t List::window_end() const {
    uint32_t end = static_cast<uint32_t>(window_start_) + visible_lines_;
    return (end < count_) ? static_cast<uint8_t>(end) : count_;
}

Rect List::scrollbar_track() const {
    uint32_t track_h = (bounds_.size.height > TRACK_BOTTOM_MARGIN)
                           ? bounds_.size.height - TRACK_BOTTOM_MARGIN : 0U;
    int32_t x = bounds_.top_left.x + static_cast<int32_t>(bounds_.size.width) -
                static_cast<int32_t>(SCROLLBAR_WIDTH);
    return {{x, bounds_.top_left.y}, {SCROLLBAR_WIDTH, track_h}};
}

Rect List::scrollbar_indicator() const {
    Rect track = scrollbar_track();
    if (count_ == 0U) {
        return {track.top_left, {SCROLLBAR_WIDTH, 0U}};
    }
    /* Proportional fill: height ~ visible/total, offset ~ window_start/total */
    uint32_t height = track.size.height * visible_lines_ / count_;
    uint32_t offset = track.size.height * window_start_ / count_;
    return {{track.top_left.x, track.top_left.y + static_cast<int32_t>(offset)},
            {SCROLLBAR_WIDTH, height}};
}

HwError List::draw(Draw_Target &target) const {
    bool scrollbar = shows_scrollbar();
    uint32_t row_width = scrollbar ? bounds_.size.width - SCROLLBAR_WIDTH
                                   : bounds_.size.width - ROW_MARGIN;
    uint32_t text_width_max = bounds_.size.width - SCROLLBAR_WIDTH;

    for (uint8_t i = window_start_; i < window_end(); ++i) {
        const List_Item &item = items_[i];
        char visible[LIST_ITEM_TEXT_LEN];
        truncate_with_ellipsis(text_width_max, item.text, font_metrics(item.font),
                               visible, sizeof(visible));

        Text_Style style;
        style.font = item.font;
        style.color = theme_.text_primary;

        Color565 bg = (i == selected_) ? theme_.highlight : theme_.screen_background;
        HwError err = render_text_with_background(target, style, row_origin(i), visible,
                                                  bg, row_width);
        if (err != HwError::None) {
            return err;
        }
    }

    if (!scrollbar) {
        return HwError::None;
    }

    HwError err = target.fill_rect(scrollbar_track(), theme_.highlight);
    if (err != HwError::None) {
        return err;
    }
    return target.fill_rect(scrollbar_indicator(), theme_.text_primary);
}

HwError List::scroll_down(Draw_Target &target) {
    if (count_ == 0U) {
        return draw(target);
    }
    if (selected_ < count_ - 1U) {
        selected_++;
    }
    if (selected_ > window_start_ + visible_lines_ - 1U) {
        window_start_++;
    }
    return draw(target);
}

HwError List::scroll_up(Draw_Target &target) {
    if (selected_ > 0U) {
        selected_--;
    }
    if (selected_ < window_start_) {
        window_start_--;
    }
    return draw(target);
}

HwError List::select_at_pos(Draw_Target &target, const Point &pos, uint8_t &selected) {
    for (uint8_t i = window_start_; i < window_end(); ++i) {
        Rect row = {row_origin(i), {bounds_.size.width, items_[i].height}};
        if (row.contains(pos)) {
            selected_ = i;
            break;
        }
    }
    HwError err = draw(target);
    selected = selected_;
    return err;
}

void List::set_selected_index(uint8_t index) {
    if (index >= count_) {
        return;
    }
    selected_ = index;

    if (selected_ < window_start_) {
        window_start_ = selected_;
    } else if (selected_ > window_start_ + visible_lines_ - 1U) {
        window_start_ = static_cast<uint8_t>(selected_ - visible_lines_ + 1U);
    }
}

/*============================================================================
 * Button
 *============================================================================*/

HwError Button::draw(Draw_Target &target, Color565 background) const {
    uint32_t inset2 = 2U * INSET;
    Size visible = {(size_.width > inset2) ? size_.width - inset2 : 0U,
                    (size_.height > inset2) ? size_.height - inset2 : 0U};
    Point origin = {pos_.x + static_cast<int32_t>(INSET), pos_.y + static_cast<int32_t>(INSET)};

    HwError err = fill_round_rect(target, {origin, visible}, CORNER_RADIUS, background);
    if (err != HwError::None) {
        return err;
    }

    const Bitmap &image = icon_bitmap(icon_);
    uint32_t margin_x = (visible.width > image.width) ? (visible.width - image.width) / 2U : 0U;
    uint32_t margin_y = (visible.height > image.height) ? (visible.height - image.height) / 2U : 0U;
    Point image_pos = {origin.x + static_cast<int32_t>(margin_x),
                       origin.y + static_cast<int32_t>(margin_y)};
    return target.blit(image_pos, image, theme_.button_foreground);
}

/*============================================================================
 * Label
 *============================================================================*/

Label::Label(const char *text, const Point &pos, uint32_t width, Color565 background,
             Font_Id font, const Theme &theme)
    : pos_(pos), width_(width), background_(background), font_(font), theme_(theme) {
    copy_text(text_, sizeof(text_), text);
}

HwError Label::draw(Draw_Target &target) const {
    char visible[WIDGET_TEXT_LEN];
    truncate_with_ellipsis(width_, text_, font_metrics(font_), visible, sizeof(visible));

    Text_Style style;
    style.font = font_;
    style.color = theme_.text_primary;
    return render_text_with_background(target, style, pos_, visible, background_, width_);
}

HwError Label::update_text(Draw_Target &target, const char *text) {
    set_text(text);
    return draw(target);
}

void Label::set_text(const char *text) {
    copy_text(text_, sizeof(text_), text);
}

/*============================================================================
 * Progress
 *============================================================================*/

Progress::Progress(Icon_Id icon, const char *text, const Rect &bounds, Color565 background,
                   Font_Id font, const Theme &theme)
    : icon_(icon), bounds_(bounds), background_(background), font_(font), theme_(theme) {
    copy_text(text_, sizeof(text_), text);
}

HwError Progress::draw(Draw_Target &target) const {
    HwError err = target.fill_rect(bounds_, background_);
    if (err != HwError::None) {
        return err;
    }

    const Bitmap &image = icon_bitmap(icon_);
    const uint32_t text_h = font_metrics(font_).char_height;
    const int32_t w = static_cast<int32_t>(bounds_.size.width);
    const int32_t h = static_cast<int32_t>(bounds_.size.height);
    const int32_t iw = static_cast<int32_t>(image.width);
    const int32_t ih = static_cast<int32_t>(image.height);

    /* Icon sits one text line above the vertical centre */
    int32_t image_x = bounds_.top_left.x + (w - iw) / 2;
    int32_t image_y = bounds_.top_left.y + (h - ih) / 2 - static_cast<int32_t>(text_h);
    if (image_y < bounds_.top_left.y) {
        image_y = bounds_.top_left.y;
    }
    if ((err = target.blit({image_x, image_y}, image, theme_.text_primary)) != HwError::None) {
        return err;
    }

    Text_Style style;
    style.font = font_;
    style.color = theme_.text_primary;
    style.align = Text_Align::Center;

    Point text_pos = {bounds_.top_left.x + w / 2,
                      image_y + ih + static_cast<int32_t>(text_h / 2U)};
    return render_text(target, style, text_pos, text_);
}

HwError Progress::update_text(Draw_Target &target, const char *text) {
    set_text(text);
    return draw(target);
}

void Progress::set_text(const char *text) {
    copy_text(text_, sizeof(text_), text);
}
