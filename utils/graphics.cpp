/*
 * Graphics Implementation
 */

#include "utils/graphics.hpp"

#include <cmath>
#include <cstring>

/* Segment bits: a b c d e f g */
static constexpr uint8_t SEG_A = 1U << 0U;
static constexpr uint8_t SEG_B = 1U << 1U;
static constexpr uint8_t SEG_C = 1U << 2U;
static constexpr uint8_t SEG_D = 1U << 3U;
static constexpr uint8_t SEG_E = 1U << 4U;
static constexpr uint8_t SEG_F = 1U << 5U;
static constexpr uint8_t SEG_G = 1U << 6U;

static const uint8_t DIGIT_SEGMENTS[10] = {
    SEG_A | SEG_B | SEG_C | SEG_D | SEG_E | SEG_F,          /* 0 */
    SEG_B | SEG_C,                                          /* 1 */
    SEG_A | SEG_B | SEG_D | SEG_E | SEG_G,                  /* 2 */
    SEG_A | SEG_B | SEG_C | SEG_D | SEG_G,                  /* 3 */
    SEG_B | SEG_C | SEG_F | SEG_G,                          /* 4 */
    SEG_A | SEG_C | SEG_D | SEG_F | SEG_G,                  /* 5 */
    SEG_A | SEG_C | SEG_D | SEG_E | SEG_F | SEG_G,          /* 6 */
    SEG_A | SEG_B | SEG_C,                                  /* 7 */
    SEG_A | SEG_B | SEG_C | SEG_D | SEG_E | SEG_F | SEG_G,  /* 8 */
    SEG_A | SEG_B | SEG_C | SEG_D | SEG_F | SEG_G,          /* 9 */
};

static uint8_t segments_for(char c) {
    if (c >= '0' && c <= '9') {
        return DIGIT_SEGMENTS[c - '0'];
    }
    if (c == '-') {
        return SEG_G;
    }
    return 0U;
}

uint32_t text_width(const Mono_Font &font, const char *text) {
    return font.char_width * static_cast<uint32_t>(strlen(text));
}

Rect text_bounds(const Text_Style &style, const Point &pos, const char *text) {
    const Mono_Font &font = font_metrics(style.font);
    uint32_t w = text_width(font, text);
    uint32_t h = font.char_height;

    Rect r;
    r.size = {w, h};
    r.top_left = pos;

    switch (style.align) {
        case Text_Align::Left:   break;
        case Text_Align::Center: r.top_left.x -= static_cast<int32_t>(w / 2U); break;
        case Text_Align::Right:  r.top_left.x -= static_cast<int32_t>(w); break;
    }
    switch (style.baseline) {
        case Text_Baseline::Top:    break;
        case Text_Baseline::Middle: r.top_left.y -= static_cast<int32_t>(h / 2U); break;
        case Text_Baseline::Bottom: r.top_left.y -= static_cast<int32_t>(h); break;
    }
    return r;
}

HwError render_text(Draw_Target &target, const Text_Style &style, const Point &pos,
                    const char *text, Point *next) {
    Rect box = text_bounds(style, pos, text);

    HwError err = target.draw_glyphs(box.top_left, text, style.font, style.color);
    if (err != HwError::None) {
        return err;
    }

    if (next != nullptr) {
        next->x = box.top_left.x + static_cast<int32_t>(box.size.width);
        next->y = pos.y;
    }
    return HwError::None;
}

HwError render_text_with_background(Draw_Target &target, const Text_Style &style,
                                    const Point &pos, const char *text,
                                    Color565 background, uint32_t width, Point *next) {
    Rect box = text_bounds(style, pos, text);

    /* Line height even for an empty string so a cleared field is erased */
    Rect strip = {{pos.x, box.top_left.y}, {width, font_metrics(style.font).char_height}};
    HwError err = target.fill_rect(strip, background);
    if (err != HwError::None) {
        return err;
    }
    return render_text(target, style, pos, text, next);
}

HwError render_image_with_background(Draw_Target &target, const Point &pos,
                                     const Bitmap &image, Color565 foreground,
                                     Color565 background) {
    Rect box = {pos, {image.width, image.height}};
    HwError err = target.fill_rect(box, background);
    if (err != HwError::None) {
        return err;
    }
    return target.blit(pos, image, foreground);
}

HwError fill_round_rect(Draw_Target &target, const Rect &area, uint32_t radius,
                        Color565 color) {
    uint32_t w = area.size.width;
    uint32_t h = area.size.height;
    if (w == 0U || h == 0U) {
        return HwError::None;
    }

    uint32_t r = radius;
    uint32_t short_side = (w < h) ? w : h;
    if (r > short_side / 2U) {
        r = short_side / 2U;
    }

    HwError err = HwError::None;

    for (uint32_t i = 0; i < r; ++i) {
        /* Horizontal inset of row i from the corner circle */
        float dy = static_cast<float>(r) - static_cast<float>(i) - 0.5f;
        float span = std::sqrt(static_cast<float>(r * r) - dy * dy);
        uint32_t inset = r - static_cast<uint32_t>(span + 0.5f);
        if (inset * 2U >= w) {
            continue;
        }
        Rect top = {{area.top_left.x + static_cast<int32_t>(inset),
                     area.top_left.y + static_cast<int32_t>(i)},
                    {w - 2U * inset, 1U}};
        Rect bottom = top;
        bottom.top_left.y = area.top_left.y + static_cast<int32_t>(h - 1U - i);

        if ((err = target.fill_rect(top, color)) != HwError::None) { return err; }
        if ((err = target.fill_rect(bottom, color)) != HwError::None) { return err; }
    }

    Rect middle = {{area.top_left.x, area.top_left.y + static_cast<int32_t>(r)},
                   {w, h - 2U * r}};
    if (middle.size.height == 0U) {
        return HwError::None;
    }
    return target.fill_rect(middle, color);
}

size_t truncate_with_ellipsis(uint32_t max_width, const char *text, const Mono_Font &font,
                              char *out, size_t out_len) {
    if (out_len == 0U) {
        return 0U;
    }

    size_t len = strlen(text);
    size_t keep = len;
    bool ellipsis = false;

    if (font.char_width > 0U && text_width(font, text) > max_width) {
        uint32_t visible = max_width / font.char_width;
        keep = (visible > 3U) ? (visible - 3U) : 0U;
        ellipsis = true;
    }

    size_t limit = out_len - 1U;
    size_t n = (keep < limit) ? keep : limit;
    memcpy(out, text, n);

    if (ellipsis) {
        for (uint8_t i = 0; i < 3U && n < limit; ++i) {
            out[n++] = '.';
        }
    }
    out[n] = '\0';
    return n;
}

uint32_t seven_segment_width(const Seven_Segment_Style &style, const char *text) {
    uint32_t w = 0;
    for (const char *p = text; *p != '\0'; ++p) {
        if (*p == '.') {
            w += style.segment_width + style.digit_spacing;
        } else {
            w += style.digit_width + style.digit_spacing;
        }
    }
    return w;
}

static HwError draw_digit(Draw_Target &target, const Seven_Segment_Style &style,
                          int32_t x, int32_t y, uint8_t segs) {
    const int32_t w = static_cast<int32_t>(style.digit_width);
    const int32_t h = static_cast<int32_t>(style.digit_height);
    const int32_t s = static_cast<int32_t>(style.segment_width);
    const uint32_t horiz = (w > 2 * s) ? static_cast<uint32_t>(w - 2 * s) : 0U;
    const uint32_t vert = (h / 2 > s) ? static_cast<uint32_t>(h / 2 - s) : 0U;

    const Rect geometry[7] = {
        {{x + s, y}, {horiz, style.segment_width}},                          /* a */
        {{x + w - s, y + s}, {style.segment_width, vert}},                   /* b */
        {{x + w - s, y + h / 2}, {style.segment_width, vert}},               /* c */
        {{x + s, y + h - s}, {horiz, style.segment_width}},                  /* d */
        {{x, y + h / 2}, {style.segment_width, vert}},                       /* e */
        {{x, y + s}, {style.segment_width, vert}},                           /* f */
        {{x + s, y + h / 2 - s / 2}, {horiz, style.segment_width}},          /* g */
    };

    for (uint8_t i = 0; i < 7U; ++i) {
        if ((segs & (1U << i)) == 0U) {
            continue;
        }
        HwError err = target.fill_rect(geometry[i], style.color);
        if (err != HwError::None) {
            return err;
        }
    }
    return HwError::None;
}

HwError render_seven_segment(Draw_Target &target, const Seven_Segment_Style &style,
                             const Point &pos, const char *text, Color565 background,
                             uint32_t width) {
    HwError err = target.fill_rect({pos, {width, style.digit_height}}, background);
    if (err != HwError::None) {
        return err;
    }

    int32_t x = pos.x;
    for (const char *p = text; *p != '\0'; ++p) {
        if (*p == '.') {
            Rect dot = {{x, pos.y + static_cast<int32_t>(style.digit_height - style.segment_width)},
                        {style.segment_width, style.segment_width}};
            if ((err = target.fill_rect(dot, style.color)) != HwError::None) {
                return err;
            }
            x += static_cast<int32_t>(style.segment_width + style.digit_spacing);
            continue;
        }

        if ((err = draw_digit(target, style, x, pos.y, segments_for(*p))) != HwError::None) {
            return err;
        }
        x += static_cast<int32_t>(style.digit_width + style.digit_spacing);
    }
    return HwError::None;
}
