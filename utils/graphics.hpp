/*
 * Graphics - Stateless drawing primitives over a Draw_Target
 * Pure logic, no SDK dependency. Testable on host.
 */

#ifndef GRAPHICS_HPP
#define GRAPHICS_HPP

#include "utils/assets.hpp"
#include "utils/draw_target.hpp"
#include "types.h"

#include <cstddef>
#include <cstdint>

enum class Text_Align : uint8_t { Left, Center, Right };
enum class Text_Baseline : uint8_t { Top, Middle, Bottom };

struct Text_Style {
    Font_Id font = Font_Id::Small;
    Color565 color = COLOR_WHITE;
    Text_Align align = Text_Align::Left;
    Text_Baseline baseline = Text_Baseline::Top;
};

struct Seven_Segment_Style {
    uint32_t digit_width;
    uint32_t digit_height;
    uint32_t digit_spacing;
    uint32_t segment_width;
    Color565 color;
};

/* Rendered width of text in a monospace font (char width x length) */
uint32_t text_width(const Mono_Font &font, const char *text);

/* Box covered by text anchored at pos according to the style's align/baseline */
Rect text_bounds(const Text_Style &style, const Point &pos, const char *text);

/*
 * Draw text anchored at pos.
 * @param next  Receives the point right after the drawn text (may be nullptr)
 */
HwError render_text(Draw_Target &target, const Text_Style &style, const Point &pos,
                    const char *text, Point *next = nullptr);

/*
 * Fill width x line height with background, then draw the text on top.
 * The strip starts at pos.x and the top of the text box, so a shorter string
 * fully covers the previous one.
 */
HwError render_text_with_background(Draw_Target &target, const Text_Style &style,
                                    const Point &pos, const char *text,
                                    Color565 background, uint32_t width,
                                    Point *next = nullptr);

/* Fill the bitmap box with background, then blit the bitmap in foreground */
HwError render_image_with_background(Draw_Target &target, const Point &pos,
                                     const Bitmap &image, Color565 foreground,
                                     Color565 background);

/* Rounded rectangle as horizontal spans; radius clamped to half the short side */
HwError fill_round_rect(Draw_Target &target, const Rect &area, uint32_t radius,
                        Color565 color);

/*
 * Shorten text to fit max_width, assuming a fixed-width font.
 * If char_width x length exceeds max_width, keeps
 * (max_width / char_width) - 3 characters and appends "...".
 * Otherwise copies text unchanged. Applying it to its own output is a no-op.
 *
 * @return length written to out (always NUL-terminated when out_len > 0)
 */
size_t truncate_with_ellipsis(uint32_t max_width, const char *text, const Mono_Font &font,
                              char *out, size_t out_len);

/* Width of a seven-segment string: digit cells plus narrow '.' cells */
uint32_t seven_segment_width(const Seven_Segment_Style &style, const char *text);

/*
 * Fill width x digit height with background, then draw text as seven-segment
 * glyphs. Supports 0-9, '-', ' ' and '.'; anything else renders blank.
 */
HwError render_seven_segment(Draw_Target &target, const Seven_Segment_Style &style,
                             const Point &pos, const char *text, Color565 background,
                             uint32_t width);

#endif // GRAPHICS_HPP
