/*
 * Digital_Input - Abstract button pin with latched edge detection
 * Implemented by Gpio_Input on hardware and by fakes in host tests
 */

#ifndef DIGITAL_INPUT_HPP
#define DIGITAL_INPUT_HPP

#include "types.h"

#include <cstdint>

enum class EdgeKind : uint8_t {
    Falling,  /* Pulled-up button, pressed = low */
    Rising,   /* Pulled-down button, pressed = high */
    Either
};

class Digital_Input {
public:
    virtual ~Digital_Input() = default;

    /*
     * Non-blocking check for a latched edge of the requested kind.
     * Clears the latched edge when seen.
     */
    virtual HwError poll_edge(EdgeKind kind, bool &edge_seen) = 0;

    /* Drop every edge latched so far */
    virtual void discard_edges() = 0;

    /* Current pin level */
    virtual HwError level(bool &high) = 0;
};

#endif // DIGITAL_INPUT_HPP
