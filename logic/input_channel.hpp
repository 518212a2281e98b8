/*
 * Input channel and calibration signal shared by the producer tasks and
 * the render loop. Created once in main() and passed by reference.
 */

#ifndef INPUT_CHANNEL_HPP
#define INPUT_CHANNEL_HPP

#include "logic/channel.hpp"
#include "types.h"

#include <cstddef>

static constexpr size_t INPUT_CHANNEL_DEPTH = 1;

using Input_Channel = Channel<InputEvent, INPUT_CHANNEL_DEPTH>;
using Calibration_Signal = Signal<Calibration>;

#endif // INPUT_CHANNEL_HPP
