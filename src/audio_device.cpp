#include "audio_device.hpp"

const char* direction_name(Direction direction) {
    return direction == Direction::Input ? "input" : "output";
}
