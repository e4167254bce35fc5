#pragma once

#include <string>

enum class Direction { Input, Output };

const char* direction_name(Direction direction);

// One device as seen by a single enumeration. Indices are only meaningful
// within the snapshot that produced them.
struct AudioDevice {
    int index = -1;
    std::string name;          // PCM name, what streams are opened with
    std::string description;   // human readable, may be empty
    int max_input_channels = 0;
    int max_output_channels = 0;
    int default_sample_rate = 44100;

    bool supports(Direction direction) const {
        return direction == Direction::Input ? max_input_channels > 0 : max_output_channels > 0;
    }
};

struct StreamParams {
    int device_index = -1;
    std::string device_name;
    unsigned sample_rate = 44100;
    unsigned channels = 1;     // the relay is mono only
    unsigned block_size = 2048;
};
