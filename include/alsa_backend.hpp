#pragma once

#include "audio_backend.hpp"

// ALSA implementation of the audio subsystem. Devices come from the PCM
// name hints; callback streams run a poll/read-or-write loop on their own
// thread and hand each block to the handler.
class AlsaBackend : public AudioBackend {
public:
    std::vector<AudioDevice> list_devices() override;

    std::unique_ptr<AudioStream> open_input_stream(const StreamParams& params,
                                                   InputHandler& handler) override;
    std::unique_ptr<AudioStream> open_output_stream(const StreamParams& params,
                                                    OutputHandler& handler) override;

    std::unique_ptr<PcmReader> open_reader(const StreamParams& params) override;
    std::unique_ptr<PcmWriter> open_writer(const StreamParams& params) override;
};
