#pragma once

#include "audio_device.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

// Called on the driver thread whenever a block of captured samples is ready.
// Implementations must not throw, block for long or log.
class InputHandler {
public:
    virtual ~InputHandler() = default;
    virtual void on_input(const float* samples, std::size_t count) noexcept = 0;
};

// Called on the driver thread whenever the device needs exactly `count`
// samples. The handler must fill all of them.
class OutputHandler {
public:
    virtual ~OutputHandler() = default;
    virtual void on_output(float* samples, std::size_t count) noexcept = 0;
};

// A callback-driven stream. stop() and close() are safe to repeat.
class AudioStream {
public:
    virtual ~AudioStream() = default;
    virtual void start() = 0;
    virtual void stop() = 0;
    virtual void close() = 0;
    virtual bool active() const = 0;
};

// Blocking 16-bit capture, one block per read().
class PcmReader {
public:
    virtual ~PcmReader() = default;
    virtual std::size_t read(std::vector<int16_t>& out) = 0;
};

// Blocking 16-bit playback.
class PcmWriter {
public:
    virtual ~PcmWriter() = default;
    virtual void write(const int16_t* samples, std::size_t count) = 0;
    virtual void drain() = 0;
};

// Operating-system audio subsystem. Opening functions throw
// std::runtime_error when the driver rejects the parameters.
class AudioBackend {
public:
    virtual ~AudioBackend() = default;

    virtual std::vector<AudioDevice> list_devices() = 0;

    virtual std::unique_ptr<AudioStream> open_input_stream(const StreamParams& params,
                                                           InputHandler& handler) = 0;
    virtual std::unique_ptr<AudioStream> open_output_stream(const StreamParams& params,
                                                            OutputHandler& handler) = 0;

    virtual std::unique_ptr<PcmReader> open_reader(const StreamParams& params) = 0;
    virtual std::unique_ptr<PcmWriter> open_writer(const StreamParams& params) = 0;
};
