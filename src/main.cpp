#include "alsa_backend.hpp"
#include "app_config.hpp"
#include "cancellation.hpp"
#include "cli.hpp"
#include "device_directory.hpp"
#include "logging.hpp"
#include "openai_services.hpp"
#include "probe_session.hpp"
#include "transcriber.hpp"

#include <iostream>
#include <memory>
#include <string>

namespace {

constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;
constexpr int kExitInterrupted = 130;

int report(const Status& status) {
    if (status.is_ok()) return 0;
    if (status.kind() == ErrorKind::Cancelled) {
        log_info("main", "Interrupted: " + status.message());
        return kExitInterrupted;
    }
    log_error("main", status.to_string());
    return kExitFailure;
}

} // namespace

int main(int argc, char** argv) {
    CancellationToken cancel;
    SignalCancellation signals(cancel);

    CliOptions options;
    Status status = parse_cli(argc, argv, options);
    if (!status.is_ok()) {
        std::cerr << status.message() << "\n\n" << usage(argv[0]);
        return kExitUsage;
    }
    if (options.help) {
        std::cout << usage(argv[0]);
        return 0;
    }

    status = load_dotenv(".env");
    if (!status.is_ok()) return report(status);

    AppConfig config;
    status = load_config(config);
    set_debug_logging(config.debug);
    if (!status.is_ok()) return report(status);

    log_info("main", "Initializing voiceprobe...");
    AlsaBackend backend;

    if (options.list_devices) {
        try {
            std::cout << DeviceDirectory::enumerate(backend).describe();
        } catch (const std::exception& e) {
            return report(Status::error(ErrorKind::DeviceOpenFailure, e.what()));
        }
        return 0;
    }

    std::string prompt_text;
    status = load_prompt_file(options.prompt_file, prompt_text);
    if (!status.is_ok()) return report(status);

    std::unique_ptr<SpeechSynthesizer> synthesizer;
    std::unique_ptr<SpeechTranscriber> transcriber;
    std::unique_ptr<ResponseClassifier> classifier;
    try {
        synthesizer = std::make_unique<OpenAiSpeechSynthesizer>(config.openai);
        if (config.transcription_backend == "vosk") {
            transcriber = std::make_unique<VoskTranscriber>(config.vosk_model_path);
            log_info("main", "Transcription using Vosk model: " + config.vosk_model_path);
        } else {
            transcriber = std::make_unique<OpenAiTranscriber>(config.openai);
        }
        classifier = std::make_unique<OpenAiClassifier>(config.openai);
    } catch (const std::exception& e) {
        return report(Status::error(ErrorKind::ConfigurationError, e.what()));
    }

    ProbeSession session(config, backend, *synthesizer, *transcriber, *classifier, options.verify);
    return report(session.run(prompt_text, cancel));
}
