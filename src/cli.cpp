#include "cli.hpp"

#include <getopt.h>

#include <fstream>
#include <iterator>
#include <sstream>

std::string usage(const std::string& program) {
    std::ostringstream oss;
    oss << "Usage: " << program << " --prompt-file PATH [--verify | --no-verify]\n"
        << "       " << program << " --list-devices\n\n"
        << "  -p, --prompt-file PATH  text file with the prompt to speak\n"
        << "      --verify            record, transcribe and evaluate the reply before\n"
        << "                          keeping the microphone live\n"
        << "      --no-verify         go live right after the prompt (default)\n"
        << "  -l, --list-devices      print audio devices and exit\n"
        << "  -h, --help              show this help\n";
    return oss.str();
}

Status parse_cli(int argc, char** argv, CliOptions& options) {
    enum { kVerify = 1000, kNoVerify };
    static const option long_options[] = {
        {"prompt-file", required_argument, nullptr, 'p'},
        {"verify", no_argument, nullptr, kVerify},
        {"no-verify", no_argument, nullptr, kNoVerify},
        {"list-devices", no_argument, nullptr, 'l'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    options = CliOptions{};
    optind = 0;   // full re-initialisation for repeated parses
    opterr = 0;

    int opt = 0;
    while ((opt = getopt_long(argc, argv, ":p:lh", long_options, nullptr)) != -1) {
        switch (opt) {
        case 'p': options.prompt_file = optarg; break;
        case kVerify: options.verify = true; break;
        case kNoVerify: options.verify = false; break;
        case 'l': options.list_devices = true; break;
        case 'h': options.help = true; break;
        case ':':
            return Status::error(ErrorKind::InvalidArgument,
                                 std::string("option requires an argument: ") + argv[optind - 1]);
        default:
            return Status::error(ErrorKind::InvalidArgument,
                                 std::string("unknown option: ") + argv[optind - 1]);
        }
    }
    if (optind < argc) {
        return Status::error(ErrorKind::InvalidArgument, std::string("unexpected argument: ") + argv[optind]);
    }

    if (options.help || options.list_devices) return Status::ok();
    if (options.prompt_file.empty()) {
        return Status::error(ErrorKind::InvalidArgument, "missing required option --prompt-file");
    }
    if (!std::filesystem::exists(options.prompt_file)) {
        return Status::error(ErrorKind::InvalidArgument,
                             "prompt file does not exist: " + options.prompt_file.string());
    }
    return Status::ok();
}

Status load_prompt_file(const std::filesystem::path& path, std::string& text) {
    std::ifstream in(path, std::ios::binary);
    if (!in) return Status::error(ErrorKind::IoError, "Prompt file does not exist: " + path.string());
    text.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    if (in.bad()) return Status::error(ErrorKind::IoError, "Failed to load prompt from file " + path.string());
    return Status::ok();
}
