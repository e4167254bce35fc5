#pragma once

#include "status.hpp"

#include <filesystem>
#include <string>

struct CliOptions {
    std::filesystem::path prompt_file;
    bool verify = false;
    bool list_devices = false;
    bool help = false;
};

std::string usage(const std::string& program);

// --prompt-file/-p is required unless --list-devices or --help is given,
// and must name an existing file.
Status parse_cli(int argc, char** argv, CliOptions& options);

Status load_prompt_file(const std::filesystem::path& path, std::string& text);
