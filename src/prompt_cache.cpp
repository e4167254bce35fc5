#include "prompt_cache.hpp"

#include "logging.hpp"

#include <openssl/evp.h>

#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>
#include <stdexcept>

std::string sha256_hex(const std::string& text) {
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), text.data(), text.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), digest, &length) != 1) {
        throw std::runtime_error("SHA-256 digest failed");
    }

    std::ostringstream oss;
    for (unsigned int i = 0; i < length; ++i) {
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(digest[i]);
    }
    return oss.str();
}

std::filesystem::path PromptAudioCache::entry_path(const std::string& text, const std::string& format) const {
    return cache_dir_ / ("prompt_" + sha256_hex(text) + "." + format);
}

Status PromptAudioCache::fetch_or_generate(const std::string& text,
                                           const std::filesystem::path& output_path,
                                           SpeechSynthesizer& synthesizer,
                                           bool& cache_used) {
    namespace fs = std::filesystem;
    cache_used = false;

    fs::path cached;
    try {
        cached = entry_path(text, synthesizer.format());
        fs::create_directories(cache_dir_);
        if (output_path.has_parent_path()) fs::create_directories(output_path.parent_path());

        if (fs::exists(cached)) {
            fs::copy_file(cached, output_path, fs::copy_options::overwrite_existing);
            cache_used = true;
            log_debug("PromptAudioCache", "hit " + cached.filename().string());
            return Status::ok();
        }
    } catch (const std::exception& e) {
        return Status::error(ErrorKind::IoError, e.what());
    }

    std::string audio;
    try {
        audio = synthesizer.synthesize(text);
    } catch (const std::exception& e) {
        return Status::error(ErrorKind::ServiceFailure,
                             std::string("Failed to generate prompt audio: ") + e.what());
    }

    try {
        std::ofstream out(output_path, std::ios::binary | std::ios::trunc);
        if (!out) throw std::runtime_error("Cannot open " + output_path.string() + " for writing");
        out.write(audio.data(), static_cast<std::streamsize>(audio.size()));
        out.close();
        if (!out) throw std::runtime_error("Failed writing " + output_path.string());
        fs::copy_file(output_path, cached, fs::copy_options::overwrite_existing);
    } catch (const std::exception& e) {
        return Status::error(ErrorKind::IoError, e.what());
    }
    return Status::ok();
}
