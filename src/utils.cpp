#include "utils.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>

float rms(const std::vector<int16_t>& x) {
    if (x.empty()) return 0.0f;
    double acc = 0.0;
    for (auto sample : x) {
        acc += static_cast<double>(sample) * static_cast<double>(sample);
    }
    double mean = acc / static_cast<double>(x.size());
    return static_cast<float>(std::sqrt(mean));
}

float dbfs(const std::vector<int16_t>& x) {
    const float r = rms(x);
    const float ref = 32768.0f; // int16 max magnitude
    return 20.0f * std::log10((r + 1e-9f) / ref);
}

float mean_abs_amplitude(const int16_t* samples, std::size_t count) {
    if (!samples || count == 0) return 0.0f;
    double acc = 0.0;
    for (std::size_t i = 0; i < count; ++i) {
        acc += std::abs(static_cast<int>(samples[i]));
    }
    return static_cast<float>(acc / static_cast<double>(count));
}

float mean_abs_amplitude(const std::vector<int16_t>& x) {
    return mean_abs_amplitude(x.data(), x.size());
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim(const std::string& s) {
    auto first = std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
    auto last = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    if (first >= last) return {};
    return std::string(first, last);
}
