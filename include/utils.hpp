#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

float rms(const std::vector<int16_t>& x);
float dbfs(const std::vector<int16_t>& x);

// Mean of |sample| over the block; the silence detector's level measure.
float mean_abs_amplitude(const int16_t* samples, std::size_t count);
float mean_abs_amplitude(const std::vector<int16_t>& x);

std::string to_lower(std::string s);
std::string trim(const std::string& s);
