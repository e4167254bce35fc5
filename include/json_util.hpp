#pragma once

#include <optional>
#include <string>

// Just enough JSON for the speech service payloads: escaping strings for
// hand-built request bodies and pulling top-level-ish fields out of
// responses by key. Not a general parser.
std::string json_escape(const std::string& s);
std::string json_quote(const std::string& s);

std::optional<std::string> json_string_field(const std::string& json, const std::string& key);
std::optional<bool> json_bool_field(const std::string& json, const std::string& key);
