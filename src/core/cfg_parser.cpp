#include "core/cfg_parser.h"

#include <cctype>
#include <cmath>
#include <fstream>
#include <stdexcept>

namespace pitchsync::core::cfg {
namespace {

std::string StripComment(std::string line) {
    bool in_quotes = false;
    for (std::string::size_type index = 0; index < line.size(); ++index) {
        if (line[index] == '"') {
            in_quotes = !in_quotes;
            continue;
        }
        if (line[index] == '#' && !in_quotes) {
            line.erase(index);
            break;
        }
    }
    return line;
}

}  // namespace

std::string Trim(std::string_view text) {
    auto is_not_space = [](unsigned char ch) { return !std::isspace(ch); };

    std::size_t start = 0;
    while (start < text.size() && !is_not_space(static_cast<unsigned char>(text[start]))) {
        ++start;
    }

    std::size_t end = text.size();
    while (end > start && !is_not_space(static_cast<unsigned char>(text[end - 1]))) {
        --end;
    }

    return std::string(text.substr(start, end - start));
}

bool ParseFile(
    const std::filesystem::path& file_path,
    std::vector<KeyValueLine>& out_lines,
    std::string& out_error) {
    out_lines.clear();

    std::ifstream file(file_path);
    if (!file.is_open()) {
        out_error = "Cannot open config file: " + file_path.string();
        return false;
    }

    std::string line;
    int line_number = 0;
    while (std::getline(file, line)) {
        ++line_number;
        line = Trim(StripComment(std::move(line)));
        if (line.empty()) {
            continue;
        }

        if (line.front() == '[' && line.back() == ']') {
            continue;
        }

        const std::string::size_type equal_pos = line.find('=');
        if (equal_pos == std::string::npos) {
            out_error = "Invalid config line (missing '='): line " + std::to_string(line_number);
            return false;
        }

        KeyValueLine parsed{};
        parsed.key = Trim(std::string_view(line).substr(0, equal_pos));
        parsed.value = Trim(std::string_view(line).substr(equal_pos + 1));
        parsed.line_number = line_number;
        if (parsed.key.empty()) {
            out_error = "Invalid config line (empty key): line " + std::to_string(line_number);
            return false;
        }

        out_lines.push_back(std::move(parsed));
    }

    out_error.clear();
    return true;
}

bool ParseBool(std::string_view value, bool& out_value) {
    const std::string trimmed = Trim(value);
    if (trimmed == "true") {
        out_value = true;
        return true;
    }
    if (trimmed == "false") {
        out_value = false;
        return true;
    }
    return false;
}

bool ParseInt(std::string_view value, int& out_value) {
    const std::string trimmed = Trim(value);
    try {
        size_t consumed = 0;
        const int parsed = std::stoi(trimmed, &consumed);
        if (consumed != trimmed.size()) {
            return false;
        }
        out_value = parsed;
        return true;
    } catch (const std::logic_error&) {
        return false;
    }
}

bool ParseDouble(std::string_view value, double& out_value) {
    const std::string trimmed = Trim(value);
    try {
        size_t consumed = 0;
        const double parsed = std::stod(trimmed, &consumed);
        if (consumed != trimmed.size() || !std::isfinite(parsed)) {
            return false;
        }
        out_value = parsed;
        return true;
    } catch (const std::logic_error&) {
        return false;
    }
}

bool ParseQuotedString(std::string_view value, std::string& out_text) {
    const std::string trimmed = Trim(value);
    if (trimmed.size() < 2 || trimmed.front() != '"' || trimmed.back() != '"') {
        return false;
    }
    out_text = trimmed.substr(1, trimmed.size() - 2);
    return true;
}

}  // namespace pitchsync::core::cfg
