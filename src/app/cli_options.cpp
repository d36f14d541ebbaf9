/**
 * @file cli_options.cpp
 * @brief Реализация разбора параметров командной строки
 */

#include "cli_options.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>
#include <string>

namespace petrolog::app {

std::optional<double> parseDepthArgument(std::string_view text) {
    std::string value(text);
    if (value.empty() || std::isspace(static_cast<unsigned char>(value.front()))) {
        return std::nullopt;
    }
    try {
        size_t pos = 0;
        double parsed = std::stod(value, &pos);
        if (pos != value.size() || !std::isfinite(parsed)) {
            return std::nullopt;
        }
        return parsed;
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

std::optional<size_t> parseJobsArgument(std::string_view text) {
    // stoul принимает знак и пробелы, поэтому проверяем цифры заранее
    if (text.empty() || !std::all_of(text.begin(), text.end(),
            [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return std::nullopt;
    }
    try {
        return static_cast<size_t>(std::stoull(std::string(text)));
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

} // namespace petrolog::app
