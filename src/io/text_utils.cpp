/**
 * @file text_utils.cpp
 * @brief Реализация перекодировки CP1251 -> UTF-8
 */

#include "text_utils.hpp"
#include <array>

namespace petrolog::io {

namespace {

// Кодовые точки для байтов 0x80-0xBF; 0xC0-0xFF - это сплошной
// диапазон А..я (U+0410..U+044F)
constexpr std::array<char16_t, 64> kCp1251Upper = {
    0x0402, 0x0403, 0x201A, 0x0453, 0x201E, 0x2026, 0x2020, 0x2021,
    0x20AC, 0x2030, 0x0409, 0x2039, 0x040A, 0x040C, 0x040B, 0x040F,
    0x0452, 0x2018, 0x2019, 0x201C, 0x201D, 0x2022, 0x2013, 0x2014,
    0x0000, 0x2122, 0x0459, 0x203A, 0x045A, 0x045C, 0x045B, 0x045F,
    0x00A0, 0x040E, 0x045E, 0x0408, 0x00A4, 0x0490, 0x00A6, 0x00A7,
    0x0401, 0x00A9, 0x0404, 0x00AB, 0x00AC, 0x00AD, 0x00AE, 0x0407,
    0x00B0, 0x00B1, 0x0406, 0x0456, 0x0491, 0x00B5, 0x00B6, 0x00B7,
    0x0451, 0x2116, 0x0454, 0x00BB, 0x0458, 0x0405, 0x0455, 0x0457
};

void appendUtf8(char32_t cp, std::string& out) {
    if (cp <= 0x7F) {
        out.push_back(static_cast<char>(cp));
    } else if (cp <= 0x7FF) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

bool isContinuation(unsigned char c) noexcept {
    return (c & 0xC0) == 0x80;
}

} // anonymous namespace

bool isValidUtf8(std::string_view input) noexcept {
    size_t i = 0;
    while (i < input.size()) {
        auto c0 = static_cast<unsigned char>(input[i]);
        if (c0 < 0x80) {
            ++i;
            continue;
        }

        size_t length = 0;
        char32_t min_cp = 0;
        char32_t cp = 0;
        if ((c0 & 0xE0) == 0xC0) {
            length = 2; min_cp = 0x80; cp = c0 & 0x1F;
        } else if ((c0 & 0xF0) == 0xE0) {
            length = 3; min_cp = 0x800; cp = c0 & 0x0F;
        } else if ((c0 & 0xF8) == 0xF0) {
            length = 4; min_cp = 0x10000; cp = c0 & 0x07;
        } else {
            return false;
        }

        if (i + length > input.size()) {
            return false;
        }
        for (size_t k = 1; k < length; ++k) {
            auto c = static_cast<unsigned char>(input[i + k]);
            if (!isContinuation(c)) {
                return false;
            }
            cp = (cp << 6) | (c & 0x3F);
        }
        if (cp < min_cp || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
            return false;
        }
        i += length;
    }
    return true;
}

std::string convertCp1251ToUtf8(std::string_view input) {
    std::string result;
    result.reserve(input.size() * 2);

    for (char ch : input) {
        auto c = static_cast<unsigned char>(ch);
        if (c < 0x80) {
            result.push_back(ch);
        } else if (c >= 0xC0) {
            appendUtf8(0x0410 + (c - 0xC0), result);
        } else if (char16_t cp = kCp1251Upper[c - 0x80]; cp != 0) {
            appendUtf8(cp, result);
        } else {
            result.push_back('?');
        }
    }
    return result;
}

std::string ensureUtf8(std::string_view input) {
    if (isValidUtf8(input)) {
        return std::string(input);
    }
    return convertCp1251ToUtf8(input);
}

} // namespace petrolog::io
