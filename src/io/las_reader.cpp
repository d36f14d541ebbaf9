/**
 * @file las_reader.cpp
 * @brief Реализация импорта LAS 2.0
 */

#include "las_reader.hpp"
#include "file_utils.hpp"
#include "text_utils.hpp"
#include "core/curve_store.hpp"
#include "model/errors.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <istream>
#include <optional>
#include <sstream>

namespace petrolog::io {

namespace {

using core::normalizeMnemonic;

std::string trim(std::string_view str) {
    size_t start = 0;
    while (start < str.size() && std::isspace(static_cast<unsigned char>(str[start]))) {
        ++start;
    }
    size_t end = str.size();
    while (end > start && std::isspace(static_cast<unsigned char>(str[end - 1]))) {
        --end;
    }
    return std::string(str.substr(start, end - start));
}

std::string toUpper(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
        [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return value;
}

enum class LasSection {
    None,
    Version,
    Well,
    Curve,
    Parameter,
    Other,
    Ascii
};

LasSection sectionFromMarker(std::string_view line) {
    if (line.size() < 2) {
        return LasSection::Other;
    }
    switch (std::toupper(static_cast<unsigned char>(line[1]))) {
        case 'V': return LasSection::Version;
        case 'W': return LasSection::Well;
        case 'C': return LasSection::Curve;
        case 'P': return LasSection::Parameter;
        case 'A': return LasSection::Ascii;
        default: return LasSection::Other;
    }
}

struct LasLine {
    std::string mnemonic;
    std::string unit;
    std::string value;
    std::string description;
};

LasLine parseLasLine(std::string_view line) {
    LasLine result;

    // Формат: MNEM.UNIT   VALUE : DESCRIPTION
    size_t dot_pos = line.find('.');
    if (dot_pos == std::string::npos) {
        return result;
    }

    result.mnemonic = trim(line.substr(0, dot_pos));

    size_t unit_end = dot_pos + 1;
    while (unit_end < line.size() &&
           !std::isspace(static_cast<unsigned char>(line[unit_end])) &&
           line[unit_end] != ':') {
        ++unit_end;
    }
    result.unit = trim(line.substr(dot_pos + 1, unit_end - dot_pos - 1));

    // Двоеточие ищем с конца: значение может содержать ':' (даты, время)
    size_t colon_pos = line.rfind(':');
    if (colon_pos != std::string::npos && colon_pos >= unit_end) {
        result.value = trim(line.substr(unit_end, colon_pos - unit_end));
        result.description = trim(line.substr(colon_pos + 1));
    } else {
        result.value = trim(line.substr(unit_end));
    }

    return result;
}

/// Строка ~C -> описание кривой; nullopt для строки без мнемоники
std::optional<LasCurveInfo> curveInfoFromLine(std::string_view line, size_t column_index) {
    auto parsed = parseLasLine(line);
    std::string mnem = normalizeMnemonic(parsed.mnemonic);
    if (mnem.empty()) {
        return std::nullopt;
    }

    LasCurveInfo info;
    info.mnemonic = std::move(mnem);
    info.unit = std::move(parsed.unit);
    info.description = std::move(parsed.description);
    info.column_index = column_index;
    return info;
}

/**
 * Следующая значимая строка: перекодирована в UTF-8 (CP1251 в заголовках
 * российских файлов), обрезана, не пустая и не комментарий.
 */
bool nextContentLine(std::istream& input, std::string& line, size_t& line_num) {
    std::string raw;
    while (std::getline(input, raw)) {
        ++line_num;
        line = trim(ensureUtf8(raw));
        if (!line.empty() && line[0] != '#') {
            return true;
        }
    }
    return false;
}

std::optional<double> parseNumber(const std::string& token) {
    if (token.empty()) {
        return std::nullopt;
    }
    errno = 0;
    char* end = nullptr;
    double value = std::strtod(token.c_str(), &end);
    if (end != token.c_str() + token.size() || errno == ERANGE) {
        return std::nullopt;
    }
    return value;
}

std::vector<double> parseDataLine(std::string_view line, size_t line_num) {
    std::vector<double> values;
    std::istringstream ss{std::string(line)};
    std::string token;
    while (ss >> token) {
        auto value = parseNumber(token);
        if (!value) {
            throw MalformedInputError(
                "Строка " + std::to_string(line_num) + ": нечисловое значение \"" + token + "\"",
                line_num);
        }
        values.push_back(*value);
    }
    return values;
}

size_t detectDepthColumn(const std::vector<LasCurveInfo>& curves) {
    for (size_t i = 0; i < curves.size(); ++i) {
        const auto& aliases = core::curve_aliases::kDepth;
        if (std::find(aliases.begin(), aliases.end(), curves[i].mnemonic) != aliases.end()) {
            return i;
        }
    }
    // По стандарту LAS первая кривая - индекс
    return 0;
}

void applyNullOverride(const LasLine& parsed, size_t line_num, LasReadResult& result) {
    auto value = parseNumber(parsed.value);
    if (!value) {
        throw MalformedInputError(
            "Строка " + std::to_string(line_num) + ": некорректное значение NULL \"" + parsed.value + "\"",
            line_num);
    }
    result.null_value = *value;
}

void assembleWellLog(
    LasReadResult& result,
    const std::vector<std::vector<double>>& rows
) {
    if (result.curves.empty()) {
        throw MalformedInputError("Секция ~Curve отсутствует или не содержит кривых");
    }
    if (rows.empty()) {
        throw MalformedInputError("Файл не содержит данных");
    }

    result.depth_column = detectDepthColumn(result.curves);
    const auto& depth_info = result.curves[result.depth_column];
    result.log.depth_unit = depth_info.unit;

    std::vector<size_t> columns;
    for (size_t i = 0; i < result.curves.size(); ++i) {
        if (i == result.depth_column) continue;
        const auto& info = result.curves[i];
        LogCurve curve(info.mnemonic, info.unit);
        curve.description = info.description;
        curve.samples.reserve(rows.size());
        result.log.curves.push_back(std::move(curve));
        columns.push_back(i);
    }

    result.log.depth.reserve(rows.size());
    for (const auto& row : rows) {
        result.log.depth.push_back(row[result.depth_column]);
        for (size_t c = 0; c < columns.size(); ++c) {
            double value = row[columns[c]];
            if (isNull(value) || std::abs(value - result.null_value) < 1e-6) {
                value = kNullValue;
            }
            result.log.curves[c].samples.push_back(value);
        }
    }
}

} // anonymous namespace

LasReadResult parseLas(std::string_view text, const std::string& fallback_well) {
    LasReadResult result;

    LasSection section = LasSection::None;
    std::vector<std::vector<double>> rows;
    std::istringstream input{std::string(text)};
    std::string line;
    size_t line_num = 0;

    while (nextContentLine(input, line, line_num)) {
        if (line[0] == '~') {
            section = sectionFromMarker(line);
            continue;
        }

        switch (section) {
            case LasSection::Version: {
                auto parsed = parseLasLine(line);
                std::string mnem = normalizeMnemonic(parsed.mnemonic);
                if (mnem == "VERS") {
                    result.version = parsed.value;
                } else if (mnem == "WRAP") {
                    if (toUpper(parsed.value) == "YES") {
                        throw MalformedInputError(
                            "Строка " + std::to_string(line_num) +
                            ": режим переноса строк (WRAP YES) не поддерживается",
                            line_num);
                    }
                } else if (mnem == "NULL") {
                    applyNullOverride(parsed, line_num, result);
                }
                break;
            }

            case LasSection::Well: {
                auto parsed = parseLasLine(line);
                std::string mnem = normalizeMnemonic(parsed.mnemonic);
                if (mnem.empty()) break;
                result.log.well_info[mnem] = parsed.value;

                if (mnem == "WELL") {
                    result.log.well = parsed.value;
                } else if (mnem == "FLD") {
                    result.log.field = parsed.value;
                } else if (mnem == "NULL") {
                    applyNullOverride(parsed, line_num, result);
                }
                break;
            }

            case LasSection::Curve: {
                if (auto info = curveInfoFromLine(line, result.curves.size())) {
                    result.curves.push_back(std::move(*info));
                }
                break;
            }

            case LasSection::Ascii: {
                if (result.curves.empty()) {
                    throw MalformedInputError(
                        "Строка " + std::to_string(line_num) + ": данные до описания кривых",
                        line_num);
                }
                auto values = parseDataLine(line, line_num);
                if (values.size() != result.curves.size()) {
                    throw MalformedInputError(
                        "Строка " + std::to_string(line_num) + ": ожидалось " +
                        std::to_string(result.curves.size()) + " значений, получено " +
                        std::to_string(values.size()),
                        line_num);
                }
                rows.push_back(std::move(values));
                break;
            }

            default:
                break;
        }
    }

    assembleWellLog(result, rows);

    if (result.log.well.empty()) {
        result.log.well = ensureUtf8(fallback_well);
    }

    core::validateWellLog(result.log);
    return result;
}

LasReadResult readLas(const std::filesystem::path& path) {
    return parseLas(readTextFile(path), path.stem().string());
}

WellLog readWellLog(const std::filesystem::path& path) {
    return readLas(path).log;
}

bool canReadLas(const std::filesystem::path& path) noexcept {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec) || toUpper(path.extension().string()) != ".LAS") {
        return false;
    }

    std::ifstream file(path);
    std::string line;
    size_t line_num = 0;
    // Первая значимая строка LAS - секция версии
    return file && nextContentLine(file, line, line_num) && toUpper(line).rfind("~V", 0) == 0;
}

std::vector<LasCurveInfo> getLasCurves(const std::filesystem::path& path) {
    std::vector<LasCurveInfo> curves;

    std::ifstream file(path);
    if (!file) {
        return curves;
    }

    LasSection section = LasSection::None;
    std::string line;
    size_t line_num = 0;

    while (nextContentLine(file, line, line_num)) {
        if (line[0] == '~') {
            section = sectionFromMarker(line);
            if (section == LasSection::Ascii) {
                break;
            }
        } else if (section == LasSection::Curve) {
            if (auto info = curveInfoFromLine(line, curves.size())) {
                curves.push_back(std::move(*info));
            }
        }
    }
    return curves;
}

} // namespace petrolog::io
