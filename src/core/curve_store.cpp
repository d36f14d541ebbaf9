/**
 * @file curve_store.cpp
 * @brief Реализация доступа к кривым скважины
 */

#include "curve_store.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace petrolog::core {

std::string normalizeMnemonic(std::string_view raw) {
    std::string cleaned;
    cleaned.reserve(raw.size());

    size_t start = 0;
    while (start < raw.size() && std::isspace(static_cast<unsigned char>(raw[start]))) {
        ++start;
    }
    size_t end = raw.size();
    while (end > start && std::isspace(static_cast<unsigned char>(raw[end - 1]))) {
        --end;
    }

    for (size_t i = start; i < end; ++i) {
        unsigned char c = static_cast<unsigned char>(raw[i]);
        if (std::isalnum(c)) {
            cleaned.push_back(static_cast<char>(std::toupper(c)));
        } else if (c == '_' || c == '-' || c == ' ') {
            cleaned.push_back('_');
        }
    }
    while (!cleaned.empty() && cleaned.back() == '_') {
        cleaned.pop_back();
    }
    return cleaned;
}

void validateWellLog(const WellLog& log) {
    for (size_t i = 0; i < log.depth.size(); ++i) {
        if (isNull(log.depth[i])) {
            throw MalformedInputError("Ось глубин содержит пропуск в отсчёте " + std::to_string(i + 1));
        }
        if (i > 0 && log.depth[i] < log.depth[i - 1]) {
            std::ostringstream oss;
            oss << "Ось глубин убывает: отсчёт " << i + 1 << " (" << log.depth[i]
                << ") меньше предыдущего (" << log.depth[i - 1] << ")";
            throw MalformedInputError(oss.str());
        }
    }

    for (const auto& curve : log.curves) {
        if (curve.size() != log.depth.size()) {
            throw MalformedInputError(
                "Длина кривой " + curve.mnemonic + " (" + std::to_string(curve.size()) +
                ") не совпадает с длиной оси глубин (" + std::to_string(log.depth.size()) + ")");
        }
    }
}

void requireSameLength(const LogCurve& a, const LogCurve& b) {
    if (a.size() != b.size()) {
        throw MalformedInputError(
            "Длины кривых " + a.mnemonic + " (" + std::to_string(a.size()) + ") и " +
            b.mnemonic + " (" + std::to_string(b.size()) + ") не совпадают");
    }
}

const LogCurve* findCurve(
    const WellLog& log,
    const std::vector<std::string>& aliases
) {
    for (const auto& alias : aliases) {
        for (const auto& curve : log.curves) {
            if (normalizeMnemonic(curve.mnemonic) == alias) {
                return &curve;
            }
        }
    }
    return nullptr;
}

const LogCurve& requireCurve(
    const WellLog& log,
    const std::vector<std::string>& aliases
) {
    const LogCurve* curve = findCurve(log, aliases);
    if (curve == nullptr) {
        throw CurveNotFoundError(aliases);
    }
    if (curve->size() != log.depth.size()) {
        throw MalformedInputError(
            "Длина кривой " + curve->mnemonic + " (" + std::to_string(curve->size()) +
            ") не совпадает с длиной оси глубин (" + std::to_string(log.depth.size()) + ")");
    }
    return *curve;
}

WellLog filterByDepthRange(const WellLog& log, Depth start, Depth end) {
    if (start > end) {
        std::ostringstream oss;
        oss << "Некорректный диапазон глубин: начало " << start.value
            << " больше конца " << end.value;
        throw MalformedInputError(oss.str());
    }
    validateWellLog(log);

    WellLog result;
    result.well = log.well;
    result.field = log.field;
    result.depth_unit = log.depth_unit;
    result.well_info = log.well_info;

    std::vector<size_t> indices;
    for (size_t i = 0; i < log.depth.size(); ++i) {
        if (log.depth[i] >= start.value && log.depth[i] <= end.value) {
            indices.push_back(i);
        }
    }

    result.depth.reserve(indices.size());
    for (size_t idx : indices) {
        result.depth.push_back(log.depth[idx]);
    }

    result.curves.reserve(log.curves.size());
    for (const auto& curve : log.curves) {
        LogCurve filtered;
        filtered.mnemonic = curve.mnemonic;
        filtered.unit = curve.unit;
        filtered.description = curve.description;
        filtered.samples.reserve(indices.size());
        for (size_t idx : indices) {
            filtered.samples.push_back(curve.samples[idx]);
        }
        result.curves.push_back(std::move(filtered));
    }

    return result;
}

} // namespace petrolog::core
