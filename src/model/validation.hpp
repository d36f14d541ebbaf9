/**
 * @file validation.hpp
 * @brief Валидация параметров расчёта
 */

#pragma once

#include "analysis_config.hpp"
#include "errors.hpp"
#include "parameters.hpp"
#include <sstream>
#include <string>
#include <vector>

namespace petrolog::model {

/**
 * @brief Ошибка валидации параметра
 */
struct ValidationError {
    std::string field;               ///< Имя параметра
    std::string message;             ///< Описание ошибки
};

/**
 * @brief Результат валидации
 */
struct ValidationResult {
    bool is_valid = true;
    std::vector<ValidationError> errors;

    void addError(const std::string& field, const std::string& message) {
        is_valid = false;
        errors.push_back({field, message});
    }

    [[nodiscard]] bool hasErrors() const noexcept { return !errors.empty(); }
};

namespace detail {

inline void checkRange(ValidationResult& result, const char* name,
                       double value, double min, double max, bool min_exclusive = false) {
    bool below = min_exclusive ? !(value > min) : !(value >= min);
    if (below || !(value <= max)) {
        std::ostringstream oss;
        oss << "Параметр " << name << " = " << value << " вне допустимого диапазона "
            << (min_exclusive ? "(" : "[") << min << ", " << max << "]";
        result.addError(name, oss.str());
    }
}

} // namespace detail

/**
 * @brief Валидация набора физических констант
 *
 * Помимо диапазонов проверяет ρma > ρf и ГКглин > ГКчист:
 * иначе знаменатели формул пористости и IGR вырождаются.
 */
[[nodiscard]] inline ValidationResult validateParameters(const ParameterSet& params) {
    using namespace parameter_limits;
    ValidationResult result;

    detail::checkRange(result, "matrix_density", params.matrix_density, kMinMatrixDensity, kMaxMatrixDensity);
    detail::checkRange(result, "fluid_density", params.fluid_density, kMinFluidDensity, kMaxFluidDensity);
    detail::checkRange(result, "gr_clean", params.gr_clean, kMinGammaRay, kMaxGrClean);
    detail::checkRange(result, "gr_shale", params.gr_shale, kMinGammaRay, kMaxGrShale);
    detail::checkRange(result, "archie_a", params.archie_a, kMinArchieA, kMaxArchieA);
    detail::checkRange(result, "archie_m", params.archie_m, kMinExponent, kMaxExponent);
    detail::checkRange(result, "archie_n", params.archie_n, kMinExponent, kMaxExponent);
    detail::checkRange(result, "rw", params.rw, 0.0, kMaxRw, true);
    detail::checkRange(result, "ws_b", params.ws_b, kMinWsB, kMaxWsB);

    if (!(params.matrix_density > params.fluid_density)) {
        result.addError("matrix_density", "Плотность матрицы должна превышать плотность флюида");
    }
    if (!(params.gr_shale > params.gr_clean)) {
        result.addError("gr_shale", "ГК глин должен превышать ГК чистого песчаника");
    }

    return result;
}

/**
 * @brief Валидация опций проницаемости
 */
[[nodiscard]] inline ValidationResult validatePermeabilityOptions(const PermeabilityOptions& options) {
    ValidationResult result;
    detail::checkRange(result, "permeability.grain_size", options.grain_size_um, 0.0, 10000.0, true);
    if (!(options.swi > 0.0 && options.swi < 1.0)) {
        result.addError("permeability.swi", "Остаточная водонасыщенность должна быть в интервале (0, 1)");
    }
    detail::checkRange(result, "permeability.coates_c", options.coates_c, 0.0, 1e6, true);
    detail::checkRange(result, "permeability.coates_x", options.coates_x, 1.0, 8.0);
    detail::checkRange(result, "permeability.coates_y", options.coates_y, 1.0, 8.0);
    return result;
}

/**
 * @brief Валидация отсечек эффективных толщин (все в [0, 1])
 */
[[nodiscard]] inline ValidationResult validateNetPayCutoffs(const NetPayCutoffs& cutoffs) {
    ValidationResult result;
    detail::checkRange(result, "net_pay.vsh_max", cutoffs.vsh_max, 0.0, 1.0);
    detail::checkRange(result, "net_pay.porosity_min", cutoffs.porosity_min, 0.0, 1.0);
    detail::checkRange(result, "net_pay.sw_max", cutoffs.sw_max, 0.0, 1.0);
    return result;
}

/**
 * @brief Валидация опций контроля качества
 */
[[nodiscard]] inline ValidationResult validateQualityControlOptions(const QualityControlOptions& options) {
    ValidationResult result;
    detail::checkRange(result, "quality_control.z_score_threshold", options.z_score_threshold, 0.0, 100.0, true);
    detail::checkRange(result, "quality_control.iqr_multiplier", options.iqr_multiplier, 0.0, 100.0, true);
    detail::checkRange(result, "quality_control.modified_z_score_threshold",
                       options.modified_z_score_threshold, 0.0, 100.0, true);
    if (!(options.density_min < options.density_max)) {
        result.addError("quality_control.density_min",
                        "Нижняя граница плотности должна быть меньше верхней");
    }
    detail::checkRange(result, "quality_control.resistivity_cutoff", options.resistivity_cutoff, 0.0, 1e5, true);
    return result;
}

/**
 * @brief Исключение для первой ошибки валидации
 * @throws InvalidParameterError Если результат содержит ошибки
 */
inline void throwIfInvalid(const ValidationResult& result) {
    if (result.hasErrors()) {
        const auto& first = result.errors.front();
        throw InvalidParameterError(first.field, first.message);
    }
}

/**
 * @brief Проверка параметров с выбросом исключения
 * @throws InvalidParameterError Для первой найденной ошибки
 */
inline void requireValidParameters(const ParameterSet& params) {
    throwIfInvalid(validateParameters(params));
}

} // namespace petrolog::model
