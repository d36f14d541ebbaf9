/**
 * @file config_io.cpp
 * @brief Реализация загрузки конфигурации анализа
 */

#include "config_io.hpp"
#include "file_utils.hpp"
#include "model/errors.hpp"
#include "model/validation.hpp"
#include <nlohmann/json.hpp>

namespace petrolog::io {

using json = nlohmann::json;

namespace {

const json* findKey(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return nullptr;
    }
    return &*it;
}

const json* findObject(const json& j, const char* key) {
    const json* value = findKey(j, key);
    if (value != nullptr && !value->is_object()) {
        throw InvalidParameterError(key, std::string("Секция \"") + key + "\" должна быть объектом");
    }
    return value;
}

void readNumber(const json& j, const char* key, const std::string& path, double& target) {
    const json* value = findKey(j, key);
    if (value == nullptr) return;
    if (!value->is_number()) {
        throw InvalidParameterError(path, "Параметр " + path + " должен быть числом");
    }
    target = value->get<double>();
}

void readCount(const json& j, const char* key, const std::string& path, size_t& target) {
    const json* value = findKey(j, key);
    if (value == nullptr) return;
    if (!value->is_number_integer() || value->get<long long>() < 0) {
        throw InvalidParameterError(path, "Параметр " + path + " должен быть неотрицательным целым");
    }
    target = value->get<size_t>();
}

void readBool(const json& j, const char* key, const std::string& path, bool& target) {
    const json* value = findKey(j, key);
    if (value == nullptr) return;
    if (!value->is_boolean()) {
        throw InvalidParameterError(path, "Параметр " + path + " должен быть true или false");
    }
    target = value->get<bool>();
}

template <typename Enum, typename Parser>
void readEnum(const json& j, const char* key, const std::string& path, Parser parse, Enum& target) {
    const json* value = findKey(j, key);
    if (value == nullptr) return;
    if (!value->is_string()) {
        throw InvalidParameterError(path, "Параметр " + path + " должен быть строкой");
    }
    auto parsed = parse(value->get<std::string>());
    if (!parsed) {
        throw InvalidParameterError(path,
            "Неизвестное значение " + path + ": \"" + value->get<std::string>() + "\"");
    }
    target = *parsed;
}

void readRule(const json& j, const char* cutoff_key, const std::string& prefix, SegmentationRule& rule) {
    readNumber(j, cutoff_key, prefix + "." + cutoff_key, rule.cutoff);
    readCount(j, "min_points", prefix + ".min_points", rule.min_points);
    double min_thickness = rule.min_thickness.value;
    readNumber(j, "min_thickness", prefix + ".min_thickness", min_thickness);
    if (min_thickness < 0.0) {
        throw InvalidParameterError(prefix + ".min_thickness",
            "Минимальная мощность " + prefix + " не может быть отрицательной");
    }
    rule.min_thickness = Depth{min_thickness};
}

// Правило зон высокой пористости настраивается отдельным подобъектом
void readHighPorosityRule(const json& j, SegmentationRule& rule) {
    readNumber(j, "high_porosity_cutoff", "porosity.high_porosity_cutoff", rule.cutoff);
    if (const json* sub = findObject(j, "high_porosity")) {
        readRule(*sub, "cutoff", "porosity.high_porosity", rule);
    }
}

void requireFraction(double value, const std::string& path) {
    if (value < 0.0 || value > 1.0) {
        throw InvalidParameterError(path, "Отсечка " + path + " должна быть в диапазоне [0, 1]");
    }
}

json ruleToJson(const SegmentationRule& rule) {
    return json{
        {"cutoff", rule.cutoff},
        {"min_points", rule.min_points},
        {"min_thickness", rule.min_thickness.value}
    };
}

} // anonymous namespace

AnalysisConfig configFromJson(const json& j) {
    if (!j.is_object()) {
        throw InvalidParameterError("config", "Конфигурация должна быть JSON-объектом");
    }

    AnalysisConfig config;
    bool explicit_baselines = false;

    if (const json* p = findObject(j, "parameters")) {
        explicit_baselines = findKey(*p, "gr_clean") != nullptr || findKey(*p, "gr_shale") != nullptr;
        auto& params = config.parameters;
        readNumber(*p, "matrix_density", "parameters.matrix_density", params.matrix_density);
        readNumber(*p, "fluid_density", "parameters.fluid_density", params.fluid_density);
        readNumber(*p, "gr_clean", "parameters.gr_clean", params.gr_clean);
        readNumber(*p, "gr_shale", "parameters.gr_shale", params.gr_shale);
        readNumber(*p, "archie_a", "parameters.archie_a", params.archie_a);
        readNumber(*p, "archie_m", "parameters.archie_m", params.archie_m);
        readNumber(*p, "archie_n", "parameters.archie_n", params.archie_n);
        readNumber(*p, "rw", "parameters.rw", params.rw);
        readNumber(*p, "ws_b", "parameters.ws_b", params.ws_b);
    }
    requireValidParameters(config.parameters);

    if (const json* p = findObject(j, "porosity")) {
        auto& porosity = config.porosity;
        readEnum(*p, "blend", "porosity.blend", parsePorosityBlend, porosity.blend);
        readEnum(*p, "lithology", "porosity.lithology", parseLithology, porosity.lithology);
        readBool(*p, "shale_correction", "porosity.shale_correction", porosity.shale_correction);
        readRule(*p, "cutoff", "porosity", porosity.reservoir);
        readHighPorosityRule(*p, porosity.high_porosity);
        readCount(*p, "min_valid_samples", "porosity.min_valid_samples", porosity.min_valid_samples);
    }
    requireFraction(config.porosity.reservoir.cutoff, "porosity.cutoff");
    requireFraction(config.porosity.high_porosity.cutoff, "porosity.high_porosity_cutoff");

    // Заданные линии ГК важнее оценки по данным, если auto_baselines не указан явно
    config.shale.auto_baselines = !explicit_baselines;
    if (const json* s = findObject(j, "shale")) {
        auto& shale = config.shale;
        readEnum(*s, "method", "shale.method", parseShaleVolumeMethod, shale.method);
        readBool(*s, "auto_baselines", "shale.auto_baselines", shale.auto_baselines);
        readRule(*s, "cutoff", "shale", shale.clean_sand);
        readCount(*s, "min_valid_samples", "shale.min_valid_samples", shale.min_valid_samples);
    }
    requireFraction(config.shale.clean_sand.cutoff, "shale.cutoff");

    if (const json* s = findObject(j, "saturation")) {
        readEnum(*s, "method", "saturation.method", parseSaturationMethod, config.saturation.method);
    }

    if (const json* p = findObject(j, "permeability")) {
        auto& perm = config.permeability;
        readEnum(*p, "method", "permeability.method", parsePermeabilityMethod, perm.method);
        readNumber(*p, "grain_size", "permeability.grain_size", perm.grain_size_um);
        readNumber(*p, "swi", "permeability.swi", perm.swi);
        readNumber(*p, "coates_c", "permeability.coates_c", perm.coates_c);
        readNumber(*p, "coates_x", "permeability.coates_x", perm.coates_x);
        readNumber(*p, "coates_y", "permeability.coates_y", perm.coates_y);
    }
    throwIfInvalid(validatePermeabilityOptions(config.permeability));

    if (const json* n = findObject(j, "net_pay")) {
        auto& cutoffs = config.net_pay;
        readNumber(*n, "vsh_max", "net_pay.vsh_max", cutoffs.vsh_max);
        readNumber(*n, "porosity_min", "net_pay.porosity_min", cutoffs.porosity_min);
        readNumber(*n, "sw_max", "net_pay.sw_max", cutoffs.sw_max);
    }
    throwIfInvalid(validateNetPayCutoffs(config.net_pay));

    if (const json* q = findObject(j, "quality_control")) {
        auto& qc = config.quality_control;
        readEnum(*q, "outlier_method", "quality_control.outlier_method", parseOutlierMethod, qc.outlier_method);
        readNumber(*q, "z_score_threshold", "quality_control.z_score_threshold", qc.z_score_threshold);
        readNumber(*q, "iqr_multiplier", "quality_control.iqr_multiplier", qc.iqr_multiplier);
        readNumber(*q, "modified_z_score_threshold", "quality_control.modified_z_score_threshold",
                   qc.modified_z_score_threshold);
        readNumber(*q, "density_min", "quality_control.density_min", qc.density_min);
        readNumber(*q, "density_max", "quality_control.density_max", qc.density_max);
        readNumber(*q, "resistivity_cutoff", "quality_control.resistivity_cutoff", qc.resistivity_cutoff);
    }
    throwIfInvalid(validateQualityControlOptions(config.quality_control));

    if (const json* d = findObject(j, "depth_range")) {
        const json* top = findKey(*d, "top");
        const json* bottom = findKey(*d, "bottom");
        if (top == nullptr || bottom == nullptr) {
            throw InvalidParameterError("depth_range", "Диапазон глубин требует top и bottom");
        }
        DepthRange range;
        readNumber(*d, "top", "depth_range.top", range.top.value);
        readNumber(*d, "bottom", "depth_range.bottom", range.bottom.value);
        if (range.top > range.bottom) {
            throw InvalidParameterError("depth_range", "Кровля диапазона глубже подошвы");
        }
        config.depth_range = range;
    }

    return config;
}

json configToJson(const AnalysisConfig& config) {
    const auto& params = config.parameters;
    json j;
    j["parameters"] = {
        {"matrix_density", params.matrix_density},
        {"fluid_density", params.fluid_density},
        {"gr_clean", params.gr_clean},
        {"gr_shale", params.gr_shale},
        {"archie_a", params.archie_a},
        {"archie_m", params.archie_m},
        {"archie_n", params.archie_n},
        {"rw", params.rw},
        {"ws_b", params.ws_b}
    };

    json porosity = ruleToJson(config.porosity.reservoir);
    porosity["blend"] = toString(config.porosity.blend);
    porosity["lithology"] = toString(config.porosity.lithology);
    porosity["shale_correction"] = config.porosity.shale_correction;
    porosity["high_porosity_cutoff"] = config.porosity.high_porosity.cutoff;
    porosity["high_porosity"] = ruleToJson(config.porosity.high_porosity);
    porosity["min_valid_samples"] = config.porosity.min_valid_samples;
    j["porosity"] = porosity;

    json shale = ruleToJson(config.shale.clean_sand);
    shale["method"] = toString(config.shale.method);
    shale["auto_baselines"] = config.shale.auto_baselines;
    shale["min_valid_samples"] = config.shale.min_valid_samples;
    j["shale"] = shale;

    j["saturation"] = {{"method", toString(config.saturation.method)}};

    const auto& perm = config.permeability;
    j["permeability"] = {
        {"method", toString(perm.method)},
        {"grain_size", perm.grain_size_um},
        {"swi", perm.swi},
        {"coates_c", perm.coates_c},
        {"coates_x", perm.coates_x},
        {"coates_y", perm.coates_y}
    };

    j["net_pay"] = {
        {"vsh_max", config.net_pay.vsh_max},
        {"porosity_min", config.net_pay.porosity_min},
        {"sw_max", config.net_pay.sw_max}
    };

    const auto& qc = config.quality_control;
    j["quality_control"] = {
        {"outlier_method", toString(qc.outlier_method)},
        {"z_score_threshold", qc.z_score_threshold},
        {"iqr_multiplier", qc.iqr_multiplier},
        {"modified_z_score_threshold", qc.modified_z_score_threshold},
        {"density_min", qc.density_min},
        {"density_max", qc.density_max},
        {"resistivity_cutoff", qc.resistivity_cutoff}
    };

    if (config.depth_range) {
        j["depth_range"] = {
            {"top", config.depth_range->top.value},
            {"bottom", config.depth_range->bottom.value}
        };
    } else {
        j["depth_range"] = nullptr;
    }
    return j;
}

AnalysisConfig parseAnalysisConfig(const std::string& json_str) {
    json j;
    try {
        j = json::parse(json_str);
    } catch (const json::parse_error& e) {
        throw MalformedInputError("Ошибка парсинга JSON: " + std::string(e.what()));
    }
    return configFromJson(j);
}

AnalysisConfig loadAnalysisConfig(const std::filesystem::path& path) {
    return parseAnalysisConfig(readTextFile(path));
}

} // namespace petrolog::io
