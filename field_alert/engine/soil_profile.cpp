#include <field_alert/engine/soil_profile.hpp>
#include <field_alert/config/config.hpp>
#include <field_alert/utils/logger.hpp>
#include <cmath>

namespace {
    static const char* TAG = "SOIL_PROFILE";

    static bool isFraction(float v) {
        return std::isfinite(v) && v >= 0.0f && v <= 1.0f;
    }
}

SoilProfile::SoilProfile()
    : cfg{}, configured(false), whc_mm(0.0f) {}

EngineError SoilProfile::create(const Config& cfg_in, SoilProfile& out_profile) {
    float weight_sum = 0.0f;
    bool any_weight = false;
    for (std::size_t i = 0; i < SOIL_DEPTH_COUNT; ++i) {
        const DepthCapacity& d = cfg_in.depths[i];
        if (!isFraction(d.field_capacity) || !isFraction(d.wilting_point)) {
            LOG_ERROR(TAG, "Depth %u: capacity bounds out of range", static_cast<unsigned>(i));
            return EngineError::CONFIG;
        }
        if (d.field_capacity <= d.wilting_point) {
            LOG_ERROR(TAG, "Depth %u: field capacity %.3f not above wilting point %.3f",
                      static_cast<unsigned>(i), d.field_capacity, d.wilting_point);
            return EngineError::CONFIG;
        }
        float w = cfg_in.weights[i];
        if (!std::isfinite(w) || w < 0.0f) {
            LOG_ERROR(TAG, "Depth %u: invalid weight %.3f", static_cast<unsigned>(i), w);
            return EngineError::CONFIG;
        }
        weight_sum += w;
        any_weight = any_weight || (w > 0.0f);
    }
    if (!any_weight) {
        LOG_ERROR(TAG, "%s", "No depth carries weight");
        return EngineError::CONFIG;
    }
    if (std::fabs(weight_sum - 1.0f) > ::Config::Soil::weight_sum_tolerance) {
        LOG_ERROR(TAG, "Depth weights sum to %.4f, expected 1", weight_sum);
        return EngineError::CONFIG;
    }
    if (!std::isfinite(cfg_in.root_zone_depth_mm) || cfg_in.root_zone_depth_mm <= 0.0f) {
        LOG_ERROR(TAG, "Invalid root zone depth %.1f mm", cfg_in.root_zone_depth_mm);
        return EngineError::CONFIG;
    }

    SoilProfile profile;
    profile.cfg = cfg_in;
    profile.configured = true;
    float whc_fraction = 0.0f;
    EngineError err = profile.effectiveWhc(ALL_DEPTHS_MASK, whc_fraction);
    if (err != EngineError::NONE) {
        return EngineError::CONFIG;
    }
    profile.whc_mm = whc_fraction * cfg_in.root_zone_depth_mm;
    out_profile = profile;
    return EngineError::NONE;
}

EngineError SoilProfile::fromTexture(SoilTexture texture, CropType crop, SoilProfile& out_profile) {
    for (const auto& props : ::Config::Soil::textures) {
        if (props.texture != texture) {
            continue;
        }
        Config c{};
        c.texture = texture;
        c.crop = crop;
        for (std::size_t i = 0; i < SOIL_DEPTH_COUNT; ++i) {
            c.depths[i].field_capacity = props.field_capacity;
            c.depths[i].wilting_point = props.wilting_point;
            c.weights[i] = ::Config::Soil::depth_weights[i];
        }
        c.root_zone_depth_mm = ::Config::Soil::root_zone_depth_mm;
        return create(c, out_profile);
    }
    LOG_ERROR(TAG, "No hydraulic properties for texture %s", toString(texture));
    return EngineError::CONFIG;
}

bool SoilProfile::isConfigured() const {
    return configured;
}

const SoilProfile::Config& SoilProfile::config() const {
    return cfg;
}

uint8_t SoilProfile::weightedMask() const {
    uint8_t mask = 0;
    for (std::size_t i = 0; i < SOIL_DEPTH_COUNT; ++i) {
        if (cfg.weights[i] > 0.0f) {
            mask |= static_cast<uint8_t>(1U << i);
        }
    }
    return mask;
}

EngineError SoilProfile::effectiveWhc(uint8_t depth_mask, float& out_fraction) const {
    if (!configured) {
        return EngineError::CONFIG;
    }
    float weight_sum = 0.0f;
    float weighted = 0.0f;
    for (std::size_t i = 0; i < SOIL_DEPTH_COUNT; ++i) {
        if ((depth_mask & (1U << i)) == 0U) {
            continue;
        }
        const DepthCapacity& d = cfg.depths[i];
        weighted += cfg.weights[i] * (d.field_capacity - d.wilting_point);
        weight_sum += cfg.weights[i];
    }
    if (weight_sum <= 0.0f) {
        return EngineError::NO_DATA;
    }
    out_fraction = weighted / weight_sum;
    return EngineError::NONE;
}

float SoilProfile::effectiveWhcMm() const {
    return whc_mm;
}

EngineError SoilProfile::measuredDeficitMm(const float* vwc, uint8_t depth_mask, float& out_mm) const {
    if (!configured) {
        return EngineError::CONFIG;
    }
    float weight_sum = 0.0f;
    float weighted = 0.0f;
    for (std::size_t i = 0; i < SOIL_DEPTH_COUNT; ++i) {
        if ((depth_mask & (1U << i)) == 0U) {
            continue;
        }
        weighted += cfg.weights[i] * (cfg.depths[i].field_capacity - vwc[i]);
        weight_sum += cfg.weights[i];
    }
    if (weight_sum <= 0.0f) {
        return EngineError::NO_DATA;
    }
    out_mm = (weighted / weight_sum) * cfg.root_zone_depth_mm;
    return EngineError::NONE;
}
