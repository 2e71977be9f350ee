#ifndef FIELD_ALERT_SOIL_PROFILE_HPP
#define FIELD_ALERT_SOIL_PROFILE_HPP

#include <cstdint>
#include <field_alert/models/soil_types.hpp>
#include <field_alert/models/engine_error.hpp>

// Static description of one zone's root profile: per-depth water holding
// bounds and the weights used to aggregate depth readings into one figure.
// Built through create()/fromTexture(), which reject inconsistent settings;
// immutable afterwards.
class SoilProfile {
public:
    struct DepthCapacity {
        float field_capacity;  // volumetric, 0..1
        float wilting_point;   // volumetric, 0..1, below field_capacity
    };

    struct Config {
        SoilTexture   texture;
        CropType      crop;
        DepthCapacity depths[SOIL_DEPTH_COUNT];
        float         weights[SOIL_DEPTH_COUNT]; // >= 0, sum to 1
        float         root_zone_depth_mm;
    };

    SoilProfile();

    static EngineError create(const Config& cfg, SoilProfile& out_profile);
    // Uniform texture over all depths with weights and root depth from Config::Soil
    static EngineError fromTexture(SoilTexture texture, CropType crop, SoilProfile& out_profile);

    bool isConfigured() const;
    const Config& config() const;

    // Depths that carry weight (bit i set for depth i)
    uint8_t weightedMask() const;

    // Weighted (field capacity - wilting point) over the depths in depth_mask,
    // renormalized over those depths. NO_DATA when none of them carries weight.
    EngineError effectiveWhc(uint8_t depth_mask, float& out_fraction) const;

    // Full-profile water holding capacity in mm over the root zone
    float effectiveWhcMm() const;

    // Weighted deficit below field capacity for the given readings, in mm.
    // Negative when the soil is wetter than field capacity.
    EngineError measuredDeficitMm(const float* vwc, uint8_t depth_mask, float& out_mm) const;

private:
    Config cfg;
    bool configured;
    float whc_mm;
};

#endif // FIELD_ALERT_SOIL_PROFILE_HPP
