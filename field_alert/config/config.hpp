#ifndef FIELD_ALERT_CONFIG_HPP
#define FIELD_ALERT_CONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <freertos/FreeRTOS.h>
#include <freertos/task.h>
#include <field_alert/models/soil_types.hpp>
#include <field_alert/models/cwsi_state.hpp>

namespace Config {

namespace Logging {
    // One of "error", "warn", "info", "debug"
    static constexpr const char* level = "info";
}

namespace Soil {
    // Hydraulic properties by texture class (volumetric, cm3/cm3).
    // Typical USDA NRCS soil survey values.
    struct TextureProperties {
        SoilTexture texture;
        float       field_capacity;
        float       wilting_point;
    };

    static constexpr TextureProperties textures[] = {
        { SoilTexture::SAND,            0.12f, 0.04f },
        { SoilTexture::LOAMY_SAND,      0.14f, 0.06f },
        { SoilTexture::SANDY_LOAM,      0.23f, 0.10f },
        { SoilTexture::LOAM,            0.27f, 0.12f },
        { SoilTexture::SILT_LOAM,       0.33f, 0.13f },
        { SoilTexture::SANDY_CLAY_LOAM, 0.26f, 0.15f },
        { SoilTexture::CLAY_LOAM,       0.32f, 0.20f },
        { SoilTexture::SILTY_CLAY_LOAM, 0.37f, 0.22f },
        { SoilTexture::CLAY,            0.43f, 0.29f },
    };

    static constexpr SoilTexture default_texture = SoilTexture::SILT_LOAM;

    // Sensor depths (inches) and the share of the root zone each one represents
    static constexpr float depths_in[SOIL_DEPTH_COUNT] = { 6.0f, 12.0f, 18.0f };
    static constexpr float depth_weights[SOIL_DEPTH_COUNT] = { 0.40f, 0.35f, 0.25f };
    static constexpr float weight_sum_tolerance = 1e-3f;

    // Effective root zone depth (36 in)
    static constexpr float root_zone_depth_mm = 36.0f * 25.4f;
}

namespace WaterBalance {
    static constexpr float mad_fraction = 0.50f;             // management allowable depletion
    static constexpr float crop_coefficient = 1.15f;         // Kc for corn at mid-season
    static constexpr float reference_et_mm_per_day = 7.0f;   // ET0, summer High Plains
    // Weight of the sensed deficit against the projected bucket (1 = trust sensors)
    static constexpr float sensor_trust = 1.0f;
}

namespace Cwsi {
    struct CropBaseline {
        CropType     crop;
        CwsiBaseline baseline;
    };

    // Non-water-stressed baselines (dT = a + b * VPD) and non-transpiring upper limits
    static constexpr CropBaseline baselines[] = {
        { CropType::CORN,    { 2.67f, -2.04f, 4.50f, 0.0f } },
        { CropType::COTTON,  { 1.49f, -2.09f, 5.00f, 0.0f } },
        { CropType::SOYBEAN, { 1.44f, -1.34f, 4.60f, 0.0f } },
        { CropType::SORGHUM, { 2.50f, -1.95f, 4.80f, 0.0f } },
    };

    // Rolling refit of the lower baseline from well-watered samples
    static constexpr float well_watered_smd_fraction = 0.10f;
    static constexpr std::size_t fit_window = 48;
    static constexpr std::size_t min_fit_samples = 12;
    static constexpr float min_fit_vpd_span_kpa = 1.0f;
    // Upper and lower baselines closer than this are treated as coincident
    static constexpr float min_baseline_spread_c = 1e-3f;
}

namespace Decision {
    static constexpr float smd_trigger_fraction = WaterBalance::mad_fraction;
    static constexpr float cwsi_trigger = 0.60f;
}

namespace Ingest {
    // Plausible physical range for canopy and air temperature
    static constexpr float min_temp_c = -10.0f;
    static constexpr float max_temp_c = 60.0f;
    // VWC this far outside [0, 1] is rounding noise and gets clamped
    static constexpr float vwc_rounding_tolerance = 0.005f;
    static constexpr float max_vpd_kpa = 10.0f;
    static constexpr float max_rain_mm = 500.0f;
}

namespace Engine {
    static constexpr std::size_t max_zones = 8;
    // Oldest decisions are evicted once a zone's history is full
    static constexpr std::size_t history_capacity = 128;
}

// Zones monitored by this node
namespace Zones {
    struct ZoneDefinition {
        const char* id;
        SoilTexture texture;
        CropType    crop;
    };

    static constexpr ZoneDefinition zones[] = {
        { "pivot-north", SoilTexture::SILT_LOAM, CropType::CORN },
        { "pivot-south", SoilTexture::CLAY_LOAM, CropType::COTTON },
    };
}

namespace Tasks {
namespace Ingest {
    static constexpr std::size_t queue_length = 16;
}
namespace Decision {
    static constexpr uint32_t period_ms = 5000;
    static constexpr std::size_t queue_length = 16;
}
namespace DemoFeed {
    static constexpr uint32_t period_ms = 2000;
    // Simulated time advanced per generated record
    static constexpr uint32_t step_s = 3600;
    static constexpr uint32_t start_ts_s = 1780272000; // 2026-06-01 00:00:00 UTC
    static constexpr uint32_t seed = 42;
}
}

// Feature toggles to enable/disable subsystems at build time
namespace Features {
    static constexpr bool enable_demo_feed    = true;  // synthetic sensor records for bench testing
    static constexpr bool enable_alert_task   = true;
    static constexpr bool enable_baseline_fit = true;
}

// Task priority levels (higher number = higher priority, can preempt lower)
namespace TaskPriorities {
    // Zone state writer must keep up with incoming records
    static constexpr UBaseType_t HIGH   = tskIDLE_PRIORITY + 2;

    // Evaluation ticks, alert hand-off and the demo feed tolerate latency
    static constexpr UBaseType_t NORMAL = tskIDLE_PRIORITY + 1;
}

} // namespace Config

#endif // FIELD_ALERT_CONFIG_HPP
