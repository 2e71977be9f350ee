#ifndef FIELD_ALERT_CWSI_CALCULATOR_HPP
#define FIELD_ALERT_CWSI_CALCULATOR_HPP

#include <field_alert/config/config.hpp>
#include <field_alert/models/cwsi_state.hpp>
#include <field_alert/models/soil_types.hpp>
#include <field_alert/models/engine_error.hpp>
#include <field_alert/utils/circular_buffer.hpp>

// Crop Water Stress Index from the canopy-air temperature differential:
//
//   CWSI = (dT - dT_lower(VPD)) / (dT_upper(VPD) - dT_lower(VPD)), clamped to [0, 1]
//
// The lower (well-watered) baseline starts from the configured crop values
// and, when fitting is enabled, is refitted from recent samples taken while
// the zone was well watered.
class CwsiCalculator {
public:
    CwsiCalculator();
    explicit CwsiCalculator(const CwsiBaseline& baseline, bool fit_enabled = Config::Features::enable_baseline_fit);

    // Baseline from Config::Cwsi for the crop; false when none is configured
    static bool baselineForCrop(CropType crop, CwsiBaseline& out_baseline);

    bool isConfigured() const;

    // Pure: the calculator's own state is not touched
    EngineError compute(float canopy_temp_c, float air_temp_c, float vpd_kpa, CwsiState& out_state) const;

    // Adopt a computed state; feeds the baseline fit when the zone is well watered.
    // fit_sample = false keeps a reading whose soil state is unknown out of the fit.
    void accept(const CwsiState& state, float smd_fraction, bool fit_sample = true);

    const CwsiState& state() const;
    std::size_t fitSampleCount() const;
    void reset();

private:
    struct BaselineSample {
        float vpd_kpa;
        float delta_t_c;
    };

    bool refitLowerBaseline();

    CwsiBaseline configured_baseline;
    CwsiState current;
    bool configured;
    bool fit_enabled;
    CircularBuffer<BaselineSample, Config::Cwsi::fit_window> samples;
};

#endif // FIELD_ALERT_CWSI_CALCULATOR_HPP
