#include <catch2/catch.hpp>
#include <field_alert/engine/irrigation_decision.hpp>
#include <cstring>
#include <limits>

namespace {
    WaterBalanceState balance(float smd_mm, float whc_mm = 200.0f) {
        WaterBalanceState b{};
        b.smd_mm = smd_mm;
        b.whc_mm = whc_mm;
        b.last_update_ts_s = 1780272000U;
        return b;
    }

    CwsiState cwsi(float index, bool valid = true) {
        CwsiState c{};
        c.valid = valid;
        c.index = index;
        return c;
    }

    const DecisionThresholds THRESHOLDS{ 0.5f, 0.6f };
}

TEST_CASE("Decision rationale follows the exceeded thresholds", "[decision]") {
    DecisionRecord rec{};

    REQUIRE(IrrigationDecision::evaluate("A", balance(40.0f), cwsi(0.2f), THRESHOLDS, rec) == EngineError::NONE);
    CHECK_FALSE(rec.triggered);
    CHECK(rec.rationale == DecisionRationale::NONE);

    REQUIRE(IrrigationDecision::evaluate("A", balance(120.0f), cwsi(0.2f), THRESHOLDS, rec) == EngineError::NONE);
    CHECK(rec.triggered);
    CHECK(rec.rationale == DecisionRationale::SMD_EXCEEDED);

    REQUIRE(IrrigationDecision::evaluate("A", balance(40.0f), cwsi(0.75f), THRESHOLDS, rec) == EngineError::NONE);
    CHECK(rec.triggered);
    CHECK(rec.rationale == DecisionRationale::CWSI_EXCEEDED);

    REQUIRE(IrrigationDecision::evaluate("A", balance(120.0f), cwsi(0.75f), THRESHOLDS, rec) == EngineError::NONE);
    CHECK(rec.triggered);
    CHECK(rec.rationale == DecisionRationale::BOTH);
}

TEST_CASE("Thresholds are inclusive", "[decision]") {
    DecisionRecord rec{};
    REQUIRE(IrrigationDecision::evaluate("A", balance(100.0f), cwsi(0.6f), THRESHOLDS, rec) == EngineError::NONE);
    CHECK(rec.rationale == DecisionRationale::BOTH);
}

TEST_CASE("The record carries the inputs behind the decision", "[decision]") {
    DecisionRecord rec{};
    REQUIRE(IrrigationDecision::evaluate("pivot-north", balance(50.0f), cwsi(0.3f), THRESHOLDS, rec) ==
            EngineError::NONE);
    CHECK(std::strcmp(rec.zone_id, "pivot-north") == 0);
    CHECK(rec.ts_s == 1780272000U);
    CHECK(rec.smd_mm == Approx(50.0f));
    CHECK(rec.whc_mm == Approx(200.0f));
    CHECK(rec.smd_fraction == Approx(0.25f));
    CHECK(rec.cwsi == Approx(0.3f));
    CHECK(rec.cwsi_valid);
    CHECK(rec.thresholds.smd_trigger_fraction == Approx(0.5f));
    CHECK(rec.thresholds.cwsi_trigger == Approx(0.6f));
}

TEST_CASE("An invalid CWSI never triggers", "[decision]") {
    DecisionRecord rec{};
    REQUIRE(IrrigationDecision::evaluate("A", balance(10.0f), cwsi(0.95f, false), THRESHOLDS, rec) ==
            EngineError::NONE);
    CHECK_FALSE(rec.triggered);
    CHECK_FALSE(rec.cwsi_valid);
    CHECK(rec.cwsi == 0.0f);
}

TEST_CASE("Evaluation is deterministic", "[decision]") {
    DecisionRecord first{};
    DecisionRecord second{};
    REQUIRE(IrrigationDecision::evaluate("A", balance(90.0f), cwsi(0.55f), THRESHOLDS, first) == EngineError::NONE);
    REQUIRE(IrrigationDecision::evaluate("A", balance(90.0f), cwsi(0.55f), THRESHOLDS, second) == EngineError::NONE);
    CHECK(first.rationale == second.rationale);
    CHECK(first.smd_fraction == second.smd_fraction);
    CHECK(first.cwsi == second.cwsi);
}

TEST_CASE("Invalid thresholds and inputs are rejected", "[decision]") {
    DecisionRecord rec{};
    const float nan = std::numeric_limits<float>::quiet_NaN();

    CHECK(IrrigationDecision::validateThresholds(DecisionThresholds{ 0.5f, 0.6f }) == EngineError::NONE);
    CHECK(IrrigationDecision::validateThresholds(DecisionThresholds{ 1.0f, 1.0f }) == EngineError::NONE);
    CHECK(IrrigationDecision::validateThresholds(DecisionThresholds{ 0.0f, 0.6f }) == EngineError::CONFIG);
    CHECK(IrrigationDecision::validateThresholds(DecisionThresholds{ 0.5f, 1.2f }) == EngineError::CONFIG);
    CHECK(IrrigationDecision::validateThresholds(DecisionThresholds{ nan, 0.6f }) == EngineError::CONFIG);

    CHECK(IrrigationDecision::evaluate("A", balance(10.0f), cwsi(0.2f), DecisionThresholds{ -0.1f, 0.6f }, rec) ==
          EngineError::CONFIG);
    CHECK(IrrigationDecision::evaluate("A", balance(0.0f, 0.0f), cwsi(0.2f), THRESHOLDS, rec) ==
          EngineError::COMPUTATION);
    CHECK(IrrigationDecision::evaluate("", balance(10.0f), cwsi(0.2f), THRESHOLDS, rec) == EngineError::VALIDATION);
    CHECK(IrrigationDecision::evaluate(nullptr, balance(10.0f), cwsi(0.2f), THRESHOLDS, rec) ==
          EngineError::VALIDATION);
}
