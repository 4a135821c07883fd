#include <umbra/engine.hpp>
#include <umbra/persistence/json_file_persistence.hpp>
#include <umbra/scene/static_scene.hpp>
#include <scene/tests/mock_providers.hpp>

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <filesystem>
#include <stdexcept>

using namespace umbra;
using namespace umbra::test_support;
using namespace testing;
using integration::ResultSource;
using integration::SystemTag;
using overrides::OverrideSource;
using overrides::PairKey;
using vision::CoverState;
using vision::VisibilityState;

namespace {

    std::vector<std::string> codes(const overrides::InvalidOverride& invalid) {
        std::vector<std::string> result;
        for (const auto& reason : invalid.reasons) {
            result.push_back(reason.code);
        }
        return result;
    }

} // namespace

class EngineScenarioTest : public ::testing::Test {
protected:
    void SetUp() override {
        scene.add_entity(make_creature("guard", 0, 0));
        scene.add_entity(make_creature("rogue", 500, 0));
    }

    scene::StaticScene scene;
    core::EngineConfig config;
};

TEST_F(EngineScenarioTest, PartialWallGivesStandardCover) {
    scene.add_wall(make_wall("crate", 450, -30, 450, 2.25));
    VisibilityCoverEngine engine(config, scene, scene);

    auto state = engine.get_combined_state("guard", "rogue");

    EXPECT_EQ(state.cover, CoverState::Standard);
    EXPECT_EQ(state.stealth_bonus, 2);
    EXPECT_EQ(state.cover_result.source, ResultSource::Native);
    EXPECT_TRUE(state.systems_available);
}

TEST_F(EngineScenarioTest, ArrowSlitGivesGreaterCoverWithoutBlockingSight) {
    scene.add_wall(make_wall("slit-left", 450, -30, 450, -2.25));
    scene.add_wall(make_wall("slit-right", 450, 2.25, 450, 30));
    VisibilityCoverEngine engine(config, scene, scene);

    auto state = engine.get_combined_state("guard", "rogue");

    EXPECT_EQ(state.cover, CoverState::Greater);
    EXPECT_EQ(state.stealth_bonus, 4);
    EXPECT_TRUE(state.has_line_of_sight);
    EXPECT_EQ(state.visibility, VisibilityState::Observed);
    EXPECT_EQ(state.effective_visibility, VisibilityState::Concealed);
}

TEST_F(EngineScenarioTest, PinnedVisibilityHoldsUntilCleared) {
    VisibilityCoverEngine engine(config, scene, scene);
    const PairKey key{"guard", "rogue"};

    ASSERT_TRUE(engine.set_override(key, VisibilityState::Undetected, OverrideSource::SneakAction, {}, "sneak"));
    auto pinned = engine.get_combined_state("guard", "rogue");
    EXPECT_EQ(pinned.visibility, VisibilityState::Undetected);
    EXPECT_EQ(pinned.visibility_result.source, ResultSource::Override);

    // The reverse direction is unaffected
    EXPECT_EQ(engine.get_combined_state("rogue", "guard").visibility, VisibilityState::Observed);

    EXPECT_TRUE(engine.clear_override(key));
    EXPECT_EQ(engine.get_combined_state("guard", "rogue").visibility, VisibilityState::Observed);
    EXPECT_EQ(engine.clear_overrides_for("rogue"), 0u);
}

TEST_F(EngineScenarioTest, LeavingCoverInvalidatesTheSneak) {
    scene.add_wall(make_wall("crate", 450, -30, 450, 2.25));
    VisibilityCoverEngine engine(config, scene, scene);
    const PairKey key{"guard", "rogue"};

    overrides::ValidationContext context;
    context.has_cover = true;
    context.expected_cover = CoverState::Standard;
    context.lighting = vision::LightingBand::Bright;
    ASSERT_TRUE(engine.set_override(key, VisibilityState::Undetected, OverrideSource::SneakAction, context));

    EXPECT_TRUE(engine.revalidate_all().empty());

    scene.move_entity("rogue", math::Point{500, 500, 0});
    engine.notify_entity_moved("rogue");
    engine.notify_entity_moved("rogue");
    EXPECT_EQ(engine.revalidation_queue().pending_count(), 1u);

    auto invalid = engine.process_pending_revalidations();

    ASSERT_EQ(invalid.size(), 1u);
    EXPECT_EQ(invalid[0].record.key, key);
    EXPECT_EQ(invalid[0].current.visibility, VisibilityState::Observed);
    EXPECT_THAT(codes(invalid[0]), ElementsAre("cover-lost", "stealth-failed", "sneak-broken", "cover-reduced"));
    EXPECT_TRUE(engine.revalidation_queue().empty());

    // Reported, not removed
    EXPECT_EQ(engine.overrides().get_visibility(key), VisibilityState::Undetected);
}

TEST_F(EngineScenarioTest, UnrelatedMovesDoNotTouchThePair) {
    scene.add_entity(make_creature("bystander", -500, 0));
    VisibilityCoverEngine engine(config, scene, scene);

    overrides::ValidationContext context;
    context.has_cover = true;
    engine.set_override(PairKey{"guard", "rogue"}, VisibilityState::Hidden, OverrideSource::HideAction, context);

    engine.notify_entity_moved("bystander");
    EXPECT_TRUE(engine.process_pending_revalidations().empty());

    // A lighting change sweeps every pair, including this stale one
    engine.notify_lighting_changed();
    EXPECT_EQ(engine.process_pending_revalidations().size(), 1u);
}

TEST_F(EngineScenarioTest, DisabledCoverFallsBackAndRecovers) {
    scene.add_wall(make_wall("bulwark", 450, -30, 450, 30));
    config.cover.enabled = false;
    VisibilityCoverEngine engine(config, scene, scene);

    auto degraded = engine.get_combined_state("guard", "rogue");
    EXPECT_EQ(degraded.cover, CoverState::Standard);
    EXPECT_FALSE(degraded.systems_available);
    EXPECT_FALSE(engine.get_system_status().at(SystemTag::Cover).available);

    EXPECT_FALSE(engine.attempt_system_recovery(SystemTag::Cover));

    engine.cover().set_enabled(true);
    EXPECT_TRUE(engine.attempt_system_recovery(SystemTag::Cover));
    EXPECT_TRUE(engine.get_system_status().at(SystemTag::Cover).available);

    auto recovered = engine.get_combined_state("guard", "rogue");
    EXPECT_EQ(recovered.cover_result.source, ResultSource::Native);
    EXPECT_TRUE(recovered.systems_available);
}

TEST_F(EngineScenarioTest, PersistenceFailureDisablesOverrides) {
    NiceMock<MockPersistenceProvider> persistence;
    ON_CALL(persistence, store(_, _))
        .WillByDefault(Return(Result<void, Error>(
            std::unexpected(core::make_error(ErrorCode::PersistenceUnavailable, "disk full")))));

    VisibilityCoverEngine engine(config, scene, scene, &persistence);
    const PairKey key{"guard", "rogue"};

    EXPECT_FALSE(engine.set_override(key, VisibilityState::Hidden, OverrideSource::Manual, {}));
    EXPECT_TRUE(engine.overrides().is_degraded());
    EXPECT_FALSE(engine.get_system_status().at(SystemTag::Overrides).available);

    auto history = engine.get_error_history(SystemTag::Overrides);
    ASSERT_EQ(history.size(), 1u);
    EXPECT_EQ(history[0].severity, integration::Severity::Critical);
    EXPECT_THAT(history[0].message, StartsWith("override persistence unavailable"));

    // Calculations carry on without overrides
    auto state = engine.get_combined_state("guard", "rogue");
    EXPECT_EQ(state.visibility, VisibilityState::Observed);
    EXPECT_EQ(state.visibility_result.source, ResultSource::Native);

    EXPECT_FALSE(engine.attempt_system_recovery(SystemTag::Overrides));
}

TEST_F(EngineScenarioTest, OverridesSurviveARestart) {
    const auto path = std::filesystem::temp_directory_path() / "umbra_engine_overrides.json";
    std::filesystem::remove(path);
    const PairKey key{"guard", "rogue"};

    {
        persistence::JsonFilePersistence file(path.string());
        VisibilityCoverEngine engine(config, scene, scene, &file);
        ASSERT_TRUE(engine.set_override(key, VisibilityState::Hidden, OverrideSource::HideAction, {}, "behind barrels"));
        ASSERT_TRUE(engine.set_override(key, CoverState::Lesser, OverrideSource::Manual, {}));
    }

    persistence::JsonFilePersistence file(path.string());
    VisibilityCoverEngine engine(config, scene, scene, &file);

    EXPECT_EQ(engine.overrides().size(), 2u);
    auto state = engine.get_combined_state("guard", "rogue");
    EXPECT_EQ(state.visibility, VisibilityState::Hidden);
    EXPECT_EQ(state.cover, CoverState::Lesser);

    auto record = engine.overrides().get(key, overrides::OverrideKind::Visibility);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->reason, "behind barrels");

    std::filesystem::remove(path);
}

TEST_F(EngineScenarioTest, InvalidConfigurationIsRejected) {
    config.cover.standard_threshold = 80.0;
    config.cover.greater_threshold = 70.0;
    EXPECT_THROW(VisibilityCoverEngine{config, scene, scene}, std::invalid_argument);

    core::EngineConfig no_batches;
    no_batches.integration.batch_size = 0;
    EXPECT_THROW(VisibilityCoverEngine{no_batches, scene, scene}, std::invalid_argument);
}

TEST_F(EngineScenarioTest, SneakIsBracketedBySnapshots) {
    scene.add_wall(make_wall("hedge", 450, 200, 450, 400));
    VisibilityCoverEngine engine(config, scene, scene);

    auto start = engine.capture_start_positions("rogue", {"guard"});
    scene.move_entity("rogue", math::Point{500, 300, 0});
    auto end = engine.calculate_end_positions("rogue", {"guard"});

    auto transitions = engine.analyze_transitions(start, end);
    ASSERT_EQ(transitions.size(), 1u);
    EXPECT_EQ(transitions.at("guard").transition_type, tracking::TransitionType::Improved);
    EXPECT_EQ(transitions.at("guard").impact_on_dc, 4);
}

TEST_F(EngineScenarioTest, FreshEngineReportsEverySystemHealthy) {
    VisibilityCoverEngine engine(config, scene, scene);

    auto status = engine.get_system_status();
    EXPECT_EQ(status.size(), integration::SYSTEM_TAG_COUNT);
    for (const auto& [tag, system] : status) {
        EXPECT_TRUE(system.available) << integration::to_string(tag);
    }
    EXPECT_TRUE(engine.get_error_history().empty());
}
