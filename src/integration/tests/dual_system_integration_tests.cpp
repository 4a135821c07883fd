#include <umbra/integration/dual_system_integration.hpp>
#include <umbra/scene/static_scene.hpp>
#include <scene/tests/mock_providers.hpp>

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <stdexcept>

using namespace umbra;
using namespace umbra::integration;
using namespace umbra::test_support;
using namespace testing;
using vision::CoverState;
using vision::VisibilityState;

namespace {

    // Calculators, store and ledger wired the way the engine wires them
    struct Harness {
        Harness(const scene::ISpatialQueryProvider& spatial, const scene::ISceneInventory& inventory,
                core::CoverConfig cover_config = {})
            : visibility(spatial, scale)
            , cover(spatial, inventory, cover_config, scale)
            , ledger(core::NotificationConfig{}, core::RecoveryConfig{}, &sink)
            , integration(inventory, visibility, cover, store, ledger) {
        }

        math::MapScale scale{50.0, 5.0};
        vision::VisibilityCalculator visibility;
        cover::CoverDetector cover;
        overrides::OverrideStore store;
        NiceMock<MockNotificationSink> sink;
        ErrorLedger ledger;
        DualSystemIntegration integration;
    };

} // namespace

class DualSystemIntegrationTest : public ::testing::Test {
protected:
    void SetUp() override {
        scene.add_entity(make_creature("guard", 0, 0));
        scene.add_entity(make_creature("rogue", 500, 0));
    }

    scene::StaticScene scene;
};

TEST_F(DualSystemIntegrationTest, NativeCalculationOnOpenGround) {
    Harness h(scene, scene);
    auto state = h.integration.get_combined_state("guard", "rogue");

    EXPECT_EQ(state.visibility, VisibilityState::Observed);
    EXPECT_EQ(state.cover, CoverState::None);
    EXPECT_EQ(state.stealth_bonus, 0);
    EXPECT_TRUE(state.systems_available);
    EXPECT_TRUE(state.warnings.empty());
    EXPECT_EQ(state.visibility_result.source, ResultSource::Native);
    EXPECT_EQ(state.cover_result.source, ResultSource::Native);
    EXPECT_TRUE(state.has_line_of_sight);
    EXPECT_EQ(state.lighting, vision::LightingBand::Bright);
}

TEST_F(DualSystemIntegrationTest, CoverWithoutBlockingSightReadsAsConcealed) {
    // Two walls leave a gap on the centre line
    scene.add_wall(make_wall("left", 450, -30, 450, -2.25));
    scene.add_wall(make_wall("right", 450, 2.25, 450, 30));

    Harness h(scene, scene);
    auto state = h.integration.get_combined_state("guard", "rogue");

    EXPECT_EQ(state.visibility, VisibilityState::Observed);
    EXPECT_EQ(state.cover, CoverState::Greater);
    EXPECT_EQ(state.stealth_bonus, 4);
    EXPECT_EQ(state.effective_visibility, VisibilityState::Concealed);
}

TEST_F(DualSystemIntegrationTest, OverridesTakePrecedence) {
    Harness h(scene, scene);
    const overrides::PairKey key{"guard", "rogue"};
    h.store.set(key, VisibilityState::Hidden, overrides::OverrideSource::HideAction, {});
    h.store.set(key, CoverState::Lesser, overrides::OverrideSource::Manual, {});

    auto state = h.integration.get_combined_state("guard", "rogue");

    EXPECT_EQ(state.visibility, VisibilityState::Hidden);
    EXPECT_EQ(state.cover, CoverState::Lesser);
    EXPECT_EQ(state.stealth_bonus, 1);
    EXPECT_EQ(state.visibility_result.source, ResultSource::Override);
    EXPECT_EQ(state.cover_result.source, ResultSource::Override);
    EXPECT_TRUE(state.systems_available);

    // The reverse direction is not pinned
    auto reverse = h.integration.get_combined_state("rogue", "guard");
    EXPECT_EQ(reverse.visibility_result.source, ResultSource::Native);
}

TEST_F(DualSystemIntegrationTest, OverridesCanBeIgnored) {
    Harness h(scene, scene);
    h.store.set(overrides::PairKey{"guard", "rogue"}, VisibilityState::Hidden,
                overrides::OverrideSource::HideAction, {});
    h.integration.set_config(core::IntegrationConfig{10, false});

    auto state = h.integration.get_combined_state("guard", "rogue");
    EXPECT_EQ(state.visibility, VisibilityState::Observed);
    EXPECT_EQ(state.visibility_result.source, ResultSource::Native);
}

TEST_F(DualSystemIntegrationTest, DisabledCoverUsesWallCollision) {
    scene.add_wall(make_wall("bulwark", 450, -30, 450, 30));
    Harness h(scene, scene);
    h.cover.set_enabled(false);

    auto state = h.integration.get_combined_state("guard", "rogue");

    EXPECT_EQ(state.cover, CoverState::Standard);
    EXPECT_EQ(state.cover_result.source, ResultSource::Heuristic);
    EXPECT_TRUE(state.cover_result.fallback_used);
    EXPECT_FALSE(state.systems_available);
    EXPECT_THAT(state.warnings, Contains("cover system error: wall-collision-fallback"));

    auto history = h.ledger.get_error_history(SystemTag::Cover);
    ASSERT_EQ(history.size(), 1u);
    EXPECT_THAT(history[0].message, StartsWith("cover system unavailable"));
    ASSERT_TRUE(history[0].context.fallback.has_value());
    EXPECT_EQ(history[0].context.fallback->tier, "wall-collision-fallback");
    EXPECT_FALSE(h.ledger.is_available(SystemTag::Cover));
}

TEST_F(DualSystemIntegrationTest, CreatureCoverFailureKeepsMeasuredWalls) {
    scene.add_wall(make_wall("crate", 450, -30, 450, 2.25));
    NiceMock<MockSceneInventory> inventory;
    ON_CALL(inventory, find(_)).WillByDefault([this](const std::string& id) { return scene.find(id); });
    ON_CALL(inventory, entities()).WillByDefault(Throw(core::OracleError("token list unavailable")));
    Harness h(scene, inventory);

    auto state = h.integration.get_combined_state("guard", "rogue");

    EXPECT_EQ(state.cover, CoverState::Standard);
    EXPECT_EQ(state.cover_result.source, ResultSource::Heuristic);
    EXPECT_FALSE(state.systems_available);
    EXPECT_THAT(state.warnings, Contains("cover system error: walls-only-fallback"));
    EXPECT_THAT(state.warnings, Not(Contains("cover system error: wall-collision-fallback")));

    auto history = h.ledger.get_error_history(SystemTag::Cover);
    ASSERT_EQ(history.size(), 1u);
    EXPECT_THAT(history[0].message, HasSubstr("token list unavailable"));
    ASSERT_TRUE(history[0].context.fallback.has_value());
    EXPECT_EQ(history[0].context.fallback->tier, "walls-only-fallback");
}

TEST_F(DualSystemIntegrationTest, DisabledVisibilityUsesLightingOnly) {
    scene.set_ambient_light(vision::LightingBand::Dim);
    Harness h(scene, scene);
    h.visibility.set_enabled(false);

    auto state = h.integration.get_combined_state("guard", "rogue");

    EXPECT_EQ(state.visibility, VisibilityState::Concealed);
    EXPECT_EQ(state.visibility_result.source, ResultSource::Heuristic);
    EXPECT_THAT(state.warnings, ElementsAre("visibility system error: lighting-only-fallback"));
    EXPECT_EQ(state.cover_result.source, ResultSource::Native);
    EXPECT_FALSE(state.systems_available);
}

TEST_F(DualSystemIntegrationTest, TotalFailureFallsThroughToDefaults) {
    NiceMock<MockSpatialQueryProvider> spatial;
    ON_CALL(spatial, walls_along(_)).WillByDefault(Throw(core::OracleError("offline")));
    ON_CALL(spatial, walls_in(_)).WillByDefault(Throw(core::OracleError("offline")));
    ON_CALL(spatial, illumination_at(_)).WillByDefault(Throw(core::OracleError("offline")));
    ON_CALL(spatial, concealing_terrain_at(_)).WillByDefault(Throw(core::OracleError("offline")));

    Harness h(spatial, scene);
    CombinedState state;
    EXPECT_NO_THROW(state = h.integration.get_combined_state("guard", "rogue"));

    EXPECT_EQ(state.visibility, VisibilityState::Observed);
    EXPECT_EQ(state.cover, CoverState::None);
    EXPECT_EQ(state.visibility_result.source, ResultSource::Default);
    EXPECT_EQ(state.cover_result.source, ResultSource::Default);
    EXPECT_FALSE(state.visibility_result.success);
    EXPECT_FALSE(state.systems_available);
    EXPECT_THAT(state.warnings, ElementsAre("visibility system error: default-fallback",
                                            "cover system error: default-fallback"));
    EXPECT_EQ(h.ledger.get_error_history().size(), 2u);
}

TEST_F(DualSystemIntegrationTest, LingeringOverridesServeAsManualFallback) {
    NiceMock<MockSpatialQueryProvider> spatial;
    ON_CALL(spatial, walls_along(_)).WillByDefault(Throw(core::OracleError("offline")));
    ON_CALL(spatial, walls_in(_)).WillByDefault(Throw(core::OracleError("offline")));
    ON_CALL(spatial, illumination_at(_)).WillByDefault(Throw(core::OracleError("offline")));

    Harness h(spatial, scene);
    const overrides::PairKey key{"guard", "rogue"};
    h.store.set(key, VisibilityState::Hidden, overrides::OverrideSource::HideAction, {});
    h.store.set(key, CoverState::Standard, overrides::OverrideSource::Manual, {});
    h.integration.set_config(core::IntegrationConfig{10, false});

    auto state = h.integration.get_combined_state("guard", "rogue");

    EXPECT_EQ(state.visibility, VisibilityState::Hidden);
    EXPECT_EQ(state.cover, CoverState::Standard);
    EXPECT_EQ(state.visibility_result.source, ResultSource::Manual);
    EXPECT_EQ(state.cover_result.source, ResultSource::Manual);
    EXPECT_THAT(state.warnings, ElementsAre("visibility system error: manual-override-fallback",
                                            "cover system error: manual-override-fallback"));
}

TEST_F(DualSystemIntegrationTest, UnknownEntitiesGiveErrorStates) {
    Harness h(scene, scene);
    auto state = h.integration.get_combined_state("guard", "ghost");

    EXPECT_FALSE(state.systems_available);
    EXPECT_THAT(state.warnings, ElementsAre("entity 'ghost' not found"));
    EXPECT_EQ(state.visibility, VisibilityState::Observed);
    EXPECT_EQ(state.cover_result.source, ResultSource::Default);
}

TEST_F(DualSystemIntegrationTest, InventoryFailureGivesErrorState) {
    NiceMock<MockSceneInventory> inventory;
    ON_CALL(inventory, find(_)).WillByDefault(Throw(core::OracleError("token list unavailable")));

    Harness h(scene, inventory);
    auto state = h.integration.get_combined_state("guard", "rogue");

    EXPECT_FALSE(state.systems_available);
    ASSERT_EQ(state.warnings.size(), 1u);
    EXPECT_THAT(state.warnings[0], HasSubstr("token list unavailable"));
}

TEST_F(DualSystemIntegrationTest, BatchCoversEveryTarget) {
    scene.add_entity(make_creature("scout", 0, 500));
    scene.add_entity(make_creature("archer", -500, 0));
    Harness h(scene, scene);
    h.store.set(overrides::PairKey{"guard", "scout"}, VisibilityState::Undetected,
                overrides::OverrideSource::SneakAction, {});

    auto states = h.integration.get_batch_combined_states("guard", {"rogue", "scout", "ghost", "archer"}, 1);

    ASSERT_EQ(states.size(), 4u);
    EXPECT_TRUE(states.at("rogue").systems_available);
    EXPECT_EQ(states.at("scout").visibility, VisibilityState::Undetected);
    EXPECT_FALSE(states.at("ghost").systems_available);
    EXPECT_EQ(states.at("archer").target_id, "archer");
}

TEST_F(DualSystemIntegrationTest, BatchWithUnknownObserver) {
    Harness h(scene, scene);
    auto states = h.integration.get_batch_combined_states("ghost", {"rogue", "guard"});

    ASSERT_EQ(states.size(), 2u);
    EXPECT_FALSE(states.at("rogue").systems_available);
    EXPECT_THAT(states.at("guard").warnings, ElementsAre("entity 'ghost' not found"));
}

TEST_F(DualSystemIntegrationTest, ProbeContextIgnoresOverrides) {
    scene.set_ambient_light(vision::LightingBand::Dim);
    scene.entity("guard")->senses.darkvision = true;
    Harness h(scene, scene);
    h.store.set(overrides::PairKey{"guard", "rogue"}, VisibilityState::Undetected,
                overrides::OverrideSource::SneakAction, {});

    auto context = h.integration.probe_context(overrides::PairKey{"guard", "rogue"});

    EXPECT_EQ(context.visibility, VisibilityState::Observed);
    EXPECT_EQ(context.cover, CoverState::None);
    EXPECT_EQ(context.lighting, vision::LightingBand::Dim);
    EXPECT_TRUE(context.observer_has_darkvision);

    EXPECT_THROW(h.integration.probe_context(overrides::PairKey{"guard", "ghost"}), std::out_of_range);
}

TEST_F(DualSystemIntegrationTest, UndetectedBlockersConsultOverrides) {
    scene.add_entity(make_creature("lurker", 250, 0));
    core::CoverConfig config;
    config.ignore_undetected = true;
    Harness h(scene, scene, config);

    EXPECT_EQ(h.integration.get_combined_state("guard", "rogue").cover, CoverState::Greater);

    h.store.set(overrides::PairKey{"guard", "lurker"}, VisibilityState::Undetected,
                overrides::OverrideSource::SneakAction, {});
    EXPECT_EQ(h.integration.get_combined_state("guard", "rogue").cover, CoverState::None);
}

TEST(CombinedStateTest, ErrorStateIsConservative) {
    auto state = DualSystemIntegration::create_error_state("guard", "rogue", "boom");

    EXPECT_EQ(state.observer_id, "guard");
    EXPECT_EQ(state.visibility, VisibilityState::Observed);
    EXPECT_EQ(state.cover, CoverState::None);
    EXPECT_EQ(state.stealth_bonus, 0);
    EXPECT_FALSE(state.systems_available);
    EXPECT_EQ(state.visibility_result.error, "boom");
    EXPECT_TRUE(state.cover_result.fallback_used);
}
