#include <umbra/vision/visibility_calculator.hpp>
#include <umbra/scene/static_scene.hpp>
#include <umbra/core/types.hpp>
#include <scene/tests/mock_providers.hpp>

#include <gtest/gtest.h>
#include <gmock/gmock.h>

using namespace umbra;
using namespace umbra::vision;
using namespace umbra::test_support;
using namespace testing;

class VisibilityCalculatorTest : public ::testing::Test {
protected:
    VisibilityCalculatorTest()
        : calculator(scene, math::MapScale{50.0, 5.0}) {
        observer = make_creature("guard", 0, 0);
        // 50 ft away
        target = make_creature("rogue", 500, 0);
    }

    scene::StaticScene scene;
    VisibilityCalculator calculator;
    scene::Entity observer;
    scene::Entity target;
};

TEST_F(VisibilityCalculatorTest, ClearBrightLineIsObserved) {
    auto result = calculator.evaluate(observer, target);

    EXPECT_EQ(result.state, VisibilityState::Observed);
    EXPECT_EQ(result.source, EvaluationSource::Native);
    EXPECT_TRUE(result.has_line_of_sight);
    EXPECT_EQ(result.lighting, LightingBand::Bright);
    EXPECT_EQ(result.deciding_signal, VisibilitySignal::LineOfSight);
    EXPECT_DOUBLE_EQ(result.distance_feet, 50.0);
}

TEST_F(VisibilityCalculatorTest, WallWithoutSensesMeansUndetected) {
    scene.add_wall(make_wall("wall", 250, -100, 250, 100));

    auto result = calculator.evaluate(observer, target);

    EXPECT_EQ(result.state, VisibilityState::Undetected);
    EXPECT_FALSE(result.has_line_of_sight);
    ASSERT_TRUE(result.line_of_sight_signal.has_value());
    EXPECT_EQ(*result.line_of_sight_signal, VisibilityState::Undetected);
    EXPECT_EQ(result.deciding_signal, VisibilitySignal::LineOfSight);
}

TEST_F(VisibilityCalculatorTest, ImpreciseSenseBridgesBlockedSight) {
    scene.add_wall(make_wall("wall", 250, -100, 250, 100));
    observer.senses.special_senses.push_back(scene::Sense{"tremorsense", scene::SenseAcuity::Imprecise, 60.0});

    EXPECT_EQ(calculator.calculate(observer, target), VisibilityState::Hidden);

    // Out of range
    observer.senses.special_senses[0].range_feet = 30.0;
    EXPECT_EQ(calculator.calculate(observer, target), VisibilityState::Undetected);
}

TEST_F(VisibilityCalculatorTest, PreciseSenseKeepsTargetObserved) {
    scene.add_wall(make_wall("wall", 250, -100, 250, 100));
    scene.set_ambient_light(LightingBand::Darkness);
    observer.senses.special_senses.push_back(scene::Sense{"echolocation", scene::SenseAcuity::Precise, 0.0});

    EXPECT_EQ(calculator.calculate(observer, target), VisibilityState::Observed);
}

TEST_F(VisibilityCalculatorTest, DimLightConcealsWithoutLowLightVision) {
    scene.set_ambient_light(LightingBand::Dim);

    auto result = calculator.evaluate(observer, target);
    EXPECT_EQ(result.state, VisibilityState::Concealed);
    EXPECT_EQ(result.deciding_signal, VisibilitySignal::Illumination);

    observer.senses.low_light_vision = true;
    EXPECT_EQ(calculator.calculate(observer, target), VisibilityState::Observed);
}

TEST_F(VisibilityCalculatorTest, DarknessHidesUnlessDarkvisionReaches) {
    scene.set_ambient_light(LightingBand::Darkness);
    EXPECT_EQ(calculator.calculate(observer, target), VisibilityState::Hidden);

    observer.senses.darkvision = true;
    EXPECT_EQ(calculator.calculate(observer, target), VisibilityState::Observed);

    observer.senses.darkvision_range_feet = 30.0;
    EXPECT_EQ(calculator.calculate(observer, target), VisibilityState::Hidden);
}

TEST_F(VisibilityCalculatorTest, LightingIsSampledAtTheTarget) {
    math::Polygon alcove{{math::Vec2(450, -50), math::Vec2(550, -50), math::Vec2(550, 50), math::Vec2(450, 50)}};
    scene.add_light_zone(scene::LightZone{alcove, LightingBand::Darkness});

    EXPECT_EQ(calculator.calculate(observer, target), VisibilityState::Hidden);
    // Reversed, the guard stands in bright light
    EXPECT_EQ(calculator.calculate(target, observer), VisibilityState::Observed);
}

TEST_F(VisibilityCalculatorTest, ConcealingTerrainAndDazzle) {
    scene.add_concealing_area(math::Polygon{{math::Vec2(450, -50), math::Vec2(550, -50),
                                             math::Vec2(550, 50), math::Vec2(450, 50)}});
    EXPECT_EQ(calculator.calculate(observer, target), VisibilityState::Concealed);

    scene::Entity far_target = make_creature("scout", -500, 0);
    EXPECT_EQ(calculator.calculate(observer, far_target), VisibilityState::Observed);
    observer.senses.dazzled = true;
    EXPECT_EQ(calculator.calculate(observer, far_target), VisibilityState::Concealed);
}

TEST_F(VisibilityCalculatorTest, BlindedObserverAndInvisibleTarget) {
    observer.senses.blinded = true;
    EXPECT_EQ(calculator.calculate(observer, target), VisibilityState::Undetected);

    observer.senses.blinded = false;
    target.invisible = true;
    auto result = calculator.evaluate(observer, target);
    EXPECT_EQ(result.state, VisibilityState::Undetected);
    // Nothing physical is in the way
    EXPECT_TRUE(result.has_line_of_sight);
}

TEST_F(VisibilityCalculatorTest, VisionRangeDecidesByDistance) {
    observer.senses.vision_range_feet = 30.0;

    auto result = calculator.evaluate(observer, target);
    EXPECT_EQ(result.state, VisibilityState::Undetected);
    EXPECT_EQ(result.deciding_signal, VisibilitySignal::Distance);
}

TEST_F(VisibilityCalculatorTest, OpenDoorsAndLowWallsDoNotBlock) {
    scene::Wall door = make_wall("door", 250, -100, 250, 100);
    door.is_door = true;
    door.door_open = true;
    scene.add_wall(door);

    scene::Wall balcony = make_wall("balcony", 300, -100, 300, 100);
    balcony.bottom = 20.0;
    scene.add_wall(balcony);

    EXPECT_EQ(calculator.calculate(observer, target), VisibilityState::Observed);
}

TEST_F(VisibilityCalculatorTest, OneWayWallOnlyBlocksFromOneSide) {
    // Guard is on the left of the upward wall
    scene::Wall wall = make_wall("mirror", 250, -100, 250, 100);
    wall.direction = scene::WallDirection::Right;
    scene.add_wall(wall);

    EXPECT_EQ(calculator.calculate(observer, target), VisibilityState::Observed);
    EXPECT_EQ(calculator.calculate(target, observer), VisibilityState::Undetected);
}

TEST(VisibilityCalculatorFallbackTest, OracleFailureUsesLightingOnly) {
    NiceMock<MockSpatialQueryProvider> spatial;
    ON_CALL(spatial, walls_along(_)).WillByDefault(Throw(core::OracleError("wall index offline")));
    ON_CALL(spatial, illumination_at(_)).WillByDefault(Return(LightingBand::Dim));
    ON_CALL(spatial, concealing_terrain_at(_)).WillByDefault(Return(false));

    VisibilityCalculator calculator(spatial, math::MapScale{});
    auto result = calculator.evaluate(make_creature("guard", 0, 0), make_creature("rogue", 100, 0));

    EXPECT_EQ(result.source, EvaluationSource::Heuristic);
    EXPECT_TRUE(result.fallback_used());
    EXPECT_EQ(result.state, VisibilityState::Concealed);
    EXPECT_FALSE(result.line_of_sight_signal.has_value());
    EXPECT_THAT(result.error, HasSubstr("wall index offline"));
}

TEST(VisibilityCalculatorFallbackTest, TotalFailureDefaultsToObserved) {
    NiceMock<MockSpatialQueryProvider> spatial;
    ON_CALL(spatial, walls_along(_)).WillByDefault(Throw(core::OracleError("wall index offline")));
    ON_CALL(spatial, illumination_at(_)).WillByDefault(Throw(core::OracleError("lighting offline")));

    VisibilityCalculator calculator(spatial, math::MapScale{});
    auto result = calculator.evaluate(make_creature("guard", 0, 0), make_creature("rogue", 100, 0));

    EXPECT_EQ(result.source, EvaluationSource::Failed);
    EXPECT_EQ(result.state, VisibilityState::Observed);
    EXPECT_THAT(result.error, HasSubstr("wall index offline"));
    EXPECT_THAT(result.error, HasSubstr("lighting offline"));
}

TEST(VisibilityCalculatorFallbackTest, LightingOnlyPropagatesOracleErrors) {
    NiceMock<MockSpatialQueryProvider> spatial;
    ON_CALL(spatial, illumination_at(_)).WillByDefault(Throw(core::OracleError("lighting offline")));

    VisibilityCalculator calculator(spatial, math::MapScale{});
    EXPECT_THROW(calculator.lighting_only(make_creature("guard", 0, 0), make_creature("rogue", 100, 0)),
                 core::OracleError);
}

TEST(VisibilityStatesTest, NamesAndOrdering) {
    EXPECT_EQ(parse_visibility_state(to_string(VisibilityState::Hidden)), VisibilityState::Hidden);
    EXPECT_EQ(parse_cover_state(to_string(CoverState::Greater)), CoverState::Greater);
    EXPECT_FALSE(parse_lighting_band("twilight").has_value());

    EXPECT_EQ(worst(VisibilityState::Concealed, VisibilityState::Hidden), VisibilityState::Hidden);
    EXPECT_EQ(strongest(CoverState::Lesser, CoverState::Standard), CoverState::Standard);
    EXPECT_EQ(stealth_bonus(CoverState::Greater), 4);
    EXPECT_FALSE(can_hide(CoverState::Lesser));
    EXPECT_TRUE(can_hide(CoverState::Standard));
}
