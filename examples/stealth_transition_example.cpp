#include <umbra/engine.hpp>
#include <umbra/core/log.hpp>
#include <umbra/scene/static_scene.hpp>

#include <iostream>
#include <string>
#include <vector>

using namespace umbra;

namespace {

class ConsoleNotifications : public scene::INotificationSink {
public:
    void notify(scene::NotificationLevel level, const std::string& message) override {
        const char* prefix = level == scene::NotificationLevel::Error     ? "[error] "
                           : level == scene::NotificationLevel::Warning   ? "[warn]  "
                                                                          : "[info]  ";
        std::cout << prefix << message << std::endl;
    }
};

scene::Entity creature(std::string id, double x, double y) {
    scene::Entity entity;
    entity.id = std::move(id);
    entity.center = math::Point{x, y, 0.0};
    return entity;
}

scene::Wall hedge() {
    scene::Wall wall;
    wall.id = "hedge";
    wall.segment = math::Segment(math::Vec2(450.0, 200.0), math::Vec2(450.0, 400.0));
    return wall;
}

void print_state(const integration::CombinedState& state) {
    std::cout << "  " << state.observer_id << " -> " << state.target_id << ": "
              << vision::to_string(state.visibility) << " ("
              << integration::to_string(state.visibility_result.source) << "), cover "
              << vision::to_string(state.cover) << " (" << integration::to_string(state.cover_result.source)
              << "), stealth +" << state.stealth_bonus << std::endl;
}

} // namespace

int main(int argc, char** argv) {
    core::Logger::instance().initialize("umbra_example.log");
    core::Logger::instance().set_console_output(false);

    core::EngineConfig config;
    if (argc > 1) {
        auto loaded = core::load_engine_config(argv[1]);
        if (!loaded) {
            std::cerr << "Failed to load config: " << loaded.error().to_string() << std::endl;
            return 1;
        }
        config = *loaded;
    }

    scene::StaticScene scene;
    scene.add_entity(creature("guard", 0.0, 0.0));
    scene.add_entity(creature("archer", 0.0, -500.0));
    scene.add_entity(creature("rogue", 500.0, 0.0));
    scene.add_wall(hedge());

    ConsoleNotifications notifications;
    VisibilityCoverEngine engine(config, scene, scene, nullptr, &notifications);
    const std::vector<std::string> observers = {"guard", "archer"};

    std::cout << "=== Before the sneak ===" << std::endl;
    for (const auto& observer_id : observers) {
        print_state(engine.get_combined_state(observer_id, "rogue"));
    }

    // Sneak: bracket the move with snapshots
    auto start = engine.capture_start_positions("rogue", observers);
    scene.move_entity("rogue", math::Point{500.0, 300.0, 0.0});
    auto end = engine.calculate_end_positions("rogue", observers);

    std::cout << "=== Sneak behind the hedge ===" << std::endl;
    auto transitions = engine.analyze_transitions(start, end);
    for (const auto& [observer_id, transition] : transitions) {
        std::cout << "  " << observer_id << ": " << tracking::to_string(transition.transition_type) << ", "
                  << vision::to_string(transition.visibility_change.from) << " -> "
                  << vision::to_string(transition.visibility_change.to) << ", DC impact "
                  << transition.impact_on_dc << std::endl;

        const auto& after = transition.end.combined;
        if (after.visibility == vision::VisibilityState::Undetected) {
            overrides::ValidationContext context;
            context.has_cover = after.cover != vision::CoverState::None;
            context.expected_cover = after.cover;
            context.lighting = after.lighting;
            engine.set_override(overrides::PairKey{observer_id, "rogue"}, vision::VisibilityState::Undetected,
                                overrides::OverrideSource::SneakAction, context, "successful sneak");
        }
    }

    auto summary = tracking::PositionTracker::summarize(transitions);
    std::cout << "  improved " << summary.improved << ", worsened " << summary.worsened << ", net DC "
              << summary.net_dc_impact << std::endl;

    // Stepping back into the open breaks the pinned results
    scene.move_entity("rogue", math::Point{500.0, 0.0, 0.0});
    engine.notify_entity_moved("rogue");

    std::cout << "=== Back in the open ===" << std::endl;
    for (const auto& invalid : engine.process_pending_revalidations()) {
        std::cout << "  " << invalid.record.key.observer_id << " -> " << invalid.record.key.target_id
                  << " override no longer holds:" << std::endl;
        for (const auto& reason : invalid.reasons) {
            std::cout << "    [" << reason.code << "] " << reason.message << std::endl;
        }
    }
    for (const auto& observer_id : observers) {
        print_state(engine.get_combined_state(observer_id, "rogue"));
    }

    core::Logger::instance().shutdown();
    return 0;
}
