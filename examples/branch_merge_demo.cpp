// branch_merge_demo — explore a design option on a branch, then merge it
//
// Runs the same branch against each merge strategy and prints what ends
// up in the target's merge version.
//
// Build: cmake --build build
// Run:   ./build/branch_merge_demo

#include <bimcollab/bimcollab.hpp>

#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Formatters/TxtFormatter.h>
#include <plog/Init.h>
#include <plog/Log.h>

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <exception>
#include <string>
#include <thread>

namespace bc = bimcollab;

static void run(bc::Resolution strategy) {
    auto engine = bc::Engine{};
    auto main_id = engine.create_session("office-tower", "alice", "Alice", "alice@example.com");
    engine.join_session(main_id, "bob", "Bob", "bob@example.com", bc::Role::editor);

    auto branch_id = engine.create_branch(main_id, "bob", "glass-facade", "Try a glass door");

    engine.make_change(main_id, "alice", bc::ChangeType::property_change, "door_2", "door",
                       bc::PropertyMap{{"material", std::string{"oak"}},
                                       {"width", std::int64_t{90}}});
    std::this_thread::sleep_for(std::chrono::milliseconds{5});
    engine.make_change(branch_id, "bob", bc::ChangeType::property_change, "door_2", "door",
                       bc::PropertyMap{{"material", std::string{"glass"}}});
    engine.make_change(branch_id, "bob", bc::ChangeType::create, "window_7", "window",
                       bc::PropertyMap{{"width", std::int64_t{120}}});
    engine.wait_until_idle();

    engine.merge_branch(main_id, branch_id, "alice", strategy);

    const auto versions = engine.get_versions(main_id, "alice");
    const auto& merged = versions.back();
    std::printf("[%s] %s: %zu changes, %zu open conflicts\n",
                std::string{bc::to_string_view(strategy)}.c_str(),
                merged.description.c_str(), merged.changes.size(),
                engine.get_conflicts(main_id, "alice").size());
    for (const auto& change : merged.changes) {
        auto material = bc::get_property<std::string>(change.new_value, "material");
        std::printf("    %-9s by %-9s material=%s\n", change.element_id.c_str(),
                    change.user_id.c_str(), material ? material->c_str() : "-");
    }
}

int main() {
    static plog::ConsoleAppender<plog::TxtFormatter> console_appender(plog::streamStdErr);
    plog::init(plog::warning, &console_appender);

    try {
        for (auto strategy : {bc::Resolution::manual, bc::Resolution::last_writer_wins,
                              bc::Resolution::merge, bc::Resolution::reject}) {
            run(strategy);
        }
    } catch (const std::exception& e) {
        PLOGE << "branch_merge_demo failed: " << e.what();
        return 1;
    }
    return 0;
}
