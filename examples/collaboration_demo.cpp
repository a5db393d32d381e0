// collaboration_demo — three users editing one model
//
// Shows session setup, role checks, conflict detection on the background
// worker, last-writer-wins resolution, automatic versioning and export.
//
// Build: cmake --build build
// Run:   ./build/collaboration_demo [config.json]

#include <bimcollab/bimcollab.hpp>
#include <bimcollab/json.hpp>

#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Formatters/TxtFormatter.h>
#include <plog/Init.h>
#include <plog/Log.h>

#include <cstdint>
#include <cstdio>
#include <exception>
#include <string>

namespace bc = bimcollab;

int main(int argc, char** argv) {
    static plog::ConsoleAppender<plog::TxtFormatter> console_appender(plog::streamStdErr);
    plog::init(plog::info, &console_appender);

    try {
        auto config = argc > 1 ? bc::load_config_file(argv[1]) : bc::EngineConfig{};
        auto engine = bc::Engine{config};

        // -- Session and members ----------------------------------------------
        auto sid = engine.create_session("office-tower", "alice", "Alice", "alice@example.com");
        engine.join_session(sid, "bob", "Bob", "bob@example.com", bc::Role::editor);
        engine.join_session(sid, "carol", "Carol", "carol@example.com", bc::Role::viewer);

        engine.make_change(sid, "bob", bc::ChangeType::resize, "wall_1", "wall",
                           bc::PropertyMap{{"height", std::int64_t{10}}});

        // Viewers are read-only.
        try {
            engine.make_change(sid, "carol", bc::ChangeType::resize, "wall_1", "wall",
                               bc::PropertyMap{{"height", std::int64_t{12}}});
        } catch (const bc::CollabError& e) {
            std::printf("carol rejected: %s (%s)\n", e.what(),
                        std::string{bc::to_string_view(e.kind())}.c_str());
        }

        // -- Concurrent edits to one element ----------------------------------
        engine.make_change(sid, "alice", bc::ChangeType::property_change, "room_5", "room",
                           bc::PropertyMap{{"name", std::string{"Lobby"}}});
        engine.make_change(sid, "bob", bc::ChangeType::property_change, "room_5", "room",
                           bc::PropertyMap{{"name", std::string{"Reception"}}});
        engine.wait_until_idle();

        for (const auto& conflict : engine.get_conflicts(sid, "alice")) {
            std::printf("conflict %s on %s between %s and %s\n",
                        conflict.conflict_id.c_str(), conflict.element_id.c_str(),
                        conflict.user_id_1.c_str(), conflict.user_id_2.c_str());
            engine.resolve_conflict(sid, conflict.conflict_id,
                                    bc::Resolution::last_writer_wins, "alice");
        }

        // -- Versioning -------------------------------------------------------
        for (int i = 0; i < 12; ++i) {
            engine.make_change(sid, "bob", bc::ChangeType::create,
                               "column_" + std::to_string(i), "column",
                               bc::PropertyMap{{"height", std::int64_t{4}}});
        }
        engine.wait_until_idle();
        engine.create_version(sid, "alice", "Structural grid", {"milestone"});

        for (const auto& version : engine.get_versions(sid, "carol")) {
            std::printf("v%llu %-16s %zu changes\n",
                        static_cast<unsigned long long>(version.version_number),
                        version.description.c_str(), version.changes.size());
        }

        // -- Status and export ------------------------------------------------
        const auto status = nlohmann::json(engine.get_session_status(sid));
        std::printf("%s\n", status.dump(2).c_str());

        const auto archive = bc::export_archive(engine, sid, "carol");
        std::printf("archive: %zu bytes\n", archive.size());
    } catch (const std::exception& e) {
        PLOGE << "collaboration_demo failed: " << e.what();
        return 1;
    }
    return 0;
}
