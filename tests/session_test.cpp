#include <bimcollab/error.hpp>
#include <bimcollab/session.hpp>
#include <bimcollab/session_store.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

using namespace bimcollab;
using namespace std::chrono_literals;

static const auto t0 = Timestamp{std::chrono::seconds{1'700'000'000}};

static auto make_session(std::string id) -> Session {
    auto session = Session{};
    session.session_id = std::move(id);
    session.model_id = "model-1";
    session.created_at = t0;
    session.last_activity = t0;
    add_member(session, make_user("alice", "Alice", "alice@example.com", Role::owner, t0));
    return session;
}

static auto make_change(std::string id, std::string user) -> Change {
    return Change{
        .change_id = std::move(id),
        .user_id = std::move(user),
        .timestamp = t0,
        .change_type = ChangeType::create,
        .element_id = "wall_1",
        .element_type = "wall",
        .old_value = std::nullopt,
        .new_value = PropertyMap{{"height", std::int64_t{10}}},
        .description = {},
        .metadata = {},
    };
}

// -- Members ------------------------------------------------------------------

TEST(Session, make_user_derives_permissions_from_role) {
    const auto user = make_user("bob", "Bob", "bob@example.com", Role::editor, t0);

    EXPECT_EQ(user.role, Role::editor);
    EXPECT_EQ(user.permissions, permissions_for_role(Role::editor));
    EXPECT_EQ(user.last_active, t0);
}

TEST(Session, add_member_registers_user_and_permissions) {
    auto session = make_session("s1");
    add_member(session, make_user("bob", "Bob", "bob@example.com", Role::viewer, t0));

    EXPECT_EQ(session.users.size(), 2u);
    EXPECT_TRUE(session.allows("bob", Permission::read));
    EXPECT_FALSE(session.allows("bob", Permission::write));
    EXPECT_TRUE(session.allows("alice", Permission::admin));
}

TEST(Session, rejoining_overwrites_role) {
    auto session = make_session("s1");
    add_member(session, make_user("bob", "Bob", "bob@example.com", Role::viewer, t0));
    add_member(session, make_user("bob", "Bob", "bob@example.com", Role::editor, t0));

    EXPECT_EQ(session.users.size(), 2u);
    EXPECT_EQ(session.users.at("bob").role, Role::editor);
    EXPECT_TRUE(session.allows("bob", Permission::write));
}

TEST(Session, remove_member_drops_permissions) {
    auto session = make_session("s1");
    add_member(session, make_user("bob", "Bob", "bob@example.com", Role::editor, t0));

    EXPECT_TRUE(remove_member(session, "bob"));
    EXPECT_FALSE(remove_member(session, "bob"));
    EXPECT_FALSE(session.users.contains("bob"));
    EXPECT_FALSE(session.allows("bob", Permission::read));
}

TEST(Session, strangers_are_not_allowed_anything) {
    const auto session = make_session("s1");
    EXPECT_FALSE(session.allows("mallory", Permission::read));
}

// -- Conflicts ----------------------------------------------------------------

TEST(Session, conflict_lookup_and_counts) {
    auto session = make_session("s1");
    auto a = make_change("c1", "alice");
    auto b = make_change("c2", "bob");
    session.conflicts.push_back(make_conflict("k1", a, b, 0.8));
    session.conflicts.push_back(make_conflict("k2", a, make_change("c3", "carol"), 0.8));
    mark_resolved(session.conflicts[1], Resolution::reject, "alice", t0);

    ASSERT_NE(session.find_conflict("k1"), nullptr);
    EXPECT_EQ(session.find_conflict("nope"), nullptr);
    EXPECT_TRUE(session.has_conflict_between("c2", "c1"));
    EXPECT_FALSE(session.has_conflict_between("c2", "c3"));
    EXPECT_EQ(session.unresolved_conflict_count(), 1u);
}

TEST(Session, status_summarises_counts_and_users) {
    auto session = make_session("s1");
    add_member(session, make_user("bob", "Bob", "bob@example.com", Role::editor, t0 + 5s));
    session.journal.append(make_change("c1", "alice"));
    session.journal.append(make_change("c2", "bob"));
    session.conflicts.push_back(make_conflict("k1", make_change("c1", "alice"),
                                              make_change("c2", "bob"), 0.8));

    const auto status = make_status(session);

    EXPECT_EQ(status.session_id, "s1");
    EXPECT_EQ(status.model_id, "model-1");
    EXPECT_EQ(status.user_count, 2u);
    EXPECT_EQ(status.active_change_count, 2u);
    EXPECT_EQ(status.conflict_count, 1u);
    EXPECT_EQ(status.unresolved_conflict_count, 1u);
    EXPECT_EQ(status.version_count, 0u);
    ASSERT_EQ(status.users.size(), 2u);
    auto bob = std::ranges::find(status.users, std::string{"bob"}, &UserActivity::user_id);
    ASSERT_NE(bob, status.users.end());
    EXPECT_EQ(bob->role, Role::editor);
    EXPECT_EQ(bob->last_active, t0 + 5s);
}

// -- Versions -----------------------------------------------------------------

TEST(Session, fold_journal_numbers_and_chains_versions) {
    auto session = make_session("s1");
    session.journal.append(make_change("c1", "alice"), ChangeStatus::applied);
    session.journal.append(make_change("c2", "alice"), ChangeStatus::applied);

    const auto v1_id = fold_journal(session, "v1", "alice", "First", {"baseline"}, t0 + 1s).version_id;
    session.journal.append(make_change("c3", "alice"), ChangeStatus::applied);
    const auto& v2 = fold_journal(session, "v2", "alice", "Second", {}, t0 + 2s);

    EXPECT_EQ(v1_id, "v1");
    ASSERT_EQ(session.versions.size(), 2u);
    EXPECT_EQ(session.versions[0].version_number, 1u);
    EXPECT_FALSE(session.versions[0].parent_version.has_value());
    EXPECT_EQ(session.versions[0].changes.size(), 2u);
    EXPECT_EQ(session.versions[0].tags, (std::vector<std::string>{"baseline"}));

    EXPECT_EQ(v2.version_number, 2u);
    EXPECT_EQ(v2.parent_version, "v1");
    ASSERT_EQ(v2.changes.size(), 1u);
    EXPECT_EQ(v2.changes[0].change_id, "c3");
    EXPECT_TRUE(session.journal.empty());
    EXPECT_EQ(session.last_activity, t0 + 2s);
}

TEST(Session, fold_empty_journal_still_creates_version) {
    auto session = make_session("s1");
    const auto& v = fold_journal(session, "v1", "alice", "Empty", {}, t0);

    EXPECT_EQ(v.version_number, 1u);
    EXPECT_TRUE(v.changes.empty());
}

// -- Branches -----------------------------------------------------------------

TEST(Session, branch_copies_history_but_not_journal) {
    auto parent = make_session("s1");
    add_member(parent, make_user("bob", "Bob", "bob@example.com", Role::editor, t0));
    parent.journal.append(make_change("c1", "alice"), ChangeStatus::applied);
    fold_journal(parent, "v1", "alice", "First", {}, t0);
    parent.journal.append(make_change("c2", "bob"));
    parent.conflicts.push_back(make_conflict("k1", make_change("c1", "alice"),
                                             make_change("c2", "bob"), 0.8));

    const auto branch = branch_session(parent, "s2", "feature", "Try a new layout", t0 + 10s);

    EXPECT_EQ(branch.session_id, "s2");
    EXPECT_EQ(branch.model_id, parent.model_id);
    EXPECT_EQ(branch.parent_session, "s1");
    EXPECT_EQ(branch.name, "feature");
    EXPECT_EQ(branch.description, "Try a new layout");
    EXPECT_EQ(branch.users, parent.users);
    EXPECT_EQ(branch.permissions, parent.permissions);
    EXPECT_EQ(branch.versions, parent.versions);
    EXPECT_TRUE(branch.journal.empty());
    EXPECT_TRUE(branch.conflicts.empty());
    EXPECT_EQ(branch.created_at, t0 + 10s);
}

// -- SessionStore -------------------------------------------------------------

TEST(SessionStore, insert_find_and_get) {
    auto store = SessionStore{};
    store.insert(make_session("s1"));

    EXPECT_TRUE(store.contains("s1"));
    EXPECT_EQ(store.size(), 1u);

    auto lock = store.lock();
    ASSERT_NE(store.find("s1"), nullptr);
    EXPECT_EQ(store.get("s1").model_id, "model-1");
    EXPECT_EQ(store.find("s2"), nullptr);
}

TEST(SessionStore, get_unknown_throws_session_not_found) {
    const auto store = SessionStore{};
    auto lock = store.lock();
    try {
        (void)store.get("missing");
        FAIL() << "expected CollabError";
    } catch (const CollabError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::session_not_found);
        EXPECT_EQ(std::string{e.what()}, "Session missing not found");
    }
}

TEST(SessionStore, lock_is_reentrant) {
    auto store = SessionStore{};
    auto outer = store.lock();
    store.insert(make_session("s1"));
    auto inner = store.lock();
    EXPECT_TRUE(store.contains("s1"));
}

TEST(SessionStore, session_ids_are_sorted) {
    auto store = SessionStore{};
    store.insert(make_session("b"));
    store.insert(make_session("a"));

    EXPECT_EQ(store.session_ids(), (std::vector<std::string>{"a", "b"}));
}
