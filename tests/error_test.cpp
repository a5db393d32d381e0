#include <bimcollab/error.hpp>

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

using namespace bimcollab;

TEST(ErrorKind, to_string_view_covers_all_variants) {
    EXPECT_EQ(to_string_view(ErrorKind::session_not_found),   "session_not_found");
    EXPECT_EQ(to_string_view(ErrorKind::user_not_in_session), "user_not_in_session");
    EXPECT_EQ(to_string_view(ErrorKind::permission_denied),   "permission_denied");
    EXPECT_EQ(to_string_view(ErrorKind::conflict_not_found),  "conflict_not_found");
    EXPECT_EQ(to_string_view(ErrorKind::invalid_config),      "invalid_config");
    EXPECT_EQ(to_string_view(ErrorKind::engine_stopped),      "engine_stopped");
}

TEST(Error, construction_and_equality) {
    const auto e1 = Error{ErrorKind::permission_denied, "no write"};
    const auto e2 = Error{ErrorKind::permission_denied, "no write"};
    const auto e3 = Error{ErrorKind::session_not_found, "no write"};

    EXPECT_EQ(e1, e2);
    EXPECT_NE(e1, e3);
}

TEST(Error, different_messages_are_not_equal) {
    const auto e1 = Error{ErrorKind::conflict_not_found, "foo"};
    const auto e2 = Error{ErrorKind::conflict_not_found, "bar"};

    EXPECT_NE(e1, e2);
}

TEST(CollabError, carries_kind_and_message) {
    const auto err = CollabError{ErrorKind::user_not_in_session, "User bob not in session s"};

    EXPECT_EQ(err.kind(), ErrorKind::user_not_in_session);
    EXPECT_EQ(err.error().message, "User bob not in session s");
    EXPECT_EQ(std::string{err.what()}, "User bob not in session s");
}

TEST(CollabError, is_a_runtime_error) {
    try {
        throw CollabError{Error{ErrorKind::engine_stopped, "Engine is shut down"}};
    } catch (const std::runtime_error& e) {
        EXPECT_EQ(std::string{e.what()}, "Engine is shut down");
        return;
    }
    FAIL() << "CollabError was not caught as std::runtime_error";
}
