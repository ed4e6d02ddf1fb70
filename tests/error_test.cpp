#include <docspan-cpp/error.hpp>

#include <gtest/gtest.h>

using namespace docspan_cpp;

TEST(ErrorKind, to_string_view_covers_all_variants) {
    EXPECT_EQ(to_string_view(ErrorKind::doc_conflict),            "doc_conflict");
    EXPECT_EQ(to_string_view(ErrorKind::version_conflict),        "version_conflict");
    EXPECT_EQ(to_string_view(ErrorKind::address_not_found),       "address_not_found");
    EXPECT_EQ(to_string_view(ErrorKind::invalid_document_format), "invalid_document_format");
    EXPECT_EQ(to_string_view(ErrorKind::render_failure),          "render_failure");
    EXPECT_EQ(to_string_view(ErrorKind::invalid_request),         "invalid_request");
}

TEST(Error, construction_and_equality) {
    const auto e1 = Error{ErrorKind::version_conflict, "stale"};
    const auto e2 = Error{ErrorKind::version_conflict, "stale"};
    const auto e3 = Error{ErrorKind::doc_conflict, "stale"};

    EXPECT_EQ(e1, e2);
    EXPECT_NE(e1, e3);
}

TEST(Error, different_messages_are_not_equal) {
    const auto e1 = Error{ErrorKind::invalid_request, "foo"};
    const auto e2 = Error{ErrorKind::invalid_request, "bar"};

    EXPECT_NE(e1, e2);
}

TEST(Error, kind_and_message_are_accessible) {
    const auto e = Error{ErrorKind::address_not_found, "Run_gone"};

    EXPECT_EQ(e.kind, ErrorKind::address_not_found);
    EXPECT_EQ(e.message, "Run_gone");
}
