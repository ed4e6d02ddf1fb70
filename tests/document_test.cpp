#include <docspan-cpp/document.hpp>

#include <gtest/gtest.h>

#include <string>

using namespace docspan_cpp;

// -- Construction and reading -------------------------------------------------

TEST(Document, default_is_empty) {
    const auto doc = Document{};
    EXPECT_EQ(doc.paragraph_count(), 0u);
    EXPECT_EQ(doc.run_count(), 0u);
    EXPECT_EQ(doc.text(), "");
}

TEST(Document, append_builds_reading_order) {
    auto doc = Document{};
    auto p1 = doc.append_paragraph();
    auto r1 = doc.append_run(p1, "Hello", RunFormat{});
    auto r2 = doc.append_run(p1, " World", RunFormat{});
    auto p2 = doc.append_paragraph();
    auto r3 = doc.append_run(p2, "Second", RunFormat{});

    EXPECT_EQ(doc.paragraph_count(), 2u);
    EXPECT_EQ(doc.run_count(), 3u);
    EXPECT_EQ(doc.text(), "Hello World\nSecond");
    EXPECT_EQ(doc.paragraph_text(p1), "Hello World");
    EXPECT_EQ(doc.runs_in_order(), (std::vector<RunId>{r1, r2, r3}));
    EXPECT_EQ(*doc.paragraph_index(p2), 1u);
    EXPECT_EQ(*doc.run_index(r2), 1u);
    EXPECT_EQ(doc.run(r3)->paragraph, p2);
}

TEST(Document, append_run_to_unknown_paragraph_fails) {
    auto doc = Document{};
    EXPECT_EQ(doc.append_run(42, "lost", RunFormat{}), 0u);
    EXPECT_EQ(doc.run_count(), 0u);
}

TEST(Document, run_length_counts_code_points) {
    auto doc = Document{};
    auto p = doc.append_paragraph();
    auto r = doc.append_run(p, "caf\xC3\xA9", RunFormat{});
    EXPECT_EQ(doc.run_length(r), 4u);
    EXPECT_EQ(doc.run_length(999), 0u);
}

TEST(Document, next_and_prev_cross_paragraphs_and_skip_empty_ones) {
    auto doc = Document{};
    auto p1 = doc.append_paragraph();
    auto r1 = doc.append_run(p1, "a", RunFormat{});
    doc.append_paragraph();  // empty
    auto p3 = doc.append_paragraph();
    auto r3 = doc.append_run(p3, "c", RunFormat{});

    EXPECT_EQ(doc.next_run(r1), r3);
    EXPECT_EQ(doc.prev_run(r3), r1);
    EXPECT_FALSE(doc.next_run(r3).has_value());
    EXPECT_FALSE(doc.prev_run(r1).has_value());
}

TEST(Document, precedes_follows_reading_order) {
    auto doc = Document{};
    auto p1 = doc.append_paragraph();
    auto r1 = doc.append_run(p1, "a", RunFormat{});
    auto r2 = doc.append_run(p1, "b", RunFormat{});
    auto p2 = doc.append_paragraph();
    auto r3 = doc.append_run(p2, "c", RunFormat{});

    EXPECT_TRUE(doc.precedes(r1, r2));
    EXPECT_TRUE(doc.precedes(r2, r3));
    EXPECT_FALSE(doc.precedes(r3, r1));
    EXPECT_FALSE(doc.precedes(r1, r1));
}

// -- Addressing ---------------------------------------------------------------

TEST(Document, resolve_goes_through_the_index) {
    auto doc = Document{};
    auto p = doc.append_paragraph();
    auto r = doc.append_run(p, "Hello", RunFormat{});
    doc.addresses().bind(r, "Run_hello");

    ASSERT_NE(doc.resolve("Run_hello"), nullptr);
    EXPECT_EQ(doc.resolve("Run_hello")->text, "Hello");
    EXPECT_EQ(doc.resolve("Run_missing"), nullptr);
}

TEST(Document, remove_run_drops_its_binding) {
    auto doc = Document{};
    auto p = doc.append_paragraph();
    auto r1 = doc.append_run(p, "a", RunFormat{});
    auto r2 = doc.append_run(p, "b", RunFormat{});
    doc.addresses().bind(r1, "Run_a");
    doc.addresses().bind(r2, "Run_b");

    doc.remove_run(r1);
    EXPECT_FALSE(doc.addresses().contains("Run_a"));
    EXPECT_TRUE(doc.addresses().contains("Run_b"));
    EXPECT_EQ(doc.paragraph(p)->runs, (std::vector<RunId>{r2}));
}

TEST(Document, remove_paragraph_drops_runs_and_bindings) {
    auto doc = Document{};
    auto p1 = doc.append_paragraph();
    auto r1 = doc.append_run(p1, "a", RunFormat{});
    auto p2 = doc.append_paragraph();
    doc.append_run(p2, "b", RunFormat{});
    doc.addresses().bind(r1, "Run_a");

    doc.remove_paragraph(p1);
    EXPECT_EQ(doc.paragraph_count(), 1u);
    EXPECT_EQ(doc.run_count(), 1u);
    EXPECT_FALSE(doc.addresses().contains("Run_a"));
    EXPECT_EQ(doc.text(), "b");
}

TEST(Document, address_unbound_runs_keeps_existing_bindings) {
    auto doc = Document{};
    auto p = doc.append_paragraph();
    auto r1 = doc.append_run(p, "a", RunFormat{});
    auto r2 = doc.append_run(p, "b", RunFormat{});
    doc.addresses().bind(r1, "Run_keep");

    auto minter = AddressMinter{5};
    doc.address_unbound_runs(minter);

    EXPECT_EQ(*doc.addresses().address_of(r1), "Run_keep");
    EXPECT_EQ(*doc.addresses().address_of(r2), "Run_00000000000000050000000000000001");
    EXPECT_EQ(minter.minted(), 1u);
}

TEST(Document, readdress_all_runs_replaces_every_binding) {
    auto doc = Document{};
    auto p = doc.append_paragraph();
    auto r1 = doc.append_run(p, "a", RunFormat{});
    doc.append_run(p, "b", RunFormat{});
    doc.addresses().bind(r1, "Run_old");

    auto minter = AddressMinter{5};
    doc.readdress_all_runs(minter);

    EXPECT_FALSE(doc.addresses().contains("Run_old"));
    EXPECT_EQ(doc.addresses().size(), 2u);
    EXPECT_EQ(minter.minted(), 2u);
}

// -- Structure ----------------------------------------------------------------

TEST(Document, insert_runs_before_and_after_anchor) {
    auto doc = Document{};
    auto p = doc.append_paragraph();
    auto mid = doc.append_run(p, "b", RunFormat{});
    doc.insert_run_before(mid, "a", RunFormat{});
    doc.insert_run_after(mid, "c", RunFormat{});
    EXPECT_EQ(doc.text(), "abc");
}

TEST(Document, insert_paragraph_after_places_it_in_order) {
    auto doc = Document{};
    auto p1 = doc.append_paragraph();
    doc.append_run(p1, "one", RunFormat{});
    auto p3 = doc.append_paragraph();
    doc.append_run(p3, "three", RunFormat{});
    auto p2 = doc.insert_paragraph_after(p1, ParagraphFormat{});
    doc.append_run(p2, "two", RunFormat{});

    EXPECT_EQ(doc.text(), "one\ntwo\nthree");
}

TEST(Document, append_paragraph_as_keeps_a_free_id) {
    auto doc = Document{};
    EXPECT_EQ(doc.append_paragraph_as(5, ParagraphFormat{}), 5u);
    EXPECT_EQ(doc.append_paragraph_as(2, ParagraphFormat{}), 2u);
    EXPECT_EQ(doc.append_paragraph(), 6u);

    // Taken or zero ids fall back to a fresh one.
    EXPECT_EQ(doc.append_paragraph_as(5, ParagraphFormat{}), 7u);
    EXPECT_EQ(doc.append_paragraph_as(0, ParagraphFormat{}), 8u);
    EXPECT_EQ(doc.paragraph_count(), 5u);
}

TEST(Document, split_paragraph_moves_tail_runs_and_keeps_format) {
    auto doc = Document{};
    auto p = doc.append_paragraph(ParagraphFormat{Alignment::center, 10.0});
    doc.append_run(p, "a", RunFormat{});
    auto r2 = doc.append_run(p, "b", RunFormat{});
    auto r3 = doc.append_run(p, "c", RunFormat{});

    auto q = doc.split_paragraph_at(r2);
    EXPECT_EQ(doc.text(), "a\nbc");
    EXPECT_EQ(doc.paragraph(q)->format.alignment, Alignment::center);
    EXPECT_EQ(doc.run(r2)->paragraph, q);
    EXPECT_EQ(doc.run(r3)->paragraph, q);
}

TEST(Document, merge_paragraphs_reparents_runs) {
    auto doc = Document{};
    auto p1 = doc.append_paragraph();
    doc.append_run(p1, "Hello", RunFormat{});
    auto p2 = doc.append_paragraph();
    auto r2 = doc.append_run(p2, "World", RunFormat{});
    doc.addresses().bind(r2, "Run_world");

    doc.merge_paragraphs(p1, p2);
    EXPECT_EQ(doc.paragraph_count(), 1u);
    EXPECT_EQ(doc.text(), "HelloWorld");
    EXPECT_EQ(doc.resolve("Run_world")->paragraph, p1);
}

TEST(Document, copies_are_deep) {
    auto doc = Document{};
    auto p = doc.append_paragraph();
    auto r = doc.append_run(p, "Hello", RunFormat{});
    doc.addresses().bind(r, "Run_a");

    auto copy = doc;
    EXPECT_EQ(copy, doc);

    copy.run(r)->text = "Changed";
    copy.addresses().unbind("Run_a");
    EXPECT_EQ(doc.run(r)->text, "Hello");
    EXPECT_TRUE(doc.addresses().contains("Run_a"));
    EXPECT_NE(copy, doc);
}
