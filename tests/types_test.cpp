#include <docspan-cpp/address_index.hpp>
#include <docspan-cpp/types.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <set>
#include <string>

using namespace docspan_cpp;

// -- Caret / TextRange / Selection --------------------------------------------

TEST(Caret, default_offset_is_zero) {
    const auto c = Caret{};
    EXPECT_TRUE(c.address.empty());
    EXPECT_EQ(c.offset, 0u);
}

TEST(Caret, equality_compares_address_and_offset) {
    EXPECT_EQ((Caret{"Run_a", 3}), (Caret{"Run_a", 3}));
    EXPECT_NE((Caret{"Run_a", 3}), (Caret{"Run_a", 4}));
    EXPECT_NE((Caret{"Run_a", 3}), (Caret{"Run_b", 3}));
}

TEST(TextRange, equality_compares_both_ends) {
    const auto r1 = TextRange{Caret{"Run_a", 0}, Caret{"Run_b", 2}};
    const auto r2 = TextRange{Caret{"Run_a", 0}, Caret{"Run_b", 2}};
    const auto r3 = TextRange{Caret{"Run_a", 0}, Caret{"Run_b", 3}};
    EXPECT_EQ(r1, r2);
    EXPECT_NE(r1, r3);
}

TEST(Selection, collapsed_selection_has_no_focus) {
    const auto s = Selection{Caret{"Run_a", 1}, std::nullopt};
    EXPECT_FALSE(s.focus.has_value());
    EXPECT_NE(s, (Selection{Caret{"Run_a", 1}, Caret{"Run_a", 2}}));
}

TEST(DocIdentity, equality_compares_id_and_version) {
    EXPECT_EQ((DocIdentity{"abc", 2}), (DocIdentity{"abc", 2}));
    EXPECT_NE((DocIdentity{"abc", 2}), (DocIdentity{"abc", 3}));
    EXPECT_NE((DocIdentity{"abc", 2}), (DocIdentity{"abd", 2}));
}

// -- AddressMinter ------------------------------------------------------------

TEST(AddressMinter, mints_salted_counter_addresses) {
    auto minter = AddressMinter{0xabcdef};
    EXPECT_EQ(minter.mint(), "Run_0000000000abcdef0000000000000001");
    EXPECT_EQ(minter.mint(), "Run_0000000000abcdef0000000000000002");
    EXPECT_EQ(minter.minted(), 2u);
}

TEST(AddressMinter, addresses_never_repeat) {
    auto minter = AddressMinter{7};
    auto seen = std::set<Address>{};
    for (int i = 0; i < 1000; ++i) {
        seen.insert(minter.mint());
    }
    EXPECT_EQ(seen.size(), 1000u);
}

TEST(AddressMinter, distinct_salts_do_not_collide) {
    auto a = AddressMinter{1};
    auto b = AddressMinter{2};
    EXPECT_NE(a.mint(), b.mint());
}

TEST(AddressMinter, random_salt_has_fixed_shape) {
    auto minter = AddressMinter{};
    auto address = minter.mint();
    EXPECT_EQ(address.size(), 4u + 32u);
    EXPECT_TRUE(address.starts_with("Run_"));
    EXPECT_TRUE(std::ranges::all_of(address.substr(4), [](char c) {
        return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
    }));
}

TEST(DocId, is_32_lowercase_hex_digits) {
    auto id = mint_doc_id();
    EXPECT_EQ(id.size(), 32u);
    EXPECT_TRUE(std::ranges::all_of(id, [](char c) {
        return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
    }));
}

TEST(DocId, successive_ids_differ) {
    EXPECT_NE(mint_doc_id(), mint_doc_id());
}
