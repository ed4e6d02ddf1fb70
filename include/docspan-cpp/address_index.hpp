/// @file address_index.hpp
/// @brief Stable addressing: the Address <-> Run index and the address minter.

#pragma once

#include <docspan-cpp/types.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace docspan_cpp {

/// Bidirectional index between stable addresses and Runs.
///
/// The index is the single source of truth for addressing: split and merge
/// primitives rebind entries explicitly, addressing is never derived from
/// tree traversal. The mapping is 1:1 but partial; a Run may be temporarily
/// unaddressed.
class AddressIndex {
public:
    /// Look up the Run currently bound to an address.
    /// @return The run handle, or nullopt if the address is unbound.
    auto resolve(std::string_view address) const -> std::optional<RunId>;

    /// Reverse lookup: the address currently bound to a Run.
    auto address_of(RunId run) const -> std::optional<Address>;

    /// Bind an address to a Run.
    ///
    /// Any previous binding of either side is dropped first, so the index
    /// stays 1:1 even if a caller forgets to unbind.
    void bind(RunId run, Address address);

    /// Remove the binding of an address. Unknown addresses are ignored.
    void unbind(std::string_view address);

    /// Remove the binding of a Run. Unbound runs are ignored.
    void unbind_run(RunId run);

    /// Check whether an address is bound.
    auto contains(std::string_view address) const -> bool;

    /// Number of bound addresses.
    auto size() const -> std::size_t { return by_address_.size(); }

    /// Drop every binding.
    void clear();

    auto operator==(const AddressIndex&) const -> bool = default;

private:
    std::unordered_map<Address, RunId> by_address_;
    std::unordered_map<RunId, Address> by_run_;
};

/// Mints fresh, never-repeating addresses.
///
/// An address is `Run_` + 16 hex digits of a per-minter salt + 16 hex digits
/// of a monotonically increasing counter. Keep one minter per session (not
/// per document) so restoring an older snapshot cannot rewind the counter.
class AddressMinter {
public:
    /// Construct with a random salt.
    AddressMinter();

    /// Construct with an explicit salt (deterministic, for tests).
    explicit AddressMinter(std::uint64_t salt);

    /// Mint a new address.
    auto mint() -> Address;

    /// Number of addresses minted so far.
    auto minted() const -> std::uint64_t { return counter_; }

private:
    std::uint64_t salt_;
    std::uint64_t counter_{0};
};

/// Mint an opaque random document identity (32 hex digits).
auto mint_doc_id() -> std::string;

}  // namespace docspan_cpp
