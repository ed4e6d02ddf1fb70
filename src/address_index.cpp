#include <docspan-cpp/address_index.hpp>

#include <random>

namespace docspan_cpp {

namespace {

void append_hex64(std::string& out, std::uint64_t value) {
    static constexpr char hex_chars[] = "0123456789abcdef";
    for (int shift = 60; shift >= 0; shift -= 4) {
        out.push_back(hex_chars[(value >> shift) & 0x0F]);
    }
}

auto random_u64() -> std::uint64_t {
    static thread_local auto engine = std::mt19937_64{std::random_device{}()};
    return engine();
}

}  // anonymous namespace

// -- AddressIndex -------------------------------------------------------------

auto AddressIndex::resolve(std::string_view address) const -> std::optional<RunId> {
    auto it = by_address_.find(Address{address});
    if (it == by_address_.end()) return std::nullopt;
    return it->second;
}

auto AddressIndex::address_of(RunId run) const -> std::optional<Address> {
    auto it = by_run_.find(run);
    if (it == by_run_.end()) return std::nullopt;
    return it->second;
}

void AddressIndex::bind(RunId run, Address address) {
    unbind(address);
    unbind_run(run);
    by_run_[run] = address;
    by_address_[std::move(address)] = run;
}

void AddressIndex::unbind(std::string_view address) {
    auto it = by_address_.find(Address{address});
    if (it == by_address_.end()) return;
    by_run_.erase(it->second);
    by_address_.erase(it);
}

void AddressIndex::unbind_run(RunId run) {
    auto it = by_run_.find(run);
    if (it == by_run_.end()) return;
    by_address_.erase(it->second);
    by_run_.erase(it);
}

auto AddressIndex::contains(std::string_view address) const -> bool {
    return by_address_.contains(Address{address});
}

void AddressIndex::clear() {
    by_address_.clear();
    by_run_.clear();
}

// -- AddressMinter ------------------------------------------------------------

AddressMinter::AddressMinter() : salt_{random_u64()} {}

AddressMinter::AddressMinter(std::uint64_t salt) : salt_{salt} {}

auto AddressMinter::mint() -> Address {
    auto address = Address{"Run_"};
    address.reserve(4 + 32);
    append_hex64(address, salt_);
    append_hex64(address, ++counter_);
    return address;
}

auto mint_doc_id() -> std::string {
    auto id = std::string{};
    id.reserve(32);
    append_hex64(id, random_u64());
    append_hex64(id, random_u64());
    return id;
}

}  // namespace docspan_cpp
