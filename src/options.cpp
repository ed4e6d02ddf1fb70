#include <docspan-cpp/options.hpp>

#include <docspan-cpp/json.hpp>

#include <spdlog/fmt/fmt.h>

#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>

namespace docspan_cpp {

auto parse_config(std::string_view text) -> Config {
    try {
        auto j = nlohmann::json::parse(text.begin(), text.end());
        if (!j.is_object()) {
            throw std::runtime_error{"invalid configuration: expected a JSON object"};
        }
        return Config{j.get<SessionOptions>(), j.get<EngineOptions>()};
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error{fmt::format("invalid configuration: {}", e.what())};
    }
}

auto load_config(const std::filesystem::path& path) -> Config {
    auto in = std::ifstream{path, std::ios::binary};
    if (!in) {
        throw std::runtime_error{fmt::format("cannot open configuration file {}", path.string())};
    }
    auto text = std::string{std::istreambuf_iterator<char>{in}, std::istreambuf_iterator<char>{}};
    try {
        return parse_config(text);
    } catch (const std::runtime_error& e) {
        throw std::runtime_error{fmt::format("{}: {}", path.string(), e.what())};
    }
}

}  // namespace docspan_cpp
