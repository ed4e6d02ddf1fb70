#pragma once

// Raw DEFLATE (no zlib/gzip header) for history snapshots.
//
// Internal header — not installed.

#include <array>
#include <cstddef>
#include <optional>
#include <span>
#include <vector>

#include <zlib.h>

namespace docspan_cpp::storage {

// Inflated snapshots larger than this are rejected.
inline constexpr std::size_t max_inflated_size = std::size_t{256} * 1024 * 1024;

inline auto deflate_compress(std::span<const std::byte> input)
    -> std::optional<std::vector<std::byte>> {

    auto stream = z_stream{};
    // windowBits = -15 selects raw deflate
    if (::deflateInit2(&stream, Z_BEST_SPEED, Z_DEFLATED, -15, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
        return std::nullopt;
    }

    auto output = std::vector<std::byte>(::deflateBound(&stream, static_cast<uLong>(input.size())));
    stream.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(input.data()));
    stream.avail_in = static_cast<uInt>(input.size());
    stream.next_out = reinterpret_cast<Bytef*>(output.data());
    stream.avail_out = static_cast<uInt>(output.size());

    auto ret = ::deflate(&stream, Z_FINISH);
    ::deflateEnd(&stream);
    if (ret != Z_STREAM_END) return std::nullopt;

    output.resize(stream.total_out);
    return output;
}

// Inflate in fixed-size chunks until the stream ends. Truncated or corrupt
// input, trailing garbage and oversized output all yield nullopt.
inline auto deflate_decompress(std::span<const std::byte> input,
                               std::size_t max_output_size = max_inflated_size)
    -> std::optional<std::vector<std::byte>> {

    auto stream = z_stream{};
    if (::inflateInit2(&stream, -15) != Z_OK) return std::nullopt;

    stream.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(input.data()));
    stream.avail_in = static_cast<uInt>(input.size());

    auto output = std::vector<std::byte>{};
    auto chunk = std::array<std::byte, 16384>{};
    auto ret = Z_OK;
    while (ret == Z_OK) {
        stream.next_out = reinterpret_cast<Bytef*>(chunk.data());
        stream.avail_out = static_cast<uInt>(chunk.size());
        ret = ::inflate(&stream, Z_NO_FLUSH);
        auto produced = chunk.size() - stream.avail_out;
        if (output.size() + produced > max_output_size) {
            ret = Z_MEM_ERROR;
            break;
        }
        output.insert(output.end(), chunk.begin(), chunk.begin() + static_cast<std::ptrdiff_t>(produced));
        if (ret == Z_BUF_ERROR && stream.avail_in == 0) break;  // truncated
    }
    auto trailing = stream.avail_in;
    ::inflateEnd(&stream);

    if (ret != Z_STREAM_END || trailing != 0) return std::nullopt;
    return output;
}

}  // namespace docspan_cpp::storage
