#pragma once

// Raw DEFLATE streams for session archives.
//
// An archive is the UTF-8 JSON export deflated with no zlib/gzip header
// (windowBits = -15). Both directions stream through a fixed-size chunk
// so neither side needs to guess the output size up front.
//
// Internal header — not installed.

#include <array>
#include <cstddef>
#include <optional>
#include <span>
#include <vector>

#include <zlib.h>

namespace bimcollab::detail {

inline constexpr std::size_t archive_chunk_size = 16 * 1024;

// Archives above this size are treated as corrupt when inflating.
inline constexpr std::size_t max_archive_size = std::size_t{256} * 1024 * 1024;

inline auto deflate_compress(std::span<const std::byte> input)
    -> std::optional<std::vector<std::byte>> {
    auto stream = z_stream{};
    if (::deflateInit2(&stream, Z_BEST_COMPRESSION, Z_DEFLATED, -15, 8,
                       Z_DEFAULT_STRATEGY) != Z_OK) {
        return std::nullopt;
    }

    stream.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(input.data()));
    stream.avail_in = static_cast<uInt>(input.size());

    auto output = std::vector<std::byte>{};
    auto chunk = std::array<std::byte, archive_chunk_size>{};
    auto ret = Z_OK;
    while (ret == Z_OK) {
        stream.next_out = reinterpret_cast<Bytef*>(chunk.data());
        stream.avail_out = static_cast<uInt>(chunk.size());
        ret = ::deflate(&stream, Z_FINISH);
        if (ret == Z_STREAM_ERROR) break;
        output.insert(output.end(), chunk.begin(), chunk.end() - stream.avail_out);
    }
    ::deflateEnd(&stream);

    if (ret != Z_STREAM_END) return std::nullopt;
    return output;
}

// Returns nullopt on malformed or truncated input, or when the inflated
// size would exceed `max_output_size`.
inline auto deflate_decompress(std::span<const std::byte> input,
                               std::size_t max_output_size = max_archive_size)
    -> std::optional<std::vector<std::byte>> {
    if (input.empty()) return std::nullopt;

    auto stream = z_stream{};
    if (::inflateInit2(&stream, -15) != Z_OK) return std::nullopt;

    stream.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(input.data()));
    stream.avail_in = static_cast<uInt>(input.size());

    auto output = std::vector<std::byte>{};
    auto chunk = std::array<std::byte, archive_chunk_size>{};
    auto ret = Z_OK;
    while (ret == Z_OK) {
        stream.next_out = reinterpret_cast<Bytef*>(chunk.data());
        stream.avail_out = static_cast<uInt>(chunk.size());
        ret = ::inflate(&stream, Z_NO_FLUSH);
        const auto produced = chunk.size() - stream.avail_out;
        if (output.size() + produced > max_output_size) {
            ret = Z_MEM_ERROR;
            break;
        }
        output.insert(output.end(), chunk.begin(), chunk.begin() + produced);
        // Input exhausted before the end-of-stream marker.
        if (ret == Z_OK && stream.avail_in == 0 && produced == 0) {
            ret = Z_DATA_ERROR;
        }
    }
    ::inflateEnd(&stream);

    if (ret != Z_STREAM_END) return std::nullopt;
    return output;
}

}  // namespace bimcollab::detail
