#include "codec/zlib_codec.hpp"

#include <boost/iostreams/copy.hpp>
#include <boost/iostreams/device/array.hpp>
#include <boost/iostreams/device/back_inserter.hpp>
#include <boost/iostreams/filter/zlib.hpp>
#include <boost/iostreams/filtering_streambuf.hpp>

#include <fmt/format.h>

#include <ios>
#include <string>

namespace io = boost::iostreams;

namespace tsblob::codec {

namespace {

constexpr int kMinLevel = 0;
constexpr int kMaxLevel = 9;

[[nodiscard]] io::array_source as_source(std::span<const std::uint8_t> data) {
    return io::array_source{reinterpret_cast<const char*>(data.data()), data.size()};
}

[[nodiscard]] Bytes to_bytes(const std::vector<char>& buf) {
    return Bytes(buf.begin(), buf.end());
}

} // anonymous namespace

// ── deflate ───────────────────────────────────────────────────────────────────

Result<Bytes> deflate(std::span<const std::uint8_t> data, std::optional<int> level) {
    io::zlib_params params;
    if (level) {
        if (*level < kMinLevel || *level > kMaxLevel) {
            return make_general_error(
                fmt::format("compression level must be in [{}, {}], got {}",
                            kMinLevel, kMaxLevel, *level));
        }
        params.level = *level;
    }

    std::vector<char> compressed;
    compressed.reserve(data.size() / 2 + 64);

    try {
        io::filtering_streambuf<io::output> out;
        out.push(io::zlib_compressor(params));
        out.push(io::back_inserter(compressed));
        // copy() closes the chain, which flushes the final deflate block.
        io::copy(as_source(data), out);
    } catch (const io::zlib_error& e) {
        return make_internal_error("zlib", e.error(), e.what());
    } catch (const std::ios_base::failure& e) {
        return make_internal_error("io", e.code().value(), e.what());
    }

    return to_bytes(compressed);
}

// ── inflate ───────────────────────────────────────────────────────────────────

Result<Bytes> inflate(std::span<const std::uint8_t> data) {
    std::vector<char> decompressed;
    decompressed.reserve(data.size() * 3 + 64);

    try {
        io::filtering_streambuf<io::input> in;
        in.push(io::zlib_decompressor());
        in.push(as_source(data));
        // A stream that ends before zlib's end marker makes the decompressor
        // report Z_BUF_ERROR on the final flush, which surfaces here.
        io::copy(in, io::back_inserter(decompressed));
    } catch (const io::zlib_error& e) {
        return make_internal_error("zlib", e.error(), e.what());
    } catch (const std::ios_base::failure& e) {
        return make_internal_error("io", e.code().value(), e.what());
    }

    return to_bytes(decompressed);
}

} // namespace tsblob::codec
