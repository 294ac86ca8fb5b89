#pragma once

#include <charconv>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <vector>
#include "image_decoder.hpp"
#include "log.hpp"

namespace cogstream {

/// Reader configuration
struct ReaderOptions {
    /// Bytes fetched in one request when opening; directory and tag reads inside
    /// this prefix are served from memory.
    uint64_t header_chunk_size = 16384;

    /// Upper bound on IFDs walked in the chain
    std::size_t max_ifds = 1024;

    /// Concurrent tile fetches per read; 0 means std::thread::hardware_concurrency()
    std::size_t max_concurrency = 0;

    /// Relative tolerance under which two resolutions count as equal when selecting an overview
    double resolution_tolerance = 0.01;

    /// Relative tolerance on the x2 ratio between consecutive overview levels
    double decimation_tolerance = 0.05;

    /// Relative tolerance on the x4 ratio between the chunk counts of consecutive levels
    double tile_count_tolerance = 0.05;

    LogLevel log_level = LogLevel::Warn;
    LogSink log_sink;

    /// Decoders for image-format tiles, keyed by Compression tag value.
    /// When no entry exists for JPEG (7), a libjpeg decoder is used.
    ImageDecoderRegistry image_decoders;

    [[nodiscard]] Logger make_logger() const {
        return Logger(log_level, log_sink);
    }

    /// Defaults overlaid with COGSTREAM_* environment variables:
    ///   COGSTREAM_HEADER_CHUNK_SIZE, COGSTREAM_MAX_CONCURRENCY,
    ///   COGSTREAM_MAX_IFDS, COGSTREAM_LOG_LEVEL
    /// Malformed values are ignored with a warning, logged at the resulting level
    /// and also appended to `warnings` when given.
    [[nodiscard]] static ReaderOptions from_env(std::vector<std::string>* warnings = nullptr);
};

namespace detail {

[[nodiscard]] inline bool parse_unsigned(std::string_view text, uint64_t& out) noexcept {
    if (text.empty()) {
        return false;
    }
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
    return ec == std::errc{} && ptr == text.data() + text.size();
}

} // namespace detail

inline ReaderOptions ReaderOptions::from_env(std::vector<std::string>* warnings) {
    ReaderOptions options;
    std::vector<std::string> ignored;

    auto warn = [&](std::string message) {
        ignored.push_back(std::move(message));
    };

    auto read_unsigned = [&](const char* name, auto& field, uint64_t minimum) {
        const char* raw = std::getenv(name);
        if (!raw) {
            return;
        }
        uint64_t value = 0;
        if (!detail::parse_unsigned(raw, value) || value < minimum) {
            warn(std::string("ignoring ") + name + "=" + raw);
            return;
        }
        field = static_cast<std::remove_reference_t<decltype(field)>>(value);
    };

    read_unsigned("COGSTREAM_HEADER_CHUNK_SIZE", options.header_chunk_size, 16);
    read_unsigned("COGSTREAM_MAX_CONCURRENCY", options.max_concurrency, 0);
    read_unsigned("COGSTREAM_MAX_IFDS", options.max_ifds, 1);

    if (const char* raw = std::getenv("COGSTREAM_LOG_LEVEL")) {
        if (auto level = parse_log_level(raw)) {
            options.log_level = *level;
        } else {
            warn(std::string("ignoring COGSTREAM_LOG_LEVEL=") + raw);
        }
    }

    const Logger logger = options.make_logger();
    for (const auto& message : ignored) {
        logger.warn("{}", message);
    }
    if (warnings) {
        warnings->insert(warnings->end(), ignored.begin(), ignored.end());
    }
    return options;
}

} // namespace cogstream
