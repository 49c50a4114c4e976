/**
 * @file read_options.hh
 * @brief Options controlling sequential shapefile decoding
 */

#pragma once

#include <functional>
#include <string_view>
#include <cstdint>

namespace shp {

    /**
     * @struct read_options
     * @brief Configuration options for reading a shapefile stream pair
     */
    struct read_options {
        /**
         * @brief Maximum allowed record content length in bytes
         *
         * Records declaring a larger content length are rejected with
         * frame_decode_error before any payload byte is read.
         * Default is 256MB.
         */
        std::uint64_t max_record_size = std::uint64_t(1) << 28;

        /**
         * @typedef warning_handler
         * @brief Callback function type for handling warnings
         * @param offset Geometry stream offset where the warning occurred
         * @param category Warning category (e.g., "record_number", "file_length")
         * @param message Human-readable warning message
         */
        using warning_handler = std::function<void(
            std::uint64_t offset,
            std::string_view category,
            std::string_view message
        )>;

        /**
         * @brief Optional warning handler callback
         *
         * If set, will be called for non-fatal issues during reading.
         * If not set, warnings are silently ignored.
         */
        warning_handler on_warning;
    };

} // namespace shp
