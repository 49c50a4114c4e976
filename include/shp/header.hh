/**
 * @file header.hh
 * @brief Fixed 100-byte header of the geometry stream
 */

#pragma once

#include <cstdint>

#include <shp/export_shp.h>
#include <shp/shape.hh>
#include <shp/shape_type.hh>
#include <shp/read_options.hh>

namespace shp {

    class counting_reader;

    /**
     * @struct file_header
     * @brief Values kept from the geometry stream header
     */
    struct file_header {
        static constexpr std::size_t size = 100;
        static constexpr std::int32_t file_code = 9994;
        static constexpr std::int32_t version = 1000;

        shape_type geometry_type = shape_type::null_shape;  ///< Advisory, records carry their own type
        box bbox;                                           ///< Passed through unchecked
        std::uint64_t file_length = 0;                      ///< Declared stream length in bytes
    };

    /**
     * @brief Consume the geometry header without seeking
     *
     * The file length is big-endian and counted in 16-bit words; the type
     * code and the bounding box are little-endian. Z and M bounds are read
     * and dropped. An unexpected file code or version is reported through
     * options.on_warning only.
     *
     * @throws header_decode_error if the header cannot be read completely
     */
    SHP_EXPORT file_header read_header(counting_reader& in, const read_options& options);

} // namespace shp
