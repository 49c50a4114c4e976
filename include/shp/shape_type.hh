/**
 * @file shape_type.hh
 * @brief Shape type codes of the geometry stream
 */

#pragma once

#include <cstdint>
#include <string>
#include <shp/export_shp.h>

namespace shp {

    /**
     * @enum shape_type
     * @brief Geometry type code as stored in the header and in every record
     *
     * Any 32-bit value can appear in a stream, so values outside the
     * enumerators are legal here; is_known() tells them apart.
     */
    enum class shape_type : std::int32_t {
        null_shape   = 0,
        point        = 1,
        polyline     = 3,
        polygon      = 5,
        multipoint   = 8,
        point_z      = 11,
        polyline_z   = 13,
        polygon_z    = 15,
        multipoint_z = 18,
        point_m      = 21,
        polyline_m   = 23,
        polygon_m    = 25,
        multipoint_m = 28,
        multipatch   = 31
    };

    SHP_EXPORT bool is_known(shape_type type);

    // True for the Z variants and multipatch
    SHP_EXPORT bool has_z(shape_type type);

    // True for types that may carry measures (Z and M variants, multipatch)
    SHP_EXPORT bool has_m(shape_type type);

    SHP_EXPORT std::string to_string(shape_type type);

} // namespace shp
