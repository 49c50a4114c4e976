/**
 * @file byte_order.hh
 * @brief Byte order (endianness) utilities for shapefile streams
 */

#pragma once

#include <shp/endian.hh>

namespace shp {
    /**
     * @enum byte_order
     * @brief Byte order for reading multi-byte values
     *
     * The geometry stream mixes both: lengths and record numbers are
     * big-endian, type codes and coordinates are little-endian.
     */
    enum class byte_order {
        little, ///< Shape type codes, coordinates, dBASE header fields
        big     ///< File length, record number, content length
    };

    /**
     * @brief Check if given byte order matches the native system byte order
     * @param bo Byte order to check
     * @return True if the byte order matches the system's native byte order
     */
    inline bool byte_order_native(byte_order bo) {
        switch (bo) {
            case byte_order::little:
                return is_little_endian;
            case byte_order::big:
                return is_big_endian;
        }
        // make compiler happy
        return false;
    }
}
