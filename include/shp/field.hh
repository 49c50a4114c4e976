/**
 * @file field.hh
 * @brief Attribute column descriptor
 */

#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace shp {

    /**
     * @struct field
     * @brief One column of the attribute table
     */
    struct field {
        std::array<char, 11> name{};  ///< NUL padded column name, as stored
        char type = 'C';              ///< dBASE type tag (C, N, F, D, L, M, ...)
        std::uint8_t size = 0;        ///< Width of the value in a row, in bytes
        std::uint8_t precision = 0;   ///< Decimal count for numeric columns

        // Name without the NUL padding
        [[nodiscard]] std::string name_string() const {
            std::size_t len = 0;
            while (len < name.size() && name[len] != '\0') {
                ++len;
            }
            return {name.data(), len};
        }
    };

} // namespace shp
