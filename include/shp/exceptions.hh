/**
 * @file exceptions.hh
 * @brief Exception classes and throwing macros for the shapefile library
 *
 * The decode errors derive from parse_error so callers can catch the whole
 * family at once, or a single kind when they need to tell a truncated file
 * from a mismatched attribute table.
 */

#pragma once

#include <stdexcept>
#include <string>
#include <sstream>

namespace shp {

    /**
     * @class shp_error
     * @brief Base exception class for all shapefile-related errors
     */
    class shp_error : public std::runtime_error {
    public:
        explicit shp_error(const std::string& msg)
            : std::runtime_error(msg) {}
    };

    /**
     * @class io_error
     * @brief The underlying byte source failed to read or to close
     */
    class io_error : public shp_error {
    public:
        explicit io_error(const std::string& msg)
            : shp_error(msg) {}
    };

    /**
     * @class parse_error
     * @brief Base of all format violations found while decoding
     */
    class parse_error : public shp_error {
    public:
        explicit parse_error(const std::string& msg)
            : shp_error(msg) {}
    };

    /**
     * @class header_decode_error
     * @brief The fixed geometry header or the attribute table header is malformed
     */
    class header_decode_error : public parse_error {
    public:
        explicit header_decode_error(const std::string& msg)
            : parse_error(msg) {}
    };

    /**
     * @class frame_decode_error
     * @brief A record frame (number, length, type, padding) could not be read
     */
    class frame_decode_error : public parse_error {
    public:
        explicit frame_decode_error(const std::string& msg)
            : parse_error(msg) {}
    };

    /**
     * @class unrecognized_shape_type_error
     * @brief A record declares a shape type code with no decoder
     */
    class unrecognized_shape_type_error : public parse_error {
    public:
        explicit unrecognized_shape_type_error(const std::string& msg)
            : parse_error(msg) {}
    };

    /**
     * @class payload_decode_error
     * @brief A geometry payload ended or failed before its layout was complete
     */
    class payload_decode_error : public parse_error {
    public:
        explicit payload_decode_error(const std::string& msg)
            : parse_error(msg) {}
    };

    /**
     * @class framing_mismatch_error
     * @brief A geometry payload needs more bytes than its record declares
     */
    class framing_mismatch_error : public parse_error {
    public:
        explicit framing_mismatch_error(const std::string& msg)
            : parse_error(msg) {}
    };

    /**
     * @class attribute_desync_error
     * @brief The attribute table could not supply the row for a geometry record
     */
    class attribute_desync_error : public parse_error {
    public:
        explicit attribute_desync_error(const std::string& msg)
            : parse_error(msg) {}
    };

    /**
     * @brief Build error message from variadic arguments
     * @tparam Args Variadic template arguments
     * @param args Arguments to concatenate into error message
     * @return Concatenated error message string
     */
    template<typename... Args>
    std::string build_error_msg(Args&&... args) {
        std::ostringstream oss;
        ((oss << args), ...);
        return oss.str();
    }

    /**
     * @defgroup ExceptionMacros Exception Throwing Macros
     * @{
     */

    /**
     * @def THROW_ERROR
     * @brief Throw an exception of the given type with formatted message
     */
    #define THROW_ERROR(type, ...) \
        throw type(::shp::build_error_msg(__VA_ARGS__))

    /**
     * @def THROW_IO
     * @brief Throw an io_error with formatted message
     */
    #define THROW_IO(...) \
        THROW_ERROR(::shp::io_error, __VA_ARGS__)

    /**
     * @def THROW_PARSE
     * @brief Throw a parse_error with formatted message
     */
    #define THROW_PARSE(...) \
        THROW_ERROR(::shp::parse_error, __VA_ARGS__)

    /**
     * @def THROW_IO_IF
     * @brief Conditionally throw an io_error
     */
    #define THROW_IO_IF(condition, ...) \
        do { if (condition) THROW_IO(__VA_ARGS__); } while(0)

    /**
     * @def THROW_PARSE_IF
     * @brief Conditionally throw a parse_error
     */
    #define THROW_PARSE_IF(condition, ...) \
        do { if (condition) THROW_PARSE(__VA_ARGS__); } while(0)

    /**
     * @def THROW_IO_UNLESS
     * @brief Throw an io_error unless condition is true
     */
    #define THROW_IO_UNLESS(condition, ...) \
        do { if (!(condition)) THROW_IO(__VA_ARGS__); } while(0)

    /**
     * @def THROW_PARSE_UNLESS
     * @brief Throw a parse_error unless condition is true
     */
    #define THROW_PARSE_UNLESS(condition, ...) \
        do { if (!(condition)) THROW_PARSE(__VA_ARGS__); } while(0)

    /** @} */ // end of ExceptionMacros group

} // namespace shp
