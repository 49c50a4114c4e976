/**
 * @file shape.hh
 * @brief Geometry values decoded from shapefile records
 */

#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

#include <shp/export_shp.h>
#include <shp/shape_type.hh>

namespace shp {

    class counting_reader;

    struct point {
        double x = 0;
        double y = 0;
    };

    /**
     * @struct box
     * @brief Bounding rectangle as written by the producer
     *
     * min <= max is not checked anywhere.
     */
    struct box {
        double min_x = 0;
        double min_y = 0;
        double max_x = 0;
        double max_y = 0;
    };

    struct value_range {
        double min = 0;
        double max = 0;
    };

    /**
     * @class shape
     * @brief Polymorphic geometry decoded from one record payload
     *
     * Decoders read through a counting_reader and never throw for I/O
     * trouble: a short read latches in the reader and the caller inspects it.
     * They do throw payload_decode_error for impossible counts and
     * framing_mismatch_error when the counts cannot fit in the declared
     * payload.
     */
    class SHP_EXPORT shape {
    public:
        virtual ~shape() = default;

        [[nodiscard]] shape_type type() const { return m_type; }

        [[nodiscard]] virtual box bbox() const = 0;

        /**
         * @brief Consume the payload that follows the record's type field
         * @param in Byte source positioned right after the type field
         * @param payload_size Declared payload size in bytes
         */
        virtual void read(counting_reader& in, std::uint64_t payload_size) = 0;

    protected:
        explicit shape(shape_type type) : m_type(type) {}

    private:
        shape_type m_type;
    };

    class SHP_EXPORT null_shape : public shape {
    public:
        null_shape() : shape(shape_type::null_shape) {}

        [[nodiscard]] box bbox() const override { return {}; }
        void read(counting_reader& in, std::uint64_t payload_size) override;
    };

    /**
     * @class point_shape
     * @brief Point, PointM and PointZ records
     */
    class SHP_EXPORT point_shape : public shape {
    public:
        explicit point_shape(shape_type type) : shape(type) {}

        [[nodiscard]] box bbox() const override;
        void read(counting_reader& in, std::uint64_t payload_size) override;

        point position;
        double z = 0;
        std::optional<double> m;
    };

    /**
     * @class multi_point_shape
     * @brief MultiPoint, MultiPointM and MultiPointZ records
     */
    class SHP_EXPORT multi_point_shape : public shape {
    public:
        explicit multi_point_shape(shape_type type) : shape(type) {}

        [[nodiscard]] box bbox() const override { return extent; }
        void read(counting_reader& in, std::uint64_t payload_size) override;

        box extent;
        std::vector<point> points;
        value_range z_range;
        std::vector<double> z;
        std::optional<value_range> m_range;
        std::vector<double> m;
    };

    /**
     * @class poly_shape
     * @brief PolyLine and Polygon records with their M and Z variants
     *
     * parts holds the index of the first point of every part.
     */
    class SHP_EXPORT poly_shape : public shape {
    public:
        explicit poly_shape(shape_type type) : shape(type) {}

        [[nodiscard]] box bbox() const override { return extent; }
        void read(counting_reader& in, std::uint64_t payload_size) override;

        box extent;
        std::vector<std::int32_t> parts;
        std::vector<point> points;
        value_range z_range;
        std::vector<double> z;
        std::optional<value_range> m_range;
        std::vector<double> m;
    };

    /**
     * @class multi_patch_shape
     * @brief MultiPatch records: a poly_shape with a type per part
     */
    class SHP_EXPORT multi_patch_shape : public poly_shape {
    public:
        multi_patch_shape() : poly_shape(shape_type::multipatch) {}

        void read(counting_reader& in, std::uint64_t payload_size) override;

        std::vector<std::int32_t> part_types;
    };

    /**
     * @brief Create an empty decoder for a shape type code
     *
     * Throws unrecognized_shape_type_error for codes with no decoder.
     */
    SHP_EXPORT std::unique_ptr<shape> make_shape(shape_type type);

} // namespace shp
