//
// Geometry payload decoders
//

#include <shp/shape.hh>
#include <shp/counting_reader.hh>
#include <shp/exceptions.hh>

namespace shp {

    namespace {
        // Tracks how much of the declared payload a decoder has used
        class payload_cursor {
        public:
            payload_cursor(counting_reader& in, std::uint64_t payload_size)
                : m_in(in), m_start(in.count()), m_size(payload_size) {}

            [[nodiscard]] bool good() const { return m_in.good(); }

            [[nodiscard]] std::uint64_t remaining() const {
                std::uint64_t used = m_in.count() - m_start;
                return used >= m_size ? 0 : m_size - used;
            }

            double read_double() {
                double value = 0;
                m_in.read(value, byte_order::little);
                return value;
            }

            std::int32_t read_int() {
                std::int32_t value = 0;
                m_in.read(value, byte_order::little);
                return value;
            }

            point read_point() {
                point p;
                p.x = read_double();
                p.y = read_double();
                return p;
            }

            box read_box() {
                box b;
                b.min_x = read_double();
                b.min_y = read_double();
                b.max_x = read_double();
                b.max_y = read_double();
                return b;
            }

            value_range read_range() {
                value_range r;
                r.min = read_double();
                r.max = read_double();
                return r;
            }

            // Count fields are signed on disk
            std::int32_t read_count(const char* what) {
                std::int32_t count = read_int();
                if (good() && count < 0) {
                    THROW_ERROR(payload_decode_error, "Negative ", what, " count ", count,
                                " at offset ", m_in.offset() - 4);
                }
                return count;
            }

            // Fail before allocating when the counts cannot fit the payload
            void require(std::uint64_t bytes, std::int32_t points) const {
                if (bytes > remaining()) {
                    THROW_ERROR(framing_mismatch_error, "Shape with ", points, " points needs ", bytes,
                                " more bytes but the record declares only ", remaining(),
                                " (offset ", m_in.offset(), ")");
                }
            }

            void read_points(std::vector<point>& out, std::int32_t n) {
                out.resize(static_cast<std::size_t>(n));
                for (auto& p : out) {
                    p = read_point();
                }
            }

            void read_doubles(std::vector<double>& out, std::int32_t n) {
                out.resize(static_cast<std::size_t>(n));
                for (auto& v : out) {
                    v = read_double();
                }
            }

            void read_ints(std::vector<std::int32_t>& out, std::int32_t n) {
                out.resize(static_cast<std::size_t>(n));
                for (auto& v : out) {
                    v = read_int();
                }
            }

        private:
            counting_reader& m_in;
            std::uint64_t m_start;
            std::uint64_t m_size;
        };

        std::uint64_t measure_block_size(std::int32_t num_points) {
            return 16 + 8 * static_cast<std::uint64_t>(num_points);
        }

        // Measures are optional in every variant: present only if the payload has room
        void read_measures(payload_cursor& cur, std::int32_t num_points,
                           std::optional<value_range>& range, std::vector<double>& values) {
            if (!cur.good() || cur.remaining() < measure_block_size(num_points)) {
                return;
            }
            range = cur.read_range();
            cur.read_doubles(values, num_points);
        }
    }

    void null_shape::read(counting_reader&, std::uint64_t) {
        // nothing after the type field
    }

    box point_shape::bbox() const {
        return {position.x, position.y, position.x, position.y};
    }

    void point_shape::read(counting_reader& in, std::uint64_t payload_size) {
        payload_cursor cur(in, payload_size);
        position = cur.read_point();
        if (has_z(type())) {
            z = cur.read_double();
        }
        if (has_m(type()) && cur.good() && cur.remaining() >= 8) {
            m = cur.read_double();
        }
    }

    void multi_point_shape::read(counting_reader& in, std::uint64_t payload_size) {
        payload_cursor cur(in, payload_size);
        extent = cur.read_box();
        std::int32_t num_points = cur.read_count("point");
        if (!cur.good()) {
            return;
        }

        std::uint64_t needed = 16 * static_cast<std::uint64_t>(num_points);
        if (has_z(type())) {
            needed += measure_block_size(num_points);
        }
        cur.require(needed, num_points);

        cur.read_points(points, num_points);
        if (has_z(type())) {
            z_range = cur.read_range();
            cur.read_doubles(z, num_points);
        }
        if (has_m(type())) {
            read_measures(cur, num_points, m_range, m);
        }
    }

    void poly_shape::read(counting_reader& in, std::uint64_t payload_size) {
        payload_cursor cur(in, payload_size);
        extent = cur.read_box();
        std::int32_t num_parts = cur.read_count("part");
        std::int32_t num_points = cur.read_count("point");
        if (!cur.good()) {
            return;
        }

        std::uint64_t needed = 4 * static_cast<std::uint64_t>(num_parts) +
                               16 * static_cast<std::uint64_t>(num_points);
        if (has_z(type())) {
            needed += measure_block_size(num_points);
        }
        cur.require(needed, num_points);

        cur.read_ints(parts, num_parts);
        cur.read_points(points, num_points);
        if (has_z(type())) {
            z_range = cur.read_range();
            cur.read_doubles(z, num_points);
        }
        if (has_m(type())) {
            read_measures(cur, num_points, m_range, m);
        }
    }

    void multi_patch_shape::read(counting_reader& in, std::uint64_t payload_size) {
        payload_cursor cur(in, payload_size);
        extent = cur.read_box();
        std::int32_t num_parts = cur.read_count("part");
        std::int32_t num_points = cur.read_count("point");
        if (!cur.good()) {
            return;
        }

        cur.require(8 * static_cast<std::uint64_t>(num_parts) +
                    16 * static_cast<std::uint64_t>(num_points) +
                    measure_block_size(num_points), num_points);

        cur.read_ints(parts, num_parts);
        cur.read_ints(part_types, num_parts);
        cur.read_points(points, num_points);
        z_range = cur.read_range();
        cur.read_doubles(z, num_points);
        read_measures(cur, num_points, m_range, m);
    }

} // namespace shp
