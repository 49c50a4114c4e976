//
// Record framing over the geometry stream (internal implementation)
//

#pragma once

#include <cstdint>
#include <memory>

#include <shp/counting_reader.hh>
#include <shp/header.hh>
#include <shp/read_options.hh>
#include <shp/shape.hh>

namespace shp {

    struct record_frame {
        std::int32_t number = 0;          // 1-based, as stored
        std::int32_t content_length = 0;  // in 16-bit words, counted from the type field
        shape_type type = shape_type::null_shape;
        std::uint64_t offset = 0;         // offset of the record number field
    };

    // Reads one record per call and realigns the stream on the declared length
    class record_framer {
    public:
        record_framer(counting_reader& in, const file_header& header, const read_options& options);

        // True if a record was decoded, false on a clean end at a record
        // boundary. Any other outcome throws a parse_error subclass.
        bool next();

        [[nodiscard]] const record_frame& frame() const { return m_frame; }
        [[nodiscard]] const shape* current() const { return m_shape.get(); }

    private:
        bool read_frame();
        void read_payload();
        void skip_padding();
        void warn(std::uint64_t offset, std::string_view category, const std::string& message) const;

        counting_reader& m_in;
        const file_header& m_header;
        const read_options& m_options;

        record_frame m_frame;
        std::unique_ptr<shape> m_shape;
        std::int32_t m_last_number = 0;
    };

} // namespace shp
