//
// Record framing over the geometry stream
//

#include "record_framer.hh"
#include <shp/exceptions.hh>

namespace shp {

    // Record number and content length precede the part counted by content length
    static constexpr std::int64_t frame_prefix_size = 8;
    static constexpr std::int64_t type_field_size = 4;

    record_framer::record_framer(counting_reader& in, const file_header& header, const read_options& options)
        : m_in(in), m_header(header), m_options(options) {
    }

    bool record_framer::next() {
        m_shape.reset();
        m_in.reset_count();

        if (!read_frame()) {
            return false;
        }

        m_shape = make_shape(m_frame.type);
        read_payload();
        skip_padding();

        if (static_cast<std::int64_t>(m_frame.number) != static_cast<std::int64_t>(m_last_number) + 1) {
            warn(m_frame.offset, "record_number",
                 build_error_msg("Record number ", m_frame.number, " follows ", m_last_number));
        }
        if (m_frame.type != shape_type::null_shape && m_frame.type != m_header.geometry_type) {
            warn(m_frame.offset, "shape_type",
                 build_error_msg("Record ", m_frame.number, " is ", to_string(m_frame.type),
                                 " in a ", to_string(m_header.geometry_type), " file"));
        }
        m_last_number = m_frame.number;
        return true;
    }

    bool record_framer::read_frame() {
        std::int32_t number = 0;
        std::int32_t length = 0;
        std::int32_t type = 0;
        std::uint64_t offset = m_in.offset();

        m_in.read(number, byte_order::big);
        m_in.read(length, byte_order::big);
        m_in.read(type, byte_order::little);

        if (!m_in.good()) {
            // Nothing at all at a record boundary is the normal end of the file
            if (m_in.at_eof() && m_in.count() == 0) {
                return false;
            }
            THROW_ERROR(frame_decode_error, "Error when reading record header at offset ", offset,
                        ": ", m_in.message());
        }

        if (length < 0) {
            THROW_ERROR(frame_decode_error, "Record ", number, " at offset ", offset,
                        " declares negative content length ", length);
        }
        std::uint64_t content_bytes = static_cast<std::uint64_t>(length) * 2;
        if (content_bytes > m_options.max_record_size) {
            THROW_ERROR(frame_decode_error, "Record ", number, " at offset ", offset, " has content length ",
                        content_bytes, " bytes, which exceeds maximum allowed size of ",
                        m_options.max_record_size, " bytes");
        }

        m_frame.number = number;
        m_frame.content_length = length;
        m_frame.type = static_cast<shape_type>(type);
        m_frame.offset = offset;
        return true;
    }

    void record_framer::read_payload() {
        std::int64_t content_bytes = static_cast<std::int64_t>(m_frame.content_length) * 2;
        std::uint64_t payload_size = content_bytes > type_field_size
                                         ? static_cast<std::uint64_t>(content_bytes - type_field_size)
                                         : 0;

        m_shape->read(m_in, payload_size);

        switch (m_in.state()) {
            case read_state::good:
                break;
            case read_state::eof:
                // The stream ended on a field boundary inside the payload;
                // whether that was the whole record is settled by the padding step
                m_in.clear_eof();
                break;
            case read_state::truncated:
            case read_state::failed:
                THROW_ERROR(payload_decode_error, "Error while reading shape of record ", m_frame.number,
                            " (", to_string(m_frame.type), "): ", m_in.message());
        }
    }

    void record_framer::skip_padding() {
        std::int64_t expected = static_cast<std::int64_t>(m_frame.content_length) * 2 + frame_prefix_size;
        std::int64_t consumed = static_cast<std::int64_t>(m_in.count());
        std::int64_t skip = expected - consumed;

        if (skip < 0) {
            THROW_ERROR(framing_mismatch_error, "Record ", m_frame.number, " at offset ", m_frame.offset,
                        " declares ", expected, " bytes but its ", to_string(m_frame.type),
                        " payload consumed ", consumed);
        }
        if (!m_in.discard(static_cast<std::uint64_t>(skip))) {
            THROW_ERROR(frame_decode_error, "Error when discarding ", skip, " bytes after record ",
                        m_frame.number, ": ", m_in.message());
        }
    }

    void record_framer::warn(std::uint64_t offset, std::string_view category, const std::string& message) const {
        if (m_options.on_warning) {
            m_options.on_warning(offset, category, message);
        }
    }

} // namespace shp
