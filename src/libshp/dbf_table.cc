//
// dBASE attribute table, forward-only
//

#include <shp/attribute_table.hh>
#include <shp/exceptions.hh>

#include <algorithm>
#include <cstring>

namespace shp {

    static constexpr std::size_t dbf_header_size = 32;
    static constexpr std::size_t dbf_field_size = 32;
    static constexpr char field_terminator = 0x0D;
    static constexpr char end_of_file_marker = 0x1A;
    static constexpr char deleted_flag = '*';

    dbf_table::dbf_table(std::unique_ptr<reader_base> source)
        : m_source(std::move(source)) {
        THROW_IO_UNLESS(m_source, "Null attribute source");
        read_header();
    }

    dbf_table::~dbf_table() = default;

    void dbf_table::read_header() {
        auto header = m_source->read_exact(dbf_header_size);

        m_version = static_cast<std::uint8_t>(header[0]);
        // header[1..3] is the YYMMDD date of last update
        std::uint32_t count;
        std::uint16_t header_length;
        std::uint16_t record_length;
        std::memcpy(&count, &header[4], sizeof(count));
        std::memcpy(&header_length, &header[8], sizeof(header_length));
        std::memcpy(&record_length, &header[10], sizeof(record_length));
        if (!byte_order_native(byte_order::little)) {
            count = swap_byte_order(count);
            header_length = swap_byte_order(header_length);
            record_length = swap_byte_order(record_length);
        }
        m_record_count = count;
        m_header_length = header_length;
        m_record_length = record_length;

        THROW_PARSE_IF(m_header_length < dbf_header_size + 1,
                       "DBF header length ", m_header_length, " is too small");

        // Field descriptors until the terminator
        std::size_t consumed = dbf_header_size;
        std::size_t row_offset = 1;  // deletion flag
        while (true) {
            auto lead = m_source->read<std::uint8_t>(byte_order::little);
            consumed += 1;
            if (static_cast<char>(lead) == field_terminator) {
                break;
            }
            THROW_PARSE_IF(consumed + dbf_field_size - 1 > m_header_length,
                           "DBF field directory runs past the declared header length ", m_header_length);

            auto rest = m_source->read_exact(dbf_field_size - 1);
            consumed += dbf_field_size - 1;

            field f;
            f.name[0] = static_cast<char>(lead);
            for (std::size_t i = 1; i < f.name.size(); ++i) {
                f.name[i] = static_cast<char>(rest[i - 1]);
            }
            f.type = static_cast<char>(rest[10]);
            // rest[11..14] is the field data address, unused on disk
            f.size = static_cast<std::uint8_t>(rest[15]);
            f.precision = static_cast<std::uint8_t>(rest[16]);

            m_fields.push_back(f);
            m_offsets.push_back(row_offset);
            row_offset += f.size;
        }

        THROW_PARSE_IF(consumed > m_header_length,
                       "DBF field directory ends at ", consumed, " past the declared header length ", m_header_length);
        THROW_PARSE_IF(row_offset != m_record_length,
                       "DBF record length ", m_record_length, " does not match the field sizes (", row_offset, ")");

        // Anything left in the header (e.g. a backlink block) is dropped
        std::uint64_t rest = m_header_length - consumed;
        THROW_IO_IF(m_source->skip(rest) != rest, "Unexpected EOF in DBF header");
    }

    bool dbf_table::next() {
        m_row.clear();
        if (m_rows_read >= m_record_count) {
            return false;
        }

        std::vector<char> row(m_record_length);
        std::size_t actual = m_source->read(row.data(), row.size());
        if (actual == 0) {
            return false;
        }
        if (actual < row.size()) {
            if (row[0] == end_of_file_marker) {
                return false;
            }
            THROW_PARSE("DBF row ", m_rows_read, " is truncated: got ", actual, " of ", m_record_length, " bytes");
        }

        m_row = std::move(row);
        ++m_rows_read;
        return true;
    }

    std::string dbf_table::value(std::size_t n) const {
        if (m_row.empty() || n >= m_fields.size()) {
            return {};
        }

        const auto& f = m_fields[n];
        const char* begin = m_row.data() + m_offsets[n];
        const char* end = begin + f.size;

        auto is_pad = [](char c) { return c == ' ' || c == '\0'; };
        // Character values keep their leading blanks
        if (f.type != 'C') {
            begin = std::find_if_not(begin, end, is_pad);
        }
        while (end != begin && is_pad(*(end - 1))) {
            --end;
        }
        return {begin, end};
    }

    bool dbf_table::deleted() const {
        return !m_row.empty() && m_row[0] == deleted_flag;
    }

    void dbf_table::close() {
        m_row.clear();
        m_source->close();
    }

} // namespace shp
