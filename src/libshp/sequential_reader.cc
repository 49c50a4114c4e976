//
// Single-pass shapefile reader
//

#include <istream>

#include <shp/sequential_reader.hh>
#include <shp/exceptions.hh>
#include "record_framer.hh"

namespace shp {

    static reader_base& checked_source(const std::unique_ptr<reader_base>& source) {
        THROW_IO_UNLESS(source, "Null geometry source");
        return *source;
    }

    std::unique_ptr<sequential_reader> sequential_reader::open(std::unique_ptr<reader_base> shp,
                                                               std::unique_ptr<reader_base> dbf,
                                                               const read_options& options) {
        return std::make_unique<sequential_reader>(std::move(shp), std::move(dbf), options);
    }

    std::unique_ptr<sequential_reader> sequential_reader::open(std::unique_ptr<std::istream> shp,
                                                               std::unique_ptr<std::istream> dbf,
                                                               const read_options& options) {
        return open(std::unique_ptr<reader_base>(std::make_unique<stream_reader>(std::move(shp))),
                    std::unique_ptr<reader_base>(std::make_unique<stream_reader>(std::move(dbf))),
                    options);
    }

    std::unique_ptr<sequential_reader> sequential_reader::open(std::unique_ptr<reader_base> shp,
                                                               std::unique_ptr<attribute_table> table,
                                                               const read_options& options) {
        return std::make_unique<sequential_reader>(std::move(shp), std::move(table), options);
    }

    sequential_reader::sequential_reader(std::unique_ptr<reader_base> shp, std::unique_ptr<reader_base> dbf,
                                         const read_options& options)
        : m_shp(std::move(shp))
        , m_in(checked_source(m_shp))
        , m_options(options) {
        m_header = read_header(m_in, m_options);

        try {
            m_table = std::make_unique<dbf_table>(std::move(dbf));
        } catch (const shp_error& e) {
            THROW_ERROR(header_decode_error, "Error reading dbf: ", e.what());
        }

        m_framer = std::make_unique<record_framer>(m_in, m_header, m_options);
    }

    sequential_reader::sequential_reader(std::unique_ptr<reader_base> shp, std::unique_ptr<attribute_table> table,
                                         const read_options& options)
        : m_shp(std::move(shp))
        , m_in(checked_source(m_shp))
        , m_options(options)
        , m_table(std::move(table)) {
        THROW_IO_UNLESS(m_table, "Null attribute table");
        m_header = read_header(m_in, m_options);
        m_framer = std::make_unique<record_framer>(m_in, m_header, m_options);
    }

    sequential_reader::~sequential_reader() = default;

    bool sequential_reader::next() {
        if (m_closed || m_state == reader_state::exhausted_clean || m_state == reader_state::exhausted_error) {
            return false;
        }

        try {
            if (!m_framer->next()) {
                finish();
                return false;
            }
            advance_row();
        } catch (const shp_error&) {
            m_error = std::current_exception();
            m_state = reader_state::exhausted_error;
            return false;
        }

        ++m_records_read;
        m_state = reader_state::active;
        return true;
    }

    void sequential_reader::advance_row() {
        const auto& frame = m_framer->frame();

        bool has_row = false;
        try {
            has_row = m_table->next();
        } catch (const shp_error& e) {
            THROW_ERROR(attribute_desync_error, "Error when reading DBF row for record ", frame.number,
                        ": ", e.what());
        }

        if (!has_row) {
            THROW_ERROR(attribute_desync_error, "Attribute table has no row for record ", frame.number,
                        " (", m_table->record_count(), " rows declared, ", m_records_read, " read)");
        }

        if (m_table->deleted() && m_options.on_warning) {
            m_options.on_warning(frame.offset, "deleted_row",
                build_error_msg("Attribute row for record ", frame.number, " is marked deleted"));
        }
    }

    void sequential_reader::finish() {
        m_state = reader_state::exhausted_clean;

        if (!m_options.on_warning) {
            return;
        }
        if (m_in.offset() != m_header.file_length) {
            m_options.on_warning(m_in.offset(), "file_length",
                build_error_msg("Geometry stream ended at ", m_in.offset(),
                                " bytes, header declares ", m_header.file_length));
        }
        if (m_records_read < m_table->record_count()) {
            m_options.on_warning(m_in.offset(), "row_count",
                build_error_msg("Attribute table declares ", m_table->record_count(),
                                " rows, geometry stream has ", m_records_read, " records"));
        }
    }

    std::pair<std::int64_t, const shp::shape*> sequential_reader::shape() const {
        if (!is_active()) {
            return {-1, nullptr};
        }
        return {static_cast<std::int64_t>(m_framer->frame().number) - 1, m_framer->current()};
    }

    shp::shape_type sequential_reader::shape_type() const {
        if (!is_active()) {
            return shp::shape_type::null_shape;
        }
        return m_framer->frame().type;
    }

    std::string sequential_reader::attribute(std::size_t n) const {
        if (!is_active()) {
            return {};
        }
        return m_table->value(n);
    }

    const std::vector<field>& sequential_reader::fields() const {
        static const std::vector<field> no_fields;
        if (m_state == reader_state::exhausted_error) {
            return no_fields;
        }
        return m_table->fields();
    }

    void sequential_reader::rethrow_if_error() const {
        if (m_error) {
            std::rethrow_exception(m_error);
        }
    }

    void sequential_reader::close() {
        if (m_closed) {
            return;
        }
        m_closed = true;

        std::exception_ptr first;
        try {
            m_shp->close();
        } catch (const shp_error&) {
            first = std::current_exception();
        }
        try {
            m_table->close();
        } catch (const shp_error&) {
            if (!first) {
                first = std::current_exception();
            }
        }

        if (first) {
            std::rethrow_exception(first);
        }
    }

    std::vector<std::string> attributes(const sequential_reader& reader) {
        if (reader.error()) {
            return {};
        }
        std::vector<std::string> values(reader.fields().size());
        for (std::size_t i = 0; i < values.size(); ++i) {
            values[i] = reader.attribute(i);
        }
        return values;
    }

    std::size_t attribute_count(const sequential_reader& reader) {
        return reader.fields().size();
    }

} // namespace shp
