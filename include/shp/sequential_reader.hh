/**
 * @file sequential_reader.hh
 * @brief Single-pass reader pairing geometry records with attribute rows
 */

#pragma once

#include <cstdint>
#include <exception>
#include <iosfwd>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <shp/export_shp.h>
#include <shp/attribute_table.hh>
#include <shp/counting_reader.hh>
#include <shp/field.hh>
#include <shp/header.hh>
#include <shp/input.hh>
#include <shp/read_options.hh>
#include <shp/shape.hh>

namespace shp {

    class record_framer;

    /**
     * @enum reader_state
     * @brief Lifecycle of a sequential_reader
     */
    enum class reader_state {
        fresh,            ///< Header read, no record yet
        active,           ///< At least one record read
        exhausted_clean,  ///< Geometry stream ended at a record boundary
        exhausted_error   ///< A fatal error is latched
    };

    /**
     * @class sequential_reader
     * @brief Reads shapes and their attribute rows one after another
     *
     * Both sources are consumed strictly forward, which makes the reader
     * usable on pipes and network streams. The declared lengths in the
     * geometry stream are trusted; nothing is verified by seeking.
     *
     * next() never throws for decoding problems. The first error is
     * latched, every later next() returns false without further I/O, and
     * error() hands the error back. A clean end of the geometry stream is
     * not an error: next() returns false and error() stays null.
     *
     * Not thread safe.
     */
    class SHP_EXPORT sequential_reader {
    public:
        /**
         * @brief Open a reader over a geometry source and a dBASE source
         * @throws header_decode_error if either header is malformed
         */
        static std::unique_ptr<sequential_reader> open(std::unique_ptr<reader_base> shp,
                                                       std::unique_ptr<reader_base> dbf,
                                                       const read_options& options = {});

        /**
         * @brief Open a reader over two owned streams
         */
        static std::unique_ptr<sequential_reader> open(std::unique_ptr<std::istream> shp,
                                                       std::unique_ptr<std::istream> dbf,
                                                       const read_options& options = {});

        /**
         * @brief Open a reader over a geometry source and a ready attribute table
         */
        static std::unique_ptr<sequential_reader> open(std::unique_ptr<reader_base> shp,
                                                       std::unique_ptr<attribute_table> table,
                                                       const read_options& options = {});

        sequential_reader(std::unique_ptr<reader_base> shp, std::unique_ptr<reader_base> dbf,
                          const read_options& options);
        sequential_reader(std::unique_ptr<reader_base> shp, std::unique_ptr<attribute_table> table,
                          const read_options& options);
        ~sequential_reader();

        sequential_reader(const sequential_reader&) = delete;
        sequential_reader& operator = (const sequential_reader&) = delete;

        /**
         * @brief Advance by one shape and one attribute row
         * @return True if both were read without error
         */
        bool next();

        /**
         * @brief Index and current shape
         *
         * The index is the stored record number minus one. Returns
         * {-1, nullptr} unless the reader is active.
         */
        [[nodiscard]] std::pair<std::int64_t, const shp::shape*> shape() const;

        // Type code of the current record, null_shape unless active
        [[nodiscard]] shp::shape_type shape_type() const;

        /**
         * @brief Value of field n in the current row
         *
         * Empty unless the reader is active, or if n is out of range.
         */
        [[nodiscard]] std::string attribute(std::size_t n) const;

        /**
         * @brief Column descriptors of the attribute table
         *
         * Empty once a fatal error is latched.
         */
        [[nodiscard]] const std::vector<field>& fields() const;

        /**
         * @brief The latched error, null while none or after a clean end
         */
        [[nodiscard]] std::exception_ptr error() const { return m_error; }

        // Rethrows the latched error, if any
        void rethrow_if_error() const;

        /**
         * @brief Release both sources
         *
         * Both releases are attempted; the first failure is thrown after
         * the second attempt. A latched error is left untouched.
         */
        void close();

        [[nodiscard]] reader_state state() const { return m_state; }
        [[nodiscard]] const file_header& header() const { return m_header; }
        [[nodiscard]] attribute_table& table() { return *m_table; }
        [[nodiscard]] const attribute_table& table() const { return *m_table; }

    private:
        void advance_row();
        void finish();
        bool is_active() const { return m_state == reader_state::active && !m_closed; }

        std::unique_ptr<reader_base> m_shp;
        counting_reader m_in;
        read_options m_options;
        file_header m_header;
        std::unique_ptr<attribute_table> m_table;
        std::unique_ptr<record_framer> m_framer;

        reader_state m_state = reader_state::fresh;
        std::exception_ptr m_error;
        std::uint64_t m_records_read = 0;
        bool m_closed = false;
    };

    /**
     * @brief All attribute values of the current row
     *
     * Empty if the reader has latched an error.
     */
    SHP_EXPORT std::vector<std::string> attributes(const sequential_reader& reader);

    // Number of columns in the attribute table
    SHP_EXPORT std::size_t attribute_count(const sequential_reader& reader);

} // namespace shp
