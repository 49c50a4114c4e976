/**
 * @file attribute_table.hh
 * @brief Row cursor over the attribute table paired with the geometry stream
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <shp/export_shp.h>
#include <shp/field.hh>
#include <shp/input.hh>

namespace shp {

    /**
     * @class attribute_table
     * @brief Forward-only cursor over attribute rows
     *
     * The row at position n belongs to geometry record n. Implementations
     * own their byte source and release it in close().
     */
    class SHP_EXPORT attribute_table {
    public:
        virtual ~attribute_table() = default;

        /**
         * @brief Advance to the next row
         * @return False when no row is left; throws on a damaged row
         */
        virtual bool next() = 0;

        [[nodiscard]] virtual const std::vector<field>& fields() const = 0;

        /**
         * @brief Value of column n in the current row, as text
         *
         * Empty when there is no current row or n is out of range.
         */
        [[nodiscard]] virtual std::string value(std::size_t n) const = 0;

        // True if the current row carries the deletion flag
        [[nodiscard]] virtual bool deleted() const = 0;

        // Number of rows the table header announces
        [[nodiscard]] virtual std::uint32_t record_count() const = 0;

        virtual void close() = 0;
    };

    /**
     * @class dbf_table
     * @brief dBASE III style table read without seeking
     *
     * The constructor consumes the table header and the field directory,
     * leaving the source at the first row.
     */
    class SHP_EXPORT dbf_table : public attribute_table {
    public:
        explicit dbf_table(std::unique_ptr<reader_base> source);
        ~dbf_table() override;

        bool next() override;
        [[nodiscard]] const std::vector<field>& fields() const override { return m_fields; }
        [[nodiscard]] std::string value(std::size_t n) const override;
        [[nodiscard]] bool deleted() const override;
        [[nodiscard]] std::uint32_t record_count() const override { return m_record_count; }
        void close() override;

        [[nodiscard]] std::uint8_t version() const { return m_version; }
        [[nodiscard]] std::uint16_t header_length() const { return m_header_length; }
        [[nodiscard]] std::uint16_t record_length() const { return m_record_length; }
        [[nodiscard]] std::uint32_t rows_read() const { return m_rows_read; }

    private:
        void read_header();

        std::unique_ptr<reader_base> m_source;
        std::vector<field> m_fields;
        std::vector<std::size_t> m_offsets;  // Offset of each field inside a row
        std::vector<char> m_row;             // Current row, empty when none

        std::uint8_t m_version = 0;
        std::uint32_t m_record_count = 0;
        std::uint16_t m_header_length = 0;
        std::uint16_t m_record_length = 0;
        std::uint32_t m_rows_read = 0;
    };

} // namespace shp
