#pragma once

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include <shp/exceptions.hh>
#include <shp/input.hh>
#include <shp/read_options.hh>
#include <shp/sequential_reader.hh>
#include <shp/shape_type.hh>

namespace test {

    // Appends values with an explicit byte order, independent of the host
    class byte_builder {
    public:
        byte_builder& be32(std::int32_t v) {
            auto u = static_cast<std::uint32_t>(v);
            for (int shift = 24; shift >= 0; shift -= 8) {
                m_data.push_back(static_cast<char>((u >> shift) & 0xFF));
            }
            return *this;
        }

        byte_builder& le32(std::int32_t v) {
            auto u = static_cast<std::uint32_t>(v);
            for (int shift = 0; shift <= 24; shift += 8) {
                m_data.push_back(static_cast<char>((u >> shift) & 0xFF));
            }
            return *this;
        }

        byte_builder& le16(std::uint16_t v) {
            m_data.push_back(static_cast<char>(v & 0xFF));
            m_data.push_back(static_cast<char>((v >> 8) & 0xFF));
            return *this;
        }

        byte_builder& u8(std::uint8_t v) {
            m_data.push_back(static_cast<char>(v));
            return *this;
        }

        byte_builder& f64(double v) {
            std::uint64_t u;
            std::memcpy(&u, &v, sizeof(u));
            for (int shift = 0; shift <= 56; shift += 8) {
                m_data.push_back(static_cast<char>((u >> shift) & 0xFF));
            }
            return *this;
        }

        byte_builder& bytes(const std::string& s) {
            m_data += s;
            return *this;
        }

        byte_builder& zeros(std::size_t n) {
            m_data.append(n, '\0');
            return *this;
        }

        [[nodiscard]] const std::string& str() const { return m_data; }
        [[nodiscard]] std::size_t size() const { return m_data.size(); }

    private:
        std::string m_data;
    };

    inline std::int32_t code(shp::shape_type t) {
        return static_cast<std::int32_t>(t);
    }

    // 100-byte geometry header
    inline std::string shp_header(shp::shape_type type, std::int32_t length_in_words,
                                  double min_x = 0, double min_y = 0, double max_x = 0, double max_y = 0) {
        byte_builder b;
        b.be32(9994).zeros(20).be32(length_in_words).le32(1000).le32(code(type));
        b.f64(min_x).f64(min_y).f64(max_x).f64(max_y);
        b.zeros(32);
        return b.str();
    }

    // Record frame: number and content length (words) big-endian, type little-endian
    inline std::string record(std::int32_t number, std::int32_t content_words, std::int32_t type,
                              const std::string& payload) {
        byte_builder b;
        b.be32(number).be32(content_words).le32(type).bytes(payload);
        return b.str();
    }

    inline std::string point_payload(double x, double y) {
        return byte_builder().f64(x).f64(y).str();
    }

    // Point record with exact content length
    inline std::string point_record(std::int32_t number, double x, double y) {
        return record(number, 10, code(shp::shape_type::point), point_payload(x, y));
    }

    inline std::string null_record(std::int32_t number) {
        return record(number, 2, code(shp::shape_type::null_shape), "");
    }

    // Header plus records, file length computed from the records
    inline std::string make_shp(shp::shape_type type, const std::vector<std::string>& records) {
        std::size_t total = 100;
        for (const auto& r : records) {
            total += r.size();
        }
        std::string data = shp_header(type, static_cast<std::int32_t>(total / 2));
        for (const auto& r : records) {
            data += r;
        }
        return data;
    }

    struct dbf_column {
        std::string name;
        char type;
        std::uint8_t size;
        std::uint8_t precision;
    };

    struct dbf_options {
        int declared_rows = -1;          // -1: number of rows given
        std::size_t extra_header = 0;    // bytes between terminator and first row
        bool eof_marker = true;
        std::vector<bool> deleted;       // per row
    };

    inline std::string make_dbf(const std::vector<dbf_column>& columns,
                                const std::vector<std::vector<std::string>>& rows,
                                const dbf_options& opts = {}) {
        std::uint16_t record_length = 1;
        for (const auto& c : columns) {
            record_length = static_cast<std::uint16_t>(record_length + c.size);
        }
        auto header_length = static_cast<std::uint16_t>(32 + 32 * columns.size() + 1 + opts.extra_header);
        auto declared = opts.declared_rows < 0 ? static_cast<std::int32_t>(rows.size()) : opts.declared_rows;

        byte_builder b;
        b.u8(0x03).u8(124).u8(1).u8(1);
        b.le32(declared).le16(header_length).le16(record_length).zeros(20);

        for (const auto& c : columns) {
            std::string name = c.name.substr(0, 10);
            name.resize(11, '\0');
            b.bytes(name).u8(static_cast<std::uint8_t>(c.type)).zeros(4).u8(c.size).u8(c.precision).zeros(14);
        }
        b.u8(0x0D).zeros(opts.extra_header);

        for (std::size_t r = 0; r < rows.size(); ++r) {
            bool del = r < opts.deleted.size() && opts.deleted[r];
            b.u8(del ? '*' : ' ');
            for (std::size_t i = 0; i < columns.size(); ++i) {
                std::string v = i < rows[r].size() ? rows[r][i] : std::string();
                v = v.substr(0, columns[i].size);
                if (columns[i].type == 'C') {
                    v.resize(columns[i].size, ' ');
                } else {
                    v = std::string(columns[i].size - v.size(), ' ') + v;
                }
                b.bytes(v);
            }
        }
        if (opts.eof_marker) {
            b.u8(0x1A);
        }
        return b.str();
    }

    // Single character column holding the row number
    inline std::string numbered_dbf(std::size_t rows) {
        std::vector<std::vector<std::string>> data;
        for (std::size_t i = 0; i < rows; ++i) {
            data.push_back({"row" + std::to_string(i)});
        }
        return make_dbf({{"NAME", 'C', 8, 0}}, data);
    }

    // In-memory source that records every call made on it
    class probe_source : public shp::reader_base {
    public:
        explicit probe_source(std::string data, std::size_t fail_after = std::string::npos)
            : m_data(std::move(data)), m_fail_after(fail_after) {}

        std::size_t read(void* dst, std::size_t size) override {
            ++read_calls;
            if (m_pos >= m_fail_after) {
                THROW_IO("simulated read failure at ", m_pos);
            }
            std::size_t limit = std::min(m_data.size(), m_fail_after);
            std::size_t n = std::min(size, limit > m_pos ? limit - m_pos : 0);
            std::memcpy(dst, m_data.data() + m_pos, n);
            m_pos += n;
            return n;
        }

        void close() override {
            ++close_calls;
            if (fail_close) {
                THROW_IO("simulated close failure");
            }
        }

        [[nodiscard]] std::size_t position() const { return m_pos; }

        int read_calls = 0;
        int close_calls = 0;
        bool fail_close = false;

    private:
        std::string m_data;
        std::size_t m_fail_after;
        std::size_t m_pos = 0;
    };

    inline std::unique_ptr<shp::sequential_reader> open_reader(const std::string& shp_data,
                                                               const std::string& dbf_data,
                                                               const shp::read_options& options = {}) {
        return shp::sequential_reader::open(std::make_unique<std::istringstream>(shp_data),
                                            std::make_unique<std::istringstream>(dbf_data),
                                            options);
    }
}
