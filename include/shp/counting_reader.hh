/**
 * @file counting_reader.hh
 * @brief Byte-counting adapter that latches the first read failure
 */

#pragma once

#include <array>
#include <cstdint>
#include <cstddef>
#include <cstring>
#include <string>

#include <shp/export_shp.h>
#include <shp/byte_order.hh>
#include <shp/input.hh>

namespace shp {

    /**
     * @enum read_state
     * @brief Outcome latched by a counting_reader
     */
    enum class read_state {
        good,       ///< Every read so far was complete
        eof,        ///< A read found no byte at all: the source ended at a read boundary
        truncated,  ///< A read got some but not all of the requested bytes
        failed      ///< The source threw io_error
    };

    /**
     * @class counting_reader
     * @brief Sticky wrapper around a reader_base
     *
     * Each read either succeeds completely and adds to the byte counters,
     * or latches a non-good state. Once latched, every later read returns
     * false without touching the source.
     */
    class SHP_EXPORT counting_reader {
    public:
        explicit counting_reader(reader_base& source);

        counting_reader(const counting_reader&) = delete;
        counting_reader& operator = (const counting_reader&) = delete;

        /**
         * @brief Read exactly size bytes
         * @return True if all bytes were read, false if a state is latched
         */
        bool read(void* dst, std::size_t size);

        /**
         * @brief Read one value in the given byte order
         *
         * On failure value is left untouched.
         */
        template<typename T>
        bool read(T& value, byte_order bo) {
            std::array<std::byte, sizeof(T)> buff;
            if (!read(buff.data(), sizeof(T))) {
                return false;
            }
            std::memcpy(&value, buff.data(), sizeof(T));
            if constexpr (sizeof(T) > 1) {
                if (!byte_order_native(bo)) {
                    value = swap_byte_order(value);
                }
            }
            return true;
        }

        /**
         * @brief Read and drop exactly size bytes
         */
        bool discard(std::uint64_t size);

        // Bytes read since the last reset_count()
        [[nodiscard]] std::uint64_t count() const { return m_count; }
        void reset_count() { m_count = 0; }

        // Bytes read since construction
        [[nodiscard]] std::uint64_t offset() const { return m_offset; }

        [[nodiscard]] read_state state() const { return m_state; }
        [[nodiscard]] bool good() const { return m_state == read_state::good; }
        [[nodiscard]] bool at_eof() const { return m_state == read_state::eof; }

        /**
         * @brief Describe the latched state, empty while good
         */
        [[nodiscard]] const std::string& message() const { return m_message; }

        /**
         * @brief Forget a latched eof
         *
         * Only eof can be cleared; it marks a payload that ended exactly on
         * a field boundary. truncated and failed stay latched for good.
         */
        void clear_eof();

    private:
        void latch(read_state state, std::string message);

        reader_base& m_source;
        std::uint64_t m_count = 0;
        std::uint64_t m_offset = 0;
        read_state m_state = read_state::good;
        std::string m_message;
    };

} // namespace shp
