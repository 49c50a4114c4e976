/**
 * @file input.hh
 * @brief Forward-only byte sources feeding the decoders
 */

#pragma once

#include <iosfwd>
#include <cstdint>
#include <cstddef>
#include <array>
#include <memory>
#include <vector>
#include <cstring>

#include <shp/export_shp.h>
#include <shp/exceptions.hh>
#include <shp/byte_order.hh>

namespace shp {

    /**
     * @class reader_base
     * @brief Base interface of a non-seekable byte source
     *
     * Implementations read strictly forward. A source that reaches its end
     * returns fewer bytes than requested; a source that fails throws io_error.
     */
    class SHP_EXPORT reader_base {
        public:
            virtual ~reader_base() = default;

            /**
             * @brief Read up to size bytes
             * @return Number of bytes actually read, 0 at end of source
             */
            virtual std::size_t read(void* dst, std::size_t size) = 0;

            /**
             * @brief Release the underlying resource
             *
             * Throws io_error if the release fails. Closing twice is a no-op.
             */
            virtual void close() = 0;

            // Convenience methods
            std::vector<std::byte> read_exact(std::size_t size) {
                std::vector<std::byte> buffer(size);
                std::size_t actual = read(buffer.data(), size);
                THROW_IO_IF(actual != size, "Unexpected EOF: requested ", size, " got ", actual);
                return buffer;
            }

            template<typename T>
            T read(byte_order bo) {
                std::array<std::byte, sizeof(T)> buff;
                std::size_t actual = read(buff.data(), sizeof(T));
                THROW_IO_IF(actual != sizeof(T), "Failed to read ", sizeof(T), " bytes");

                T value;
                std::memcpy(&value, buff.data(), sizeof(T));
                if constexpr (sizeof(T) > 1) {
                    if (!byte_order_native(bo)) {
                        value = swap_byte_order(value);
                    }
                }
                return value;
            }

            /**
             * @brief Discard bytes by reading them
             * @return Number of bytes actually discarded
             */
            std::uint64_t skip(std::uint64_t size);
    };

    /**
     * @class stream_reader
     * @brief Reads from a std::istream without ever seeking it
     */
    class SHP_EXPORT stream_reader : public reader_base {
        public:
            // Borrowed stream, the caller keeps it alive
            explicit stream_reader(std::istream& is);
            // Owned stream, released by close()
            explicit stream_reader(std::unique_ptr<std::istream> is);
            ~stream_reader() override;

            stream_reader(const stream_reader&) = delete;
            stream_reader& operator = (const stream_reader&) = delete;

            std::size_t read(void* dst, std::size_t size) override;
            void close() override;

            [[nodiscard]] bool is_closed() const { return m_stream == nullptr; }

        private:
            std::unique_ptr<std::istream> m_owned;
            std::istream* m_stream;
    };
}
