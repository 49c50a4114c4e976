//
// Forward-only byte sources
//

#include <istream>
#include <fstream>
#include <algorithm>

#include <shp/input.hh>

namespace shp {
    // reader_base implementation
    std::uint64_t reader_base::skip(std::uint64_t size) {
        std::array<char, 4096> scratch;
        std::uint64_t skipped = 0;
        while (skipped < size) {
            auto chunk = static_cast<std::size_t>(std::min<std::uint64_t>(scratch.size(), size - skipped));
            std::size_t actual = read(scratch.data(), chunk);
            skipped += actual;
            if (actual != chunk) {
                break;
            }
        }
        return skipped;
    }

    // stream_reader implementation
    stream_reader::stream_reader(std::istream& is)
        : m_stream(&is) {}

    stream_reader::stream_reader(std::unique_ptr<std::istream> is)
        : m_owned(std::move(is)), m_stream(m_owned.get()) {
        THROW_IO_UNLESS(m_stream, "Null stream passed to stream_reader");
    }

    stream_reader::~stream_reader() = default;

    std::size_t stream_reader::read(void* dst, std::size_t size) {
        THROW_IO_UNLESS(dst, "Null buffer in read");
        THROW_IO_IF(is_closed(), "Read from closed stream");

        if (size == 0) {
            return 0;
        }

        // A stream already at EOF has nothing more to give
        if (m_stream->eof()) {
            return 0;
        }
        THROW_IO_UNLESS(m_stream->good(), "Stream in bad state");

        m_stream->read(static_cast<char*>(dst), static_cast<std::streamsize>(size));
        std::size_t bytes_read = static_cast<std::size_t>(m_stream->gcount());

        THROW_IO_IF(m_stream->bad(), "Stream read failed after ", bytes_read, " bytes");
        return bytes_read;
    }

    void stream_reader::close() {
        if (is_closed()) {
            return;
        }

        auto* file = dynamic_cast<std::ifstream*>(m_stream);
        m_stream = nullptr;
        if (file && m_owned && file->is_open()) {
            // Drop the eof/fail bits left by the last short read
            file->clear();
            file->close();
            bool failed = file->fail();
            m_owned.reset();
            THROW_IO_IF(failed, "Failed to close file stream");
            return;
        }
        m_owned.reset();
    }
}
