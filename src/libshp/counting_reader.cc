//
// Sticky byte-counting adapter
//

#include <algorithm>
#include <utility>

#include <shp/counting_reader.hh>

namespace shp {

    counting_reader::counting_reader(reader_base& source)
        : m_source(source) {}

    bool counting_reader::read(void* dst, std::size_t size) {
        if (m_state != read_state::good) {
            return false;
        }
        if (size == 0) {
            return true;
        }

        std::size_t actual = 0;
        try {
            actual = m_source.read(dst, size);
        } catch (const io_error& e) {
            latch(read_state::failed, e.what());
            return false;
        }

        m_count += actual;
        m_offset += actual;

        if (actual == size) {
            return true;
        }
        if (actual == 0) {
            latch(read_state::eof, build_error_msg("end of stream at offset ", m_offset));
        } else {
            latch(read_state::truncated, build_error_msg("unexpected end of stream at offset ", m_offset,
                                                         ": requested ", size, " bytes, got ", actual));
        }
        return false;
    }

    bool counting_reader::discard(std::uint64_t size) {
        std::array<char, 4096> scratch;
        std::uint64_t done = 0;
        while (done < size) {
            auto chunk = static_cast<std::size_t>(std::min<std::uint64_t>(scratch.size(), size - done));
            if (!read(scratch.data(), chunk)) {
                // Running out partway through a discard is never a clean end
                if (m_state == read_state::eof && done > 0) {
                    m_state = read_state::truncated;
                    m_message = build_error_msg("unexpected end of stream at offset ", m_offset,
                                                " while discarding ", size, " bytes");
                }
                return false;
            }
            done += chunk;
        }
        return true;
    }

    void counting_reader::clear_eof() {
        if (m_state == read_state::eof) {
            m_state = read_state::good;
            m_message.clear();
        }
    }

    void counting_reader::latch(read_state state, std::string message) {
        m_state = state;
        m_message = std::move(message);
    }

} // namespace shp
