//
// Geometry stream header
//

#include <shp/header.hh>
#include <shp/counting_reader.hh>
#include <shp/exceptions.hh>

namespace shp {

    file_header read_header(counting_reader& in, const read_options& options) {
        file_header header;

        std::int32_t code = 0;
        in.read(code, byte_order::big);
        in.discard(20);  // five unused big-endian integers

        std::int32_t length_in_words = 0;
        in.read(length_in_words, byte_order::big);

        std::int32_t version = 0;
        in.read(version, byte_order::little);

        std::int32_t type = 0;
        in.read(type, byte_order::little);

        double bounds[4] = {0, 0, 0, 0};
        for (auto& v : bounds) {
            in.read(v, byte_order::little);
        }
        in.discard(32);  // Zmin, Zmax, Mmin, Mmax

        if (!in.good()) {
            THROW_ERROR(header_decode_error, "Error when reading SHP header: ", in.message());
        }

        if (length_in_words < 0) {
            THROW_ERROR(header_decode_error, "Negative file length ", length_in_words, " in SHP header");
        }

        header.file_length = static_cast<std::uint64_t>(length_in_words) * 2;
        header.geometry_type = static_cast<shape_type>(type);
        header.bbox = {bounds[0], bounds[1], bounds[2], bounds[3]};

        if (options.on_warning) {
            if (code != file_header::file_code) {
                options.on_warning(0, "file_code",
                    build_error_msg("File code is ", code, ", expected ", file_header::file_code));
            }
            if (version != file_header::version) {
                options.on_warning(28, "version",
                    build_error_msg("Version is ", version, ", expected ", file_header::version));
            }
        }

        return header;
    }

} // namespace shp
