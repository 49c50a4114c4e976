/**
 * @file shp_dump.cpp
 * @brief Prints every record of a shapefile with its attributes
 *
 * Reads the .shp and .dbf files front to back, once, and prints
 * the shape type, bounding box and attribute row of each record.
 */

#include <shp/sequential_reader.hh>
#include <iostream>
#include <fstream>
#include <memory>

int main(int argc, char* argv[]) {
    if (argc != 3) {
        std::cout << "Usage: " << argv[0] << " <file.shp> <file.dbf>\n";
        std::cout << "\n";
        std::cout << "Lists all records of a shapefile in file order.\n";
        return 1;
    }

    auto shp_file = std::make_unique<std::ifstream>(argv[1], std::ios::binary);
    if (!*shp_file) {
        std::cerr << "Error: Cannot open file '" << argv[1] << "'\n";
        return 1;
    }
    auto dbf_file = std::make_unique<std::ifstream>(argv[2], std::ios::binary);
    if (!*dbf_file) {
        std::cerr << "Error: Cannot open file '" << argv[2] << "'\n";
        return 1;
    }

    shp::read_options options;
    options.on_warning = [](std::uint64_t offset, std::string_view category, std::string_view message) {
        std::cerr << "Warning [" << category << "] at offset " << offset << ": " << message << "\n";
    };

    try {
        auto reader = shp::sequential_reader::open(std::move(shp_file), std::move(dbf_file), options);

        const auto& header = reader->header();
        std::cout << "File type: " << shp::to_string(header.geometry_type) << "\n";
        std::cout << "Fields:";
        for (const auto& f : reader->fields()) {
            std::cout << " " << f.name_string() << "(" << f.type << ")";
        }
        std::cout << "\n====================\n\n";

        while (reader->next()) {
            auto [index, shape] = reader->shape();
            auto bbox = shape->bbox();
            std::cout << "#" << index << " " << shp::to_string(reader->shape_type())
                      << " [" << bbox.min_x << ", " << bbox.min_y << ", "
                      << bbox.max_x << ", " << bbox.max_y << "]\n";

            const auto& fields = reader->fields();
            for (std::size_t i = 0; i < fields.size(); ++i) {
                std::cout << "  " << fields[i].name_string() << " = " << reader->attribute(i) << "\n";
            }
        }

        reader->rethrow_if_error();
        reader->close();

        std::cout << "\nReading completed successfully!\n";

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
