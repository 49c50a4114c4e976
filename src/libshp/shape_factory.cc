//
// Shape type dispatch
//

#include <shp/shape.hh>
#include <shp/exceptions.hh>

namespace shp {

    bool is_known(shape_type type) {
        switch (type) {
            case shape_type::null_shape:
            case shape_type::point:
            case shape_type::polyline:
            case shape_type::polygon:
            case shape_type::multipoint:
            case shape_type::point_z:
            case shape_type::polyline_z:
            case shape_type::polygon_z:
            case shape_type::multipoint_z:
            case shape_type::point_m:
            case shape_type::polyline_m:
            case shape_type::polygon_m:
            case shape_type::multipoint_m:
            case shape_type::multipatch:
                return true;
        }
        return false;
    }

    bool has_z(shape_type type) {
        switch (type) {
            case shape_type::point_z:
            case shape_type::polyline_z:
            case shape_type::polygon_z:
            case shape_type::multipoint_z:
            case shape_type::multipatch:
                return true;
            default:
                return false;
        }
    }

    bool has_m(shape_type type) {
        switch (type) {
            case shape_type::point_m:
            case shape_type::polyline_m:
            case shape_type::polygon_m:
            case shape_type::multipoint_m:
                return true;
            default:
                return has_z(type);
        }
    }

    std::string to_string(shape_type type) {
        switch (type) {
            case shape_type::null_shape:   return "Null";
            case shape_type::point:        return "Point";
            case shape_type::polyline:     return "PolyLine";
            case shape_type::polygon:      return "Polygon";
            case shape_type::multipoint:   return "MultiPoint";
            case shape_type::point_z:      return "PointZ";
            case shape_type::polyline_z:   return "PolyLineZ";
            case shape_type::polygon_z:    return "PolygonZ";
            case shape_type::multipoint_z: return "MultiPointZ";
            case shape_type::point_m:      return "PointM";
            case shape_type::polyline_m:   return "PolyLineM";
            case shape_type::polygon_m:    return "PolygonM";
            case shape_type::multipoint_m: return "MultiPointM";
            case shape_type::multipatch:   return "MultiPatch";
        }
        return "Unknown(" + std::to_string(static_cast<std::int32_t>(type)) + ")";
    }

    std::unique_ptr<shape> make_shape(shape_type type) {
        switch (type) {
            case shape_type::null_shape:
                return std::make_unique<null_shape>();
            case shape_type::point:
            case shape_type::point_z:
            case shape_type::point_m:
                return std::make_unique<point_shape>(type);
            case shape_type::polyline:
            case shape_type::polygon:
            case shape_type::polyline_z:
            case shape_type::polygon_z:
            case shape_type::polyline_m:
            case shape_type::polygon_m:
                return std::make_unique<poly_shape>(type);
            case shape_type::multipoint:
            case shape_type::multipoint_z:
            case shape_type::multipoint_m:
                return std::make_unique<multi_point_shape>(type);
            case shape_type::multipatch:
                return std::make_unique<multi_patch_shape>();
        }
        THROW_ERROR(unrecognized_shape_type_error, "Unsupported shape type ",
                    static_cast<std::int32_t>(type));
    }

} // namespace shp
