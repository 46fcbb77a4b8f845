#include "depotpack/layout_csv.hpp"

#include <cctype>
#include <stdexcept>
#include <string>
#include <string_view>

namespace depotpack {
namespace {

std::string trim_copy(std::string_view s) {
    size_t b = 0;
    while (b < s.size() && std::isspace(static_cast<unsigned char>(s[b]))) {
        ++b;
    }
    size_t e = s.size();
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) {
        --e;
    }
    return std::string(s.substr(b, e - b));
}

std::vector<std::string> split_fields(const std::string& line) {
    std::vector<std::string> out;
    size_t start = 0;
    for (;;) {
        const size_t pos = line.find(',', start);
        if (pos == std::string::npos) {
            out.push_back(trim_copy(std::string_view(line).substr(start)));
            return out;
        }
        out.push_back(trim_copy(std::string_view(line).substr(start, pos - start)));
        start = pos + 1;
    }
}

std::runtime_error line_error(int line_no, const std::string& msg) {
    return std::runtime_error("line " + std::to_string(line_no) + ": " + msg);
}

int parse_int_field(const std::string& s, int line_no, const char* what) {
    size_t pos = 0;
    int v = 0;
    try {
        v = std::stoi(s, &pos);
    } catch (const std::exception&) {
        throw line_error(line_no, std::string("invalid ") + what + ": '" + s + "'");
    }
    if (pos != s.size()) {
        throw line_error(line_no, std::string("invalid ") + what + ": '" + s + "'");
    }
    return v;
}

Fixed parse_fixed_field(const std::string& s, int line_no, const char* what) {
    try {
        return Fixed::parse(s);
    } catch (const std::exception& e) {
        throw line_error(line_no, std::string("invalid ") + what + ": " + e.what());
    }
}

}  // namespace

std::vector<LayoutEntry> read_layout_csv(std::istream& in) {
    std::vector<LayoutEntry> out;
    std::string line;
    int line_no = 0;

    while (std::getline(in, line)) {
        line_no++;
        const std::string t = trim_copy(line);
        if (t.empty() || t[0] == '#') {
            continue;
        }
        if (out.empty() && (t == "type" || t.rfind("type,", 0) == 0)) {
            continue;
        }

        const auto fields = split_fields(t);
        LayoutEntry e;
        e.line_no = line_no;
        if (fields[0] == "rect") {
            if (fields.size() != 3) {
                throw line_error(line_no, "expected rect,a,b");
            }
            e.is_rect = true;
            e.a = parse_fixed_field(fields[1], line_no, "a");
            e.b = parse_fixed_field(fields[2], line_no, "b");
            if (!(e.a > Fixed()) || !(e.b > Fixed())) {
                throw line_error(line_no, "rect sizes must be > 0");
            }
        } else {
            if (fields.size() != 2 && fields.size() != 3) {
                throw line_error(line_no, "expected type,capacity[,angle]");
            }
            try {
                e.kind = parse_area_kind(fields[0]);
            } catch (const std::invalid_argument& ex) {
                throw line_error(line_no, ex.what());
            }
            e.capacity = parse_int_field(fields[1], line_no, "capacity");
            if (fields.size() == 3 && !fields[2].empty()) {
                if (area_kind_shape(e.kind) != AreaShape::kRotatableRow) {
                    throw line_error(line_no, "angle applies to DSR and DSR_90 only");
                }
                e.angle = parse_int_field(fields[2], line_no, "angle");
            }
        }
        out.push_back(e);
    }
    return out;
}

Area make_layout_area(const LayoutEntry& entry, const VehicleParameters& params) {
    if (entry.is_rect) {
        Area area = Area::plain(entry.a, entry.b);
        area.set_label("rect");
        return area;
    }
    try {
        return make_area(entry.kind, entry.capacity, params, entry.angle);
    } catch (const std::invalid_argument& ex) {
        throw line_error(entry.line_no, ex.what());
    }
}

void load_layout(std::istream& in, Bin& bin, const VehicleParameters& params) {
    for (const auto& e : read_layout_csv(in)) {
        bin.add_item(make_layout_area(e, params));
    }
}

void write_placements_csv(std::ostream& out, const Bin& bin) {
    out << "index,type,x,y,a,b,count_inner\n";
    for (size_t i = 0; i < bin.packed_count(); ++i) {
        const Area& item = bin.packed_item(i);
        out << i << "," << item.label() << "," << item.x() << "," << item.y() << "," << item.a() << ","
            << item.b() << "," << item.count_inner() << "\n";
    }
}

}  // namespace depotpack
