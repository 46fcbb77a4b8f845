#include "depotpack/packing_stats.hpp"

#include <iomanip>
#include <sstream>
#include <string>

namespace depotpack {
namespace {

const char* tri_state(const std::optional<bool>& v) {
    if (!v) {
        return "null";
    }
    return *v ? "true" : "false";
}

std::string json_escape(const std::string& text) {
    std::ostringstream out;
    for (const char c : text) {
        switch (c) {
            case '"':
                out << "\\\"";
                break;
            case '\\':
                out << "\\\\";
                break;
            case '\n':
                out << "\\n";
                break;
            case '\t':
                out << "\\t";
                break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                        << static_cast<int>(static_cast<unsigned char>(c)) << std::dec << std::setfill(' ');
                } else {
                    out << c;
                }
        }
    }
    return out.str();
}

}  // namespace

PackingReport packing_report(const Bin& bin) {
    PackingReport st;
    st.bin_a = bin.a();
    st.bin_b = bin.b();
    st.feasible = bin.feasible();
    st.precheck_passed = bin.precheck_passed();
    st.item_count = bin.items().size();
    st.packed_count = bin.packed_count();
    st.count_inner = bin.count_inner();
    st.a_inner = bin.a_inner();
    st.util_rate = bin.util_rate();

    st.placements.reserve(bin.packed_count());
    for (size_t i = 0; i < bin.packed_count(); ++i) {
        const Area& item = bin.packed_item(i);
        const Rect r = item.rect();
        st.occupied = st.occupied ? bounding_union(*st.occupied, r) : r;
        st.placements.push_back(PlacementRecord{item.label(), r, item.count_inner(), item.conflict_category()});
    }
    return st;
}

void write_report_json(std::ostream& out, const PackingReport& report, int indent) {
    const std::string pad(static_cast<size_t>(indent), ' ');
    out << std::setprecision(17);
    out << pad << "{\n";
    out << pad << "  \"bin\": {\"a\": " << report.bin_a << ", \"b\": " << report.bin_b << "},\n";
    out << pad << "  \"feasible\": " << tri_state(report.feasible) << ",\n";
    out << pad << "  \"precheck_passed\": " << tri_state(report.precheck_passed) << ",\n";
    out << pad << "  \"items\": " << report.item_count << ",\n";
    out << pad << "  \"packed\": " << report.packed_count << ",\n";
    out << pad << "  \"count_inner\": " << report.count_inner << ",\n";
    out << pad << "  \"a_inner\": " << report.a_inner << ",\n";
    out << pad << "  \"util_rate\": " << report.util_rate << ",\n";
    if (report.occupied) {
        const Rect& o = *report.occupied;
        out << pad << "  \"occupied\": {\"x\": " << o.x << ", \"y\": " << o.y << ", \"a\": " << o.a
            << ", \"b\": " << o.b << "},\n";
    } else {
        out << pad << "  \"occupied\": null,\n";
    }
    out << pad << "  \"placements\": [\n";
    for (size_t i = 0; i < report.placements.size(); ++i) {
        const auto& p = report.placements[i];
        out << pad << "    {\"i\": " << i << ", \"type\": \"" << json_escape(p.label) << "\", \"x\": " << p.rect.x
            << ", \"y\": " << p.rect.y << ", \"a\": " << p.rect.a << ", \"b\": " << p.rect.b
            << ", \"count_inner\": " << p.count_inner << "}";
        if (i + 1 != report.placements.size()) {
            out << ",";
        }
        out << "\n";
    }
    out << pad << "  ]\n";
    out << pad << "}";
}

}  // namespace depotpack
