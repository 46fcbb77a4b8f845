#include "depotpack/render.hpp"

#include <iomanip>
#include <sstream>
#include <stdexcept>

#include "depotpack/bin_with_distances.hpp"

namespace depotpack {
namespace {

struct Style {
    const char* fill;
    const char* stroke;
    double opacity;
};

Style role_style(DrawRole role) {
    switch (role) {
        case DrawRole::kBin:
            return Style{"none", "black", 1.0};
        case DrawRole::kItem:
            return Style{"#9ecae1", "#08519c", 0.9};
        case DrawRole::kSlot:
            return Style{"#fdd0a2", "#a63603", 0.9};
        case DrawRole::kBuffer:
            return Style{"#d9d9d9", "#969696", 0.5};
        case DrawRole::kEdgeZone:
            return Style{"#fcbba1", "#cb181d", 0.4};
        case DrawRole::kAvailable:
            return Style{"none", "#31a354", 1.0};
    }
    return Style{"none", "black", 1.0};
}

std::string xml_escape(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (const char c : text) {
        switch (c) {
            case '&':
                out += "&amp;";
                break;
            case '<':
                out += "&lt;";
                break;
            case '>':
                out += "&gt;";
                break;
            case '"':
                out += "&quot;";
                break;
            case '\'':
                out += "&apos;";
                break;
            default:
                out += c;
        }
    }
    return out;
}

void append_item(std::vector<DrawRect>& out, const Area& item, size_t index, const RenderOptions& opt) {
    if (opt.draw_distances) {
        for (const Side s : kAllSides) {
            if (item.buffer_depth(s) > Fixed()) {
                out.push_back(DrawRect{DrawRole::kBuffer, item.buffer_rect(s), {}});
            }
        }
    }
    std::string text = translate("no", opt.language) + " " + std::to_string(index);
    if (!item.label().empty()) {
        text = item.label() + " " + text;
    }
    out.push_back(DrawRect{DrawRole::kItem, item.rect(), text});
    if (opt.draw_slots && item.shape() != AreaShape::kPlain) {
        for (int i = 0; i < item.count_inner(); ++i) {
            out.push_back(DrawRect{DrawRole::kSlot, item.slot_rect(i), {}});
        }
    }
}

void append_frame(std::vector<DrawRect>& out, const Bin& bin, const RenderOptions& opt) {
    out.push_back(DrawRect{DrawRole::kBin, bin.rect(), {}});
    if (!opt.draw_distances) {
        return;
    }
    if (const auto* dbin = dynamic_cast<const BinWithDistances*>(&bin)) {
        for (const Side s : kAllSides) {
            if (dbin->clearance().depth(s) > Fixed()) {
                out.push_back(DrawRect{DrawRole::kEdgeZone, dbin->edge_zone(s), {}});
            }
        }
    }
}

void append_availables(std::vector<DrawRect>& out, const std::vector<Rect>& availables, const RenderOptions& opt) {
    if (!opt.draw_availables) {
        return;
    }
    for (size_t k = 0; k < availables.size(); ++k) {
        out.push_back(DrawRect{DrawRole::kAvailable, availables[k],
                               translate("av", opt.language) + std::to_string(k)});
    }
}

}  // namespace

const char* draw_role_name(DrawRole role) {
    switch (role) {
        case DrawRole::kBin:
            return "bin";
        case DrawRole::kItem:
            return "item";
        case DrawRole::kSlot:
            return "slot";
        case DrawRole::kBuffer:
            return "buffer";
        case DrawRole::kEdgeZone:
            return "edge_zone";
        case DrawRole::kAvailable:
            return "available";
    }
    return "unknown";
}

Language parse_language(const std::string& s) {
    if (s == "en") {
        return Language::kEnglish;
    }
    if (s == "de") {
        return Language::kGerman;
    }
    throw std::invalid_argument("parse_language: unknown language '" + s + "' (use en|de)");
}

std::string translate(const std::string& text, Language lang) {
    if (lang == Language::kEnglish) {
        return text;
    }
    if (text == "Step") {
        return "Schritt";
    }
    if (text == "av") {
        return "V";
    }
    if (text == "no") {
        return "Nr.";
    }
    return text;
}

std::vector<DrawRect> drawable_rectangles(const Bin& bin, const RenderOptions& opt) {
    std::vector<DrawRect> out;
    append_frame(out, bin, opt);
    for (size_t i = 0; i < bin.packed_count(); ++i) {
        append_item(out, bin.packed_item(i), i, opt);
    }
    append_availables(out, bin.availables(), opt);
    return out;
}

std::vector<DrawRect> drawable_step(const Bin& bin, size_t step, const RenderOptions& opt) {
    if (step >= bin.history().size()) {
        throw std::out_of_range("drawable_step: step out of range");
    }
    const PackingStep& ps = bin.history()[step];
    std::vector<DrawRect> out;
    append_frame(out, bin, opt);
    for (size_t i = 0; i < ps.packed.size(); ++i) {
        append_item(out, ps.packed[i], i, opt);
    }
    append_availables(out, ps.availables, opt);
    return out;
}

void write_svg(std::ostream& out,
               const std::vector<DrawRect>& rects,
               Fixed a,
               Fixed b,
               const RenderOptions& opt,
               const std::string& title) {
    if (!(opt.scale > 0.0)) {
        throw std::invalid_argument("write_svg: scale must be > 0");
    }
    const double s = opt.scale;
    const double h = b.to_double();
    const double margin = 10.0;
    const double title_h = title.empty() ? 0.0 : 20.0;

    std::ostringstream body;
    body << std::fixed << std::setprecision(3);
    for (const auto& r : rects) {
        const Style st = role_style(r.role);
        const double x = r.rect.x.to_double() * s;
        // Bottom-left corner of the rectangle in flipped coordinates.
        const double y0 = (h - r.rect.y.to_double()) * s;
        const double w = r.rect.a.to_double() * s;
        const double hh = r.rect.b.to_double() * s;
        body << "  <rect class=\"" << draw_role_name(r.role) << "\" x=\"" << x << "\" y=\"" << (y0 - hh)
             << "\" width=\"" << w << "\" height=\"" << hh << "\" fill=\"" << st.fill << "\" stroke=\""
             << st.stroke << "\" fill-opacity=\"" << st.opacity << "\"";
        if (r.rect.angle != 0) {
            body << " transform=\"rotate(" << -r.rect.angle << " " << x << " " << y0 << ")\"";
        }
        body << "/>\n";
        if (!r.text.empty()) {
            const Point c = r.rect.center();
            body << "  <text x=\"" << c.x.to_double() * s << "\" y=\"" << (h - c.y.to_double()) * s
                 << "\" font-size=\"10\" text-anchor=\"middle\">" << xml_escape(r.text) << "</text>\n";
        }
    }

    const double width = a.to_double() * s + 2.0 * margin;
    const double height = h * s + 2.0 * margin + title_h;
    out << std::fixed << std::setprecision(3);
    out << "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>\n";
    out << "<svg xmlns=\"http://www.w3.org/2000/svg\" width=\"" << width << "\" height=\"" << height << "\">\n";
    if (!title.empty()) {
        out << "  <text x=\"" << margin << "\" y=\"" << (margin + 12.0) << "\" font-size=\"14\">"
            << xml_escape(title) << "</text>\n";
    }
    out << "<g transform=\"translate(" << margin << " " << (margin + title_h) << ")\">\n";
    out << body.str();
    out << "</g>\n";
    out << "</svg>\n";
}

}  // namespace depotpack
