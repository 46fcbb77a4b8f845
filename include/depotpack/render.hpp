#pragma once

#include <ostream>
#include <string>
#include <vector>

#include "depotpack/bin.hpp"
#include "depotpack/geometry.hpp"

namespace depotpack {

enum class DrawRole {
    kBin = 0,
    kItem = 1,
    kSlot = 2,
    kBuffer = 3,
    kEdgeZone = 4,
    kAvailable = 5,
};

const char* draw_role_name(DrawRole role);

struct DrawRect {
    DrawRole role = DrawRole::kItem;
    Rect rect;
    std::string text;
};

enum class Language {
    kEnglish = 0,
    kGerman = 1,
};

// "en" or "de".
Language parse_language(const std::string& s);

struct RenderOptions {
    bool draw_distances = true;
    bool draw_slots = true;
    bool draw_availables = false;
    Language language = Language::kEnglish;
    double scale = 4.0;  // pixels per meter
};

// Rectangles of a packed (or partially packed) bin in drawing order.
std::vector<DrawRect> drawable_rectangles(const Bin& bin, const RenderOptions& opt = {});

// Rectangles of one recorded history step.
std::vector<DrawRect> drawable_step(const Bin& bin, size_t step, const RenderOptions& opt = {});

// Writes rects as a standalone SVG document of a bin with size (a, b).
// y points up in bin coordinates and is flipped for the output.
void write_svg(std::ostream& out,
               const std::vector<DrawRect>& rects,
               Fixed a,
               Fixed b,
               const RenderOptions& opt = {},
               const std::string& title = {});

// Label text in the requested language ("Step", "av", "no").
std::string translate(const std::string& text, Language lang);

}  // namespace depotpack
