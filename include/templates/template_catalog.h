// include/templates/template_catalog.h
#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace photobooth::templates {

// Fixed A4 canvas at 300 DPI
constexpr int kCanvasWidth = 2480;
constexpr int kCanvasHeight = 3508;

// Slot rectangle in percent of the canvas
struct SlotRect {
    double leftPct = 0.0;
    double topPct = 0.0;
    double widthPct = 0.0;
    double heightPct = 0.0;
};

struct Template {
    std::string id;
    std::string name;
    int slotCount = 0;
    std::vector<SlotRect> rects;     // rects.size() == slotCount
    std::string backgroundPath;      // optional image under the photos
};

class TemplateCatalogError : public std::runtime_error {
public:
    explicit TemplateCatalogError(const std::string& what) : std::runtime_error(what) {}
};

// Immutable, ordered set of layout templates, loaded once at startup
class TemplateCatalog {
public:
    // Missing file: built-in catalog. Malformed content: TemplateCatalogError.
    static TemplateCatalog loadFromFile(const std::string& path);

    // baseDir resolves relative background paths
    static TemplateCatalog fromJson(const nlohmann::json& json, const std::string& baseDir = "");

    static TemplateCatalog builtin();

    size_t size() const { return templates_.size(); }
    const Template& at(size_t index) const { return templates_.at(index); }
    const Template* findById(const std::string& id) const;
    std::optional<size_t> indexOf(const std::string& id) const;
    const std::vector<Template>& all() const { return templates_; }

private:
    explicit TemplateCatalog(std::vector<Template> templates);

    std::vector<Template> templates_;
};

} // namespace photobooth::templates
