// src/templates/template_catalog.cpp
#include "templates/template_catalog.h"
#include "logging/logger.h"
#include <filesystem>
#include <cstdint>
#include <fstream>
#include <limits>
#include <set>

namespace photobooth::templates {

namespace {

std::string entryLabel(size_t index) {
    return "template[" + std::to_string(index) + "]";
}

double requirePercent(const nlohmann::json& rect, const char* field, const std::string& where) {
    auto it = rect.find(field);
    if (it == rect.end() || !it->is_number()) {
        throw TemplateCatalogError(where + ": missing numeric field '" + field + "'");
    }
    double value = it->get<double>();
    if (value < 0.0 || value > 100.0) {
        throw TemplateCatalogError(where + ": '" + field + "' out of range [0,100]: " + std::to_string(value));
    }
    return value;
}

Template parseTemplate(const nlohmann::json& entry, size_t index, const std::string& baseDir) {
    const std::string where = entryLabel(index);
    if (!entry.is_object()) {
        throw TemplateCatalogError(where + ": not an object");
    }

    Template tpl;

    auto id = entry.find("id");
    if (id == entry.end() || !id->is_string() || id->get<std::string>().empty()) {
        throw TemplateCatalogError(where + ": missing or empty 'id'");
    }
    tpl.id = id->get<std::string>();

    auto name = entry.find("name");
    if (name == entry.end() || !name->is_string()) {
        throw TemplateCatalogError(where + " (" + tpl.id + "): missing 'name'");
    }
    tpl.name = name->get<std::string>();

    auto slots = entry.find("slots");
    if (slots == entry.end() || !slots->is_number_integer()) {
        throw TemplateCatalogError(where + " (" + tpl.id + "): 'slots' must be a positive integer");
    }
    const int64_t slotValue = slots->get<int64_t>();
    if (slotValue < 1 || slotValue > std::numeric_limits<int>::max()) {
        throw TemplateCatalogError(where + " (" + tpl.id + "): 'slots' must be a positive integer, got " +
                                   slots->dump());
    }
    tpl.slotCount = static_cast<int>(slotValue);

    auto rects = entry.find("rects");
    if (rects == entry.end() || !rects->is_array()) {
        throw TemplateCatalogError(where + " (" + tpl.id + "): missing 'rects' array");
    }
    if (rects->size() != static_cast<size_t>(tpl.slotCount)) {
        throw TemplateCatalogError(where + " (" + tpl.id + "): " + std::to_string(rects->size()) +
                                   " rects for " + std::to_string(tpl.slotCount) + " slots");
    }
    for (size_t i = 0; i < rects->size(); ++i) {
        const auto& r = (*rects)[i];
        const std::string rectWhere = where + " (" + tpl.id + ") rects[" + std::to_string(i) + "]";
        if (!r.is_object()) {
            throw TemplateCatalogError(rectWhere + ": not an object");
        }
        SlotRect rect;
        rect.leftPct = requirePercent(r, "leftPct", rectWhere);
        rect.topPct = requirePercent(r, "topPct", rectWhere);
        rect.widthPct = requirePercent(r, "widthPct", rectWhere);
        rect.heightPct = requirePercent(r, "heightPct", rectWhere);
        tpl.rects.push_back(rect);
    }

    auto background = entry.find("background");
    if (background != entry.end() && !background->is_null()) {
        if (!background->is_string()) {
            throw TemplateCatalogError(where + " (" + tpl.id + "): 'background' must be a string");
        }
        std::filesystem::path bg(background->get<std::string>());
        if (bg.is_relative() && !baseDir.empty()) {
            bg = std::filesystem::path(baseDir) / bg;
        }
        tpl.backgroundPath = bg.string();
    }

    return tpl;
}

} // namespace

TemplateCatalog::TemplateCatalog(std::vector<Template> templates)
    : templates_(std::move(templates)) {
}

TemplateCatalog TemplateCatalog::builtin() {
    Template tpl;
    tpl.id = "single_full";
    tpl.name = "Single Full";
    tpl.slotCount = 1;
    tpl.rects.push_back(SlotRect{10.0, 15.0, 80.0, 70.0});
    return TemplateCatalog({tpl});
}

TemplateCatalog TemplateCatalog::fromJson(const nlohmann::json& json, const std::string& baseDir) {
    if (!json.is_array()) {
        throw TemplateCatalogError("template catalog must be a JSON array");
    }
    if (json.empty()) {
        throw TemplateCatalogError("template catalog is empty");
    }

    std::vector<Template> templates;
    std::set<std::string> seenIds;
    for (size_t i = 0; i < json.size(); ++i) {
        Template tpl = parseTemplate(json[i], i, baseDir);
        if (!seenIds.insert(tpl.id).second) {
            throw TemplateCatalogError(entryLabel(i) + ": duplicate id '" + tpl.id + "'");
        }
        templates.push_back(std::move(tpl));
    }
    return TemplateCatalog(std::move(templates));
}

TemplateCatalog TemplateCatalog::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        logging::Logger::getInstance().warn("Template catalog not found at " + path + ", using built-in 'single_full'");
        return builtin();
    }

    nlohmann::json json;
    try {
        json = nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        throw TemplateCatalogError("cannot parse " + path + ": " + e.what());
    }

    std::string baseDir = std::filesystem::path(path).parent_path().string();
    TemplateCatalog catalog = fromJson(json, baseDir);
    logging::Logger::getInstance().info("Loaded " + std::to_string(catalog.size()) + " templates from " + path);
    return catalog;
}

const Template* TemplateCatalog::findById(const std::string& id) const {
    for (const auto& tpl : templates_) {
        if (tpl.id == id) {
            return &tpl;
        }
    }
    return nullptr;
}

std::optional<size_t> TemplateCatalog::indexOf(const std::string& id) const {
    for (size_t i = 0; i < templates_.size(); ++i) {
        if (templates_[i].id == id) {
            return i;
        }
    }
    return std::nullopt;
}

} // namespace photobooth::templates
