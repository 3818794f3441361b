#include "page_norm/io/corpus_io.hpp"
#include "page_norm/core/errors.hpp"
#include "page_norm/core/utils.hpp"
#include "page_norm/io/raster_io.hpp"

#include <opencv2/imgcodecs.hpp>

#include <map>
#include <set>

namespace page_norm {

using json = nlohmann::json;

void to_json(json& j, const Box& b) {
    j = json::array({b.left, b.top, b.right, b.bottom});
}

void from_json(const json& j, Box& b) {
    if (!j.is_array() || j.size() != 4) {
        throw ValidationError("bounding box must be an array of four integers");
    }
    b.left = j.at(0).get<int>();
    b.top = j.at(1).get<int>();
    b.right = j.at(2).get<int>();
    b.bottom = j.at(3).get<int>();
}

void to_json(json& j, const PageSource& p) {
    j = json{{"id", p.id},
             {"filename", p.filename},
             {"originalPath", p.path.string()},
             {"checksum", p.checksum},
             {"widthPx", p.width_px},
             {"heightPx", p.height_px}};
    if (p.density) j["density"] = *p.density;
}

void from_json(const json& j, PageSource& p) {
    p.id = j.at("id").get<std::string>();
    p.path = j.at("originalPath").get<std::string>();
    p.filename = j.value("filename", p.path.filename().string());
    p.checksum = j.value("checksum", std::string());
    p.width_px = j.value("widthPx", 0);
    p.height_px = j.value("heightPx", 0);
    if (j.contains("density") && j["density"].is_number()) {
        p.density = j["density"].get<double>();
    } else {
        p.density.reset();
    }
}

void to_json(json& j, const BoundsEstimate& e) {
    j = json{{"pageId", e.page_id},
             {"widthPx", e.width_px},
             {"heightPx", e.height_px},
             {"bleedPx", e.bleed_px},
             {"trimPx", e.trim_px},
             {"pageBounds", e.page_bounds},
             {"contentBounds", e.content_bounds}};
}

void from_json(const json& j, BoundsEstimate& e) {
    e.page_id = j.at("pageId").get<std::string>();
    e.width_px = j.value("widthPx", 0);
    e.height_px = j.value("heightPx", 0);
    e.bleed_px = j.value("bleedPx", 0.0);
    e.trim_px = j.value("trimPx", 0.0);
    if (j.contains("pageBounds")) e.page_bounds = j["pageBounds"].get<Box>();
    if (j.contains("contentBounds")) e.content_bounds = j["contentBounds"].get<Box>();
}

} // namespace page_norm

namespace page_norm::io {

using json = nlohmann::json;

namespace {

json parse_file(const fs::path& path) {
    try {
        return json::parse(core::read_text(path));
    } catch (const json::parse_error& e) {
        throw ValidationError("Cannot parse " + path.string() + ": " + e.what());
    }
}

void require_unique_id(std::set<std::string>& seen, const std::string& id, const fs::path& path) {
    if (!seen.insert(id).second) {
        throw ValidationError(path.string() + ": duplicate page id '" + id + "'");
    }
}

const json& records_of(const json& doc, const char* key, const fs::path& path) {
    if (doc.is_array()) return doc;
    if (doc.is_object() && doc.contains(key) && doc[key].is_array()) return doc[key];
    throw ValidationError(path.string() + ": expected an array or an object with '" + key + "'");
}

} // namespace

std::vector<PageSource> load_page_sources(const fs::path& path) {
    const json doc = parse_file(path);
    std::vector<PageSource> pages;
    std::set<std::string> ids;
    try {
        for (const auto& rec : records_of(doc, "pages", path)) {
            pages.push_back(rec.get<PageSource>());
            require_unique_id(ids, pages.back().id, path);
        }
    } catch (const json::exception& e) {
        throw ValidationError(path.string() + ": " + e.what());
    }
    return pages;
}

std::map<std::string, BoundsEstimate> load_bounds_estimates(const fs::path& path) {
    const json doc = parse_file(path);
    std::map<std::string, BoundsEstimate> estimates;
    try {
        for (const auto& rec : records_of(doc, "estimates", path)) {
            auto e = rec.get<BoundsEstimate>();
            if (estimates.count(e.page_id)) {
                throw ValidationError(path.string() + ": duplicate estimate for page '" + e.page_id + "'");
            }
            estimates[e.page_id] = e;
        }
    } catch (const json::exception& e) {
        throw ValidationError(path.string() + ": " + e.what());
    }
    return estimates;
}

std::vector<PageSource> discover_page_sources(const fs::path& dir, bool with_checksums,
                                              bool probe_dimensions) {
    std::vector<PageSource> pages;
    std::map<std::string, std::string> owners;
    for (const auto& p : core::discover_images(dir)) {
        if (!is_raster_image_path(p)) continue;
        PageSource page;
        page.id = p.stem().string();
        page.filename = p.filename().string();
        auto [it, inserted] = owners.emplace(page.id, page.filename);
        if (!inserted) {
            throw ValidationError("Page id '" + page.id + "' is shared by " + it->second +
                                  " and " + page.filename);
        }
        page.path = p;
        if (with_checksums) page.checksum = core::sha256_file(p);
        if (probe_dimensions) {
            cv::Mat img = cv::imread(p.string(), cv::IMREAD_ANYCOLOR);
            page.width_px = img.cols;
            page.height_px = img.rows;
            if (!img.empty()) page.density = read_density_hint(p);
        }
        pages.push_back(std::move(page));
    }
    return pages;
}

} // namespace page_norm::io
