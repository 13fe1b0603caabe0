#include "modkeeper/classify.h"
#include "modkeeper/log.h"
#include "modkeeper/modini.h"
#include "modkeeper/modpath.h"
#include "modkeeper/probe.h"

#include <algorithm>
#include <regex>

namespace fs = std::filesystem;

namespace modkeeper::classify {

// ---------------------------------------------------------------------------
// ClassificationMaps
// ---------------------------------------------------------------------------

ClassificationMaps ClassificationMaps::build(const catalog::Catalog& cat) {
    return from(cat.categories(), cat.entities());
}

ClassificationMaps ClassificationMaps::from(const std::vector<catalog::Category>& categories,
                                            const std::vector<catalog::Entity>& entities) {
    ClassificationMaps maps;
    for (const auto& c : categories) {
        maps.category_ids.emplace(c.slug, c.id);
        auto [it, inserted] = maps.category_names.emplace(modpath::to_lower(c.name), c.slug);
        if (!inserted && it->second != c.slug)
            LOGW("classify: category name", c.name, "is shared by", it->second, "and", c.slug);
    }

    // Entities arrive in id order, so the oldest entity keeps a shared name.
    for (const auto& e : entities) {
        maps.entity_ids.emplace(e.slug, e.id);
        if (e.slug.ends_with(catalog::other_entity_suffix) && e.name == catalog::other_entity_name)
            continue;
        auto [it, inserted] = maps.entity_names.emplace(modpath::to_lower(e.name), e.slug);
        if (!inserted && it->second != e.slug)
            LOGW("classify: entity name", e.name, "is shared by", it->second, "and", e.slug,
                 "- keeping", it->second);
    }
    return maps;
}

std::optional<std::string> ClassificationMaps::match_entity(const std::string& name) const {
    if (name.empty()) return std::nullopt;
    if (entity_ids.contains(name)) return name;
    auto it = entity_names.find(modpath::to_lower(name));
    if (it != entity_names.end()) return it->second;
    return std::nullopt;
}

std::optional<std::string> ClassificationMaps::match_category(const std::string& name) const {
    if (name.empty()) return std::nullopt;
    if (category_ids.contains(name)) return name;
    auto it = category_names.find(modpath::to_lower(name));
    if (it != category_names.end()) return it->second;
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// Fuzzy fallback
// ---------------------------------------------------------------------------

static bool prefix_either_way(const std::string& a, const std::string& b) {
    return modpath::starts_with_ci(a, b) || modpath::starts_with_ci(b, a);
}

std::optional<std::string> fuzzy_category_match(const std::string& candidate,
                                                const ClassificationMaps& maps) {
    if (candidate.empty()) return std::nullopt;

    std::vector<std::string> slugs;
    slugs.reserve(maps.category_ids.size());
    for (const auto& [slug, id] : maps.category_ids) slugs.push_back(slug);
    std::sort(slugs.begin(), slugs.end());
    for (const auto& slug : slugs) {
        if (!slug.empty() && prefix_either_way(candidate, slug)) return slug;
    }

    std::vector<std::pair<std::string, std::string>> names(maps.category_names.begin(),
                                                            maps.category_names.end());
    std::sort(names.begin(), names.end());
    for (const auto& [name, slug] : names) {
        if (!name.empty() && prefix_either_way(candidate, name)) return slug;
    }
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// Name cleanup
// ---------------------------------------------------------------------------

std::string clean_mod_name(const std::string& raw, const std::string& folder_name) {
    static const std::regex rx(R"((_v\d+(\.\d+)*|_DISABLED|DISABLED_|\(disabled\)))",
                               std::regex_constants::icase);
    std::string cleaned = modpath::trim(std::regex_replace(raw, rx, ""));
    return cleaned.empty() ? folder_name : cleaned;
}

// ---------------------------------------------------------------------------
// Deducer
// ---------------------------------------------------------------------------

const char* match_source_name(MatchSource source) {
    switch (source) {
        case MatchSource::Ancestry: return "ancestry";
        case MatchSource::Descriptor: return "descriptor";
        case MatchSource::CategoryOther: return "category";
        case MatchSource::Fuzzy: return "fuzzy";
        case MatchSource::Fallback: return "fallback";
    }
    return "fallback";
}

static std::vector<std::string> relative_components(const fs::path& base, const fs::path& dir) {
    std::vector<std::string> parts;
    fs::path rel = dir.lexically_normal().lexically_relative(base.lexically_normal());
    for (const auto& p : rel) {
        std::string s = p.string();
        if (s.empty() || s == ".") continue;
        if (s == "..") return {};
        parts.push_back(std::move(s));
    }
    return parts;
}

static modini::ModMetadata read_descriptor(const fs::path& mod_dir) {
    auto files = probe::descriptor_files(mod_dir);
    if (files.empty()) return {};
    try {
        return modini::read_metadata(modini::parse_file(files.front()));
    } catch (const std::exception& e) {
        LOGW("classify: unreadable descriptor", files.front().string(), e.what());
        return {};
    }
}

std::optional<DeducedInfo> deduce_mod_info(const fs::path& mod_dir, const fs::path& base,
                                           const ClassificationMaps& maps,
                                           const std::string& fallback_category) {
    fs::path dir = mod_dir.lexically_normal();
    if (!dir.has_filename()) dir = dir.parent_path();
    // Deduce from the canonical leaf so a mod classifies the same either way it is toggled.
    std::string folder_name = modpath::strip_disabled_prefix(dir.filename().string());
    if (folder_name.empty() || folder_name == "." || folder_name == "..") return std::nullopt;

    DeducedInfo info;
    info.mod_name = folder_name;
    info.image_filename = probe::find_preview_image(dir);

    // 1. Ancestry: parents from nearest to the top-level folder under base.
    auto parts = relative_components(base, dir);
    if (!parts.empty()) parts.back() = folder_name;
    std::optional<std::string> entity;
    std::optional<std::string> category;
    if (parts.size() >= 2) {
        for (size_t i = parts.size() - 1; i-- > 0;) {
            if (!entity) entity = maps.match_entity(parts[i]);
            if (!category) category = maps.match_category(parts[i]);
            if (entity && category) break;
        }
    }
    if (entity) info.source = MatchSource::Ancestry;

    // 2. Descriptor hints.
    auto meta = read_descriptor(dir);
    if (meta.name && !meta.name->empty()) info.mod_name = *meta.name;
    info.author = meta.author;
    info.description = meta.description;
    info.mod_type_tag = meta.type_hint;

    // 3. Hint resolution.
    if (meta.entity_hint && !meta.entity_hint->empty()) {
        auto hinted = maps.match_entity(*meta.entity_hint);
        if (!entity) {
            if (hinted) {
                entity = hinted;
                info.source = MatchSource::Descriptor;
            } else {
                // Warned once per hint value.
                LOGW_ONCE(::modkeeper::log::detail::fnv1a_hash(meta.entity_hint->c_str()), "classify:", dir.string(),
                          "names unknown entity", *meta.entity_hint);
            }
        } else if (hinted && *hinted != *entity) {
            LOGW("classify:", dir.string(), "sits under entity", *entity,
                 "but its descriptor names", *hinted, "- keeping", *entity);
        }
    }
    if (!category && meta.type_hint && !meta.type_hint->empty())
        category = maps.match_category(*meta.type_hint);

    // 4. Fallback chain.
    if (entity) {
        info.entity_slug = *entity;
    } else if (category) {
        info.entity_slug = catalog::other_entity_slug(*category);
        info.source = MatchSource::CategoryOther;
    } else {
        std::string top = parts.empty() ? folder_name : parts.front();
        if (auto fuzzy = fuzzy_category_match(top, maps)) {
            info.entity_slug = catalog::other_entity_slug(*fuzzy);
            info.source = MatchSource::Fuzzy;
            LOGD("classify: fuzzy matched", top, "to category", *fuzzy);
        } else {
            info.entity_slug = catalog::other_entity_slug(fallback_category);
            info.source = MatchSource::Fallback;
            LOGI("classify: no signal for", dir.string(), "- assigning", info.entity_slug);
        }
    }

    // 5. Name cleanup.
    info.mod_name = clean_mod_name(info.mod_name, folder_name);
    return info;
}

} // namespace modkeeper::classify
