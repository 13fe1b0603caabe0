#pragma once

#include "modkeeper/catalog.h"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace modkeeper::classify {

// ClassificationMaps is a point-in-time lookup over categories and entities.
// Build a fresh one for every scan.
struct ClassificationMaps {
    std::unordered_map<std::string, int64_t> category_ids;      // slug -> id
    std::unordered_map<std::string, int64_t> entity_ids;        // slug -> id
    std::unordered_map<std::string, std::string> category_names; // lowercase name -> slug
    std::unordered_map<std::string, std::string> entity_names;   // lowercase name -> slug

    static ClassificationMaps build(const catalog::Catalog& cat);
    static ClassificationMaps from(const std::vector<catalog::Category>& categories,
                                   const std::vector<catalog::Entity>& entities);

    // match_entity resolves a folder name or hint: exact slug first, then
    // case-insensitive display name. Returns the entity slug.
    std::optional<std::string> match_entity(const std::string& name) const;
    std::optional<std::string> match_category(const std::string& name) const;
};

// fuzzy_category_match compares candidate against every category slug, then
// every category name, sorted, using case-insensitive prefix containment in
// either direction. The first hit wins. An empty candidate never matches.
std::optional<std::string> fuzzy_category_match(const std::string& candidate,
                                                const ClassificationMaps& maps);

// clean_mod_name strips version suffixes and disabled markers. Falls back to
// folder_name when nothing is left.
std::string clean_mod_name(const std::string& raw, const std::string& folder_name);

// How the entity of a mod was decided.
enum class MatchSource {
    Ancestry,      // a parent folder named the entity
    Descriptor,    // the descriptor's Target/Entity/Character key
    CategoryOther, // only a category was known
    Fuzzy,         // first path component prefix-matched a category
    Fallback,      // configured fallback category
};

const char* match_source_name(MatchSource source);

struct DeducedInfo {
    std::string entity_slug;
    std::string mod_name;
    std::optional<std::string> mod_type_tag;
    std::optional<std::string> author;
    std::optional<std::string> description;
    std::optional<std::string> image_filename;
    MatchSource source = MatchSource::Fallback;
};

// deduce_mod_info classifies mod_dir (a directory below base). It never
// fails: missing signals degrade to the fallback category's "Other" entity.
// Returns nullopt only when mod_dir has no usable name.
std::optional<DeducedInfo> deduce_mod_info(const std::filesystem::path& mod_dir,
                                           const std::filesystem::path& base,
                                           const ClassificationMaps& maps,
                                           const std::string& fallback_category);

} // namespace modkeeper::classify
