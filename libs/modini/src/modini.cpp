#include "modkeeper/modini.h"
#include "modkeeper/error.h"
#include "modkeeper/modpath.h"

#include <format>
#include <fstream>

namespace modkeeper::modini {

std::optional<std::string> Section::get(const std::string& key) const {
    std::optional<std::string> out;
    for (const auto& [k, v] : entries) {
        if (modpath::iequals(k, key)) out = v;
    }
    return out;
}

std::vector<const Section*> Document::find_all(const std::string& name) const {
    std::vector<const Section*> out;
    for (const auto& s : sections) {
        if (modpath::iequals(s.name, name)) out.push_back(&s);
    }
    return out;
}

static std::string unquote(std::string v) {
    if (v.size() >= 2 && ((v.front() == '"' && v.back() == '"') ||
                          (v.front() == '\'' && v.back() == '\''))) {
        v = v.substr(1, v.size() - 2);
    }
    return v;
}

Document parse(std::istream& in) {
    Document doc;
    Section* current = nullptr;
    std::string line;
    bool first_line = true;

    while (std::getline(in, line)) {
        if (first_line) {
            // UTF-8 BOM
            if (line.size() >= 3 && static_cast<unsigned char>(line[0]) == 0xEF &&
                static_cast<unsigned char>(line[1]) == 0xBB &&
                static_cast<unsigned char>(line[2]) == 0xBF)
                line.erase(0, 3);
            first_line = false;
        }

        std::string t = modpath::trim(line);
        if (t.empty() || t[0] == ';' || t[0] == '#') continue;

        if (t.front() == '[') {
            auto close = t.find(']');
            if (close == std::string::npos) continue;
            doc.sections.push_back(Section{.name = modpath::trim(t.substr(1, close - 1)), .entries = {}});
            current = &doc.sections.back();
            continue;
        }

        auto eq = t.find('=');
        if (eq == std::string::npos) continue;
        std::string key = modpath::trim(t.substr(0, eq));
        if (key.empty()) continue;
        std::string value = unquote(modpath::trim(t.substr(eq + 1)));

        if (!current) {
            doc.sections.push_back(Section{.name = "", .entries = {}});
            current = &doc.sections.back();
        }
        current->entries.emplace_back(std::move(key), std::move(value));
    }
    return doc;
}

Document parse_file(const std::filesystem::path& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open())
        throw Error(ErrorKind::Filesystem, std::format("cannot open {}", path.string()));
    return parse(f);
}

static std::optional<std::string> first_of(const Section& s,
                                           std::initializer_list<const char*> keys) {
    for (const char* k : keys) {
        if (auto v = s.get(k)) return modpath::trim(*v);
    }
    return std::nullopt;
}

ModMetadata read_metadata(const Document& doc) {
    ModMetadata meta;
    for (const auto& name : metadata_sections()) {
        for (const Section* s : doc.find_all(name)) {
            if (auto v = first_of(*s, {"Name", "ModName"})) meta.name = std::move(v);
            if (auto v = first_of(*s, {"Author"})) meta.author = std::move(v);
            if (auto v = first_of(*s, {"Description"})) meta.description = std::move(v);
            if (auto v = first_of(*s, {"Type", "Category"})) meta.type_hint = std::move(v);
            if (auto v = first_of(*s, {"Target", "Entity", "Character"})) meta.entity_hint = std::move(v);
        }
    }
    return meta;
}

std::vector<Keybind> keybinds(const Document& doc) {
    std::vector<Keybind> out;
    for (const auto& s : doc.sections) {
        if (!modpath::starts_with_ci(s.name, "Key")) continue;
        auto key = s.get("key");
        if (!key) continue;
        out.push_back(Keybind{.title = modpath::trim(s.name.substr(3)), .key = *key});
    }
    return out;
}

} // namespace modkeeper::modini
