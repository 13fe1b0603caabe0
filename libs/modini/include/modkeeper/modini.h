#pragma once

#include <filesystem>
#include <istream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace modkeeper::modini {

// Section is one [name] block of a descriptor file. Keys keep file order.
struct Section {
    std::string name;
    std::vector<std::pair<std::string, std::string>> entries;

    // get returns the value of key (case-insensitive); the last occurrence wins.
    std::optional<std::string> get(const std::string& key) const;
};

// Document is a parsed INI-style descriptor. Entries before the first
// section header land in a section with an empty name.
struct Document {
    std::vector<Section> sections;

    // find_all returns every section called name (case-insensitive), in file order.
    std::vector<const Section*> find_all(const std::string& name) const;
};

// parse reads INI text. Comment lines start with ';' or '#'; lines without
// '=' outside a header are ignored; values are trimmed and lose one pair of
// surrounding quotes.
Document parse(std::istream& in);

// parse_file reads and parses path. Throws modkeeper::Error (Filesystem)
// when the file cannot be opened.
Document parse_file(const std::filesystem::path& path);

// ModMetadata holds the descriptor hints used for classification.
struct ModMetadata {
    std::optional<std::string> name;
    std::optional<std::string> author;
    std::optional<std::string> description;
    std::optional<std::string> type_hint;   // Type, else Category
    std::optional<std::string> entity_hint; // Target, else Entity, else Character
};

// Sections consulted for metadata, in order. Later sections overwrite
// fields that earlier ones set.
inline const std::vector<std::string>& metadata_sections() {
    static const std::vector<std::string> names = {"Mod", "Settings", "Info", "General"};
    return names;
}

ModMetadata read_metadata(const Document& doc);

// Keybind is one hotkey a mod declares.
struct Keybind {
    std::string title;
    std::string key;
};

// keybinds lists sections named Key* that carry a "key" entry. The title is
// the section name without its "Key" prefix.
std::vector<Keybind> keybinds(const Document& doc);

} // namespace modkeeper::modini
