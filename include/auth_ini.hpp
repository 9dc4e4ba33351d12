/**
 * @file auth_ini.hpp
 * @brief INI configuration file parsing for the authorization core
 * @author Bennie Shearer
 * @version 1.0.0
 * @date 2025-01-06
 *
 * This header provides:
 * - a line reader accepting "key = value" and "key: value"
 * - indented continuation lines joined to the previous value
 * - strict typed lookups returning std::optional
 */

#ifndef AUTHCORE_INI_HPP
#define AUTHCORE_INI_HPP

#include <cctype>
#include <charconv>
#include <fstream>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace authcore {
namespace ini {

// ============================================================================
// IniSection
// ============================================================================

class IniSection {
public:
    IniSection() = default;
    explicit IniSection(std::string name) : name_(std::move(name)) {}

    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] bool contains(const std::string& key) const noexcept { return entries_.count(key) != 0; }

    [[nodiscard]] std::optional<std::string> get(const std::string& key) const {
        auto it = entries_.find(key);
        if (it == entries_.end()) return std::nullopt;
        return it->second;
    }

    [[nodiscard]] std::string get(const std::string& key, const std::string& fallback) const {
        return get(key).value_or(fallback);
    }

    /** @return nullopt when absent or not a whole decimal number */
    [[nodiscard]] std::optional<int> getInt(const std::string& key) const noexcept {
        auto it = entries_.find(key);
        if (it == entries_.end() || it->second.empty()) return std::nullopt;
        const char* first = it->second.data();
        const char* last = first + it->second.size();
        if (*first == '+') ++first;
        int value = 0;
        auto [ptr, ec] = std::from_chars(first, last, value);
        if (ec != std::errc() || ptr != last) return std::nullopt;
        return value;
    }

    [[nodiscard]] int getInt(const std::string& key, int fallback) const noexcept {
        return getInt(key).value_or(fallback);
    }

    /** @brief true/false, yes/no, on/off or 1/0, any case */
    [[nodiscard]] std::optional<bool> getBool(const std::string& key) const {
        auto raw = get(key);
        if (!raw) return std::nullopt;
        std::string word;
        for (char c : *raw) word += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        static const std::map<std::string, bool> words = {
            {"1", true}, {"yes", true}, {"true", true}, {"on", true},
            {"0", false}, {"no", false}, {"false", false}, {"off", false},
        };
        auto it = words.find(word);
        if (it == words.end()) return std::nullopt;
        return it->second;
    }

    /** @brief Items separated by commas or line breaks; blank items dropped */
    [[nodiscard]] std::vector<std::string> getList(const std::string& key) const {
        std::vector<std::string> items;
        auto raw = get(key);
        if (!raw) return items;
        std::string current;
        auto flush = [&] {
            auto first = current.find_first_not_of(" \t");
            if (first != std::string::npos) {
                items.push_back(current.substr(first, current.find_last_not_of(" \t") - first + 1));
            }
            current.clear();
        };
        for (char c : *raw) {
            if (c == ',' || c == '\n') flush();
            else current += c;
        }
        flush();
        return items;
    }

private:
    friend class IniFile;

    std::string name_;
    std::map<std::string, std::string> entries_;
};

// ============================================================================
// IniFile
// ============================================================================

class IniFile {
public:
    IniFile() = default;

    /**
     * @brief Parse INI text
     *
     * Lines starting with ';' or '#' are comments. A line indented deeper
     * than its key continues the previous value. Values wrapped in matching
     * single or double quotes lose the quotes.
     */
    [[nodiscard]] static IniFile parse(std::string_view content);

    /** @return nullopt when the file cannot be opened */
    [[nodiscard]] static std::optional<IniFile> load(const std::string& path) {
        std::ifstream in(path);
        if (!in) return std::nullopt;
        std::stringstream buffer;
        buffer << in.rdbuf();
        return parse(buffer.str());
    }

    [[nodiscard]] bool hasSection(const std::string& name) const noexcept { return sections_.count(name) != 0; }

    [[nodiscard]] const IniSection* section(const std::string& name) const noexcept {
        auto it = sections_.find(name);
        return it == sections_.end() ? nullptr : &it->second;
    }

    /** @brief Keys appearing before the first section header */
    [[nodiscard]] const IniSection& global() const noexcept { return global_; }

    [[nodiscard]] std::optional<std::string> get(const std::string& sectionName, const std::string& key) const {
        const IniSection* sec = section(sectionName);
        if (!sec) return std::nullopt;
        return sec->get(key);
    }

private:
    /** @brief Section @p name, created empty when missing */
    IniSection& openSection(const std::string& name) {
        return sections_.try_emplace(name, name).first->second;
    }

    static std::string_view strip(std::string_view s) {
        while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
        while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
        return s;
    }

    static std::string unquote(std::string_view value) {
        if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
            value = value.substr(1, value.size() - 2);
        }
        return std::string(value);
    }

    IniSection global_;
    std::map<std::string, IniSection> sections_;
};

inline IniFile IniFile::parse(std::string_view content) {
    IniFile file;
    IniSection* current = &file.global_;
    std::string* lastValue = nullptr;
    std::size_t lastIndent = 0;

    while (!content.empty()) {
        std::size_t eol = content.find('\n');
        std::string_view raw = content.substr(0, eol);
        content = eol == std::string_view::npos ? std::string_view() : content.substr(eol + 1);

        std::string_view line = strip(raw);
        if (line.empty() || line.front() == ';' || line.front() == '#') continue;

        std::size_t indent = raw.find_first_not_of(" \t");
        if (lastValue && indent > lastIndent) {
            lastValue->append(lastValue->empty() ? "" : "\n").append(line);
            continue;
        }
        lastValue = nullptr;

        if (line.front() == '[' && line.back() == ']') {
            std::string_view name = strip(line.substr(1, line.size() - 2));
            if (!name.empty()) current = &file.openSection(std::string(name));
            continue;
        }

        std::size_t sep = line.find_first_of("=:");
        if (sep == std::string_view::npos) continue;
        std::string key(strip(line.substr(0, sep)));
        if (key.empty()) continue;
        std::string& slot = current->entries_[key];
        slot = unquote(strip(line.substr(sep + 1)));
        lastValue = &slot;
        lastIndent = indent;
    }
    return file;
}

} // namespace ini
} // namespace authcore

#endif // AUTHCORE_INI_HPP
