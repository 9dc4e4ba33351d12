/**
 * @file auth_args.hpp
 * @brief Command-line argument parsing for the authcore tools
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 *
 * Accepted forms: "--name value", "--name=value", "-n value", "-nvalue",
 * bundled short flags ("-qs") and "--" ending option processing. Numeric
 * values are parsed strictly and reported as Result errors.
 */
#ifndef AUTHCORE_AUTH_ARGS_HPP
#define AUTHCORE_AUTH_ARGS_HPP

#include "result.hpp"
#include <algorithm>
#include <charconv>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace authcore {
namespace args {

// ============================================================================
// Values and results
// ============================================================================

class ArgValue {
public:
    ArgValue() = default;
    explicit ArgValue(std::optional<std::string> text) : present_(true), text_(std::move(text)) {}

    [[nodiscard]] bool isSet() const noexcept { return present_; }
    [[nodiscard]] explicit operator bool() const noexcept { return present_; }

    [[nodiscard]] std::string asString(const std::string& fallback = "") const {
        return text_ ? *text_ : fallback;
    }

    /** @return @p fallback when no value, INVALID_ARGUMENT when not an integer */
    [[nodiscard]] Result<int64_t> asInt64(int64_t fallback = 0) const {
        if (!text_) return fallback;
        int64_t number = 0;
        const char* end = text_->data() + text_->size();
        auto [ptr, ec] = std::from_chars(text_->data(), end, number);
        if (ec == std::errc() && ptr == end && !text_->empty()) return number;
        return Err<int64_t>(ErrorCode::INVALID_ARGUMENT, "'" + *text_ + "' is not an integer");
    }

private:
    bool present_ = false;
    std::optional<std::string> text_;
};

class ParseResult {
public:
    [[nodiscard]] bool success() const noexcept { return error_.empty(); }
    [[nodiscard]] const std::string& error() const noexcept { return error_; }
    [[nodiscard]] bool helpRequested() const noexcept { return help_; }

    [[nodiscard]] bool has(const std::string& name) const { return values_.count(name) != 0; }

    [[nodiscard]] const ArgValue& get(const std::string& name) const {
        static const ArgValue missing;
        auto it = values_.find(name);
        return it == values_.end() ? missing : it->second;
    }
    [[nodiscard]] const ArgValue& operator[](const std::string& name) const { return get(name); }

private:
    friend class ArgParser;

    std::string error_;
    bool help_ = false;
    std::map<std::string, ArgValue> values_;
};

// ============================================================================
// ArgParser
// ============================================================================

class ArgParser {
public:
    explicit ArgParser(std::string programName = "", std::string description = "")
        : program_(std::move(programName)), description_(std::move(description)) {}

    ArgParser& addFlag(const std::string& name, char shortName = '\0', const std::string& description = "") {
        specs_.push_back({name, shortName, description, false, "", "", false});
        return *this;
    }

    /** @param defaultValue empty for "no default" */
    ArgParser& addOption(const std::string& name, char shortName = '\0', const std::string& description = "",
                         const std::string& defaultValue = "", const std::string& metavar = "VALUE") {
        specs_.push_back({name, shortName, description, true, defaultValue, metavar, false});
        return *this;
    }

    ArgParser& addRequired(const std::string& name, char shortName = '\0', const std::string& description = "",
                           const std::string& metavar = "VALUE") {
        specs_.push_back({name, shortName, description, true, "", metavar, true});
        return *this;
    }

    [[nodiscard]] ParseResult parse(int argc, char* argv[]) const {
        return parse(std::vector<std::string>(argv + (argc > 0 ? 1 : 0), argv + argc));
    }

    [[nodiscard]] ParseResult parse(const std::vector<std::string>& argv) const;

    [[nodiscard]] std::string help() const;

private:
    struct Spec {
        std::string name;
        char shortName;
        std::string description;
        bool takesValue;
        std::string defaultValue;
        std::string metavar;
        bool required;
    };

    const Spec* lookup(const std::string& name) const {
        for (const auto& spec : specs_) {
            if (spec.name == name) return &spec;
        }
        return nullptr;
    }

    const Spec* lookup(char shortName) const {
        for (const auto& spec : specs_) {
            if (shortName != '\0' && spec.shortName == shortName) return &spec;
        }
        return nullptr;
    }

    static std::string usageOf(const Spec& spec) {
        std::string text = spec.shortName ? std::string("-") + spec.shortName + ", " : std::string(4, ' ');
        text += "--" + spec.name;
        if (spec.takesValue) text += " " + spec.metavar;
        return text;
    }

    std::string program_;
    std::string description_;
    std::vector<Spec> specs_;
};

inline ParseResult ArgParser::parse(const std::vector<std::string>& argv) const {
    ParseResult out;
    auto fail = [&out](std::string message) {
        out.error_ = std::move(message);
        return out;
    };

    bool optionsEnded = false;
    for (std::size_t i = 0; i < argv.size(); ++i) {
        const std::string& word = argv[i];
        if (optionsEnded || word.size() < 2 || word[0] != '-') {
            return fail("Unexpected argument: " + word);
        }
        if (word == "--") {
            optionsEnded = true;
            continue;
        }
        if (word == "--help" || word == "-h") {
            out.help_ = true;
            continue;
        }

        if (word[1] == '-') {
            std::string name = word.substr(2);
            std::optional<std::string> inlined;
            if (auto eq = name.find('='); eq != std::string::npos) {
                inlined = name.substr(eq + 1);
                name.erase(eq);
            }
            const Spec* spec = lookup(name);
            if (!spec) return fail("Unknown option: --" + name);
            if (!spec->takesValue) {
                if (inlined) return fail("Option --" + name + " takes no value");
                out.values_[name] = ArgValue(std::nullopt);
                continue;
            }
            if (!inlined && i + 1 < argv.size()) inlined = argv[++i];
            if (!inlined || inlined->empty()) return fail("Option --" + name + " requires a value");
            out.values_[name] = ArgValue(inlined);
            continue;
        }

        // one or more short options; a value-taking one consumes the rest
        for (std::size_t k = 1; k < word.size(); ++k) {
            const Spec* spec = lookup(word[k]);
            if (!spec) return fail(std::string("Unknown option: -") + word[k]);
            if (!spec->takesValue) {
                out.values_[spec->name] = ArgValue(std::nullopt);
                continue;
            }
            std::string value = word.substr(k + 1);
            if (value.empty() && i + 1 < argv.size()) value = argv[++i];
            if (value.empty()) return fail("Option --" + spec->name + " requires a value");
            out.values_[spec->name] = ArgValue(value);
            break;
        }
    }

    for (const auto& spec : specs_) {
        if (out.values_.count(spec.name)) continue;
        if (!spec.defaultValue.empty()) {
            out.values_[spec.name] = ArgValue(spec.defaultValue);
        } else if (spec.required && !out.help_) {
            return fail("Required option missing: --" + spec.name);
        }
    }
    return out;
}

inline std::string ArgParser::help() const {
    std::size_t column = 20;
    for (const auto& spec : specs_) column = std::max(column, usageOf(spec).size() + 2);

    std::string text = "Usage: " + program_ + " [OPTIONS]\n\n";
    if (!description_.empty()) text += description_ + "\n\n";
    text += "Options:\n";
    auto line = [&](const std::string& usage, const std::string& what) {
        text += "  " + usage + std::string(column - usage.size(), ' ') + what + "\n";
    };
    line("-h, --help", "Show this help message");
    for (const auto& spec : specs_) {
        std::string what = spec.description;
        if (spec.required) what += " (required)";
        else if (!spec.defaultValue.empty()) what += " [default: " + spec.defaultValue + "]";
        line(usageOf(spec), what);
    }
    return text;
}

} // namespace args
} // namespace authcore

#endif // AUTHCORE_AUTH_ARGS_HPP
