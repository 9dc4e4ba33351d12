/**
 * @file auth_config.hpp
 * @brief Typed configuration and its validation
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 *
 * Configuration is read from an INI file with the sections
 * [auth_api_prefetching], [auth_api] and [logging].
 */
#ifndef AUTHCORE_AUTH_CONFIG_HPP
#define AUTHCORE_AUTH_CONFIG_HPP

#include "auth_types.hpp"
#include "auth_error.hpp"
#include "auth_ini.hpp"
#include "auth_logger.hpp"
#include "auth_string_utils.hpp"
#include "result.hpp"
#include <set>
#include <string>
#include <vector>

namespace authcore {

//=============================================================================
// Validation report
//=============================================================================

/**
 * @brief Problems and notes collected while reading or checking a configuration
 *
 * Problems make the configuration unusable; notes are logged as warnings.
 */
class ConfigReport {
public:
    void problem(const std::string& key, const std::string& detail) { problems_.push_back(key + ": " + detail); }
    void note(const std::string& text) { notes_.push_back(text); }

    [[nodiscard]] bool ok() const noexcept { return problems_.empty(); }
    [[nodiscard]] const std::vector<std::string>& notes() const noexcept { return notes_; }

    /** @brief Problems joined into one line, "key: detail; key: detail" */
    [[nodiscard]] std::string describe() const { return string_utils::join(problems_, "; "); }

private:
    std::vector<std::string> problems_;
    std::vector<std::string> notes_;
};

//=============================================================================
// Structured Configuration
//=============================================================================

/**
 * @struct PrefetchConfig
 * @brief Tuning of the background snapshot refresh (all values in seconds)
 */
struct PrefetchConfig {
    int max_sleep_between_runs = 12;
    int tolerance_for_outdated = 300;
    int tolerance_for_outdated_on_error = 1200;
    std::string pickle_cache_dir;
    std::string pickle_cache_signature_secret;

    /** @brief The on-disk cache is used only when both cache options are non-blank */
    bool cacheEnabled() const {
        return !string_utils::isBlank(pickle_cache_dir) &&
               !string_utils::isBlank(pickle_cache_signature_secret);
    }
};

/**
 * @struct AuthConfig
 * @brief Complete runtime configuration
 */
struct AuthConfig {
    PrefetchConfig prefetching;

    CompilerMode compiler_mode = CompilerMode::DEFAULT;
    std::set<std::string> fqdn_only_categories;
    std::string directory_file;

    LogLevel log_level = LogLevel::LOG_INFO;
    std::string log_dir;
    bool log_console = false;

    /**
     * @brief Build a configuration from parsed INI content
     * @return CONFIG_PARSE_ERROR for malformed values, CONFIG_INVALID for
     *         values outside their permitted ranges
     */
    static Result<AuthConfig> fromIni(const ini::IniFile& file);

    static Result<AuthConfig> load(const std::string& path);
};

//=============================================================================
// Validator
//=============================================================================

class ConfigValidator {
public:
    static ConfigReport validate(const AuthConfig& config) {
        ConfigReport report;
        const PrefetchConfig& p = config.prefetching;
        atLeast(report, "max_sleep_between_runs", p.max_sleep_between_runs, 5);
        atLeast(report, "tolerance_for_outdated", p.tolerance_for_outdated, 60);
        atLeast(report, "tolerance_for_outdated_on_error", p.tolerance_for_outdated_on_error, 0);

        const bool dirBlank = string_utils::isBlank(p.pickle_cache_dir);
        const bool secretBlank = string_utils::isBlank(p.pickle_cache_signature_secret);
        if (dirBlank && !secretBlank) {
            report.problem("auth_api_prefetching.pickle_cache_dir",
                           "required when pickle_cache_signature_secret is set");
        } else if (!dirBlank && secretBlank) {
            report.problem("auth_api_prefetching.pickle_cache_signature_secret",
                           "required when pickle_cache_dir is set");
        }
        if (!secretBlank && p.pickle_cache_signature_secret.size() < 16) {
            report.note("auth_api_prefetching.pickle_cache_signature_secret is short ("
                        + std::to_string(p.pickle_cache_signature_secret.size()) + " characters)");
        }
        return report;
    }

    /** @throws ConfigurationError unless the configuration is valid */
    static void require(const AuthConfig& config) {
        ConfigReport report = validate(config);
        if (!report.ok()) throw ConfigurationError(report.describe());
    }

private:
    static void atLeast(ConfigReport& report, const char* key, int value, int min) {
        if (value < min) {
            report.problem(std::string("auth_api_prefetching.") + key,
                           std::to_string(value) + " is less than the minimum " + std::to_string(min));
        }
    }
};
//=============================================================================
// Implementation
//=============================================================================

inline Result<AuthConfig> AuthConfig::fromIni(const ini::IniFile& file) {
    AuthConfig config;
    ConfigReport malformed;
    auto reject = [&malformed](const std::string& key, const std::string& raw, const std::string& expected) {
        malformed.problem(key, "'" + raw + "' is not " + expected);
    };

    if (const auto* sec = file.section("auth_api_prefetching")) {
        const std::pair<const char*, int*> intervals[] = {
            {"max_sleep_between_runs", &config.prefetching.max_sleep_between_runs},
            {"tolerance_for_outdated", &config.prefetching.tolerance_for_outdated},
            {"tolerance_for_outdated_on_error", &config.prefetching.tolerance_for_outdated_on_error},
        };
        for (const auto& [key, target] : intervals) {
            if (!sec->contains(key)) continue;
            if (auto seconds = sec->getInt(key)) {
                *target = *seconds;
            } else {
                reject(std::string("auth_api_prefetching.") + key, sec->get(key, ""), "a whole number of seconds");
            }
        }
        config.prefetching.pickle_cache_dir = string_utils::trim(sec->get("pickle_cache_dir", ""));
        config.prefetching.pickle_cache_signature_secret = sec->get("pickle_cache_signature_secret", "");
    }

    if (const auto* sec = file.section("auth_api")) {
        if (auto mode = sec->get("compiler_mode")) {
            if (auto parsed = compilerModeFromString(*mode)) {
                config.compiler_mode = *parsed;
            } else {
                reject("auth_api.compiler_mode", *mode,
                       "one of default, skip_optimization, legacy_unsafe_negation");
            }
        }
        for (const auto& category : sec->getList("fqdn_only_categories")) {
            config.fqdn_only_categories.insert(category);
        }
        config.directory_file = sec->get("directory_file", "");
    }

    if (const auto* sec = file.section("logging")) {
        if (auto level = sec->get("level")) {
            if (auto parsed = logLevelFromString(*level)) {
                config.log_level = *parsed;
            } else {
                reject("logging.level", *level, "a log level (TRACE, DEBUG, INFO, WARN, ERROR, FATAL)");
            }
        }
        config.log_dir = sec->get("dir", "");
        if (auto raw = sec->get("console")) {
            if (auto console = sec->getBool("console")) {
                config.log_console = *console;
            } else {
                reject("logging.console", *raw, "a boolean");
            }
        }
    }

    if (!malformed.ok()) {
        return Err<AuthConfig>(ErrorCode::CONFIG_PARSE_ERROR, malformed.describe());
    }

    ConfigReport report = ConfigValidator::validate(config);
    for (const auto& note : report.notes()) {
        LOG_WARNING("Config", note);
    }
    if (!report.ok()) {
        return Err<AuthConfig>(ErrorCode::CONFIG_INVALID, report.describe());
    }
    return config;
}

inline Result<AuthConfig> AuthConfig::load(const std::string& path) {
    auto file = ini::IniFile::load(path);
    if (!file) {
        return Err<AuthConfig>(ErrorCode::CONFIG_MISSING, "cannot read configuration file: " + path);
    }
    return fromIni(*file).withContext(path);
}

} // namespace authcore

#endif // AUTHCORE_AUTH_CONFIG_HPP
