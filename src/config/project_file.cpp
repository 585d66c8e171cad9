/**
 * project_file.cpp
 * INI-like reader for build.smk
 */

#include "config/project_file.hpp"

#include <fstream>
#include <map>
#include <optional>
#include <regex>
#include <sstream>
#include <utility>

namespace spectre::make::config {

namespace {

struct Value {
    bool is_array = false;
    std::string scalar;
    std::vector<std::string> items;
};

struct FlagOverride {
    std::optional<std::vector<std::string>> compiler_flags;
    std::optional<std::vector<std::string>> linker_flags;
};

std::string trim(const std::string& text) {
    auto start = text.find_first_not_of(" \t\r");
    if (start == std::string::npos) return "";
    auto end = text.find_last_not_of(" \t\r");
    return text.substr(start, end - start + 1);
}

std::string location(const std::string& origin, size_t line_num) {
    return origin + ":" + std::to_string(line_num);
}

class Reader {
public:
    Reader(const std::string& origin, ProjectConfig& staged)
        : origin_(origin), staged_(staged) {}

    ProjectFileResult run(const std::string& content) {
        std::istringstream stream(content);
        std::string raw;

        while (std::getline(stream, raw)) {
            line_num_++;

            std::string line = trim(raw);
            if (line.empty() || line[0] == '#' || line[0] == ';') continue;

            if (line[0] == '[') {
                if (!enter_section(line)) return result_;
                continue;
            }

            auto eq_pos = line.find('=');
            if (eq_pos == std::string::npos) {
                fail(ErrorKind::CONFIG_ERROR, "expected 'key = value'");
                return result_;
            }

            std::string key = trim(line.substr(0, eq_pos));
            if (key.empty()) {
                fail(ErrorKind::CONFIG_ERROR, "missing key before '='");
                return result_;
            }

            std::optional<Value> value = parse_value(trim(line.substr(eq_pos + 1)));
            if (!value) return result_;

            if (!assign(key, *value)) return result_;
        }

        for (const auto& [name, flags] : overrides_) {
            BuildError error = staged_.profiles.override_flags(
                name, flags.compiler_flags, flags.linker_flags);
            if (!error.ok()) {
                result_.error = error;
                return result_;
            }
        }

        return result_;
    }

private:
    const std::string& origin_;
    ProjectConfig& staged_;
    ProjectFileResult result_;
    size_t line_num_ = 0;

    std::string section_;
    std::string profile_section_;   // Profile name while inside [profile.X]
    std::map<std::string, FlagOverride> overrides_;

    void fail(ErrorKind kind, const std::string& message) {
        result_.error = BuildError(kind, location(origin_, line_num_), message);
    }

    void warn(const std::string& message) {
        result_.warnings.push_back(location(origin_, line_num_) + ": " + message);
    }

    bool enter_section(const std::string& line) {
        auto end = line.find(']');
        if (end == std::string::npos || end != line.size() - 1) {
            fail(ErrorKind::CONFIG_ERROR, "invalid section header");
            return false;
        }

        section_ = trim(line.substr(1, end - 1));
        profile_section_.clear();

        if (section_.compare(0, 8, "profile.") == 0) {
            std::string name = section_.substr(8);
            if (!parse_profile(name)) {
                fail(ErrorKind::UNKNOWN_PROFILE, "unknown profile section [" + section_ + "]");
                return false;
            }
            profile_section_ = name;
        } else if (section_ != "project" && section_ != "toolchain" && section_ != "tests") {
            warn("unknown section [" + section_ + "] ignored");
        }
        return true;
    }

    std::optional<Value> parse_value(const std::string& text) {
        Value value;

        if (!text.empty() && text.front() == '[') {
            if (text.back() != ']') {
                fail(ErrorKind::CONFIG_ERROR, "unterminated array");
                return std::nullopt;
            }
            value.is_array = true;

            // Comma-separated quoted strings
            std::string content = text.substr(1, text.size() - 2);
            std::regex item_regex("\"([^\"]*)\"");
            std::sregex_iterator it(content.begin(), content.end(), item_regex);
            std::sregex_iterator end;
            std::string rest;
            std::string tail = content;
            for (; it != end; ++it) {
                rest += it->prefix().str();
                tail = it->suffix().str();
                value.items.push_back((*it)[1].str());
            }
            rest += tail;
            if (rest.find_first_not_of(" \t,") != std::string::npos) {
                fail(ErrorKind::CONFIG_ERROR, "array items must be quoted strings");
                return std::nullopt;
            }
            return value;
        }

        if (text.size() >= 2 && text.front() == '"' && text.back() == '"') {
            value.scalar = text.substr(1, text.size() - 2);
        } else {
            value.scalar = text;
        }
        return value;
    }

    bool expect_string(const std::string& key, const Value& value, std::string& out) {
        if (value.is_array) {
            fail(ErrorKind::CONFIG_ERROR, "'" + key + "' expects a string");
            return false;
        }
        if (value.scalar.empty()) {
            fail(ErrorKind::CONFIG_ERROR, "'" + key + "' must not be empty");
            return false;
        }
        out = value.scalar;
        return true;
    }

    // Input roots stay inside the project and clear of the output roots
    bool expect_path(const std::string& key, const Value& value, fs::path& out) {
        std::string text;
        if (!expect_string(key, value, text)) return false;

        fs::path normal = fs::path(text).lexically_normal();
        std::string first = normal.empty() ? "" : normal.begin()->string();
        if (normal.is_absolute() || first == "." || first == ".." || first.empty()) {
            fail(ErrorKind::CONFIG_ERROR,
                 "'" + key + "' must be a subdirectory of the project root");
            return false;
        }
        if (first == BUILD_DIR || first == BIN_DIR || first == LIB_DIR) {
            fail(ErrorKind::CONFIG_ERROR,
                 "'" + key + "' must not lie inside the output directory " + first + "/");
            return false;
        }
        out = normal;
        return true;
    }

    bool expect_array(const std::string& key, const Value& value, std::vector<std::string>& out) {
        if (!value.is_array) {
            fail(ErrorKind::CONFIG_ERROR, "'" + key + "' expects an array of strings");
            return false;
        }
        out = value.items;
        return true;
    }

    bool expect_prefixes(const std::string& key, const Value& value, std::vector<std::string>& out) {
        std::vector<std::string> items;
        if (!expect_array(key, value, items)) return false;
        for (const auto& item : items) {
            if (item.empty()) {
                fail(ErrorKind::CONFIG_ERROR, "'" + key + "' must not contain an empty prefix");
                return false;
            }
        }
        out = std::move(items);
        return true;
    }

    bool assign(const std::string& key, const Value& value) {
        if (!profile_section_.empty()) {
            FlagOverride& flags = overrides_[profile_section_];
            std::vector<std::string> items;
            if (key == "cflags") {
                if (!expect_array(key, value, items)) return false;
                flags.compiler_flags = std::move(items);
            } else if (key == "ldflags") {
                if (!expect_array(key, value, items)) return false;
                flags.linker_flags = std::move(items);
            } else {
                warn("unknown key '" + key + "' in [" + section_ + "] ignored");
            }
            return true;
        }

        if (section_ == "project") {
            if (key == "name")            return expect_string(key, value, staged_.project_name);
            if (key == "sources")         return expect_path(key, value, staged_.source_dir);
            if (key == "tests")           return expect_path(key, value, staged_.test_dir);
            if (key == "include")         return expect_path(key, value, staged_.include_dir);
            if (key == "extensions")      return expect_array(key, value, staged_.source_extensions);
            if (key == "executable_only") return expect_array(key, value, staged_.executable_only_dirs);
        } else if (section_ == "toolchain") {
            if (key == "compiler") return expect_string(key, value, staged_.toolchain.compiler);
            if (key == "archiver") return expect_string(key, value, staged_.toolchain.archiver);
        } else if (section_ == "tests") {
            if (key == "prefixes") return expect_prefixes(key, value, staged_.test_prefixes);
        } else if (section_.empty()) {
            warn("key '" + key + "' outside of any section ignored");
            return true;
        } else {
            return true;  // unknown section, already warned
        }

        warn("unknown key '" + key + "' in [" + section_ + "] ignored");
        return true;
    }
};

} // namespace

ProjectFileResult parse_project_file(const std::string& content,
                                     const std::string& origin,
                                     ProjectConfig& config) {
    ProjectConfig staged = config;
    Reader reader(origin, staged);

    ProjectFileResult result = reader.run(content);
    result.found = true;
    if (result.ok()) {
        config = std::move(staged);
    }
    return result;
}

ProjectFileResult load_project_file(const fs::path& path,
                                    bool required,
                                    ProjectConfig& config) {
    ProjectFileResult result;

    std::error_code ec;
    if (!fs::exists(path, ec)) {
        if (required) {
            result.error = BuildError(ErrorKind::CONFIG_ERROR, path.string(),
                                      "project file not found");
        }
        return result;
    }

    std::ifstream file(path);
    if (!file) {
        result.error = BuildError(ErrorKind::CONFIG_ERROR, path.string(),
                                  "cannot open project file");
        return result;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    return parse_project_file(buffer.str(), path.string(), config);
}

} // namespace spectre::make::config
