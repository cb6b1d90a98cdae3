// SEEDFORGE - Configuration Implementation
// Copyright (c) 2024 SEEDFORGE Developers
// MIT License

#include "seedforge/util/config.h"
#include "seedforge/util/logging.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

namespace seedforge {
namespace util {

namespace {

const char* const COMMAND_LINE = "<command-line>";
const char* const DEFAULT = "<default>";

std::string StripSpace(const std::string& s) {
    auto first = std::find_if_not(s.begin(), s.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto last = std::find_if_not(s.rbegin(), s.rend(),
                                 [](unsigned char c) { return std::isspace(c); }).base();
    return first < last ? std::string(first, last) : std::string();
}

/// Drop one pair of matching outer quotes
std::string StripQuotes(const std::string& s) {
    if (s.size() >= 2 && (s.front() == '"' || s.front() == '\'') && s.back() == s.front()) {
        return s.substr(1, s.size() - 2);
    }
    return s;
}

bool IsKeyName(const std::string& key) {
    return !key.empty() &&
           std::all_of(key.begin(), key.end(), [](unsigned char c) {
               return std::isalnum(c) || c == '-' || c == '_';
           });
}

} // namespace

ParseStatus ParseStatus::Fail(const std::string& source, int line, const std::string& what) {
    ParseStatus status;
    status.ok = false;
    status.message = source;
    if (line > 0) {
        status.message += ":" + std::to_string(line);
    }
    status.message += ": " + what;
    return status;
}

bool ConfigManager::Insert(const std::string& key, std::string text, std::string origin) {
    return values_.emplace(key, Value{std::move(text), std::move(origin)}).second;
}

// ============================================================================
// Sources
// ============================================================================

ParseStatus ConfigManager::ParseCommandLine(int argc, const char* const argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg.size() < 2 || arg[0] != '-') {
            positional_.push_back(arg);
            continue;
        }

        std::string body = arg.substr(arg.compare(0, 2, "--") == 0 ? 2 : 1);
        std::string key = body;
        std::string value = "true";

        size_t eq = body.find('=');
        if (eq != std::string::npos) {
            key = body.substr(0, eq);
            value = body.substr(eq + 1);
        } else if (i + 1 < argc && argv[i + 1][0] != '-') {
            value = argv[++i];
        }

        if (!IsKeyName(key)) {
            return ParseStatus::Fail(COMMAND_LINE, 0, "bad option '" + arg + "'");
        }
        if (!Insert(key, value, COMMAND_LINE)) {
            return ParseStatus::Fail(COMMAND_LINE, 0, "option '" + key + "' given twice");
        }
    }
    return {};
}

ParseStatus ConfigManager::ParseFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return ParseStatus::Fail(path, 0, "cannot open configuration file");
    }

    std::string text(MAX_CONFIG_FILE_SIZE + 1, '\0');
    in.read(&text[0], static_cast<std::streamsize>(text.size()));
    text.resize(static_cast<size_t>(in.gcount()));
    if (text.size() > MAX_CONFIG_FILE_SIZE) {
        return ParseStatus::Fail(path, 0, "configuration file exceeds " +
                                 std::to_string(MAX_CONFIG_FILE_SIZE) + " bytes");
    }
    return ParseString(text, path);
}

ParseStatus ConfigManager::ParseString(const std::string& text, const std::string& source) {
    std::istringstream lines(text);
    std::string raw;
    int lineNo = 0;

    while (std::getline(lines, raw)) {
        ++lineNo;
        std::string line = StripSpace(raw);
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        std::string key = line;
        std::string value = "true";
        size_t eq = line.find('=');
        if (eq != std::string::npos) {
            key = StripSpace(line.substr(0, eq));
            value = StripQuotes(StripSpace(line.substr(eq + 1)));
        }

        if (!IsKeyName(key)) {
            return ParseStatus::Fail(source, lineNo, "bad option name '" + key + "'");
        }

        std::string origin = source + ":" + std::to_string(lineNo);
        if (!Insert(key, value, origin)) {
            LOG_DEBUG(LogCategory::CONFIG) << "Ignoring " << key << " at " << origin
                                           << ", set by " << values_.at(key).origin;
        }
    }
    return {};
}

// ============================================================================
// Access
// ============================================================================

bool ConfigManager::HasKey(const std::string& key) const {
    return values_.count(key) != 0;
}

std::optional<std::string> ConfigManager::TryGetString(const std::string& key) const {
    auto it = values_.find(key);
    if (it == values_.end()) {
        return std::nullopt;
    }
    return it->second.text;
}

std::string ConfigManager::GetString(const std::string& key, const std::string& fallback) const {
    return TryGetString(key).value_or(fallback);
}

std::optional<int64_t> ConfigManager::TryGetInt(const std::string& key) const {
    auto text = TryGetString(key);
    if (!text || text->empty()) {
        return std::nullopt;
    }

    size_t i = ((*text)[0] == '-') ? 1 : 0;
    if (i == text->size() || text->size() > 18) {
        return std::nullopt;
    }
    int64_t value = 0;
    for (; i < text->size(); ++i) {
        unsigned char c = static_cast<unsigned char>((*text)[i]);
        if (!std::isdigit(c)) {
            return std::nullopt;
        }
        value = value * 10 + (c - '0');
    }
    return (*text)[0] == '-' ? -value : value;
}

std::optional<bool> ConfigManager::TryGetBool(const std::string& key) const {
    auto text = TryGetString(key);
    if (!text) {
        return std::nullopt;
    }
    std::string word = *text;
    std::transform(word.begin(), word.end(), word.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (word == "1" || word == "true" || word == "yes" || word == "on") {
        return true;
    }
    if (word == "0" || word == "false" || word == "no" || word == "off") {
        return false;
    }
    return std::nullopt;
}

void ConfigManager::SetDefault(const std::string& key, const std::string& value) {
    Insert(key, value, DEFAULT);
}

void ConfigManager::AllowKey(const std::string& key) {
    allowed_.insert(key);
}

std::vector<std::string> ConfigManager::Validate() const {
    std::vector<std::string> problems;
    if (allowed_.empty()) {
        return problems;
    }
    for (const auto& [key, value] : values_) {
        if (allowed_.count(key) == 0) {
            problems.push_back("unknown option '" + key + "' (" + value.origin + ")");
        }
    }
    return problems;
}

} // namespace util
} // namespace seedforge
