#include "VdfParser.hpp"
#include <pollswitch/Errors.hpp>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <optional>
#include <sstream>

namespace pollswitch {

namespace {

struct Token {
    std::string key;
    std::optional<std::string> value;
};

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool isNumber(const std::string& s) {
    return !s.empty() &&
           std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); });
}

// Reads one quoted string starting at pos, resolving \\ and \" escapes.
std::optional<std::string> readQuoted(const std::string& line, std::size_t& pos) {
    while (pos < line.size() && std::isspace(static_cast<unsigned char>(line[pos]))) {
        ++pos;
    }
    if (pos >= line.size() || line[pos] != '"') {
        return std::nullopt;
    }

    std::string out;
    for (++pos; pos < line.size(); ++pos) {
        char c = line[pos];
        if (c == '\\' && pos + 1 < line.size()) {
            out += line[++pos];
        } else if (c == '"') {
            ++pos;
            return out;
        } else {
            out += c;
        }
    }
    return std::nullopt;
}

std::optional<Token> tokenize(const std::string& line) {
    std::size_t pos = 0;
    auto key = readQuoted(line, pos);
    if (!key) {
        return std::nullopt;
    }
    return Token{*key, readQuoted(line, pos)};
}

std::string trim(const std::string& s) {
    auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

} // namespace

std::map<std::string, LibraryFolder> VdfParser::parseLibraryFolders(const std::string& content) {
    std::map<std::string, LibraryFolder> libraries;
    std::istringstream stream(content);
    std::string raw;

    int depth = 0;
    std::optional<std::string> currentKey;
    LibraryFolder current;

    while (std::getline(stream, raw)) {
        const std::string line = trim(raw);
        if (line.empty() || line.rfind("//", 0) == 0) {
            continue;
        }

        if (line == "{") {
            ++depth;
            continue;
        }

        if (line == "}") {
            --depth;
            if (currentKey && depth == 1) {
                libraries[*currentKey] = current;
                currentKey.reset();
            }
            continue;
        }

        auto token = tokenize(line);
        if (!token) {
            continue;
        }

        if (depth == 1 && isNumber(token->key)) {
            if (token->value) {
                libraries[token->key] = LibraryFolder{*token->value, "", ""};
            } else {
                currentKey = token->key;
                current = LibraryFolder{};
            }
            continue;
        }

        if (currentKey && depth == 2 && token->value) {
            const std::string key = lower(token->key);
            if (key == "path") {
                current.path = *token->value;
            } else if (key == "label") {
                current.label = *token->value;
            } else if (key == "mounted") {
                current.mounted = *token->value;
            }
        }
    }

    return libraries;
}

AppManifest VdfParser::parseAppManifest(const std::string& content) {
    AppManifest manifest;
    std::istringstream stream(content);
    std::string raw;
    int depth = 0;

    while (std::getline(stream, raw)) {
        const std::string line = trim(raw);
        if (line == "{") {
            ++depth;
            continue;
        }
        if (line == "}") {
            --depth;
            continue;
        }

        // Only the top level of the AppState block carries the fields.
        auto token = tokenize(line);
        if (!token || !token->value || depth != 1) {
            continue;
        }

        const std::string key = lower(token->key);
        const std::string& value = *token->value;
        if (key == "appid") {
            manifest.appId = value;
        } else if (key == "name") {
            manifest.name = value;
        } else if (key == "installdir") {
            manifest.installDir = value;
        } else if (key == "stateflags") {
            manifest.stateFlags = value;
        } else if (key == "buildid") {
            manifest.buildId = value;
        } else if (key == "sizeondisk" && isNumber(value)) {
            manifest.sizeOnDisk = std::strtoll(value.c_str(), nullptr, 10);
        }
    }

    if (manifest.appId.empty() || manifest.name.empty() || manifest.installDir.empty()) {
        throw ConfigError("Missing required fields in app manifest");
    }
    return manifest;
}

}
