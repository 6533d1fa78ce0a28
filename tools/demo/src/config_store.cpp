/**
 * @file config_store.cpp
 * @brief ConfigStore implementation
 */

#include "config_store.hpp"

#include "cmdkit/core/environment.hpp"
#include "cmdkit/core/errors.hpp"
#include "cmdkit/utils/logger.hpp"
#include "cmdkit/utils/string_utils.hpp"

#include <fstream>
#include <sstream>

namespace cmdkit::demo {

namespace {

std::string escapeValue(const std::string& value) {
    std::string escaped;
    for (char c : value) {
        if (c == '\\') {
            escaped += "\\\\";
        } else if (c == '\n') {
            escaped += "\\n";
        } else {
            escaped += c;
        }
    }
    return escaped;
}

std::string unescapeValue(const std::string& text) {
    std::string value;
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '\\' && i + 1 < text.size()) {
            char next = text[++i];
            value += next == 'n' ? '\n' : next;
        } else {
            value += text[i];
        }
    }
    return value;
}

} // anonymous namespace

std::string qualifyKey(const std::string& path) {
    if (path.empty() || path.find_first_of(" \t\r\n=#\\\"'") != std::string::npos) {
        throw Error("invalid key path: '" + path + "'");
    }
    size_t dot = path.find('.');
    if (dot == std::string::npos) {
        return std::string(kDefaultNamespace) + "." + path;
    }
    if (dot == 0 || dot + 1 == path.size() || path.find('.', dot + 1) != std::string::npos) {
        throw Error("invalid key path: '" + path + "'");
    }
    return path;
}

ConfigStore::ConfigStore(std::string path)
    : path_(std::move(path))
{
    std::ifstream in(path_);
    if (!in) {
        LOG_DEBUG("ConfigStore", "No settings file at {}", path_);
        return;
    }

    std::ostringstream content;
    content << in.rdbuf();
    if (in.bad()) {
        throw Error("cannot read " + path_);
    }

    for (auto& [key, value] : parseEnvBlob(content.str())) {
        entries_[key] = unescapeValue(value);
    }
    LOG_DEBUG("ConfigStore", "Loaded {} setting(s) from {}", entries_.size(), path_);
}

std::optional<std::string> ConfigStore::get(const std::string& key) const {
    auto it = entries_.find(qualifyKey(key));
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void ConfigStore::set(const std::string& key, const std::string& value) {
    entries_[qualifyKey(key)] = utils::join(utils::split_lines(value), "\n");
    save();
}

bool ConfigStore::remove(const std::string& key) {
    if (entries_.erase(qualifyKey(key)) == 0) {
        return false;
    }
    save();
    return true;
}

void ConfigStore::reset() {
    entries_.clear();
    save();
}

Map ConfigStore::list(const std::string& ns, bool expand) const {
    std::map<std::string, std::string> shown;
    for (const auto& [path, value] : entries_) {
        size_t dot = path.find('.');
        std::string domain = path.substr(0, dot);
        std::string key = path.substr(dot + 1);

        if (!ns.empty() && domain != ns && domain != kDefaultNamespace) {
            continue;
        }
        bool bare = !ns.empty() || domain == kDefaultNamespace;
        std::string text = expand ? value : value.substr(0, value.find('\n'));
        shown[bare ? key : path] = text;
    }

    Map result;
    for (auto& [key, value] : shown) {
        result.emplace_back(key, Value(std::move(value)));
    }
    return result;
}

void ConfigStore::save() const {
    std::ofstream out(path_, std::ios::trunc);
    if (!out) {
        throw Error("cannot write " + path_);
    }
    for (const auto& [key, value] : entries_) {
        out << key << "=\"" << escapeValue(value) << "\"\n";
    }
    if (!out.flush()) {
        throw Error("cannot write " + path_);
    }
    LOG_TRACE("ConfigStore", "Saved {} setting(s) to {}", entries_.size(), path_);
}

} // namespace cmdkit::demo
