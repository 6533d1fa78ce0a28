/**
 * @file config_store.hpp
 * @brief File-backed key/value settings used by the demo "config" commands
 */

#pragma once

#include "cmdkit/core/value.hpp"

#include <map>
#include <optional>
#include <string>

namespace cmdkit::demo {

/// Namespace of settings addressed by a bare key.
constexpr const char* kDefaultNamespace = "all";

/**
 * @brief Settings addressed as "namespace.key", persisted as a KEY=VALUE file.
 *
 * A bare "key" lives in the "all" namespace. Values may span several lines;
 * line breaks are escaped in the file. Every mutation is written back
 * immediately.
 */
class ConfigStore {
public:
    /**
     * @param path Backing file; a missing file is an empty store
     * @throws cmdkit::Error if the file exists but cannot be read
     */
    explicit ConfigStore(std::string path);

    /**
     * @throws cmdkit::Error on a malformed key
     */
    std::optional<std::string> get(const std::string& key) const;

    /**
     * @throws cmdkit::Error on a malformed key or a failed write
     */
    void set(const std::string& key, const std::string& value);

    /**
     * @return false if the key was not set
     * @throws cmdkit::Error on a malformed key
     */
    bool remove(const std::string& key);

    /**
     * @brief Remove every setting.
     */
    void reset();

    /**
     * @brief Settings sorted by displayed key.
     *
     * Without a namespace every setting is listed and only "all" keys are
     * shown bare. With one, that namespace and "all" are listed without
     * prefix. Multi-line values show their first line unless expanded.
     */
    Map list(const std::string& ns = "", bool expand = false) const;

    const std::string& path() const { return path_; }

private:
    std::string path_;
    std::map<std::string, std::string> entries_;

    void save() const;
};

/**
 * @brief Validate a key path and qualify a bare key with "all".
 * @return "namespace.key"
 * @throws cmdkit::Error
 */
std::string qualifyKey(const std::string& path);

} // namespace cmdkit::demo
