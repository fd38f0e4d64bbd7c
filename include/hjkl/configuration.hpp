#pragma once

#include <hjkl/common.hpp>
#include <hjkl/game.hpp>

#include <filesystem>
#include <span>
#include <string>
#include <string_view>

namespace hjkl {

// => If a value is both a section and a key, the key wins; ini files cannot nest further anyway.

class Configuration {
public:
    /*
     * Create the project configuration directory if one isn't found.
     *
     * Returns true if a new directory was created.
     */
    static bool init();

    /*
     * Open an ini file below the project (or, if user_wide, the per-user)
     * configuration directory. Project files take their defaults from the
     * per-user file at the same subpath.
     */
    Configuration(std::span<std::string_view const> subpath, bool user_wide = false);

    Configuration(Configuration const&) = delete;
    Configuration& operator=(Configuration const&) = delete;

    /*
     * Accessor for a value, located by {section, key} or
     * {section, subsection, key} which maps to [section "subsection"].
     */
    std::string & operator[](std::span<std::string_view const> locator);

    /*
     * Destructor; writes the file back if any accessed value changed.
     */
    ~Configuration();

    /*
     * Get a per-project configuration path.
     */
    static std::filesystem::path path_local(std::span<std::string_view const> subpath = {}, bool is_dir = false);

    /*
     * Get a per-user configuration path.
     */
    static std::filesystem::path path_user(std::span<std::string_view const> subpath = {}, bool is_dir = false);

private:
    void* impl_;
};

/*
 * Board settings from the [board] section. Missing keys keep their defaults.
 *
 * Throws ConfigurationError on a value that doesn't parse.
 */
GameConfig game_config(Configuration & config);

} // namespace hjkl
