#pragma once

#include "config.hpp"

#include <regex>
#include <string>

/**
 * Regex filename filter.
 * A disabled filter matches nothing: no file takes part in the sync pass.
 */
class FileFilter
{
public:
    /**
     * @throws ConfigError if the filter is enabled and the pattern does not compile
     */
    explicit FileFilter(const FilterConfig &config);

    bool enabled() const { return enabled_; }
    const std::string &pattern() const { return pattern_; }
    bool caseSensitive() const { return caseSensitive_; }

    /**
     * Search the pattern anywhere in the filename (not anchored).
     */
    bool matches(const std::string &filename) const;

private:
    bool enabled_;
    std::string pattern_;
    bool caseSensitive_;
    std::regex regex_;
};
