#include "file_filter.hpp"

#include "transfer_error.hpp"

#include <fmt/core.h>

FileFilter::FileFilter(const FilterConfig &config)
    : enabled_(config.enabled), pattern_(config.pattern), caseSensitive_(config.caseSensitive)
{
    if (!enabled_)
    {
        return;
    }

    auto flags = std::regex::ECMAScript;
    if (!caseSensitive_)
    {
        flags |= std::regex::icase;
    }

    try
    {
        regex_ = std::regex(pattern_, flags);
    }
    catch (const std::regex_error &e)
    {
        throw ConfigError(fmt::format("Invalid regex pattern '{}': {}", pattern_, e.what()));
    }
}

bool FileFilter::matches(const std::string &filename) const
{
    if (!enabled_)
    {
        return false;
    }
    return std::regex_search(filename, regex_);
}
