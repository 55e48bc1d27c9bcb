#include "http_source.hpp"

#include <regex>
#include <stdexcept>

std::optional<ContentRange> parseContentRange(const std::string &value)
{
    static const std::regex pattern(R"(^\s*bytes\s+(\d+)-(\d+)/(\d+|\*)\s*$)", std::regex::icase);

    std::smatch match;
    if (!std::regex_match(value, match, pattern))
    {
        return std::nullopt; // Includes "bytes */1000" (unsatisfied range)
    }

    ContentRange range;
    try
    {
        range.first = std::stoll(match[1].str());
        range.last = std::stoll(match[2].str());
        if (match[3].str() != "*")
        {
            range.total = std::stoll(match[3].str());
        }
    }
    catch (const std::out_of_range &)
    {
        return std::nullopt;
    }

    if (range.last < range.first || (range.total && range.last >= *range.total))
    {
        return std::nullopt;
    }
    return range;
}

std::optional<std::int64_t> parseUnsatisfiedRange(const std::string &value)
{
    static const std::regex pattern(R"(^\s*bytes\s+\*/(\d+)\s*$)", std::regex::icase);

    std::smatch match;
    if (!std::regex_match(value, match, pattern))
    {
        return std::nullopt;
    }

    try
    {
        return std::stoll(match[1].str());
    }
    catch (const std::out_of_range &)
    {
        return std::nullopt;
    }
}
