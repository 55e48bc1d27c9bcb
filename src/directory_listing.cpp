#include "directory_listing.hpp"

#include "transfer_error.hpp"

#include <algorithm>
#include <cctype>
#include <regex>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace
{

std::string toLower(std::string text)
{
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

bool endsWith(const std::string &text, const std::string &suffix)
{
    return text.size() >= suffix.size() && text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Visible text of a table cell
std::string cellText(const std::string &cell)
{
    static const std::regex tags("<[^>]*>");
    std::string text = std::regex_replace(cell, tags, "");

    std::string::size_type pos;
    while ((pos = text.find("&nbsp;")) != std::string::npos)
    {
        text.replace(pos, 6, " ");
    }

    auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos)
    {
        return "";
    }
    auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

// Parent directory, sub-directories, column sort links and links leaving the listing
bool isFileLink(const std::string &href)
{
    return !href.empty() && href[0] != '?' && href[0] != '/' && href[0] != '#' && href.back() != '/' &&
           href.find("://") == std::string::npos;
}

// "812" is a byte count, "1.5K" a rounded display value
bool isByteCount(const std::string &text)
{
    static const std::regex digits(R"(^\s*\d+\s*$)");
    return std::regex_match(text, digits);
}

} // namespace

std::optional<std::int64_t> parseHumanSize(const std::string &text)
{
    static const std::regex pattern(R"(^\s*(\d+(?:\.\d+)?)\s*([KMGT])?\s*$)", std::regex::icase);

    std::smatch match;
    if (!std::regex_match(text, match, pattern))
    {
        return std::nullopt;
    }

    double value = std::stod(match[1].str());
    std::string unit = match[2].matched ? toLower(match[2].str()) : "";
    if (unit == "k")
    {
        value *= 1024.0;
    }
    else if (unit == "m")
    {
        value *= 1024.0 * 1024.0;
    }
    else if (unit == "g")
    {
        value *= 1024.0 * 1024.0 * 1024.0;
    }
    else if (unit == "t")
    {
        value *= 1024.0 * 1024.0 * 1024.0 * 1024.0;
    }
    return static_cast<std::int64_t>(value);
}

std::string percentDecode(const std::string &text)
{
    std::string decoded;
    decoded.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i)
    {
        if (text[i] == '%' && i + 2 < text.size() && std::isxdigit(static_cast<unsigned char>(text[i + 1])) &&
            std::isxdigit(static_cast<unsigned char>(text[i + 2])))
        {
            decoded += static_cast<char>(std::stoi(text.substr(i + 1, 2), nullptr, 16));
            i += 2;
        }
        else
        {
            decoded += text[i];
        }
    }
    return decoded;
}

std::vector<RemoteFile> parseDirectoryListing(const std::string &html, const std::string &baseUrl,
                                              const std::string &extension)
{
    static const std::regex rowPattern(R"(<tr[^>]*>([\s\S]*?)</tr>)", std::regex::icase);
    static const std::regex cellPattern(R"(<td[^>]*>([\s\S]*?)</td>)", std::regex::icase);
    static const std::regex linkPattern(R"re(<a\s[^>]*href\s*=\s*"([^"]*)")re", std::regex::icase);

    std::string prefix = baseUrl;
    if (!prefix.empty() && prefix.back() != '/')
    {
        prefix += '/';
    }
    const std::string wantedSuffix = toLower(extension);

    std::vector<RemoteFile> files;
    for (std::sregex_iterator row(html.begin(), html.end(), rowPattern), end; row != end; ++row)
    {
        const std::string rowHtml = (*row)[1].str();

        std::vector<std::string> cells;
        for (std::sregex_iterator cell(rowHtml.begin(), rowHtml.end(), cellPattern); cell != end; ++cell)
        {
            cells.push_back((*cell)[1].str());
        }

        // Skip rows that don't have enough cells (headers, separators)
        if (cells.size() < 4)
        {
            continue;
        }

        // Icon, name, last modified, size
        std::smatch link;
        if (!std::regex_search(cells[1], link, linkPattern))
        {
            continue;
        }
        const std::string href = link[1].str();
        if (!isFileLink(href))
        {
            continue;
        }

        RemoteFile file;
        file.name = percentDecode(href);
        if (!wantedSuffix.empty() && !endsWith(toLower(file.name), wantedSuffix))
        {
            continue;
        }
        file.url = prefix + href;
        file.lastModified = cellText(cells[2]);
        const std::string sizeText = cellText(cells[3]);
        file.size = parseHumanSize(sizeText);
        file.sizeExact = file.size && isByteCount(sizeText);
        files.push_back(std::move(file));
    }
    return files;
}

DirectoryListing::DirectoryListing(HttpSource &source, std::string baseUrl, std::string extension)
    : source_(source), baseUrl_(std::move(baseUrl)), extension_(std::move(extension))
{
}

std::vector<RemoteFile> DirectoryListing::fetch() const
{
    spdlog::info("Connecting to {}...", baseUrl_);

    auto stream = source_.open(baseUrl_, 0);
    long status = stream->info().status;
    if (status < 200 || status >= 300)
    {
        throw TransferError(classifyHttpStatus(status),
                            fmt::format("HTTP error {}: {} ({})", status, httpStatusText(status), baseUrl_), status);
    }

    std::string html;
    char buffer[16 * 1024];
    while (std::size_t count = stream->read(buffer, sizeof(buffer)))
    {
        html.append(buffer, count);
    }

    auto files = parseDirectoryListing(html, baseUrl_, extension_);
    spdlog::info("Found {} files on server", files.size());
    return files;
}
