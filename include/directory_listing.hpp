#pragma once

#include "http_source.hpp"
#include "sync_types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

/**
 * Parse size strings like '176M' into bytes (K/M/G/T are powers of 1024).
 * A suffixed size is rounded by the server, only plain digits are exact.
 *
 * @return nullopt for "-", empty or unparsable text
 */
std::optional<std::int64_t> parseHumanSize(const std::string &text);

/**
 * Decode %XX escapes in a link target.
 */
std::string percentDecode(const std::string &text);

/**
 * Extract the files of an Apache autoindex table.
 *
 * @param html listing page
 * @param baseUrl URL the page was fetched from
 * @param extension keep only names ending with this suffix (case-insensitive), empty keeps all
 */
std::vector<RemoteFile> parseDirectoryListing(const std::string &html, const std::string &baseUrl,
                                              const std::string &extension);

/**
 * Remote directory listing fetched over HTTP.
 */
class DirectoryListing
{
public:
    DirectoryListing(HttpSource &source, std::string baseUrl, std::string extension);

    /**
     * @throws TransferError if the page cannot be fetched
     */
    std::vector<RemoteFile> fetch() const;

private:
    HttpSource &source_;
    std::string baseUrl_;
    std::string extension_;
};
