#include "transfer_error.hpp"

const char *toString(ErrorType type)
{
    switch (type)
    {
    case ErrorType::Transient:
        return "transient";
    case ErrorType::Permanent:
        return "permanent";
    case ErrorType::Unknown:
        return "unknown";
    }
    return "unknown";
}

ErrorType classifyHttpStatus(long status)
{
    if (status == 408 || status == 429)
    {
        // Request Timeout / Too Many Requests: server asks us to come back later
        return ErrorType::Transient;
    }
    if (status >= 400 && status < 500)
    {
        // 404 Not Found, 403 Forbidden, 401 Unauthorized
        return ErrorType::Permanent;
    }
    if (status >= 500 && status < 600)
    {
        // 500 Internal Server Error, 503 Service Unavailable
        return ErrorType::Transient;
    }
    return ErrorType::Unknown;
}

std::string httpStatusText(long status)
{
    switch (status)
    {
    case 200:
        return "OK";
    case 206:
        return "Partial Content";
    case 301:
        return "Moved Permanently";
    case 302:
        return "Found";
    case 400:
        return "Bad Request";
    case 401:
        return "Unauthorized";
    case 403:
        return "Forbidden";
    case 404:
        return "Not Found";
    case 408:
        return "Request Timeout";
    case 416:
        return "Range Not Satisfiable";
    case 429:
        return "Too Many Requests";
    case 500:
        return "Internal Server Error";
    case 502:
        return "Bad Gateway";
    case 503:
        return "Service Unavailable";
    case 504:
        return "Gateway Timeout";
    default:
        return "Unknown Status";
    }
}
