#include "protocol.hpp"

#include <algorithm>
#include <cctype>

namespace
{

std::string toLower(std::string text)
{
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char ch)
                   { return static_cast<char>(std::tolower(ch)); });
    return text;
}

} // namespace

std::optional<Protocol> protocolFromToken(const std::string &token)
{
    const std::string lowered = toLower(token);

    if (lowered == "http" || lowered == "https")
    {
        return Protocol::Http;
    }
    if (lowered == "ftp")
    {
        return Protocol::Ftp;
    }
    if (lowered == "s3")
    {
        return Protocol::ObjectStorage;
    }
    if (lowered == "fasp")
    {
        return Protocol::Fasp;
    }
    return std::nullopt;
}

const char *protocolName(Protocol protocol)
{
    switch (protocol)
    {
    case Protocol::Http:
        return "HTTP";
    case Protocol::Ftp:
        return "FTP";
    case Protocol::ObjectStorage:
        return "S3";
    case Protocol::Fasp:
        return "FASP";
    }
    return "UNKNOWN";
}

std::string Url::basename() const
{
    size_t slash = path.find_last_of('/');
    if (slash == std::string::npos)
    {
        return path;
    }
    return path.substr(slash + 1);
}

bool Url::hasFileName() const
{
    std::string name = basename();
    return !name.empty() && name != "." && name != "..";
}

std::optional<Url> parseUrl(const std::string &text)
{
    size_t schemeEnd = text.find("://");
    if (schemeEnd == std::string::npos || schemeEnd == 0)
    {
        return std::nullopt;
    }

    Url url;
    url.text = text;
    url.scheme = toLower(text.substr(0, schemeEnd));

    auto protocol = protocolFromToken(url.scheme);
    if (!protocol)
    {
        return std::nullopt;
    }
    url.protocol = *protocol;

    std::string rest = text.substr(schemeEnd + 3);
    size_t slash = rest.find('/');
    if (slash == std::string::npos)
    {
        url.host = rest;
        url.path = "/";
    }
    else
    {
        url.host = rest.substr(0, slash);
        url.path = rest.substr(slash);
    }

    if (url.host.empty())
    {
        return std::nullopt;
    }

    return url;
}
