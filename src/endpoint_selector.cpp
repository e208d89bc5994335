#include "endpoint_selector.hpp"

#include <algorithm>
#include <cctype>
#include <memory>
#include <sstream>

#include <curl/curl.h>
#include <fmt/core.h>

#include "logger.hpp"

namespace
{

size_t appendToString(char *ptr, size_t size, size_t nmemb, void *userdata)
{
    static_cast<std::string *>(userdata)->append(ptr, size * nmemb);
    return size * nmemb;
}

std::vector<std::string> split(const std::string &text, char delimiter)
{
    std::vector<std::string> parts;
    std::string part;
    std::istringstream stream(text);
    while (std::getline(stream, part, delimiter))
    {
        parts.push_back(part);
    }
    return parts;
}

std::string toLower(std::string text)
{
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char ch)
                   { return static_cast<char>(std::tolower(ch)); });
    return text;
}

std::string trim(const std::string &text)
{
    size_t begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos)
    {
        return "";
    }
    size_t end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

} // namespace

std::optional<PriorityList> parsePriorityList(const std::string &text)
{
    if (trim(text).empty())
    {
        return std::nullopt;
    }

    PriorityList priorities;
    for (const auto &raw : split(text, ','))
    {
        std::string token = trim(raw);
        if (token.empty())
        {
            continue;
        }

        if (!protocolFromToken(token))
        {
            logger::warn("Ignoring unknown endpoint priority '{}'", token);
            continue;
        }
        priorities.push_back(toLower(token));
    }
    return priorities;
}

bool queryInstanceMetadata(const std::string &metadataUrl)
{
    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), curl_easy_cleanup);
    if (!curl)
    {
        return false;
    }

    // One attempt plus one retry
    for (int attempt = 0; attempt < 2; ++attempt)
    {
        std::string body;
        curl_easy_setopt(curl.get(), CURLOPT_URL, metadataUrl.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, 500L);
        curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS, 500L);
        curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_FAILONERROR, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, appendToString);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &body);

        CURLcode res = curl_easy_perform(curl.get());
        if (res == CURLE_OK)
        {
            return !body.empty();
        }
        logger::debug("Instance metadata query {} failed: {}", attempt + 1, curl_easy_strerror(res));
    }
    return false;
}

std::string rewriteDemoObjectUrl(const std::string &url)
{
    if (url.find("s3://") == std::string::npos || url.find("HMDEMO") == std::string::npos)
    {
        return url;
    }

    // "s3://bucket/a/b/..." splits into {"s3:", "", "bucket", "a", "b", ...}
    auto elements = split(url, '/');
    if (elements.size() < 7)
    {
        return url;
    }

    std::string tail;
    for (size_t i = elements.size() - 4; i < elements.size(); ++i)
    {
        tail += (tail.empty() ? "" : "/") + elements[i];
    }
    return fmt::format("s3://{}/DEMO/{}/{}", elements[2], elements[4], tail);
}

EndpointSelector::EndpointSelector(std::optional<PriorityList> priorities, CloudCheck cloudCheck)
    : priorities_(std::move(priorities)), cloudCheck_(std::move(cloudCheck))
{
}

const PriorityList &EndpointSelector::effectivePriorities() const
{
    if (!resolved_)
    {
        if (priorities_)
        {
            resolved_ = *priorities_;
        }
        else if (cloudCheck_ && cloudCheck_())
        {
            logger::info("Running on a cloud instance, preferring object storage");
            resolved_ = PriorityList{"s3", "http", "ftp"};
        }
        else
        {
            resolved_ = PriorityList{"http", "ftp", "s3"};
        }
    }
    return *resolved_;
}

std::vector<EndpointCandidate> EndpointSelector::select(const std::vector<std::string> &urls) const
{
    std::vector<EndpointCandidate> candidates;
    if (urls.empty())
    {
        return candidates;
    }

    std::vector<Url> parsed;
    for (const auto &text : urls)
    {
        auto url = parseUrl(rewrite_ ? rewrite_(text) : text);
        if (!url)
        {
            logger::warn("Skipping malformed or unsupported URL '{}'", text);
            continue;
        }
        if (!url->hasFileName())
        {
            logger::warn("Skipping URL '{}': it does not name a file", text);
            continue;
        }
        parsed.push_back(*url);
    }

    for (const std::string &token : effectivePriorities())
    {
        for (const auto &url : parsed)
        {
            // "http" selects https:// URLs as well
            if (url.scheme.compare(0, token.size(), token) != 0)
            {
                continue;
            }

            // Overlapping tokens must not queue the same URL twice
            bool seen = std::any_of(candidates.begin(), candidates.end(),
                                    [&url](const EndpointCandidate &c)
                                    { return c.url.text == url.text; });
            if (!seen)
            {
                candidates.push_back({url, url.protocol});
            }
        }
    }

    return candidates;
}
