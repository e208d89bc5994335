#include "manifest.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <initializer_list>
#include <optional>
#include <sstream>
#include <stdexcept>

#include <fmt/core.h>

namespace
{

std::string trim(const std::string &text)
{
    auto isSpace = [](unsigned char ch)
    { return std::isspace(ch) != 0; };

    auto begin = std::find_if_not(text.begin(), text.end(), isSpace);
    auto end = std::find_if_not(text.rbegin(), text.rend(), isSpace).base();
    if (begin >= end)
    {
        return "";
    }
    return std::string(begin, end);
}

std::vector<std::string> splitFields(const std::string &line, char delimiter)
{
    std::vector<std::string> fields;
    std::string field;
    std::istringstream stream(line);
    while (std::getline(stream, field, delimiter))
    {
        fields.push_back(field);
    }
    // getline drops a trailing empty field
    if (!line.empty() && line.back() == delimiter)
    {
        fields.emplace_back();
    }
    return fields;
}

std::optional<size_t> findColumn(const std::vector<std::string> &header,
                                 std::initializer_list<const char *> names)
{
    for (const char *name : names)
    {
        auto it = std::find(header.begin(), header.end(), name);
        if (it != header.end())
        {
            return static_cast<size_t>(it - header.begin());
        }
    }
    return std::nullopt;
}

std::string fieldAt(const std::vector<std::string> &fields, size_t index)
{
    return index < fields.size() ? trim(fields[index]) : std::string();
}

} // namespace

const char *outcomeName(OutcomeCode code)
{
    switch (code)
    {
    case OutcomeCode::Success:
        return "success";
    case OutcomeCode::NoValidEndpoint:
        return "no valid endpoint";
    case OutcomeCode::EndpointUnreachable:
        return "endpoint unreachable";
    case OutcomeCode::ChecksumMismatch:
        return "checksum mismatch";
    }
    return "unknown";
}

std::vector<std::string> splitUrlList(const std::string &urls)
{
    std::vector<std::string> result;
    for (const auto &item : splitFields(urls, ','))
    {
        std::string url = trim(item);
        if (!url.empty())
        {
            result.push_back(std::move(url));
        }
    }
    return result;
}

std::vector<ManifestEntry> parseManifest(std::istream &input)
{
    std::string line;
    if (!std::getline(input, line))
    {
        throw std::runtime_error("Manifest is empty (missing header row)");
    }

    std::vector<std::string> header;
    for (const auto &name : splitFields(line, '\t'))
    {
        header.push_back(trim(name));
    }

    auto idColumn = findColumn(header, {"id", "file_id"});
    auto md5Column = findColumn(header, {"md5"});
    auto urlsColumn = findColumn(header, {"urls"});
    if (!idColumn || !md5Column || !urlsColumn)
    {
        throw std::runtime_error(
            fmt::format("Manifest header must name 'id', 'md5' and 'urls' columns, got '{}'", line));
    }

    std::vector<ManifestEntry> entries;
    while (std::getline(input, line))
    {
        if (trim(line).empty())
        {
            continue;
        }

        auto fields = splitFields(line, '\t');

        ManifestEntry entry;
        entry.id = fieldAt(fields, *idColumn);
        entry.md5 = fieldAt(fields, *md5Column);
        entry.urls = splitUrlList(fieldAt(fields, *urlsColumn));
        entries.push_back(std::move(entry));
    }

    return entries;
}

std::vector<ManifestEntry> readManifest(const std::filesystem::path &manifestPath)
{
    std::ifstream file(manifestPath);
    if (!file)
    {
        throw std::runtime_error(
            fmt::format("Cannot open manifest: {}", manifestPath.string()));
    }
    return parseManifest(file);
}
