#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "protocol.hpp"

/**
 * Lower-case scheme tokens ("http", "https", "ftp", "s3", "fasp"), most preferred first.
 * A token selects every URL whose scheme starts with it, so "http" also takes
 * https:// URLs while "https" takes only those.
 */
using PriorityList = std::vector<std::string>;

/**
 * A candidate URL, in the order it should be tried.
 */
struct EndpointCandidate
{
    Url url;
    Protocol protocol;
};

/**
 * Parse a comma-separated, case-insensitive priority list ("ftp,HTTP,s3").
 * Tokens are lower-cased; unknown ones are dropped with a warning.
 *
 * @return std::nullopt for a blank string: derive the order from the environment
 */
std::optional<PriorityList> parsePriorityList(const std::string &text);

/**
 * Ask the cloud instance metadata service whether we run on a cloud VM.
 * Bounded: 500 ms per attempt, one retry.
 *
 * @param metadataUrl Metadata endpoint to query
 * @return true if the service answered with a non-empty document
 */
bool queryInstanceMetadata(const std::string &metadataUrl = "http://169.254.169.254/latest/meta-data/");

/**
 * Rewrite a demo-dataset object-storage URL into its bucket/key layout:
 * "s3://B/x/Y/.../a/b/c/d" containing "HMDEMO" becomes "s3://B/DEMO/Y/a/b/c/d".
 * Any other URL is returned unchanged.
 */
std::string rewriteDemoObjectUrl(const std::string &url);

/**
 * Orders an entry's candidate URLs by protocol priority.
 */
class EndpointSelector
{
public:
    using CloudCheck = std::function<bool()>;
    using UrlRewrite = std::function<std::string(const std::string &)>;

    /**
     * @param priorities Explicit order, or std::nullopt to pick a default:
     *                   {s3, http, ftp} on a cloud instance, {http, ftp, s3} elsewhere
     * @param cloudCheck Environment check used for the default; called at most once
     */
    explicit EndpointSelector(std::optional<PriorityList> priorities,
                              CloudCheck cloudCheck = [] { return queryInstanceMetadata(); });

    /**
     * Install a normalization applied to each URL before it is parsed.
     */
    void setUrlRewrite(UrlRewrite rewrite) { rewrite_ = std::move(rewrite); }

    /**
     * Order `urls` by scheme priority.
     * URLs matched by the same token keep their manifest order. URLs no token
     * matches, that do not parse, or that name no file (path ending in "/",
     * "." or "..") are left out.
     *
     * @return Candidates to try first-to-last; empty if none qualify
     */
    std::vector<EndpointCandidate> select(const std::vector<std::string> &urls) const;

    /**
     * The priority list in force (resolving the environment default on first use).
     */
    const PriorityList &effectivePriorities() const;

private:
    std::optional<PriorityList> priorities_;
    CloudCheck cloudCheck_;
    UrlRewrite rewrite_;
    mutable std::optional<PriorityList> resolved_;
};
