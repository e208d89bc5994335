#include "endpoint_selector.hpp"
#include <fmt/core.h>

#include "logger.hpp"
#include "test_support.hpp"

namespace
{

std::vector<std::string> texts(const std::vector<EndpointCandidate> &candidates)
{
    std::vector<std::string> result;
    for (const auto &candidate : candidates)
    {
        result.push_back(candidate.url.text);
    }
    return result;
}

} // namespace

int main()
{
    TestRun run;
    logger::setLevel(logger::Level::Error);

    // Test 1: Priority list parsing
    auto parsed = parsePriorityList(" ftp, HTTP ,S3,bogus,fasp");
    run.check(parsed && *parsed == PriorityList{"ftp", "http", "s3", "fasp"},
              "Tokens are lower-cased; unknown ones are dropped");
    run.check(!parsePriorityList(""), "Empty string means environment default");
    run.check(!parsePriorityList("   "), "Blank string means environment default");
    auto onlyBogus = parsePriorityList("gopher");
    run.check(onlyBogus && onlyBogus->empty(), "Only unknown tokens gives an empty list");

    const std::vector<std::string> urls = {
        "http://a/x.bin",
        "ftp://b/x.bin",
        "s3://bucket/x.bin",
        "http://c/x.bin",
    };

    // Test 2: Explicit priorities order by protocol, then manifest order
    EndpointSelector ftpFirst(PriorityList{"ftp", "http"},
                              []
                              { return true; });
    run.check(texts(ftpFirst.select(urls)) ==
                  std::vector<std::string>{"ftp://b/x.bin", "http://a/x.bin", "http://c/x.bin"},
              "FTP first, then HTTP in manifest order, S3 left out");
    auto candidates = ftpFirst.select(urls);
    run.check(candidates.front().protocol == Protocol::Ftp, "Candidate carries its protocol");

    // Test 3: No candidates
    run.check(ftpFirst.select({}).empty(), "Empty URL list gives no candidates");
    run.check(ftpFirst.select({"s3://bucket/only.bin", "fasp://h/only.bin"}).empty(),
              "No URL matching the priorities gives no candidates");
    run.check(ftpFirst.select({"not a url", "gopher://h/x"}).empty(), "Malformed URLs are skipped");

    EndpointSelector none(PriorityList{});
    run.check(none.select(urls).empty(), "Empty priority list selects nothing");

    // Test 4: Environment default, queried once
    int checks = 0;
    EndpointSelector cloud(std::nullopt, [&checks]
                           { ++checks; return true; });
    run.check(texts(cloud.select(urls)).front() == "s3://bucket/x.bin", "Cloud instance prefers object storage");
    cloud.select(urls);
    run.check(checks == 1, "Environment is queried once per selector");
    run.check(cloud.effectivePriorities() ==
                  PriorityList{"s3", "http", "ftp"},
              "Cloud default is S3, HTTP, FTP");

    EndpointSelector local(std::nullopt, []
                           { return false; });
    run.check(texts(local.select(urls)) ==
                  std::vector<std::string>{"http://a/x.bin", "http://c/x.bin", "ftp://b/x.bin", "s3://bucket/x.bin"},
              "Elsewhere the default is HTTP, FTP, S3");

    EndpointSelector explicitList(PriorityList{"http"}, [&checks]
                                  { ++checks; return true; });
    explicitList.select(urls);
    run.check(checks == 1, "Explicit priorities never query the environment");

    // Test 5: A repeated token does not repeat URLs
    EndpointSelector repeated(PriorityList{"http", "ftp", "http"});
    run.check(repeated.select(urls).size() == 3, "Each URL is queued once");

    // Test 6: "http" covers https:// URLs, "https" covers only those
    const std::vector<std::string> mixed = {"http://a/x.bin", "https://b/x.bin", "ftp://c/x.bin"};
    EndpointSelector secureOnly(parsePriorityList("HTTPS"));
    auto secure = secureOnly.select(mixed);
    run.check(texts(secure) == std::vector<std::string>{"https://b/x.bin"}, "https selects only https URLs");
    run.check(!secure.empty() && secure[0].protocol == Protocol::Http, "https URLs use the HTTP transport");

    EndpointSelector plain(PriorityList{"http"});
    run.check(texts(plain.select(mixed)) == std::vector<std::string>{"http://a/x.bin", "https://b/x.bin"},
              "http selects http and https URLs");

    EndpointSelector secureFirst(PriorityList{"https", "http"});
    run.check(texts(secureFirst.select(mixed)) == std::vector<std::string>{"https://b/x.bin", "http://a/x.bin"},
              "https ranked ahead of http, without duplicates");

    // Test 7: URLs that name no file
    run.check(texts(plain.select({"http://a/", "http://a", "http://a/dir/..", "http://a/.", "http://a/y.bin"})) ==
                  std::vector<std::string>{"http://a/y.bin"},
              "Directory-like URLs are left out");

    // Test 8: Demo dataset URLs
    run.check(rewriteDemoObjectUrl("s3://bucket/HMDEMO/SRS011/extra/a/b/c/d.fastq") ==
                  "s3://bucket/DEMO/SRS011/a/b/c/d.fastq",
              "Demo object URL is rewritten");
    run.check(rewriteDemoObjectUrl("s3://bucket/data/x/a/b/c/d") == "s3://bucket/data/x/a/b/c/d",
              "Other object URLs are unchanged");
    run.check(rewriteDemoObjectUrl("http://h/HMDEMO/a/b/c/d/e") == "http://h/HMDEMO/a/b/c/d/e",
              "Non-object URLs are unchanged");

    EndpointSelector demo(PriorityList{"s3"});
    demo.setUrlRewrite(rewriteDemoObjectUrl);
    auto rewritten = demo.select({"s3://bucket/HMDEMO/SRS011/extra/a/b/c/d.fastq"});
    run.check(rewritten.size() == 1 && rewritten[0].url.path == "/DEMO/SRS011/a/b/c/d.fastq",
              "Selector applies the installed rewrite");

    return run.finish();
}
