#include "protocol.hpp"
#include <fmt/core.h>

#include "test_support.hpp"

int main()
{
    TestRun run;

    // Test 1: Scheme tokens
    run.check(protocolFromToken("http") == Protocol::Http, "http is HTTP");
    run.check(protocolFromToken("HTTPS") == Protocol::Http, "HTTPS is HTTP (case-insensitive)");
    run.check(protocolFromToken("Ftp") == Protocol::Ftp, "Ftp is FTP");
    run.check(protocolFromToken("s3") == Protocol::ObjectStorage, "s3 is object storage");
    run.check(protocolFromToken("fasp") == Protocol::Fasp, "fasp is FASP");
    run.check(!protocolFromToken("gopher"), "Unknown token is rejected");
    run.check(std::string(protocolName(Protocol::ObjectStorage)) == "S3", "Object storage displays as S3");

    // Test 2: URL parts
    auto ftp = parseUrl("ftp://ftp.example.org/pub/data/x.bin");
    run.check(ftp && ftp->protocol == Protocol::Ftp, "FTP URL parses");
    run.check(ftp && ftp->host == "ftp.example.org" && ftp->path == "/pub/data/x.bin", "Host and path are split");
    run.check(ftp && ftp->basename() == "x.bin", "Basename is the last path component");

    auto s3 = parseUrl("S3://bucket/key/with/parts.fastq.gz");
    run.check(s3 && s3->scheme == "s3" && s3->host == "bucket", "Scheme is lower-cased; host is the bucket");
    run.check(s3 && s3->text == "S3://bucket/key/with/parts.fastq.gz", "Original text is kept");

    auto bare = parseUrl("http://host.only");
    run.check(bare && bare->path == "/" && bare->basename().empty(), "Host-only URL has an empty basename");

    auto port = parseUrl("https://example.org:8443/a.bin");
    run.check(port && port->host == "example.org:8443", "Port stays with the host");

    // Test 3: URLs that can name a local file
    run.check(parseUrl("http://h/x.bin")->hasFileName(), "Plain file name");
    run.check(!parseUrl("http://h/")->hasFileName(), "Trailing slash names no file");
    run.check(!parseUrl("http://h")->hasFileName(), "Host-only URL names no file");
    run.check(!parseUrl("http://h/dir/..")->hasFileName(), "'..' names no file");
    run.check(!parseUrl("http://h/dir/.")->hasFileName(), "'.' names no file");
    run.check(parseUrl("http://h/dir/.hidden")->hasFileName(), "Dot files are files");

    // Test 4: Rejected URLs
    run.check(!parseUrl("example.org/x.bin"), "URL without scheme is rejected");
    run.check(!parseUrl("gopher://example.org/x"), "Unsupported scheme is rejected");
    run.check(!parseUrl("http:///x.bin"), "URL without host is rejected");

    return run.finish();
}
