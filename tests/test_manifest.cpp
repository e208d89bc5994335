#include "manifest.hpp"
#include <fmt/core.h>
#include <sstream>
#include <stdexcept>

#include "test_support.hpp"

int main()
{
    TestRun run;

    try
    {
        // Test 1: Columns found by name, extra columns ignored
        std::istringstream manifest(
            "file_id\tmd5\tsize\turls\tsample_id\n"
            "F1\t4032af8d61035123906e58e067140cc5\t16\thttp://a/x.bin, ftp://b/x.bin\tS1\n"
            "F2\td41d8cd98f00b204e9800998ecf8427e\t0\t\tS2\n"
            "\n"
            "F3\t5eb63bbbe01eeed093cb22bb8f5acdc3\t11\ts3://bucket/key/y.bin,,\tS3\n");

        auto entries = parseManifest(manifest);
        run.check(entries.size() == 3, "Blank lines are skipped");
        run.check(entries[0].id == "F1" && entries[0].md5 == "4032af8d61035123906e58e067140cc5",
                  "id and md5 columns are read");
        run.check(entries[0].urls.size() == 2 && entries[0].urls[0] == "http://a/x.bin" &&
                      entries[0].urls[1] == "ftp://b/x.bin",
                  "URLs are split and trimmed in order");
        run.check(entries[1].urls.empty(), "An entry without URLs is kept");
        run.check(entries[2].urls.size() == 1 && entries[2].urls[0] == "s3://bucket/key/y.bin",
                  "Blank URL items are dropped");

        // Test 2: "id" column name
        std::istringstream plainId("urls\tid\tmd5\nhttp://h/f\tA\t5eb63bbbe01eeed093cb22bb8f5acdc3\n");
        auto plain = parseManifest(plainId);
        run.check(plain.size() == 1 && plain[0].id == "A" && plain[0].urls.size() == 1,
                  "'id' column and any column order are accepted");

        // Test 3: Row shorter than header
        std::istringstream shortRow("id\tmd5\turls\nB\n");
        auto shortEntries = parseManifest(shortRow);
        run.check(shortEntries.size() == 1 && shortEntries[0].md5.empty() && shortEntries[0].urls.empty(),
                  "Missing trailing fields read as empty");

        // Test 4: Missing required column
        bool missingColumnThrows = false;
        try
        {
            std::istringstream noUrls("id\tmd5\nC\tabc\n");
            parseManifest(noUrls);
        }
        catch (const std::runtime_error &)
        {
            missingColumnThrows = true;
        }
        run.check(missingColumnThrows, "Header without a urls column is rejected");

        bool emptyThrows = false;
        try
        {
            std::istringstream empty("");
            parseManifest(empty);
        }
        catch (const std::runtime_error &)
        {
            emptyThrows = true;
        }
        run.check(emptyThrows, "Empty manifest is rejected");

        // Test 5: From a file
        ScratchDir scratch("manifest");
        writeFile(scratch.path() / "manifest.tsv", "id\tmd5\turls\nD\tffff\tfasp://h/d.bin\n");
        auto fromFile = readManifest(scratch.path() / "manifest.tsv");
        run.check(fromFile.size() == 1 && fromFile[0].urls[0] == "fasp://h/d.bin", "Manifest is read from a file");

        bool unreadableThrows = false;
        try
        {
            readManifest(scratch.path() / "missing.tsv");
        }
        catch (const std::runtime_error &)
        {
            unreadableThrows = true;
        }
        run.check(unreadableThrows, "Missing manifest file is rejected");

        // Test 6: Outcome names
        run.check(std::string(outcomeName(OutcomeCode::ChecksumMismatch)) == "checksum mismatch",
                  "Outcome codes have readable names");
        run.check(static_cast<int>(OutcomeCode::EndpointUnreachable) == 2, "Outcome values are fixed");
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "❌ Error: {}\n", e.what());
        return 1;
    }

    return run.finish();
}
