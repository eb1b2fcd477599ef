#include <drogon/drogon_test.h>
#include <codec/codec.hpp>
#include <support/batch.hpp>
#include <support/errors.hpp>
#include <support/file_utils.hpp>
#include <test_helpers.hpp>

using namespace inkwell;
namespace fs = std::filesystem;

static void writePgm(const fs::path& path, int w, int h) {
    files::ensureDirectory(path.parent_path());
    files::writeFileAtomically(path, image::encodeNetpbm(test::gradient(w, h)));
}

static BatchConfig configFor(const test::TempDir& tmp) {
    BatchConfig config;
    config.input = tmp / "in";
    config.output = tmp / "in/out";
    config.extensions = {"pgm", "png"};
    config.outputFormat = "png";
    config.params.resize = pipeline::FitWithin{16, 16};
    return config;
}

DROGON_TEST(BatchMirrorsTreeAndSkipsOutput)
{
    test::TempDir tmp;
    writePgm(tmp / "in/a.pgm", 32, 32);
    writePgm(tmp / "in/sub/b.PGM", 20, 10);
    files::writeFileAtomically(tmp / "in/notes.txt", "not an image");

    BatchDriver driver(configFor(tmp));
    const auto inputs = driver.collectInputs();
    REQUIRE(inputs.size() == 2);
    CHECK(driver.destinationFor(tmp / "in/sub/b.PGM") == tmp / "in/out/sub/b.png");

    const auto summary = driver.run();
    CHECK(summary.processed == 2);
    CHECK(summary.failed == 0);
    CHECK(fs::exists(tmp / "in/out/a.png"));
    CHECK(fs::exists(tmp / "in/out/sub/b.png"));

    const auto out = image::decode(files::readFile(tmp / "in/out/a.png"));
    CHECK(out.width == 16);
    CHECK(out.height == 16);

    // the PNG results live under the output directory and are not collected again
    CHECK(driver.collectInputs().size() == 2);
}

DROGON_TEST(BatchContinuesAfterFailure)
{
    test::TempDir tmp;
    writePgm(tmp / "in/good.pgm", 8, 8);
    files::writeFileAtomically(tmp / "in/bad.pgm", "P5\n8 8\n255\nshort");

    BatchDriver driver(configFor(tmp));
    const auto summary = driver.run();
    CHECK(summary.processed == 1);
    CHECK(summary.failed == 1);
    REQUIRE(summary.entries.size() == 2);
    // sorted: bad.pgm first
    CHECK(!summary.entries[0].ok);
    CHECK(!summary.entries[0].error.empty());
    CHECK(summary.entries[1].ok);
    CHECK(!fs::exists(tmp / "in/out/bad.png"));

    const auto json = summary.toJson();
    CHECK(json["processed"].asUInt64() == 1);
    CHECK(json["failed"].asUInt64() == 1);
    CHECK(json["files"].size() == 2);
    CHECK(json["files"][0].isMember("error"));
    CHECK(!json["files"][1].isMember("error"));

    writeReport(summary, tmp / "reports/report.json");
    CHECK(fs::exists(tmp / "reports/report.json"));
}

DROGON_TEST(BatchStopsOnErrorWhenAsked)
{
    test::TempDir tmp;
    files::ensureDirectory(tmp / "in");
    files::writeFileAtomically(tmp / "in/bad.pgm", "P5\n8 8\n255\nshort");

    auto config = configFor(tmp);
    config.continueOnError = false;
    BatchDriver driver(config);
    CHECK_THROWS_AS(driver.run(), CodecError);
}

DROGON_TEST(BatchRequiresInputDirectory)
{
    test::TempDir tmp;
    BatchDriver driver(configFor(tmp));
    CHECK_THROWS_AS(driver.collectInputs(), MissingSourceError);
}

DROGON_TEST(EnsureDirectoryIsIdempotent)
{
    test::TempDir tmp;
    CHECK_NOTHROW(files::ensureDirectory(tmp / "x/y"));
    CHECK_NOTHROW(files::ensureDirectory(tmp / "x/y"));
    CHECK(fs::is_directory(tmp / "x/y"));

    files::writeFileAtomically(tmp / "file", "data");
    CHECK_THROWS_AS(files::ensureDirectory(tmp / "file"), CodecError);
    CHECK_THROWS_AS(files::ensureDirectory(tmp / "file/sub"), CodecError);
}

DROGON_TEST(BatchSkipsOversizedEnlargement)
{
    test::TempDir tmp;
    writePgm(tmp / "in/a.pgm", 3, 3);
    writePgm(tmp / "in/b.pgm", 4, 4);

    auto config = configFor(tmp);
    config.params.resize = pipeline::ScaleBy{1e9};
    BatchDriver driver(config);
    const auto summary = driver.run();
    CHECK(summary.processed == 0);
    CHECK(summary.failed == 2);
    CHECK(!fs::exists(tmp / "in/out/a.png"));
}
