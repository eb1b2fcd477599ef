#include <drogon/drogon_test.h>
#include <codec/codec.hpp>
#include <codec/exif.hpp>
#include <pipeline/pipeline.hpp>
#include <support/errors.hpp>
#include <support/file_utils.hpp>
#include <test_helpers.hpp>
#include <algorithm>
#include <cstdlib>

using namespace inkwell;
using image::PixelMode;
using image::Raster;
namespace fs = std::filesystem;

static pipeline::EnhancementParams identityParams() {
    pipeline::EnhancementParams params;
    params.brightness = 1.0;
    params.contrast = 1.0;
    params.sharpness = 1.0;
    params.resize = pipeline::FitWithin{4096, 4096};
    return params;
}

static void writeImage(const fs::path& path, const Raster& raster) {
    files::writeFileAtomically(path, image::encode(raster, image::formatForExtension(path.extension().string().substr(1)), {}));
}

DROGON_TEST(StageOrderForFit)
{
    pipeline::EnhancementParams params;
    const auto names = pipeline::stageNames(pipeline::buildStages(params));
    CHECK((names == std::vector<std::string>{"orient", "grayscale", "brightness", "contrast", "sharpness", "fit"}));
}

DROGON_TEST(StageOrderForEnlargement)
{
    pipeline::EnhancementParams params;
    params.resize = pipeline::ScaleBy{2.0};
    auto names = pipeline::stageNames(pipeline::buildStages(params));
    CHECK((names == std::vector<std::string>{"orient", "grayscale", "brightness", "contrast", "scale", "sharpness"}));

    params.binarize = pipeline::Binarization{128, true};
    names = pipeline::stageNames(pipeline::buildStages(params));
    CHECK((names == std::vector<std::string>{"orient", "grayscale", "brightness", "contrast", "scale", "sharpness",
                                             "threshold", "dither"}));
}

DROGON_TEST(MissingSourceFailsBeforeCreatingDirectories)
{
    test::TempDir tmp;
    const auto destination = tmp / "nested/deeper/out.png";
    CHECK_THROWS_AS(pipeline::processImage(tmp / "absent.png", destination, pipeline::EnhancementParams{}),
                    MissingSourceError);
    CHECK(!fs::exists(tmp / "nested"));
}

DROGON_TEST(InvalidScaleWritesNothing)
{
    test::TempDir tmp;
    writeImage(tmp / "in.pgm", test::gradient(8, 8));

    for (double factor : {0.0, -1.0}) {
        pipeline::EnhancementParams params;
        params.resize = pipeline::ScaleBy{factor};
        CHECK_THROWS_AS(pipeline::processImage(tmp / "in.pgm", tmp / "out/in.png", params), InvalidParameterError);
        CHECK(!fs::exists(tmp / "out"));
    }
}

DROGON_TEST(ColorInputBecomesFittedGrayscale)
{
    test::TempDir tmp;
    Raster rgb(400, 300, PixelMode::Rgb);
    for (size_t i = 0; i < rgb.pixels.size(); ++i) rgb.pixels[i] = static_cast<uint8_t>(i * 31 % 251);
    writeImage(tmp / "in.ppm", rgb);

    pipeline::EnhancementParams params;
    params.resize = pipeline::FitWithin{100, 100};
    pipeline::processImage(tmp / "in.ppm", tmp / "a/b/out.pgm", params);

    REQUIRE(fs::exists(tmp / "a/b/out.pgm"));
    const auto out = image::decode(files::readFile(tmp / "a/b/out.pgm"));
    CHECK(out.mode == PixelMode::Gray);
    CHECK(out.width == 100);
    CHECK(out.height == 75);
    // no temporary file left behind
    CHECK(!fs::exists(tmp / "a/b/out.pgm.inkwell-tmp"));
}

DROGON_TEST(PngOutputIsLossless)
{
    test::TempDir tmp;
    const auto source = test::gradient(37, 23);
    writeImage(tmp / "in.pgm", source);

    pipeline::processImage(tmp / "in.pgm", tmp / "out.png", identityParams());
    const auto out = image::decode(files::readFile(tmp / "out.png"));
    CHECK(out.mode == PixelMode::Gray);
    CHECK(out.width == 37);
    CHECK(out.pixels == source.pixels);
}

DROGON_TEST(WebpOutputIsGrayRgb)
{
    test::TempDir tmp;
    const auto source = test::gradient(37, 23);
    writeImage(tmp / "in.pgm", source);

    pipeline::processImage(tmp / "in.pgm", tmp / "out.webp", identityParams());
    const auto bytes = files::readFile(tmp / "out.webp");
    REQUIRE(image::sniffFormat(bytes) == image::ImageFormat::Webp);
    const auto out = image::decode(bytes);
    CHECK(out.mode == PixelMode::Rgb);
    CHECK(out.width == 37);
    CHECK(out.height == 23);

    int maxSpread = 0;
    long totalError = 0;
    for (int y = 0; y < out.height; ++y) {
        for (int x = 0; x < out.width; ++x) {
            const uint8_t* px = out.row(y) + x * 3;
            maxSpread = std::max({maxSpread, std::abs(px[0] - px[1]), std::abs(px[1] - px[2])});
            totalError += std::abs(px[1] - source.at(x, y));
        }
    }
    CHECK(maxSpread <= 2);
    CHECK(totalError / (37 * 23) <= 3);
}

DROGON_TEST(WebpSourceIsRotatedByItsExif)
{
    test::TempDir tmp;
    Raster source(40, 20, PixelMode::Gray, 90);
    image::EncodeOptions options;
    options.lossless = true;
    options.exif = test::tiffWithOrientation(6);
    const auto encoded = image::encodeWebp(source, options);

    const auto decoded = image::decode(encoded);
    CHECK(decoded.width == 40);
    CHECK(decoded.orientation == 6);
    CHECK(decoded.exif == test::tiffWithOrientation(6));
    CHECK(decoded.at(5, 5, 0) == 90);
    CHECK(decoded.at(5, 5, 1) == 90);
    CHECK(decoded.at(5, 5, 2) == 90);

    files::writeFileAtomically(tmp / "in.webp", encoded);
    pipeline::processImage(tmp / "in.webp", tmp / "out.jpg", identityParams());
    const auto bytes = files::readFile(tmp / "out.jpg");
    const auto out = image::decode(bytes);
    CHECK(out.width == 20);
    CHECK(out.height == 40);
    const auto payload = image::exif::findExifPayload(bytes);
    REQUIRE(!payload.empty());
    CHECK(image::exif::readOrientation(payload) == 1);

    // a plain lossy file has no extended header and no EXIF
    CHECK(image::decode(image::encodeWebp(source, {})).exif.empty());
}

DROGON_TEST(RerunIsIdempotent)
{
    test::TempDir tmp;
    writeImage(tmp / "in.pgm", test::gradient(120, 90));

    pipeline::EnhancementParams params;
    params.resize = pipeline::FitWithin{50, 50};
    for (const char* name : {"out.png", "out.jpg", "out.pgm"}) {
        pipeline::processImage(tmp / "in.pgm", tmp / name, params);
        const auto first = files::readFile(tmp / name);
        pipeline::processImage(tmp / "in.pgm", tmp / name, params);
        CHECK(files::readFile(tmp / name) == first);
    }
}

DROGON_TEST(EnlargeAndBinarize)
{
    test::TempDir tmp;
    writeImage(tmp / "light.pgm", test::uniform(10, 6, 200));
    writeImage(tmp / "dark.pgm", test::uniform(10, 6, 50));

    for (bool dither : {true, false}) {
        pipeline::EnhancementParams params = identityParams();
        params.resize = pipeline::ScaleBy{2.5};
        params.binarize = pipeline::Binarization{128, dither};

        pipeline::processImage(tmp / "light.pgm", tmp / "light.png", params);
        const auto light = image::decode(files::readFile(tmp / "light.png"));
        CHECK(light.width == 25);
        CHECK(light.height == 15);
        CHECK(std::all_of(light.pixels.begin(), light.pixels.end(), [](uint8_t p) { return p == 255; }));

        pipeline::processImage(tmp / "dark.pgm", tmp / "dark.pbm", params);
        const auto dark = image::decode(files::readFile(tmp / "dark.pbm"));
        CHECK(dark.mode == PixelMode::Bilevel);
        CHECK(std::all_of(dark.pixels.begin(), dark.pixels.end(), [](uint8_t p) { return p == 0; }));
    }
}

DROGON_TEST(JpegOutputKeepsExifWithOrientationCleared)
{
    test::TempDir tmp;
    Raster source(40, 20, PixelMode::Rgb, 128);
    image::EncodeOptions options;
    options.quality = 95;
    options.exif = test::tiffWithOrientation(6);
    files::writeFileAtomically(tmp / "in.jpg", image::encodeJpeg(source, options));

    pipeline::processImage(tmp / "in.jpg", tmp / "out.jpg", identityParams());

    const auto bytes = files::readFile(tmp / "out.jpg");
    const auto out = image::decode(bytes);
    // rotated upright, then the tag reset so viewers do not rotate again
    CHECK(out.width == 20);
    CHECK(out.height == 40);
    CHECK(out.mode == PixelMode::Gray);
    const auto payload = image::exif::findExifPayload(bytes);
    REQUIRE(!payload.empty());
    CHECK(image::exif::readOrientation(payload) == 1);
    CHECK(out.orientation == 1);

    // other formats do not carry the block
    pipeline::processImage(tmp / "in.jpg", tmp / "out.png", identityParams());
    CHECK(image::decode(files::readFile(tmp / "out.png")).exif.empty());
}

DROGON_TEST(UnknownOutputExtensionFails)
{
    test::TempDir tmp;
    writeImage(tmp / "in.pgm", test::gradient(8, 8));
    CHECK_THROWS_AS(pipeline::processImage(tmp / "in.pgm", tmp / "out/in.tiff", identityParams()), CodecError);
    CHECK(!fs::exists(tmp / "out"));
}

DROGON_TEST(CorruptSourceWritesNothing)
{
    test::TempDir tmp;
    files::writeFileAtomically(tmp / "broken.png", std::string("\x89PNG\r\n\x1a\n garbage", 16));
    files::writeFileAtomically(tmp / "text.jpg", "plain text");
    CHECK_THROWS_AS(pipeline::processImage(tmp / "broken.png", tmp / "out/a.png", identityParams()), CodecError);
    CHECK_THROWS_AS(pipeline::processImage(tmp / "text.jpg", tmp / "out/b.png", identityParams()), CodecError);
    CHECK(!fs::exists(tmp / "out"));
}

DROGON_TEST(SourceIsNeverOverwritten)
{
    test::TempDir tmp;
    writeImage(tmp / "in.pgm", test::gradient(8, 8));
    const auto before = files::readFile(tmp / "in.pgm");
    CHECK_THROWS_AS(pipeline::processImage(tmp / "in.pgm", tmp / "in.pgm", identityParams()), InvalidParameterError);
    CHECK(files::readFile(tmp / "in.pgm") == before);
}
