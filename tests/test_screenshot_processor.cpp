// =============================================================================
// SimPilot - Screenshot Post-Processing Tests
// =============================================================================

#include <gtest/gtest.h>
#include "image/screenshot_processor.hpp"

#include <cmath>

using namespace simpilot;
using namespace simpilot::image;

namespace {

RgbImage solid(int w, int h, uint8_t r, uint8_t g, uint8_t b) {
    RgbImage img;
    img.width = w;
    img.height = h;
    img.pixels.resize(img.stride() * static_cast<size_t>(h));
    for (size_t i = 0; i < img.pixels.size(); i += 3) {
        img.pixels[i] = r;
        img.pixels[i + 1] = g;
        img.pixels[i + 2] = b;
    }
    return img;
}

void setPixel(RgbImage& img, int x, int y, uint8_t r, uint8_t g, uint8_t b) {
    uint8_t* p = &img.pixels[static_cast<size_t>(y) * img.stride() + static_cast<size_t>(x) * 3];
    p[0] = r;
    p[1] = g;
    p[2] = b;
}

uint8_t red(const RgbImage& img, int x, int y) {
    return img.pixels[static_cast<size_t>(y) * img.stride() + static_cast<size_t>(x) * 3];
}

std::vector<uint8_t> png(const RgbImage& img) {
    auto r = encodeImage(img, ImageFormat::Png, 100);
    EXPECT_TRUE(r.is_ok());
    return r.value();
}

// 3x2, 赤チャンネルに座標番号を入れる:  1 2 3 / 4 5 6
RgbImage numbered() {
    RgbImage img = solid(3, 2, 0, 0, 0);
    uint8_t n = 1;
    for (int y = 0; y < 2; ++y) {
        for (int x = 0; x < 3; ++x) setPixel(img, x, y, n++, 0, 0);
    }
    return img;
}

} // namespace

// =============================================================================
// Names
// =============================================================================

TEST(ScreenshotProcessorTest, FormatNames) {
    EXPECT_EQ(parseImageFormat("JPEG"), ImageFormat::Jpeg);
    EXPECT_EQ(parseImageFormat("jpg"), ImageFormat::Jpeg);
    EXPECT_EQ(parseImageFormat("png"), ImageFormat::Png);
    EXPECT_FALSE(parseImageFormat("webp").has_value());
    EXPECT_STREQ(imageFormatExtension(ImageFormat::Jpeg), "jpg");
    EXPECT_STREQ(imageFormatName(ImageFormat::Jpeg), "jpeg");
}

TEST(ScreenshotProcessorTest, OrientationNames) {
    EXPECT_EQ(parseOrientation("PORTRAIT"), Orientation::Portrait);
    EXPECT_EQ(parseOrientation("LANDSCAPE"), Orientation::Landscape);
    EXPECT_EQ(parseOrientation("UIA_DEVICE_ORIENTATION_LANDSCAPERIGHT"), Orientation::LandscapeRight);
    EXPECT_EQ(parseOrientation("UIA_DEVICE_ORIENTATION_PORTRAIT_UPSIDEDOWN"),
              Orientation::PortraitUpsideDown);
    EXPECT_EQ(parseOrientation("sideways"), Orientation::Portrait);
}

// =============================================================================
// Rotation
// =============================================================================

TEST(ScreenshotProcessorTest, LandscapeRotatesCounterClockwise) {
    RgbImage out = rotateForOrientation(numbered(), Orientation::Landscape);
    ASSERT_EQ(out.width, 2);
    ASSERT_EQ(out.height, 3);
    // 3 6 / 2 5 / 1 4
    EXPECT_EQ(red(out, 0, 0), 3);
    EXPECT_EQ(red(out, 1, 0), 6);
    EXPECT_EQ(red(out, 0, 2), 1);
    EXPECT_EQ(red(out, 1, 2), 4);
}

TEST(ScreenshotProcessorTest, LandscapeRightRotatesClockwise) {
    RgbImage out = rotateForOrientation(numbered(), Orientation::LandscapeRight);
    ASSERT_EQ(out.width, 2);
    ASSERT_EQ(out.height, 3);
    // 4 1 / 5 2 / 6 3
    EXPECT_EQ(red(out, 0, 0), 4);
    EXPECT_EQ(red(out, 1, 0), 1);
    EXPECT_EQ(red(out, 0, 2), 6);
    EXPECT_EQ(red(out, 1, 2), 3);
}

TEST(ScreenshotProcessorTest, UpsideDownRotates180) {
    RgbImage out = rotateForOrientation(numbered(), Orientation::PortraitUpsideDown);
    ASSERT_EQ(out.width, 3);
    ASSERT_EQ(out.height, 2);
    EXPECT_EQ(red(out, 0, 0), 6);
    EXPECT_EQ(red(out, 2, 1), 1);
}

TEST(ScreenshotProcessorTest, PortraitUnchanged) {
    RgbImage src = numbered();
    RgbImage out = rotateForOrientation(src, Orientation::Portrait);
    EXPECT_EQ(out.pixels, src.pixels);
}

// =============================================================================
// Resize
// =============================================================================

TEST(ScreenshotProcessorTest, ScaledDimension) {
    EXPECT_EQ(scaledDimension(1170, 0.5), 585);
    EXPECT_EQ(scaledDimension(2532, 0.5), 1266);
    EXPECT_EQ(scaledDimension(3, 0.5), 2);   // 1.5 -> 2
    EXPECT_EQ(scaledDimension(1, 0.1), 1);
}

TEST(ScreenshotProcessorTest, ResizeKeepsSolidColor) {
    RgbImage out = resizeBilinear(solid(40, 20, 10, 200, 30), 10, 5);
    ASSERT_EQ(out.width, 10);
    ASSERT_EQ(out.height, 5);
    for (size_t i = 0; i < out.pixels.size(); i += 3) {
        EXPECT_EQ(out.pixels[i], 10);
        EXPECT_EQ(out.pixels[i + 1], 200);
        EXPECT_EQ(out.pixels[i + 2], 30);
    }
}

// =============================================================================
// Full pipeline
// =============================================================================

TEST(ScreenshotProcessorTest, LandscapeDeviceScreenshot) {
    auto raw = png(solid(2532, 1170, 90, 120, 200));

    ScreenshotOptions opts;
    opts.scale = 0.5;
    opts.format = ImageFormat::Jpeg;
    opts.quality = 80;
    opts.orientation = Orientation::Landscape;

    auto r = processScreenshot(raw, opts);
    ASSERT_TRUE(r.is_ok()) << r.error().message;
    const auto& shot = r.value();
    EXPECT_EQ(shot.original_width, 2532);
    EXPECT_EQ(shot.original_height, 1170);
    EXPECT_EQ(shot.width, 585);
    EXPECT_EQ(shot.height, 1266);
    EXPECT_EQ(shot.original_bytes, raw.size());
    EXPECT_EQ(shot.optimized_bytes, shot.data.size());

    // JPEG SOI
    ASSERT_GE(shot.data.size(), 2u);
    EXPECT_EQ(shot.data[0], 0xFF);
    EXPECT_EQ(shot.data[1], 0xD8);

    auto decoded = decodeImage(shot.data);
    ASSERT_TRUE(decoded.is_ok());
    EXPECT_EQ(decoded.value().width, 585);
    EXPECT_EQ(decoded.value().height, 1266);
}

TEST(ScreenshotProcessorTest, PngOutputAndStats) {
    auto raw = png(solid(100, 200, 1, 2, 3));
    ScreenshotOptions opts;
    opts.scale = 1.0;
    opts.format = ImageFormat::Png;

    auto r = processScreenshot(raw, opts);
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value().width, 100);
    EXPECT_EQ(r.value().height, 200);
    EXPECT_EQ(r.value().data[1], 'P');

    auto j = r.value().toJson();
    EXPECT_EQ(j["format"], "png");
    EXPECT_FALSE(j.contains("data"));
    const double pct = j["reduction_percent"].get<double>();
    EXPECT_DOUBLE_EQ(pct, std::round(pct * 10.0) / 10.0);
}

TEST(ScreenshotProcessorTest, ScaleAndQualityClamped) {
    auto raw = png(solid(100, 50, 0, 0, 0));
    ScreenshotOptions opts;
    opts.scale = 0.01;     // -> 0.1
    opts.quality = 500;    // -> 100
    auto r = processScreenshot(raw, opts);
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value().width, 10);
    EXPECT_EQ(r.value().height, 5);

    opts.scale = 4.0;      // -> 1.0
    auto big = processScreenshot(raw, opts);
    ASSERT_TRUE(big.is_ok());
    EXPECT_EQ(big.value().width, 100);
}

TEST(ScreenshotProcessorTest, NonFiniteScaleRejected) {
    auto raw = png(solid(4, 4, 0, 0, 0));
    ScreenshotOptions opts;
    opts.scale = std::nan("");
    auto r = processScreenshot(raw, opts);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().kind, ErrorKind::InvalidArgument);
}

TEST(ScreenshotProcessorTest, UndecodableInput) {
    std::vector<uint8_t> garbage = {'n', 'o', 't', ' ', 'a', 'n', ' ', 'i', 'm', 'a', 'g', 'e'};
    auto r = processScreenshot(garbage, ScreenshotOptions{});
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().kind, ErrorKind::InvalidArgument);

    auto empty = processScreenshot({}, ScreenshotOptions{});
    ASSERT_TRUE(empty.is_err());
    EXPECT_EQ(empty.error().kind, ErrorKind::InvalidArgument);
}
