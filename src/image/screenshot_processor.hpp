#pragma once
// =============================================================================
// スクリーンショット後処理 - 回転・縮小・再エンコード (stb_image / stb_image_write)
// =============================================================================
// 横向き端末の画像は縦長へ回転してから縮小する:
//   LANDSCAPE        -> 反時計回り 90°
//   LANDSCAPERIGHT   -> 時計回り 90°
//   PORTRAIT_UPSIDEDOWN -> 180°
// 出力サイズ = round(scale × 各辺)（最小 1px）、縦横比は維持。
// =============================================================================

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "result.hpp"

namespace simpilot::image {

constexpr double kMinScale = 0.1;
constexpr double kMaxScale = 1.0;
constexpr int kMinQuality = 1;
constexpr int kMaxQuality = 100;

enum class ImageFormat { Jpeg, Png };

enum class Orientation {
    Portrait,
    Landscape,           // ホームボタン右 / 反時計回りで戻す
    LandscapeRight,      // ホームボタン左 / 時計回りで戻す
    PortraitUpsideDown,
};

// "jpeg" / "jpg" / "png"（大文字小文字無視）
std::optional<ImageFormat> parseImageFormat(const std::string& name);
const char* imageFormatName(ImageFormat format);
const char* imageFormatExtension(ImageFormat format);

// エージェントの向き文字列 ("LANDSCAPE", "UIA_DEVICE_ORIENTATION_LANDSCAPERIGHT", ...)
// 不明な値は Portrait
Orientation parseOrientation(const std::string& name);

// RGB 8bit x 3ch
struct RgbImage {
    int width = 0;
    int height = 0;
    std::vector<uint8_t> pixels;

    size_t stride() const { return static_cast<size_t>(width) * 3; }
};

struct ScreenshotOptions {
    double scale = 0.5;
    ImageFormat format = ImageFormat::Jpeg;
    int quality = 80;
    Orientation orientation = Orientation::Portrait;
};

struct ProcessedScreenshot {
    std::vector<uint8_t> data;
    ImageFormat format = ImageFormat::Jpeg;
    int original_width = 0;
    int original_height = 0;
    int width = 0;
    int height = 0;
    size_t original_bytes = 0;
    size_t optimized_bytes = 0;
    double reduction_percent = 0.0;

    // data は含まない
    nlohmann::json toJson() const;
};

Result<RgbImage> decodeImage(const std::vector<uint8_t>& bytes);
RgbImage rotateForOrientation(const RgbImage& src, Orientation orientation);
RgbImage resizeBilinear(const RgbImage& src, int width, int height);
Result<std::vector<uint8_t>> encodeImage(const RgbImage& image, ImageFormat format, int quality);

// round(scale × size), 最小 1
int scaledDimension(int size, double scale);

Result<ProcessedScreenshot> processScreenshot(const std::vector<uint8_t>& raw,
                                              const ScreenshotOptions& options);

} // namespace simpilot::image
