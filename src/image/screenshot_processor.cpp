// =============================================================================
// スクリーンショット後処理 実装
// =============================================================================
#include "image/screenshot_processor.hpp"
#include "simpilot_log.hpp"

#include "stb_image.h"
#include "stb_image_write.h"

#include <algorithm>
#include <cctype>
#include <cmath>

static constexpr const char* TAG = "Screenshot";

namespace simpilot::image {

namespace {

std::string toUpper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

// stbi_write_*_to_func の出力先
void appendToVector(void* context, void* data, int size) {
    auto* out = static_cast<std::vector<uint8_t>*>(context);
    const auto* bytes = static_cast<const uint8_t*>(data);
    out->insert(out->end(), bytes, bytes + size);
}

} // namespace

// =============================================================================
// 名前 <-> 列挙
// =============================================================================

std::optional<ImageFormat> parseImageFormat(const std::string& name) {
    const std::string upper = toUpper(name);
    if (upper == "JPEG" || upper == "JPG") return ImageFormat::Jpeg;
    if (upper == "PNG") return ImageFormat::Png;
    return std::nullopt;
}

const char* imageFormatName(ImageFormat format) {
    return format == ImageFormat::Png ? "png" : "jpeg";
}

const char* imageFormatExtension(ImageFormat format) {
    return format == ImageFormat::Png ? "png" : "jpg";
}

Orientation parseOrientation(const std::string& name) {
    const std::string upper = toUpper(name);
    // 判定順: UPSIDEDOWN / LANDSCAPERIGHT を LANDSCAPE より先に
    if (upper.find("UPSIDEDOWN") != std::string::npos) return Orientation::PortraitUpsideDown;
    if (upper.find("LANDSCAPERIGHT") != std::string::npos) return Orientation::LandscapeRight;
    if (upper.find("LANDSCAPE") != std::string::npos) return Orientation::Landscape;
    return Orientation::Portrait;
}

nlohmann::json ProcessedScreenshot::toJson() const {
    return nlohmann::json{
        {"format", imageFormatName(format)},
        {"original_width", original_width},
        {"original_height", original_height},
        {"width", width},
        {"height", height},
        {"original_bytes", original_bytes},
        {"optimized_bytes", optimized_bytes},
        {"reduction_percent", reduction_percent},
    };
}

// =============================================================================
// デコード / エンコード
// =============================================================================

Result<RgbImage> decodeImage(const std::vector<uint8_t>& bytes) {
    if (bytes.empty()) {
        return AutomationError(ErrorKind::InvalidArgument, "image data is empty");
    }

    int w = 0, h = 0, channels = 0;
    uint8_t* img = stbi_load_from_memory(bytes.data(), static_cast<int>(bytes.size()),
                                         &w, &h, &channels, 3);
    if (!img) {
        const char* reason = stbi_failure_reason();
        SPLOG_WARN(TAG, "stbi_load_from_memory失敗: %s", reason ? reason : "unknown");
        return AutomationError(ErrorKind::InvalidArgument,
                               std::string("cannot decode image: ") + (reason ? reason : "unknown"));
    }

    RgbImage out;
    out.width = w;
    out.height = h;
    out.pixels.assign(img, img + static_cast<size_t>(w) * h * 3);
    stbi_image_free(img);
    return out;
}

Result<std::vector<uint8_t>> encodeImage(const RgbImage& image, ImageFormat format, int quality) {
    if (image.width <= 0 || image.height <= 0 ||
        image.pixels.size() < image.stride() * static_cast<size_t>(image.height)) {
        return AutomationError(ErrorKind::InvalidArgument, "cannot encode an empty image");
    }

    std::vector<uint8_t> out;
    int ret = 0;
    if (format == ImageFormat::Png) {
        ret = stbi_write_png_to_func(appendToVector, &out, image.width, image.height, 3,
                                     image.pixels.data(), static_cast<int>(image.stride()));
    } else {
        ret = stbi_write_jpg_to_func(appendToVector, &out, image.width, image.height, 3,
                                     image.pixels.data(),
                                     std::clamp(quality, kMinQuality, kMaxQuality));
    }
    if (ret == 0 || out.empty()) {
        return AutomationError(ErrorKind::UnknownAgentError,
                               std::string(imageFormatName(format)) + " encode failed");
    }
    return out;
}

// =============================================================================
// 回転 / 縮小
// =============================================================================

RgbImage rotateForOrientation(const RgbImage& src, Orientation orientation) {
    if (orientation == Orientation::Portrait) return src;

    const int W = src.width;
    const int H = src.height;
    RgbImage dst;
    const bool quarter = orientation != Orientation::PortraitUpsideDown;
    dst.width = quarter ? H : W;
    dst.height = quarter ? W : H;
    dst.pixels.resize(dst.stride() * static_cast<size_t>(dst.height));

    for (int y = 0; y < dst.height; ++y) {
        for (int x = 0; x < dst.width; ++x) {
            int sx = 0, sy = 0;
            switch (orientation) {
                case Orientation::Landscape:           // 反時計回り
                    sx = W - 1 - y;
                    sy = x;
                    break;
                case Orientation::LandscapeRight:      // 時計回り
                    sx = y;
                    sy = H - 1 - x;
                    break;
                case Orientation::PortraitUpsideDown:
                    sx = W - 1 - x;
                    sy = H - 1 - y;
                    break;
                case Orientation::Portrait:
                    sx = x;
                    sy = y;
                    break;
            }
            const uint8_t* s = &src.pixels[static_cast<size_t>(sy) * src.stride() + static_cast<size_t>(sx) * 3];
            uint8_t* d = &dst.pixels[static_cast<size_t>(y) * dst.stride() + static_cast<size_t>(x) * 3];
            d[0] = s[0];
            d[1] = s[1];
            d[2] = s[2];
        }
    }
    return dst;
}

RgbImage resizeBilinear(const RgbImage& src, int width, int height) {
    if (width == src.width && height == src.height) return src;

    RgbImage dst;
    dst.width = width;
    dst.height = height;
    dst.pixels.resize(dst.stride() * static_cast<size_t>(height));

    const double sx_ratio = static_cast<double>(src.width) / width;
    const double sy_ratio = static_cast<double>(src.height) / height;

    for (int y = 0; y < height; ++y) {
        // ピクセル中心で対応付け
        double fy = (y + 0.5) * sy_ratio - 0.5;
        fy = std::clamp(fy, 0.0, static_cast<double>(src.height - 1));
        const int y0 = static_cast<int>(fy);
        const int y1 = std::min(y0 + 1, src.height - 1);
        const double wy = fy - y0;

        for (int x = 0; x < width; ++x) {
            double fx = (x + 0.5) * sx_ratio - 0.5;
            fx = std::clamp(fx, 0.0, static_cast<double>(src.width - 1));
            const int x0 = static_cast<int>(fx);
            const int x1 = std::min(x0 + 1, src.width - 1);
            const double wx = fx - x0;

            const uint8_t* p00 = &src.pixels[static_cast<size_t>(y0) * src.stride() + static_cast<size_t>(x0) * 3];
            const uint8_t* p01 = &src.pixels[static_cast<size_t>(y0) * src.stride() + static_cast<size_t>(x1) * 3];
            const uint8_t* p10 = &src.pixels[static_cast<size_t>(y1) * src.stride() + static_cast<size_t>(x0) * 3];
            const uint8_t* p11 = &src.pixels[static_cast<size_t>(y1) * src.stride() + static_cast<size_t>(x1) * 3];
            uint8_t* d = &dst.pixels[static_cast<size_t>(y) * dst.stride() + static_cast<size_t>(x) * 3];

            for (int c = 0; c < 3; ++c) {
                const double top = p00[c] + (p01[c] - p00[c]) * wx;
                const double bottom = p10[c] + (p11[c] - p10[c]) * wx;
                d[c] = static_cast<uint8_t>(std::lround(top + (bottom - top) * wy));
            }
        }
    }
    return dst;
}

int scaledDimension(int size, double scale) {
    return std::max(1, static_cast<int>(std::lround(size * scale)));
}

// =============================================================================
// 全体処理
// =============================================================================

Result<ProcessedScreenshot> processScreenshot(const std::vector<uint8_t>& raw,
                                              const ScreenshotOptions& options) {
    if (!std::isfinite(options.scale)) {
        return AutomationError(ErrorKind::InvalidArgument, "scale must be a finite number");
    }
    const double scale = std::clamp(options.scale, kMinScale, kMaxScale);
    const int quality = std::clamp(options.quality, kMinQuality, kMaxQuality);

    auto decoded = decodeImage(raw);
    if (decoded.is_err()) return decoded.error();

    ProcessedScreenshot out;
    out.format = options.format;
    out.original_width = decoded.value().width;
    out.original_height = decoded.value().height;
    out.original_bytes = raw.size();

    RgbImage rotated = rotateForOrientation(decoded.value(), options.orientation);
    RgbImage resized = resizeBilinear(rotated,
                                      scaledDimension(rotated.width, scale),
                                      scaledDimension(rotated.height, scale));

    auto encoded = encodeImage(resized, options.format, quality);
    if (encoded.is_err()) return encoded.error();

    out.width = resized.width;
    out.height = resized.height;
    out.data = std::move(encoded.value());
    out.optimized_bytes = out.data.size();
    out.reduction_percent = out.original_bytes == 0 ? 0.0 :
        std::round((1.0 - static_cast<double>(out.optimized_bytes) / out.original_bytes) * 1000.0) / 10.0;

    SPLOG_DEBUG(TAG, "%dx%d (%zu B) -> %dx%d %s (%zu B, %.1f%%)",
                out.original_width, out.original_height, out.original_bytes,
                out.width, out.height, imageFormatName(out.format),
                out.optimized_bytes, out.reduction_percent);
    return out;
}

} // namespace simpilot::image
