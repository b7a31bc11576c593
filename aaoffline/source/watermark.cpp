#include "aao/watermark.hpp"
#include "aao/content_sniff.hpp"
#include "aao/logger.hpp"
#include "aao/url.hpp"
#include "stb_image.h"
#include "stb_image_write.h"

namespace aao {

namespace {

constexpr int kJpegQuality = 90;

void appendToString(void* context, void* data, int size) {
    auto* out = static_cast<std::string*>(context);
    out->append(static_cast<const char*>(data), static_cast<size_t>(size));
}

} // namespace

bool isWatermarkHost(const std::string& url) {
    return hostMatches(urlHost(url), "photobucket.com");
}

bool cropBottomRows(const std::string& bytes, int rows, std::string& out, std::string& outExt, std::string& err) {
    int w = 0, h = 0, channels = 0;
    unsigned char* pixels = stbi_load_from_memory(reinterpret_cast<const unsigned char*>(bytes.data()),
                                                  static_cast<int>(bytes.size()), &w, &h, &channels, 0);
    if (!pixels) {
        const char* reason = stbi_failure_reason();
        err = std::string("decode failed: ") + (reason ? reason : "unknown");
        return false;
    }
    // The band covers real content on small images; leave those alone.
    if (h <= rows * 3) {
        stbi_image_free(pixels);
        err = "image too small (" + std::to_string(w) + "x" + std::to_string(h) + ")";
        return false;
    }

    const int croppedH = h - rows;
    const bool jpeg = sniffContent(bytes).extension == "jpg";
    std::string encoded;
    int ok = 0;
    if (jpeg) {
        ok = stbi_write_jpg_to_func(appendToString, &encoded, w, croppedH, channels, pixels, kJpegQuality);
    } else {
        ok = stbi_write_png_to_func(appendToString, &encoded, w, croppedH, channels, pixels, w * channels);
    }
    stbi_image_free(pixels);
    if (!ok || encoded.empty()) {
        err = "encode failed";
        return false;
    }
    out = std::move(encoded);
    outExt = jpeg ? "jpg" : "png";
    return true;
}

bool WatermarkStripper::strip(AssetRecord& rec) const {
    if (!enabled_ || refererFix_ || rec.status != AssetStatus::Fetched || !isWatermarkHost(rec.url)) return false;
    if (rec.mime.compare(0, 6, "image/") != 0 || rec.mime == "image/svg+xml") return false;
    if (rec.mime == "image/gif") {
        logDebug("Keeping " + rec.url + " as is: cropping would flatten the animation", "WM");
        return false;
    }

    std::string out;
    std::string ext;
    std::string err;
    if (!cropBottomRows(rec.bytes, kWatermarkBandRows, out, ext, err)) {
        logWarn("Keeping watermark on " + rec.url + ": " + err, "WM");
        return false;
    }
    rec.bytes = std::move(out);
    rec.extension = ext;
    rec.mime = mimeForExtension(ext);
    rec.watermarkStripped = true;
    logDebug("Removed watermark band from " + rec.url, "WM");
    return true;
}

} // namespace aao
