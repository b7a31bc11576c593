#pragma once

#include <string>
#include "aao/models.hpp"

namespace aao {

// Height of the overlay band Photobucket paints over the bottom of images.
constexpr int kWatermarkBandRows = 24;

bool isWatermarkHost(const std::string& url);

// Decode, drop the bottom `rows` rows, re-encode (JPEG stays JPEG, everything
// else becomes PNG). `outExt` receives the extension of the new encoding.
bool cropBottomRows(const std::string& bytes, int rows, std::string& out, std::string& outExt, std::string& err);

class WatermarkStripper {
public:
    // With `refererFix` the downloads carry the Photobucket Referer and come
    // back without the band, so nothing is cropped.
    WatermarkStripper(bool enabled, bool refererFix) : enabled_(enabled), refererFix_(refererFix) {}

    // Rewrites `rec` in place when it is a watermarked still image. GIFs are
    // left alone since re-encoding keeps only the first frame. Returns true
    // when the bytes changed; on any failure the original bytes stay untouched.
    bool strip(AssetRecord& rec) const;

private:
    bool enabled_;
    bool refererFix_;
};

} // namespace aao
