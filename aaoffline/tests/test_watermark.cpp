#include "catch.hpp"
#include "aao/watermark.hpp"
#include "stb_image.h"
#include "stb_image_write.h"
#include <vector>

namespace {

void appendBytes(void* context, void* data, int size) {
    static_cast<std::string*>(context)->append(static_cast<const char*>(data), static_cast<size_t>(size));
}

std::string makePng(int w, int h) {
    std::vector<unsigned char> pixels(static_cast<size_t>(w * h * 3));
    for (size_t i = 0; i < pixels.size(); ++i) pixels[i] = static_cast<unsigned char>(i % 251);
    std::string out;
    REQUIRE(stbi_write_png_to_func(appendBytes, &out, w, h, 3, pixels.data(), w * 3) != 0);
    return out;
}

bool decodedSize(const std::string& bytes, int& w, int& h) {
    int channels = 0;
    unsigned char* px = stbi_load_from_memory(reinterpret_cast<const unsigned char*>(bytes.data()),
                                              static_cast<int>(bytes.size()), &w, &h, &channels, 0);
    if (!px) return false;
    stbi_image_free(px);
    return true;
}

aao::AssetRecord photobucketImage(const std::string& bytes) {
    aao::AssetRecord rec;
    rec.url = "https://i12.photobucket.com/albums/a1/user/court.png";
    rec.status = aao::AssetStatus::Fetched;
    rec.mime = "image/png";
    rec.extension = "png";
    rec.bytes = bytes;
    return rec;
}

} // namespace

TEST_CASE("watermark hosts are matched by domain") {
    REQUIRE(aao::isWatermarkHost("https://i12.photobucket.com/albums/x.png"));
    REQUIRE(aao::isWatermarkHost("https://photobucket.com/x.png"));
    REQUIRE_FALSE(aao::isWatermarkHost("https://notphotobucket.com/x.png"));
    REQUIRE_FALSE(aao::isWatermarkHost("https://i.imgur.com/x.png"));
}

TEST_CASE("cropBottomRows removes the band and keeps the width") {
    const std::string png = makePng(10, 100);
    std::string out;
    std::string ext;
    std::string err;
    REQUIRE(aao::cropBottomRows(png, aao::kWatermarkBandRows, out, ext, err));
    REQUIRE(ext == "png");
    int w = 0, h = 0;
    REQUIRE(decodedSize(out, w, h));
    REQUIRE(w == 10);
    REQUIRE(h == 100 - aao::kWatermarkBandRows);
}

TEST_CASE("WatermarkStripper rewrites a Photobucket image") {
    aao::AssetRecord rec = photobucketImage(makePng(8, 80));
    aao::WatermarkStripper stripper(true, false);
    REQUIRE(stripper.strip(rec));
    REQUIRE(rec.watermarkStripped);
    REQUIRE(rec.mime == "image/png");
    int w = 0, h = 0;
    REQUIRE(decodedSize(rec.bytes, w, h));
    REQUIRE(h == 80 - aao::kWatermarkBandRows);
}

TEST_CASE("WatermarkStripper keeps the original bytes when it cannot crop") {
    aao::WatermarkStripper stripper(true, false);

    const std::string small = makePng(8, 60);
    aao::AssetRecord tooSmall = photobucketImage(small);
    REQUIRE_FALSE(stripper.strip(tooSmall));
    REQUIRE(tooSmall.bytes == small);
    REQUIRE_FALSE(tooSmall.watermarkStripped);

    aao::AssetRecord broken = photobucketImage("not an image at all");
    REQUIRE_FALSE(stripper.strip(broken));
    REQUIRE(broken.bytes == "not an image at all");
    REQUIRE(broken.status == aao::AssetStatus::Fetched);
}

TEST_CASE("WatermarkStripper ignores other hosts, other media and disabled runs") {
    const std::string png = makePng(8, 80);

    aao::AssetRecord imgur = photobucketImage(png);
    imgur.url = "https://i.imgur.com/court.png";
    REQUIRE_FALSE(aao::WatermarkStripper(true, false).strip(imgur));

    aao::AssetRecord audio = photobucketImage("ID3....");
    audio.mime = "audio/mpeg";
    REQUIRE_FALSE(aao::WatermarkStripper(true, false).strip(audio));

    aao::AssetRecord off = photobucketImage(png);
    REQUIRE_FALSE(aao::WatermarkStripper(false, false).strip(off));
    REQUIRE(off.bytes == png);
}

TEST_CASE("WatermarkStripper leaves clean downloads and animations untouched") {
    const std::string png = makePng(8, 80);

    // The Referer already got the image without the band.
    aao::AssetRecord clean = photobucketImage(png);
    REQUIRE_FALSE(aao::WatermarkStripper(true, true).strip(clean));
    REQUIRE(clean.bytes == png);
    REQUIRE_FALSE(clean.watermarkStripped);

    aao::AssetRecord gif = photobucketImage("GIF89a animated frames");
    gif.url = "https://i12.photobucket.com/albums/a1/user/objection.gif";
    gif.mime = "image/gif";
    gif.extension = "gif";
    REQUIRE_FALSE(aao::WatermarkStripper(true, false).strip(gif));
    REQUIRE(gif.bytes == "GIF89a animated frames");
    REQUIRE(gif.mime == "image/gif");
}
