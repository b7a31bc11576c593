#include "aao/content_sniff.hpp"
#include "aao/http_common.hpp"
#include "aao/util.hpp"
#include <cstring>

namespace aao {

namespace {

struct MimeEntry {
    const char* ext;
    const char* mime;
};

// First entry per mime wins for extensionForMime.
const MimeEntry kMimeTable[] = {
    {"png", "image/png"},
    {"jpg", "image/jpeg"},
    {"jpeg", "image/jpeg"},
    {"gif", "image/gif"},
    {"webp", "image/webp"},
    {"bmp", "image/bmp"},
    {"ico", "image/x-icon"},
    {"svg", "image/svg+xml"},
    {"mp3", "audio/mpeg"},
    {"ogg", "audio/ogg"},
    {"opus", "audio/opus"},
    {"wav", "audio/wav"},
    {"flac", "audio/flac"},
    {"m4a", "audio/mp4"},
    {"mp4", "video/mp4"},
    {"woff", "font/woff"},
    {"woff2", "font/woff2"},
    {"ttf", "font/ttf"},
    {"otf", "font/otf"},
    {"css", "text/css"},
    {"js", "text/javascript"},
    {"html", "text/html"},
    {"json", "application/json"},
};

const MimeEntry kMimeAliases[] = {
    {"wav", "audio/x-wav"},
    {"wav", "audio/wave"},
    {"mp3", "audio/mp3"},
    {"ico", "image/vnd.microsoft.icon"},
    {"js", "application/javascript"},
    {"js", "application/x-javascript"},
    {"woff", "application/font-woff"},
    {"ttf", "application/x-font-ttf"},
    {"otf", "application/x-font-opentype"},
    {"m4a", "audio/x-m4a"},
};

bool hasPrefix(const std::string& b, size_t at, const char* magic, size_t n) {
    return b.size() >= at + n && std::memcmp(b.data() + at, magic, n) == 0;
}

unsigned char byteAt(const std::string& b, size_t i) {
    return static_cast<unsigned char>(b[i]);
}

ContentType make(const char* ext) {
    return ContentType{mimeForExtension(ext), ext};
}

} // namespace

ContentType sniffContent(const std::string& b) {
    if (b.size() >= 3 && byteAt(b, 0) == 0xFF && byteAt(b, 1) == 0xD8 && byteAt(b, 2) == 0xFF) return make("jpg");
    if (hasPrefix(b, 0, "\x89PNG\r\n\x1a\n", 8)) return make("png");
    if (hasPrefix(b, 0, "GIF87a", 6) || hasPrefix(b, 0, "GIF89a", 6)) return make("gif");
    if (hasPrefix(b, 0, "RIFF", 4) && hasPrefix(b, 8, "WEBP", 4)) return make("webp");
    if (hasPrefix(b, 0, "RIFF", 4) && hasPrefix(b, 8, "WAVE", 4)) return make("wav");
    if (hasPrefix(b, 0, "OggS", 4)) {
        // Opus streams name their codec in the first page.
        if (b.find("OpusHead") != std::string::npos && b.find("OpusHead") < 128) return make("opus");
        return make("ogg");
    }
    if (hasPrefix(b, 0, "fLaC", 4)) return make("flac");
    if (hasPrefix(b, 0, "ID3", 3)) return make("mp3");
    // Bare MPEG audio frame sync.
    if (b.size() >= 2 && byteAt(b, 0) == 0xFF && (byteAt(b, 1) & 0xE0) == 0xE0) return make("mp3");
    if (hasPrefix(b, 4, "ftyp", 4)) {
        if (hasPrefix(b, 8, "M4A ", 4) || hasPrefix(b, 8, "M4B ", 4)) return make("m4a");
        return make("mp4");
    }
    if (hasPrefix(b, 0, "wOFF", 4)) return make("woff");
    if (hasPrefix(b, 0, "wOF2", 4)) return make("woff2");
    if (hasPrefix(b, 0, "\x00\x01\x00\x00", 4) || hasPrefix(b, 0, "true", 4)) return make("ttf");
    if (hasPrefix(b, 0, "OTTO", 4)) return make("otf");
    if (hasPrefix(b, 0, "BM", 2) && b.size() >= 14) return make("bmp");
    if (hasPrefix(b, 0, "\x00\x00\x01\x00", 4)) return make("ico");
    {
        std::string head = util::toLower(b.substr(0, 256));
        size_t start = head.find_first_not_of(" \t\r\n");
        if (start != std::string::npos) {
            if (head.compare(start, 4, "<svg") == 0) return make("svg");
            if (head.compare(start, 5, "<?xml") == 0 && head.find("<svg") != std::string::npos) return make("svg");
        }
    }
    return ContentType{};
}

std::string mimeForExtension(const std::string& ext) {
    std::string e = util::toLower(ext);
    for (const auto& m : kMimeTable) {
        if (e == m.ext) return m.mime;
    }
    return {};
}

std::string extensionForMime(const std::string& mime) {
    std::string m = mediaTypeOf(mime);
    for (const auto& e : kMimeTable) {
        if (m == e.mime) return e.ext;
    }
    for (const auto& e : kMimeAliases) {
        if (m == e.mime) return e.ext;
    }
    return {};
}

bool isGenericMediaType(const std::string& mediaType) {
    std::string m = mediaTypeOf(mediaType);
    return m.empty() || m == "application/octet-stream" || m == "binary/octet-stream" ||
           m == "application/unknown" || m == "text/plain" || m == "application/force-download" ||
           m == "application/x-download";
}

ContentType resolveContentType(const std::string& declaredContentType,
                               const std::string& bytes,
                               const std::string& extensionHint) {
    if (!isGenericMediaType(declaredContentType)) {
        std::string m = mediaTypeOf(declaredContentType);
        std::string ext = extensionForMime(m);
        if (!ext.empty()) return ContentType{mimeForExtension(ext), ext};
    }
    ContentType sniffed = sniffContent(bytes);
    if (!sniffed.mime.empty()) return sniffed;
    std::string mime = mimeForExtension(extensionHint);
    if (!mime.empty()) return ContentType{mime, util::toLower(extensionHint)};
    if (!isGenericMediaType(declaredContentType)) {
        // Specific but unmapped type (e.g. image/x-foo): keep it, extension unknown.
        return ContentType{mediaTypeOf(declaredContentType), "bin"};
    }
    return ContentType{"application/octet-stream", "bin"};
}

bool extensionsEquivalent(const std::string& a, const std::string& b) {
    std::string x = util::toLower(a);
    std::string y = util::toLower(b);
    if (x == y) return true;
    std::string mx = mimeForExtension(x);
    return !mx.empty() && mx == mimeForExtension(y);
}

} // namespace aao
