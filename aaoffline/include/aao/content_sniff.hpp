#pragma once

#include <string>

namespace aao {

struct ContentType {
    std::string mime;      // "" when unknown
    std::string extension; // without dot, "" when unknown
};

// Magic-number detection; returns an empty ContentType when inconclusive.
ContentType sniffContent(const std::string& bytes);

std::string mimeForExtension(const std::string& ext);
std::string extensionForMime(const std::string& mime);

// True for missing or catch-all declared types (octet-stream, text/plain, ...).
bool isGenericMediaType(const std::string& mediaType);

// Declared type when specific, otherwise sniffed bytes, otherwise the hint
// extension from the reference. Falls back to application/octet-stream + "bin".
ContentType resolveContentType(const std::string& declaredContentType,
                               const std::string& bytes,
                               const std::string& extensionHint);

// Extensions that are spellings of the same type ("jpeg"/"jpg").
bool extensionsEquivalent(const std::string& a, const std::string& b);

} // namespace aao
