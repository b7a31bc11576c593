#pragma once

#include <string>
#include <vector>

namespace aao {

enum class SequenceMode { None, Every };

// How plain http:// asset URLs are treated.
enum class HttpHandling { RedirectToHttps, AllowInsecure, Disallow };

struct Config {
    // Output root; each case lands in <output>/<sanitized title>/ (or <title>.html)
    std::string output{"."};
    // Case ids or player URLs to download
    std::vector<std::string> cases;
    // Upper bound on in-flight network operations across the whole run
    int concurrency{5};
    // Player template commit-ish on the template repository
    std::string playerVersion{"master"};
    // Player UI language (lang_dir/<language>/*.js)
    std::string language{"en"};
    // Inline everything into one HTML document per case
    bool oneHtmlFile{false};
    bool removeWatermarks{true};
    // Audio-compat toggle: when set, howler keeps Web Audio instead of HTML5 audio
    bool disableHtml5Audio{false};
    bool disablePhotobucketFix{false};
    SequenceMode sequenceMode{SequenceMode::None};
    // Opaque script snippets appended to the player verbatim
    std::vector<std::string> userscripts;
    // Best-effort bundling: write cases even when some assets failed
    bool continueOnAssetError{false};
    bool replaceExisting{false};
    // Attempts per request, including the first
    int retries{3};
    int connectTimeoutSeconds{10};
    int readTimeoutSeconds{30};
    HttpHandling httpHandling{HttpHandling::RedirectToHttps};
    // Optional prefix put in front of every request URL
    std::string proxy;
    // Logging verbosity (debug, info, warn, error)
    std::string logLevel{"info"};
    // Optional log file path; empty logs to stdout only
    std::string logFile;
};

const char* sequenceModeLabel(SequenceMode mode);
bool parseSequenceMode(const std::string& text, SequenceMode& out);
const char* httpHandlingLabel(HttpHandling mode);
bool parseHttpHandling(const std::string& text, HttpHandling& out);

// Load <dir>/.env then <dir>/config.json (JSON values win).
bool loadConfig(const std::string& dir, Config& outCfg, std::string& outError);
bool validateConfig(const Config& cfg, std::string& outError);

#ifdef UNIT_TEST
// Test helpers: parse .env-style or JSON content from an in-memory string.
bool parseEnvString(const std::string& contents, Config& outCfg, std::string& outError);
bool parseJsonString(const std::string& contents, Config& outCfg, std::string& outError);
#endif

} // namespace aao
