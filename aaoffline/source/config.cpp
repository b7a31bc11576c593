#include "aao/config.hpp"
#include "aao/logger.hpp"
#include "aao/util.hpp"
#include "mini/json.hpp"
#include <fstream>
#include <sstream>
#include <cstdlib>

namespace aao {

using util::toLower;
using util::trim;

const char* sequenceModeLabel(SequenceMode mode) {
    return mode == SequenceMode::Every ? "every" : "none";
}

bool parseSequenceMode(const std::string& text, SequenceMode& out) {
    std::string v = toLower(text);
    if (v == "none" || v == "single") out = SequenceMode::None;
    else if (v == "every" || v == "all") out = SequenceMode::Every;
    else return false;
    return true;
}

const char* httpHandlingLabel(HttpHandling mode) {
    switch (mode) {
        case HttpHandling::AllowInsecure: return "allow";
        case HttpHandling::Disallow: return "disallow";
        default: return "redirect";
    }
}

bool parseHttpHandling(const std::string& text, HttpHandling& out) {
    std::string v = toLower(text);
    if (v == "redirect" || v == "redirect_to_https") out = HttpHandling::RedirectToHttps;
    else if (v == "allow" || v == "allow_insecure") out = HttpHandling::AllowInsecure;
    else if (v == "disallow") out = HttpHandling::Disallow;
    else return false;
    return true;
}

static bool parseBool(const std::string& val) {
    std::string v = toLower(val);
    return v == "1" || v == "true" || v == "yes" || v == "on";
}

static bool applyEnvLine(const std::string& rawLine, Config& outCfg, std::string& outError) {
    std::string line = rawLine;
    trim(line);
    if (line.empty()) return true;
    if (line[0] == '#' || line[0] == ';') return true;
    auto pos = line.find('=');
    if (pos == std::string::npos) return true;
    std::string key = toLower(line.substr(0, pos));
    std::string val = line.substr(pos + 1);
    trim(key); trim(val);
    if (!val.empty() && val.front() == '"' && val.back() == '"' && val.size() >= 2) {
        val = val.substr(1, val.size() - 2);
    }
    if (key == "output") outCfg.output = val;
    else if (key == "cases") {
        outCfg.cases.clear();
        for (auto item : util::split(val, ',')) {
            trim(item);
            if (!item.empty()) outCfg.cases.push_back(item);
        }
    }
    else if (key == "concurrency") outCfg.concurrency = std::atoi(val.c_str());
    else if (key == "player_version") outCfg.playerVersion = val;
    else if (key == "language") outCfg.language = val;
    else if (key == "one_html_file") outCfg.oneHtmlFile = parseBool(val);
    else if (key == "remove_watermarks") outCfg.removeWatermarks = parseBool(val);
    else if (key == "disable_html5_audio") outCfg.disableHtml5Audio = parseBool(val);
    else if (key == "disable_photobucket_fix") outCfg.disablePhotobucketFix = parseBool(val);
    else if (key == "sequence") {
        if (!parseSequenceMode(val, outCfg.sequenceMode)) {
            outError = "Invalid config value for sequence: " + val;
            return false;
        }
    }
    else if (key == "userscript") {
        // Repeatable; "\n" in the value stands for a line break.
        util::replaceAll(val, "\\n", "\n");
        outCfg.userscripts.push_back(val);
    }
    else if (key == "continue_on_asset_error") outCfg.continueOnAssetError = parseBool(val);
    else if (key == "replace_existing") outCfg.replaceExisting = parseBool(val);
    else if (key == "retries") outCfg.retries = std::atoi(val.c_str());
    else if (key == "connect_timeout_seconds") outCfg.connectTimeoutSeconds = std::atoi(val.c_str());
    else if (key == "read_timeout_seconds") outCfg.readTimeoutSeconds = std::atoi(val.c_str());
    else if (key == "http_handling") {
        if (!parseHttpHandling(val, outCfg.httpHandling)) {
            outError = "Invalid config value for http_handling: " + val;
            return false;
        }
    }
    else if (key == "proxy") outCfg.proxy = val;
    else if (key == "log_level") outCfg.logLevel = toLower(val);
    else if (key == "log_file") outCfg.logFile = val;
    else logDebug("Ignoring unknown config key " + key, "CFG");
    return true;
}

static bool parseEnvContents(const std::string& contents, Config& outCfg, std::string& outError) {
    std::istringstream in(contents);
    std::string line;
    while (std::getline(in, line)) {
        if (!applyEnvLine(line, outCfg, outError)) return false;
    }
    return true;
}

static bool parseJsonContents(const std::string& content, Config& outCfg, std::string& outError) {
    mini::Object obj;
    if (!mini::parse(content, obj)) {
        outError = "Invalid config JSON.";
        return false;
    }
    auto getStr = [&](const char* key, std::string& out) {
        auto it = obj.find(key);
        if (it != obj.end() && it->second.type == mini::Value::Type::String) {
            out = it->second.str;
        }
    };
    auto getInt = [&](const char* key, int& out) {
        auto it = obj.find(key);
        if (it != obj.end() && it->second.type == mini::Value::Type::Number) {
            out = static_cast<int>(it->second.number);
        }
    };
    auto getBool = [&](const char* key, bool& out) {
        auto it = obj.find(key);
        if (it != obj.end() && it->second.type == mini::Value::Type::Bool) {
            out = it->second.boolean;
        }
    };
    auto getStrings = [&](const char* key, std::vector<std::string>& out) {
        auto it = obj.find(key);
        if (it == obj.end()) return;
        if (it->second.type == mini::Value::Type::Array) {
            out.clear();
            for (const auto& v : it->second.array) {
                if (v.type == mini::Value::Type::String) out.push_back(v.str);
                else if (v.type == mini::Value::Type::Number) out.push_back(v.str);
            }
        } else if (it->second.type == mini::Value::Type::String) {
            out.assign(1, it->second.str);
        }
    };
    getStr("output", outCfg.output);
    getStrings("cases", outCfg.cases);
    getInt("concurrency", outCfg.concurrency);
    getStr("player_version", outCfg.playerVersion);
    getStr("language", outCfg.language);
    getBool("one_html_file", outCfg.oneHtmlFile);
    getBool("remove_watermarks", outCfg.removeWatermarks);
    getBool("disable_html5_audio", outCfg.disableHtml5Audio);
    getBool("disable_photobucket_fix", outCfg.disablePhotobucketFix);
    getStrings("userscripts", outCfg.userscripts);
    getBool("continue_on_asset_error", outCfg.continueOnAssetError);
    getBool("replace_existing", outCfg.replaceExisting);
    getInt("retries", outCfg.retries);
    getInt("connect_timeout_seconds", outCfg.connectTimeoutSeconds);
    getInt("read_timeout_seconds", outCfg.readTimeoutSeconds);
    getStr("proxy", outCfg.proxy);
    getStr("log_file", outCfg.logFile);
    {
        std::string seq;
        getStr("sequence", seq);
        if (!seq.empty() && !parseSequenceMode(seq, outCfg.sequenceMode)) {
            outError = "Invalid config value for sequence: " + seq;
            return false;
        }
    }
    {
        std::string handling;
        getStr("http_handling", handling);
        if (!handling.empty() && !parseHttpHandling(handling, outCfg.httpHandling)) {
            outError = "Invalid config value for http_handling: " + handling;
            return false;
        }
    }
    {
        std::string lvl;
        getStr("log_level", lvl);
        if (!lvl.empty()) outCfg.logLevel = toLower(lvl);
    }
    return true;
}

static bool readFile(const std::string& path, std::string& out) {
    std::ifstream file(path, std::ios::in | std::ios::binary);
    if (!file) return false;
    out.assign((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    return true;
}

bool validateConfig(const Config& cfg, std::string& outError) {
    if (cfg.concurrency < 1) {
        outError = "Invalid config: concurrency must be a positive integer.";
        return false;
    }
    if (cfg.retries < 1) {
        outError = "Invalid config: retries must be at least 1.";
        return false;
    }
    if (cfg.connectTimeoutSeconds < 1 || cfg.readTimeoutSeconds < 1) {
        outError = "Invalid config: timeouts must be positive.";
        return false;
    }
    if (cfg.playerVersion.empty()) {
        outError = "Invalid config: player_version is empty.";
        return false;
    }
    if (cfg.language.empty()) {
        outError = "Invalid config: language is empty.";
        return false;
    }
    if (cfg.output.empty()) {
        outError = "Invalid config: output is empty.";
        return false;
    }
    return true;
}

bool loadConfig(const std::string& dir, Config& outCfg, std::string& outError) {
    std::string base = dir.empty() ? std::string(".") : dir;
    if (base.back() != '/') base.push_back('/');
    const std::string envPath = base + ".env";
    const std::string jsonPath = base + "config.json";

    std::string envText;
    std::string jsonText;
    bool envFound = readFile(envPath, envText);
    bool jsonFound = readFile(jsonPath, jsonText);
    if (!envFound && !jsonFound) {
        outError = "Missing config: place .env or config.json in " + base;
        return false;
    }
    if (envFound) {
        if (!parseEnvContents(envText, outCfg, outError)) return false;
        logDebug("Loaded " + envPath, "CFG");
    }
    if (jsonFound) {
        if (!parseJsonContents(jsonText, outCfg, outError)) return false;
        logDebug("Loaded " + jsonPath, "CFG");
    }
    return validateConfig(outCfg, outError);
}

#ifdef UNIT_TEST
bool parseEnvString(const std::string& contents, Config& outCfg, std::string& outError) {
    if (!parseEnvContents(contents, outCfg, outError)) return false;
    return validateConfig(outCfg, outError);
}

bool parseJsonString(const std::string& contents, Config& outCfg, std::string& outError) {
    if (!parseJsonContents(contents, outCfg, outError)) return false;
    return validateConfig(outCfg, outError);
}
#endif

} // namespace aao
