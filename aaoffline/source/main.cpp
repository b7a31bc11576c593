#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <vector>

#include "aao/config.hpp"
#include "aao/errors.hpp"
#include "aao/filesystem.hpp"
#include "aao/http_client.hpp"
#include "aao/logger.hpp"
#include "aao/pipeline.hpp"
#include "aao/version.hpp"

using aao::Config;

namespace {

aao::CancelToken gCancel;

void handleSignal(int) {
    gCancel.cancel();
}

void printUsage() {
    std::printf(
        "usage: aaoffline [options] <case id or URL>...\n"
        "  --config DIR               read DIR/.env and DIR/config.json\n"
        "  --output DIR               output root (default .)\n"
        "  --one-html-file            write one self-contained HTML file per case\n"
        "  --sequence none|every      also download the other parts of a sequence\n"
        "  --concurrency N            in-flight request limit for the whole run\n"
        "  --player-version REF       player template version (default master)\n"
        "  --language CODE            player language (default en)\n"
        "  --keep-watermarks          do not remove Photobucket watermarks\n"
        "  --disable-html5-audio      use Web Audio instead of HTML5 audio\n"
        "  --continue-on-asset-error  write cases even when some assets failed\n"
        "  --replace-existing         overwrite existing output\n"
        "  --log-level LEVEL          debug, info, warn or error\n"
        "  --version                  print the version and exit\n");
}

// Flags override whatever the config files said.
bool parseArgs(int argc, char** argv, Config& cfg, std::string& configDir, bool& exitEarly, std::string& err) {
    std::vector<std::string> cases;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto value = [&](std::string& out) {
            if (i + 1 >= argc) {
                err = "Invalid config: " + arg + " needs a value";
                return false;
            }
            out = argv[++i];
            return true;
        };
        std::string v;
        if (arg == "--help" || arg == "-h") {
            printUsage();
            exitEarly = true;
            return true;
        } else if (arg == "--version") {
            std::printf("aaoffline %s\n", aao::appVersion());
            exitEarly = true;
            return true;
        } else if (arg == "--config") {
            if (!value(configDir)) return false;
        } else if (arg == "--output" || arg == "-o") {
            if (!value(cfg.output)) return false;
        } else if (arg == "--one-html-file" || arg == "-1") {
            cfg.oneHtmlFile = true;
        } else if (arg == "--sequence" || arg == "-s") {
            if (!value(v)) return false;
            if (!aao::parseSequenceMode(v, cfg.sequenceMode)) {
                err = "Invalid config: unknown sequence mode " + v;
                return false;
            }
        } else if (arg == "--concurrency" || arg == "-j") {
            if (!value(v)) return false;
            cfg.concurrency = std::atoi(v.c_str());
        } else if (arg == "--player-version") {
            if (!value(cfg.playerVersion)) return false;
        } else if (arg == "--language") {
            if (!value(cfg.language)) return false;
        } else if (arg == "--keep-watermarks") {
            cfg.removeWatermarks = false;
        } else if (arg == "--disable-html5-audio") {
            cfg.disableHtml5Audio = true;
        } else if (arg == "--continue-on-asset-error") {
            cfg.continueOnAssetError = true;
        } else if (arg == "--replace-existing") {
            cfg.replaceExisting = true;
        } else if (arg == "--log-level") {
            if (!value(cfg.logLevel)) return false;
        } else if (!arg.empty() && arg[0] == '-') {
            err = "Invalid config: unknown option " + arg;
            return false;
        } else {
            cases.push_back(arg);
        }
    }
    if (!cases.empty()) cfg.cases = cases;
    return true;
}

} // namespace

int main(int argc, char** argv) {
    setvbuf(stdout, nullptr, _IONBF, 0);

    Config config;
    std::string configDir;
    std::string cfgError;
    bool exitEarly = false;

    // First pass only to find --config; flags are applied again on top of the files.
    Config cliConfig;
    if (!parseArgs(argc, argv, cliConfig, configDir, exitEarly, cfgError)) {
        aao::logError(cfgError, "CFG");
        printUsage();
        return 2;
    }
    if (exitEarly) return 0;

    const std::string dir = configDir.empty() ? std::string(".") : configDir;
    const bool haveFiles = aao::fileExists(aao::joinPath(dir, ".env")) ||
                           aao::fileExists(aao::joinPath(dir, "config.json"));
    if (!configDir.empty() || haveFiles) {
        if (!aao::loadConfig(dir, config, cfgError)) {
            aao::logError(cfgError, "CFG");
            return 2;
        }
    }
    if (!parseArgs(argc, argv, config, configDir, exitEarly, cfgError) || !aao::validateConfig(config, cfgError)) {
        aao::logError(cfgError, "CFG");
        return 2;
    }

    aao::setLogLevelFromString(config.logLevel);
    if (!config.logFile.empty()) aao::initLogFile(config.logFile);
    aao::logInfo(std::string("aaoffline ") + aao::appVersion(), "APP");
    if (config.cases.empty()) {
        aao::logError("No cases given", "CFG");
        printUsage();
        return 2;
    }
    aao::logDebug(" output=" + config.output, "CFG");
    aao::logDebug(std::string(" sequence=") + aao::sequenceModeLabel(config.sequenceMode), "CFG");
    aao::logDebug(std::string(" http_handling=") + aao::httpHandlingLabel(config.httpHandling), "CFG");
    aao::logDebug(" concurrency=" + std::to_string(config.concurrency), "CFG");

    aao::CurlGlobal curl;
    if (!curl.ok()) {
        aao::logError("curl_global_init failed", "APP");
        return 1;
    }

    std::signal(SIGINT, handleSignal);
    std::signal(SIGTERM, handleSignal);

    aao::Pipeline pipeline(config, aao::makeCurlTransport());
    const aao::RunReport report = pipeline.run(config.cases, gCancel);
    std::printf("%s", aao::formatReport(report).c_str());

    switch (report.status) {
        case aao::RunStatus::Succeeded: return 0;
        case aao::RunStatus::SucceededWithWarnings: return 0;
        case aao::RunStatus::Cancelled: return 130;
        default: return 1;
    }
}
