#pragma once

namespace aao {

// Origin host of the case data and the default assets.
constexpr const char* kOriginBase = "https://aaonline.fr";
constexpr const char* kOriginHost = "aaonline.fr";
// Host of the pre-2014 site; old player links still point there.
constexpr const char* kLegacyHost = "aceattorney.sparklin.org";

// Player template sources, addressed by version (commit-ish).
constexpr const char* kTemplateRepoBase =
    "https://bitbucket.org/AceAttorneyOnline/aao-game-creation-engine/raw";
constexpr const char* kTemplateRepoHost = "bitbucket.org";
constexpr const char* kDefaultPlayerVersion = "master";

constexpr const char* kBridgePath = "bridge.js.php";
constexpr const char* kDefaultDataPath = "default_data.js.php";

// Local asset directory inside a directory-mode case output.
constexpr const char* kAssetDir = "assets";
constexpr const char* kIndexFile = "index.html";

} // namespace aao
