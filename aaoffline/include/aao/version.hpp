#pragma once

namespace aao {

inline const char* appVersion() {
#ifdef AAO_APP_VERSION
    return AAO_APP_VERSION;
#else
    return "0.0.0";
#endif
}

} // namespace aao
