#pragma once

namespace helpmirror {

inline const char* appVersion() {
#ifdef HELPMIRROR_APP_VERSION
    return HELPMIRROR_APP_VERSION;
#else
    return "0.0.0";
#endif
}

} // namespace helpmirror
