#pragma once

#include <string>

namespace helpmirror {

struct Config {
    // Base address of the catalog service (locales + book catalogs)
    std::string catalogBaseUrl{"https://services.mtps.microsoft.com/serviceapi/"};
    // Base address that package links are resolved against
    std::string packageBaseUrl{"https://packages.mtps.microsoft.com/"};
    // Catalog version token (visualstudio11, visualstudio12, dev14, dev15)
    std::string vsVersion{"visualstudio11"};
    // Locale code used when the command line does not name one
    std::string locale;
    // Local cache mirrored for the help viewer
    std::string cacheDir;
    // HTTP timeout (seconds) for network calls
    int httpTimeoutSeconds{30};
    // Optional forward proxy (http://host:port) and its credentials
    std::string proxyUrl;
    std::string proxyUsername;
    std::string proxyPassword;
    // Command that verifies a package signature; the quoted path is appended
    std::string verifyCommand{"osslsigncode verify -in"};
    bool skipSignatureCheck{false};
    // Logging verbosity (debug, info, warn, error)
    std::string logLevel{"info"};
    // Optional log file path; empty logs to stderr only
    std::string logFile;
};

// Default location: $XDG_CONFIG_HOME/helpmirror/helpmirror.env, falling back to ~/.config.
std::string defaultConfigPath();
// Default cache directory: ~/Downloads/MSDN Library.
std::string defaultCacheDir();

// Loads path on top of the defaults. A missing file is not an error unless
// required is set; the result is validated either way.
bool loadConfig(const std::string& path, bool required, Config& outCfg, std::string& outError);

// Parses .env-style content from an in-memory string and validates it.
bool parseEnvString(const std::string& contents, Config& outCfg, std::string& outError);

bool validateConfig(const Config& cfg, std::string& outError);

} // namespace helpmirror
