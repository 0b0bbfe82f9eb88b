#include "helpmirror/config.hpp"
#include "helpmirror/http_common.hpp"
#include "helpmirror/logger.hpp"
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace helpmirror {

static std::string toLower(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

static void trim(std::string& s) {
    while (!s.empty() && (s.back() == '\r' || s.back() == '\n' || s.back() == ' ' || s.back() == '\t')) s.pop_back();
    size_t i = 0;
    while (i < s.size() && (s[i] == ' ' || s[i] == '\t')) i++;
    s = s.substr(i);
}

static std::string homeDir() {
    const char* home = std::getenv("HOME");
    return home ? std::string(home) : std::string(".");
}

static bool parseBool(const std::string& val) {
    std::string v = toLower(val);
    return v == "1" || v == "true" || v == "yes";
}

static bool parseEnvStream(std::istream& in, Config& outCfg, std::string& outError) {
    std::string line;
    int lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        trim(line);
        if (line.empty()) continue;
        if (line[0] == '#' || line[0] == ';') continue;
        auto pos = line.find('=');
        if (pos == std::string::npos) {
            logWarn("Ignoring config line " + std::to_string(lineNo) + " without '='", "CFG");
            continue;
        }
        std::string key = toLower(line.substr(0, pos));
        std::string val = line.substr(pos + 1);
        trim(key); trim(val);
        if (!val.empty() && val.front() == '"' && val.back() == '"' && val.size() >= 2) {
            val = val.substr(1, val.size() - 2);
        }
        if (key == "catalog_base_url") outCfg.catalogBaseUrl = val;
        else if (key == "package_base_url") outCfg.packageBaseUrl = val;
        else if (key == "vs_version") outCfg.vsVersion = val;
        else if (key == "locale") outCfg.locale = toLower(val);
        else if (key == "cache_dir") outCfg.cacheDir = val;
        else if (key == "http_timeout_seconds") {
            char* end = nullptr;
            long t = std::strtol(val.c_str(), &end, 10);
            if (val.empty() || (end && *end != '\0')) {
                outError = "Invalid config value for http_timeout_seconds: " + val;
                return false;
            }
            outCfg.httpTimeoutSeconds = static_cast<int>(t);
        }
        else if (key == "proxy_url") outCfg.proxyUrl = val;
        else if (key == "proxy_username") outCfg.proxyUsername = val;
        else if (key == "proxy_password") outCfg.proxyPassword = val;
        else if (key == "verify_command") outCfg.verifyCommand = val;
        else if (key == "skip_signature_check") outCfg.skipSignatureCheck = parseBool(val);
        else if (key == "log_level") outCfg.logLevel = toLower(val);
        else if (key == "log_file") outCfg.logFile = val;
        else logWarn("Unknown config key: " + key, "CFG");
    }
    return true;
}

std::string defaultConfigPath() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    std::filesystem::path base = (xdg && *xdg) ? std::filesystem::path(xdg)
                                               : std::filesystem::path(homeDir()) / ".config";
    return (base / "helpmirror" / "helpmirror.env").string();
}

std::string defaultCacheDir() {
    return (std::filesystem::path(homeDir()) / "Downloads" / "MSDN Library").string();
}

bool validateConfig(const Config& cfg, std::string& outError) {
    if (cfg.catalogBaseUrl.empty() || cfg.packageBaseUrl.empty() || cfg.cacheDir.empty()) {
        outError = "Config missing catalog_base_url, package_base_url or cache_dir.";
        return false;
    }
    if (!isHttpUrl(cfg.catalogBaseUrl) || !isHttpUrl(cfg.packageBaseUrl)) {
        outError = "Invalid config: base URLs must be http:// or https:// with a host.";
        return false;
    }
    if (!cfg.proxyUrl.empty() && !isHttpUrl(cfg.proxyUrl)) {
        outError = "Invalid config: proxy_url must be http:// or https:// with a host.";
        return false;
    }
    if (cfg.httpTimeoutSeconds <= 0) {
        outError = "Invalid config: http_timeout_seconds must be positive.";
        return false;
    }
    if (cfg.verifyCommand.empty() && !cfg.skipSignatureCheck) {
        outError = "Config missing verify_command (or set skip_signature_check=true).";
        return false;
    }
    return true;
}

bool parseEnvString(const std::string& contents, Config& outCfg, std::string& outError) {
    if (outCfg.cacheDir.empty()) outCfg.cacheDir = defaultCacheDir();
    std::istringstream in(contents);
    if (!parseEnvStream(in, outCfg, outError)) return false;
    return validateConfig(outCfg, outError);
}

bool loadConfig(const std::string& path, bool required, Config& outCfg, std::string& outError) {
    if (outCfg.cacheDir.empty()) outCfg.cacheDir = defaultCacheDir();
    std::ifstream f(path);
    if (!f) {
        if (required) {
            outError = "Config missing: cannot open " + path;
            return false;
        }
        logDebug("No config file at " + path + ", using defaults", "CFG");
        return validateConfig(outCfg, outError);
    }
    if (!parseEnvStream(f, outCfg, outError)) return false;
    logDebug("Loaded config from " + path, "CFG");
    return validateConfig(outCfg, outError);
}

} // namespace helpmirror
