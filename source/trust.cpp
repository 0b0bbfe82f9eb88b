#include "helpmirror/trust.hpp"
#include "helpmirror/logger.hpp"
#include "helpmirror/raii.hpp"
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <sys/wait.h>

namespace helpmirror {

std::string shellQuote(const std::string& s) {
    std::string out = "'";
    for (char c : s) {
        if (c == '\'') out += "'\\''";
        else out.push_back(c);
    }
    out += "'";
    return out;
}

CommandTrustVerifier::CommandTrustVerifier(std::string command) : command_(std::move(command)) {}

bool CommandTrustVerifier::isTrusted(const std::string& path) const {
    const std::string cmd = command_ + " " + shellQuote(path) + " 2>&1";
    logDebug("Verifying: " + cmd, "TRUST");
    UniquePipe pipe(popen(cmd.c_str(), "r"));
    if (!pipe) {
        logError(std::string("Cannot run verify command: ") + std::strerror(errno), "TRUST");
        return false;
    }

    char buffer[256];
    std::string output;
    while (std::fgets(buffer, sizeof(buffer), pipe.f)) {
        output += buffer;
    }
    const int status = pipe.close();
    if (!output.empty()) logDebug(output, "TRUST");

    if (status == -1) {
        logError(std::string("Verify command wait failed: ") + std::strerror(errno), "TRUST");
        return false;
    }
    if (!WIFEXITED(status)) {
        logError("Verify command terminated abnormally for " + path, "TRUST");
        return false;
    }
    const int code = WEXITSTATUS(status);
    if (code == 127) {
        logError("Verify command not found: " + command_, "TRUST");
        return false;
    }
    if (code != 0) {
        logWarn("Signature rejected (exit " + std::to_string(code) + ") for " + path, "TRUST");
        return false;
    }
    return true;
}

bool AcceptAllVerifier::isTrusted(const std::string& path) const {
    logWarn("Signature check skipped for " + path, "TRUST");
    return true;
}

} // namespace helpmirror
