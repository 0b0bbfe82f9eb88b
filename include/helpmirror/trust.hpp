#pragma once

#include <string>

namespace helpmirror {

// Signature/trust oracle consulted once per freshly downloaded package.
class TrustVerifier {
public:
    virtual ~TrustVerifier() = default;
    virtual bool isTrusted(const std::string& path) const = 0;
};

// Runs "<command> '<path>'" through the shell; exit status 0 means trusted.
// The command's output is captured into the debug log.
class CommandTrustVerifier : public TrustVerifier {
public:
    explicit CommandTrustVerifier(std::string command);
    bool isTrusted(const std::string& path) const override;

private:
    std::string command_;
};

// Used only when signature checks are explicitly disabled in the config.
class AcceptAllVerifier : public TrustVerifier {
public:
    bool isTrusted(const std::string& path) const override;
};

// Single-quote a string for /bin/sh.
std::string shellQuote(const std::string& s);

} // namespace helpmirror
