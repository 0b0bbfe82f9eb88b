#include <chrono>
#include <cstdio>
#include <cstring>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "helpmirror/catalog_client.hpp"
#include "helpmirror/config.hpp"
#include "helpmirror/logger.hpp"
#include "helpmirror/progress.hpp"
#include "helpmirror/raii.hpp"
#include "helpmirror/reconciler.hpp"
#include "helpmirror/sync_engine.hpp"
#include "helpmirror/transport.hpp"
#include "helpmirror/trust.hpp"
#include "helpmirror/util.hpp"
#include "helpmirror/version.hpp"

using helpmirror::Config;
using helpmirror::ErrorInfo;

namespace {

struct Options {
    std::string configPath;
    bool configExplicit{false};
    std::string cacheDir;
    std::string versionToken;
    std::string command;
    std::string locale;
    std::vector<std::string> books;
    bool all{false};
    bool keepDefaults{false};
    bool showHelp{false};
    bool showVersion{false};
};

void printUsage(const char* argv0) {
    std::printf(
        "Usage: %s [--config FILE] [--cache DIR] [--version-token TOKEN] <command>\n"
        "\n"
        "Commands:\n"
        "  versions                 list known catalog versions\n"
        "  locales                  list locales of the catalog version\n"
        "  books <locale>           list books with their cache state\n"
        "  sync <locale> [options]  mirror the selected books into the cache\n"
        "      --book NAME          select a book by name or code (repeatable)\n"
        "      --all                select every book\n"
        "      --keep-defaults      keep the books already mostly cached selected\n"
        "\n"
        "  --version                print the version\n"
        "  --help                   print this help\n",
        argv0);
}

bool parseArgs(int argc, char** argv, Options& opts, std::string& err) {
    std::vector<std::string> positional;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto needValue = [&](const char* name, std::string& dst) {
            if (i + 1 >= argc) {
                err = std::string(name) + " requires a value";
                return false;
            }
            dst = argv[++i];
            return true;
        };
        if (arg == "--help" || arg == "-h") {
            opts.showHelp = true;
        } else if (arg == "--version") {
            opts.showVersion = true;
        } else if (arg == "--config") {
            if (!needValue("--config", opts.configPath)) return false;
            opts.configExplicit = true;
        } else if (arg == "--cache") {
            if (!needValue("--cache", opts.cacheDir)) return false;
        } else if (arg == "--version-token") {
            if (!needValue("--version-token", opts.versionToken)) return false;
        } else if (arg == "--book") {
            std::string book;
            if (!needValue("--book", book)) return false;
            opts.books.push_back(book);
        } else if (arg == "--all") {
            opts.all = true;
        } else if (arg == "--keep-defaults") {
            opts.keepDefaults = true;
        } else if (arg.size() > 1 && arg[0] == '-') {
            err = "Unknown option: " + arg;
            return false;
        } else {
            positional.push_back(arg);
        }
    }
    if (opts.showHelp || opts.showVersion) return true;
    if (positional.empty()) {
        err = "No command given";
        return false;
    }
    opts.command = positional[0];
    if (opts.command == "books" || opts.command == "sync") {
        if (positional.size() > 1) opts.locale = positional[1];
        if (positional.size() > 2) {
            err = "Too many arguments for " + opts.command;
            return false;
        }
    } else if (opts.command == "versions" || opts.command == "locales") {
        if (positional.size() > 1) {
            err = "Too many arguments for " + opts.command;
            return false;
        }
    } else {
        err = "Unknown command: " + opts.command;
        return false;
    }
    if ((!opts.books.empty() || opts.all || opts.keepDefaults) && opts.command != "sync") {
        err = "--book, --all and --keep-defaults only apply to sync";
        return false;
    }
    return true;
}

std::unique_ptr<helpmirror::Transport> makeTransport(const Config& cfg) {
    helpmirror::HttpTransportOptions o;
    o.timeoutSeconds = cfg.httpTimeoutSeconds;
    o.proxyUrl = cfg.proxyUrl;
    o.proxyUsername = cfg.proxyUsername;
    o.proxyPassword = cfg.proxyPassword;
    return std::make_unique<helpmirror::HttpTransport>(o);
}

int fail(const ErrorInfo& err) {
    helpmirror::logDebug(std::string("Failed with ") + helpmirror::errorCategoryLabel(err.category) + "/" +
                         helpmirror::errorCodeLabel(err.code), "APP");
    std::fprintf(stderr, "Error: %s\n", helpmirror::describeError(err).c_str());
    return 1;
}

// Fetches the locale list and then the book catalog of the named locale.
bool loadCatalog(helpmirror::Transport& transport,
                 const Config& cfg,
                 const std::string& locale,
                 std::vector<helpmirror::BookGroup>& groups,
                 ErrorInfo& err) {
    std::vector<helpmirror::Locale> locales;
    if (!helpmirror::loadAvailableLocales(transport, cfg.catalogBaseUrl, cfg.vsVersion, locales, err)) return false;
    const helpmirror::Locale* match = helpmirror::findLocale(locales, locale);
    if (!match) {
        err = helpmirror::makeError(helpmirror::ErrorCategory::InvalidArgument, helpmirror::ErrorCode::MissingArgument,
                                    "Locale " + locale + " is not offered by catalog " + cfg.vsVersion);
        return false;
    }
    return helpmirror::loadBooksInformation(transport, cfg.catalogBaseUrl, match->catalogLink, groups, err);
}

void printBooks(const std::vector<helpmirror::BookGroup>& groups) {
    // Books are listed under their category label, as the help viewer does.
    std::map<std::string, std::vector<const helpmirror::Book*>> byCategory;
    for (const auto& g : groups) {
        for (const auto& b : g.books) byCategory[b.category].push_back(&b);
    }
    for (const auto& [category, books] : byCategory) {
        std::printf("%s\n", category.c_str());
        for (const auto* b : books) {
            const auto s = helpmirror::summarizeBook(*b);
            std::printf("  [%c] %-48s %8s MB  %zu/%zu cached  %zu to fetch (%s MB)\n",
                        b->wanted ? 'x' : ' ', b->name.c_str(),
                        helpmirror::util::formatMegabytes(s.totalSize).c_str(),
                        s.packagesCached, s.packageCount, s.packagesOutOfDate,
                        helpmirror::util::formatMegabytes(s.downloadSize).c_str());
        }
    }
}

bool applySelection(std::vector<helpmirror::BookGroup>& groups, const Options& opts, std::string& err) {
    std::vector<bool> matched(opts.books.size(), false);
    for (auto& g : groups) {
        for (auto& b : g.books) {
            bool want = opts.all || (opts.keepDefaults && b.wanted);
            for (size_t i = 0; i < opts.books.size(); ++i) {
                if (helpmirror::util::equalsIgnoreCase(b.name, opts.books[i]) ||
                    helpmirror::util::equalsIgnoreCase(b.code, opts.books[i])) {
                    want = true;
                    matched[i] = true;
                }
            }
            b.wanted = want;
        }
    }
    for (size_t i = 0; i < opts.books.size(); ++i) {
        if (!matched[i]) {
            err = "No book named " + opts.books[i];
            return false;
        }
    }
    return true;
}

// Runs the sync on a worker thread and prints its events from this one.
bool runSync(std::vector<helpmirror::BookGroup>& groups,
             const Config& cfg,
             helpmirror::Transport& transport,
             const helpmirror::TrustVerifier& verifier,
             ErrorInfo& err) {
    helpmirror::SyncEventQueue queue;
    helpmirror::SyncEnvironment env;
    env.transport = &transport;
    env.verifier = &verifier;
    env.packageBaseUrl = cfg.packageBaseUrl;

    bool ok = false;
    std::thread worker([&]() {
        ok = helpmirror::syncBooks(groups, cfg.cacheDir, env, helpmirror::makeQueueingCallbacks(queue), err);
        helpmirror::SyncEvent done;
        done.kind = ok ? helpmirror::SyncEventKind::Finished : helpmirror::SyncEventKind::Failed;
        if (!ok) done.error = helpmirror::describeError(err);
        queue.push(done);
    });

    bool finished = false;
    while (!finished) {
        auto ev = queue.pop();
        if (!ev) {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            continue;
        }
        switch (ev->kind) {
            case helpmirror::SyncEventKind::Progress:
                std::printf("Overall: %d%%\n", ev->percent);
                break;
            case helpmirror::SyncEventKind::FileStatus:
                if (ev->file.bytesToDownload >= 0) {
                    std::printf("  %s %3d%% (%lld/%lld bytes)\n", ev->file.filename.c_str(), ev->file.percent,
                                static_cast<long long>(ev->file.bytesDownloaded),
                                static_cast<long long>(ev->file.bytesToDownload));
                } else {
                    std::printf("  %s %3d%%\n", ev->file.filename.c_str(), ev->file.percent);
                }
                break;
            case helpmirror::SyncEventKind::Finished:
            case helpmirror::SyncEventKind::Failed:
                finished = true;
                break;
        }
    }
    worker.join();
    return ok;
}

} // namespace

int main(int argc, char** argv) {
    setvbuf(stdout, nullptr, _IONBF, 0);
    setvbuf(stderr, nullptr, _IONBF, 0);

    Options opts;
    std::string argErr;
    if (!parseArgs(argc, argv, opts, argErr)) {
        std::fprintf(stderr, "%s\n", argErr.c_str());
        printUsage(argv[0]);
        return 2;
    }
    if (opts.showHelp) {
        printUsage(argv[0]);
        return 0;
    }
    if (opts.showVersion) {
        std::printf("helpmirror %s\n", helpmirror::appVersion());
        return 0;
    }

    Config cfg;
    std::string cfgError;
    const std::string cfgPath = opts.configExplicit ? opts.configPath : helpmirror::defaultConfigPath();
    if (!helpmirror::loadConfig(cfgPath, opts.configExplicit, cfg, cfgError)) {
        return fail(helpmirror::classifyError(cfgError, helpmirror::ErrorCategory::Config));
    }
    if (!opts.cacheDir.empty()) cfg.cacheDir = opts.cacheDir;
    if (!opts.versionToken.empty()) cfg.vsVersion = opts.versionToken;

    helpmirror::setLogLevelFromString(cfg.logLevel);
    if (!cfg.logFile.empty() && !helpmirror::initLogFile(cfg.logFile)) {
        helpmirror::logWarn("Cannot open log file " + cfg.logFile, "APP");
    }
    auto logGuard = helpmirror::make_scope_guard([]() { helpmirror::closeLogFile(); });
    helpmirror::logDebug(std::string("helpmirror ") + helpmirror::appVersion() + " starting", "APP");

    if (opts.command == "versions") {
        for (const auto& token : helpmirror::supportedVersionTokens()) {
            std::printf("%s%s\n", token.c_str(), token == cfg.vsVersion ? " (configured)" : "");
        }
        return 0;
    }

    auto transport = makeTransport(cfg);
    ErrorInfo err;

    if (opts.command == "locales") {
        std::vector<helpmirror::Locale> locales;
        if (!helpmirror::loadAvailableLocales(*transport, cfg.catalogBaseUrl, cfg.vsVersion, locales, err)) {
            return fail(err);
        }
        for (const auto& l : locales) std::printf("%-8s %s\n", l.code.c_str(), l.name.c_str());
        return 0;
    }

    const std::string locale = opts.locale.empty() ? cfg.locale : opts.locale;
    if (locale.empty()) {
        std::fprintf(stderr, "%s needs a locale (argument or locale= in %s)\n", opts.command.c_str(), cfgPath.c_str());
        return 2;
    }

    std::vector<helpmirror::BookGroup> groups;
    if (!loadCatalog(*transport, cfg, locale, groups, err)) return fail(err);
    if (!helpmirror::reconcile(groups, cfg.cacheDir, err)) return fail(err);
    helpmirror::applyDefaultSelection(groups);

    if (opts.command == "books") {
        printBooks(groups);
        return 0;
    }

    std::string selErr;
    if (!applySelection(groups, opts, selErr)) {
        std::fprintf(stderr, "%s\n", selErr.c_str());
        return 2;
    }

    std::unique_ptr<helpmirror::TrustVerifier> verifier;
    if (cfg.skipSignatureCheck) {
        verifier = std::make_unique<helpmirror::AcceptAllVerifier>();
    } else {
        verifier = std::make_unique<helpmirror::CommandTrustVerifier>(cfg.verifyCommand);
    }

    if (!runSync(groups, cfg, *transport, *verifier, err)) return fail(err);
    std::printf("Cache up to date: %s\n", cfg.cacheDir.c_str());
    return 0;
}
