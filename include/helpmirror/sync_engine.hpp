#pragma once

#include <string>
#include <vector>
#include "helpmirror/errors.hpp"
#include "helpmirror/models.hpp"
#include "helpmirror/progress.hpp"
#include "helpmirror/transport.hpp"
#include "helpmirror/trust.hpp"

namespace helpmirror {

// Collaborators for one sync pass. Both pointers are borrowed and must be set.
struct SyncEnvironment {
    Transport* transport{nullptr};
    const TrustVerifier* verifier{nullptr};
    std::string packageBaseUrl; // package links are resolved against this
};

// Brings cacheDirectory in line with the wanted books of groups:
//  - rewrites HelpContentSetup.msha and every group/book index,
//  - deletes cached packages no wanted book references,
//  - downloads and verifies every package that is not Ready,
//    marking it Ready in the model once it is on disk.
// Stops at the first error. Nothing already written is rolled back.
bool syncBooks(std::vector<BookGroup>& groups,
               const std::string& cacheDirectory,
               const SyncEnvironment& env,
               const SyncCallbacks& callbacks,
               ErrorInfo& err);

} // namespace helpmirror
