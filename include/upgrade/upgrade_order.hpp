#pragma once

#include "util/manifest.hpp"
#include "util/result.hpp"

#include <vector>

namespace updsrv {

// Orders manifests for installation: roots are taken in ascending priority
// (file order among equal priorities) and every dependency is emitted before
// its dependent. Dependencies outside `manifests` are ignored.
//
// Fails with ErrorKind::DependencyCycle, leaving `out` empty, when the
// dependency graph has a cycle. Duplicate ids keep the first occurrence; a
// manifest conflicting with one already emitted is dropped together with
// everything that depends on it.
Result OrderUpgrades(const std::vector<UpgradeManifest>& manifests,
                     std::vector<UpgradeManifest>& out);

} // namespace updsrv
