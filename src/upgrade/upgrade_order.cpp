#include "upgrade/upgrade_order.hpp"

#include "util/logger.hpp"

#include <algorithm>
#include <numeric>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace updsrv {

namespace {

struct Frame {
    std::size_t node;
    std::size_t next_dep;
};

bool Contains(const std::vector<std::string>& v, const std::string& s) {
    return std::find(v.begin(), v.end(), s) != v.end();
}

bool ConflictsWithEmitted(const UpgradeManifest& m, const std::vector<UpgradeManifest>& emitted) {
    for (const auto& e : emitted) {
        if (Contains(m.conflicts, e.id) || Contains(e.conflicts, m.id)) {
            LogWarn("dropping upgrade %s: conflicts with %s", m.id.c_str(), e.id.c_str());
            return true;
        }
    }
    return false;
}

} // namespace

Result OrderUpgrades(const std::vector<UpgradeManifest>& manifests,
                     std::vector<UpgradeManifest>& out) {
    out.clear();

    std::vector<const UpgradeManifest*> nodes;
    std::unordered_map<std::string, std::size_t> by_id;
    for (const auto& m : manifests) {
        if (by_id.count(m.id)) {
            LogWarn("duplicate upgrade id %s, keeping the first definition", m.id.c_str());
            continue;
        }
        by_id.emplace(m.id, nodes.size());
        nodes.push_back(&m);
    }

    std::vector<std::size_t> roots(nodes.size());
    std::iota(roots.begin(), roots.end(), 0);
    std::stable_sort(roots.begin(), roots.end(), [&](std::size_t a, std::size_t b) {
        return nodes[a]->priority < nodes[b]->priority;
    });

    std::unordered_set<std::size_t> visited;
    std::unordered_set<std::size_t> visiting;
    std::unordered_set<std::size_t> dropped;
    std::vector<UpgradeManifest> ordered;
    ordered.reserve(nodes.size());

    for (std::size_t root : roots) {
        if (visited.count(root)) continue;

        std::vector<Frame> stack;
        stack.push_back({root, 0});
        visiting.insert(root);

        while (!stack.empty()) {
            Frame& top = stack.back();
            const UpgradeManifest& node = *nodes[top.node];

            if (top.next_dep < node.dependencies.size()) {
                const std::string& dep_id = node.dependencies[top.next_dep++];
                auto it = by_id.find(dep_id);
                if (it == by_id.end()) {
                    LogDebug("upgrade %s: dependency %s not applicable, ignored",
                             node.id.c_str(), dep_id.c_str());
                    continue;
                }
                const std::size_t dep = it->second;
                if (visited.count(dep)) continue;
                if (visiting.count(dep)) {
                    LogError("dependency cycle: %s -> %s", node.id.c_str(), dep_id.c_str());
                    return Result::Fail(ErrorKind::DependencyCycle,
                                        "Circular dependency detected between " + node.id + " and " + dep_id);
                }
                visiting.insert(dep);
                stack.push_back({dep, 0}); // invalidates `top`
                continue;
            }

            const std::size_t done = top.node;
            visiting.erase(done);
            visited.insert(done);
            stack.pop_back();

            // Dependencies finish first, so a drop propagates to every dependent.
            const std::string* dropped_dep = nullptr;
            for (const auto& dep_id : node.dependencies) {
                auto it = by_id.find(dep_id);
                if (it != by_id.end() && dropped.count(it->second)) {
                    dropped_dep = &dep_id;
                    break;
                }
            }
            if (dropped_dep) {
                LogWarn("dropping upgrade %s: dependency %s was dropped", node.id.c_str(), dropped_dep->c_str());
                dropped.insert(done);
            } else if (ConflictsWithEmitted(node, ordered)) {
                dropped.insert(done);
            } else {
                ordered.push_back(node);
            }
        }
    }

    out = std::move(ordered);
    return Result::Ok();
}

} // namespace updsrv
