#pragma once

#include "utils/config.h"
#include <string>
#include <vector>
#include <memory>

namespace testbox {
namespace sandbox {

enum class RestrictionLayer {
    PERMISSIONS,
    RESOURCE_LIMITS,
    NAMESPACES,
    SECCOMP
};

struct LayerStatus {
    RestrictionLayer layer;
    bool applied = false;
    std::string detail;
};

// What apply_restrictions actually achieved; callers assert on this instead
// of assuming isolation.
struct RestrictionReport {
    std::vector<LayerStatus> layers;

    bool isApplied(RestrictionLayer layer) const;
    const LayerStatus* find(RestrictionLayer layer) const;
    std::vector<std::string> degraded() const;
};

// Hardening requested for one spawned child.
struct ChildRestrictions {
    bool applyLimits = false;
    utils::ResourceLimits limits;
    bool userNamespace = false;
    bool networkNamespace = false;
    bool seccompFilter = false;
};

// Everything the child needs, computed before fork so the child only makes
// syscalls between fork and exec.
class PreparedRestrictions {
public:
    explicit PreparedRestrictions(const ChildRestrictions& spec);
    ~PreparedRestrictions();
    PreparedRestrictions(const PreparedRestrictions&) = delete;
    PreparedRestrictions& operator=(const PreparedRestrictions&) = delete;

    // Runs in the forked child. Failures of optional layers are reported on
    // stderr and do not abort the exec.
    void applyInChild() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

const char* layerName(RestrictionLayer layer);

bool namespacesSupported(std::string* reason = nullptr);
bool seccompSupported(std::string* reason = nullptr);

}
}
