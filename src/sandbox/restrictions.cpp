#include "sandbox/restrictions.h"
#include <cerrno>
#include <cstddef>
#include <cstring>
#include <string>
#include <unistd.h>
#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <sys/resource.h>

#if defined(__linux__)
#include <sched.h>
#include <sys/prctl.h>
#include <sys/syscall.h>
#include <linux/audit.h>
#include <linux/filter.h>
#include <linux/seccomp.h>
#endif

namespace testbox {
namespace sandbox {

const char* layerName(RestrictionLayer layer) {
    switch (layer) {
        case RestrictionLayer::PERMISSIONS: return "permissions";
        case RestrictionLayer::RESOURCE_LIMITS: return "resource_limits";
        case RestrictionLayer::NAMESPACES: return "namespaces";
        case RestrictionLayer::SECCOMP: return "seccomp";
        default: return "unknown";
    }
}

bool RestrictionReport::isApplied(RestrictionLayer layer) const {
    const LayerStatus* s = find(layer);
    return s && s->applied;
}

const LayerStatus* RestrictionReport::find(RestrictionLayer layer) const {
    for (const auto& s : layers) {
        if (s.layer == layer) return &s;
    }
    return nullptr;
}

std::vector<std::string> RestrictionReport::degraded() const {
    std::vector<std::string> out;
    for (const auto& s : layers) {
        if (!s.applied) out.push_back(std::string(layerName(s.layer)) + ": " + s.detail);
    }
    return out;
}

#if defined(__linux__)
#if defined(__x86_64__)
static constexpr uint32_t kAuditArch = AUDIT_ARCH_X86_64;
#elif defined(__aarch64__)
static constexpr uint32_t kAuditArch = AUDIT_ARCH_AARCH64;
#else
static constexpr uint32_t kAuditArch = 0;
#endif

// Syscalls a test suite has no business making. Everything else is allowed.
static std::vector<sock_filter> buildDenyFilter() {
    std::vector<sock_filter> filter;
    filter.push_back({static_cast<uint16_t>(BPF_LD | BPF_W | BPF_ABS), 0, 0,
                      static_cast<uint32_t>(offsetof(struct seccomp_data, arch))});
    filter.push_back({static_cast<uint16_t>(BPF_JMP | BPF_JEQ | BPF_K), 1, 0, kAuditArch});
    filter.push_back({static_cast<uint16_t>(BPF_RET | BPF_K), 0, 0, SECCOMP_RET_ALLOW});
    filter.push_back({static_cast<uint16_t>(BPF_LD | BPF_W | BPF_ABS), 0, 0,
                      static_cast<uint32_t>(offsetof(struct seccomp_data, nr))});

    auto deny = [&filter](long nr) {
        filter.push_back({static_cast<uint16_t>(BPF_JMP | BPF_JEQ | BPF_K), 0, 1,
                          static_cast<uint32_t>(nr)});
        filter.push_back({static_cast<uint16_t>(BPF_RET | BPF_K), 0, 0,
                          static_cast<uint32_t>(SECCOMP_RET_ERRNO | (EPERM & SECCOMP_RET_DATA))});
    };

    deny(__NR_ptrace);
    deny(__NR_mount);
    deny(__NR_umount2);
    deny(__NR_pivot_root);
    deny(__NR_reboot);
    deny(__NR_kexec_load);
    deny(__NR_init_module);
    deny(__NR_finit_module);
    deny(__NR_delete_module);
    deny(__NR_swapon);
    deny(__NR_swapoff);
    deny(__NR_acct);
    deny(__NR_settimeofday);
#if defined(__NR_kexec_file_load)
    deny(__NR_kexec_file_load);
#endif
#if defined(__NR_process_vm_writev)
    deny(__NR_process_vm_writev);
#endif
#if defined(__NR_bpf)
    deny(__NR_bpf);
#endif

    filter.push_back({static_cast<uint16_t>(BPF_RET | BPF_K), 0, 0, SECCOMP_RET_ALLOW});
    return filter;
}
#endif

struct PreparedRestrictions::Impl {
    ChildRestrictions spec;
    std::string uidMap;
    std::string gidMap;
#if defined(__linux__)
    std::vector<sock_filter> filter;
#endif
};

PreparedRestrictions::PreparedRestrictions(const ChildRestrictions& spec)
    : impl_(std::make_unique<Impl>()) {
    impl_->spec = spec;
    impl_->uidMap = std::to_string(getuid()) + " " + std::to_string(getuid()) + " 1\n";
    impl_->gidMap = std::to_string(getgid()) + " " + std::to_string(getgid()) + " 1\n";
#if defined(__linux__)
    if (spec.seccompFilter && kAuditArch != 0) {
        impl_->filter = buildDenyFilter();
    }
#endif
}

PreparedRestrictions::~PreparedRestrictions() = default;

static void childNote(const char* msg) {
    ssize_t n = write(STDERR_FILENO, msg, std::strlen(msg));
    (void)n;
}

static bool writeProcFile(const char* path, const std::string& content) {
    int fd = open(path, O_WRONLY | O_CLOEXEC);
    if (fd < 0) return false;
    ssize_t n = write(fd, content.data(), content.size());
    close(fd);
    return n == static_cast<ssize_t>(content.size());
}

static void setLimit(int resource, uint64_t value) {
    if (value == 0) return;
    struct rlimit rl;
    rl.rlim_cur = rl.rlim_max = static_cast<rlim_t>(value);
    if (setrlimit(resource, &rl) != 0) {
        childNote("testbox: setrlimit failed\n");
    }
}

void PreparedRestrictions::applyInChild() const {
    const ChildRestrictions& spec = impl_->spec;

    if (spec.applyLimits) {
        setLimit(RLIMIT_CPU, spec.limits.cpuSeconds);
        setLimit(RLIMIT_AS, spec.limits.memoryBytes);
        setLimit(RLIMIT_NOFILE, spec.limits.openFiles);
        setLimit(RLIMIT_NPROC, spec.limits.processes);
        setLimit(RLIMIT_FSIZE, spec.limits.fileSizeBytes);
    }

#if defined(__linux__)
    if (spec.userNamespace || spec.networkNamespace) {
        int flags = CLONE_NEWUSER;
        if (spec.networkNamespace) flags |= CLONE_NEWNET;
        if (unshare(flags) == 0) {
            // Map the caller's ids onto themselves so sandbox files stay writable.
            writeProcFile("/proc/self/setgroups", "deny");
            if (!writeProcFile("/proc/self/uid_map", impl_->uidMap) ||
                !writeProcFile("/proc/self/gid_map", impl_->gidMap)) {
                childNote("testbox: namespace id mapping failed\n");
            }
        } else {
            childNote("testbox: namespace isolation unavailable\n");
        }
    }

    if (!impl_->filter.empty()) {
        if (prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) != 0) {
            childNote("testbox: no_new_privs unavailable\n");
            return;
        }
        struct sock_fprog program;
        program.len = static_cast<unsigned short>(impl_->filter.size());
        program.filter = const_cast<sock_filter*>(impl_->filter.data());
        if (prctl(PR_SET_SECCOMP, SECCOMP_MODE_FILTER, &program) != 0) {
            childNote("testbox: seccomp filter unavailable\n");
        }
    }
#endif
}

bool namespacesSupported(std::string* reason) {
#if defined(__linux__)
    pid_t pid = fork();
    if (pid < 0) {
        if (reason) *reason = std::string("fork failed: ") + std::strerror(errno);
        return false;
    }
    if (pid == 0) {
        _exit(unshare(CLONE_NEWUSER | CLONE_NEWNET) == 0 ? 0 : 1);
    }
    int status = 0;
    if (waitpid(pid, &status, 0) < 0) {
        if (reason) *reason = std::string("waitpid failed: ") + std::strerror(errno);
        return false;
    }
    if (WIFEXITED(status) && WEXITSTATUS(status) == 0) return true;
    if (reason) *reason = "unprivileged user namespaces are not permitted on this host";
    return false;
#else
    if (reason) *reason = "namespaces are only available on Linux";
    return false;
#endif
}

bool seccompSupported(std::string* reason) {
#if defined(__linux__)
    if (kAuditArch == 0) {
        if (reason) *reason = "seccomp filter not built for this architecture";
        return false;
    }
    if (prctl(PR_GET_SECCOMP, 0, 0, 0, 0) < 0) {
        if (reason) *reason = std::string("kernel lacks seccomp: ") + std::strerror(errno);
        return false;
    }
    return true;
#else
    if (reason) *reason = "seccomp is only available on Linux";
    return false;
#endif
}

}
}
