/**
 * @file microvm_provider.hpp
 * @brief Firecracker microVM sandbox provider
 *
 * Used for kernel exploitation and Windows challenges that need a full guest
 * kernel. Every VM runs inside a jailer chroot with its own TAP device on
 * the shared bridge.
 *
 * **Jail Layout** (`<jail_base>/firecracker/<vm_id>/root`):
 * ```
 * root/
 * ├── run/firecracker.socket   API socket
 * ├── dev/                     null, zero, random, urandom, tty
 * ├── logs/                    firecracker.log, serial.log
 * └── images/                  vmlinux, rootfs.ext4 (hard links)
 * ```
 *
 * **Addressing** is derived from a SHA-256 of the instance id, so a given
 * instance always receives the same MAC and guest IP.
 *
 * @date 2025
 */

#pragma once

#include "cerberus/core/config.hpp"
#include "cerberus/providers/provider_specs.hpp"
#include "cerberus/providers/sandbox_provider.hpp"
#include "cerberus/utils/command_runner.hpp"

#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace cerberus {
namespace providers {

/**
 * @struct VmAddressing
 * @brief Deterministic identifiers of one microVM
 */
struct VmAddressing {
    std::string vm_id;        ///< First 8 hex chars of the instance id
    std::string tap_device;   ///< <tap_prefix>-<vm_id>
    std::string guest_mac;    ///< 02:FC:00:00:xx:yy
    std::string guest_ip;     ///< 172.16.x.y
};

/**
 * @class MicroVmProvider
 * @brief SandboxProvider backed by jailed Firecracker processes
 *
 * The process id of every VM is stored in the instance's provider metadata,
 * so a restarted orchestrator can still find, probe and stop VMs it did not
 * launch itself.
 */
class MicroVmProvider : public SandboxProvider {
public:
    /// provider_metadata key holding the jailer/firecracker pid
    static constexpr const char* kPidMetadataKey = "vm_pid";

    MicroVmProvider(core::MicroVmProviderConfig config,
                    std::shared_ptr<utils::CommandRunner> runner);

    core::SpawnResult Spawn(core::ChallengeInstance& instance, Deadline deadline) override;
    bool Destroy(const core::ChallengeInstance& instance) override;
    bool Exists(const core::ChallengeInstance& instance) override;
    std::string GetLogs(const core::ChallengeInstance& instance, int tail_lines = 100) override;
    ExecResult ExecCommand(const core::ChallengeInstance& instance,
                           const std::vector<std::string>& command) override;
    nlohmann::json GetStats(const core::ChallengeInstance& instance) override;
    std::string Name() const override { return "microvm"; }

    VmAddressing Addressing(const std::string& instance_id) const;

    /// Chroot root of a VM as created by the jailer
    std::filesystem::path JailRoot(const std::string& vm_id) const;

    /// Number of VMs currently tracked
    std::size_t TrackedCount() const;

private:
    struct VmRecord {
        long pid{-1};
        VmAddressing addressing;
        std::filesystem::path jail_root;
        std::filesystem::path api_socket;
        bool tap_created{false};
    };

    void PrepareJail(const VmRecord& vm, const MicroVmSpec& spec, Deadline deadline);
    void CreateTap(VmRecord& vm, Deadline deadline);
    void StartJailer(VmRecord& vm, Deadline deadline);
    void WaitForApiSocket(const VmRecord& vm, Deadline deadline);
    void ConfigureVm(const VmRecord& vm, const core::ChallengeInstance& instance, Deadline deadline);
    void WaitForBoot(const VmRecord& vm, int port, Deadline deadline);

    /// PUT a JSON document to the Firecracker API; 200 and 204 are success
    void ApiPut(const VmRecord& vm, const std::string& path, const nlohmann::json& body,
                Deadline deadline);

    /// Stop the process, delete the TAP and remove the jail. Never throws.
    void Teardown(const VmRecord& vm);

    std::optional<VmRecord> FindVm(const std::string& instance_id) const;

    /**
     * @brief Rebuild the record of a VM from its deterministic names
     *
     * The pid comes from the instance metadata, or from the jailer's pid file.
     * It is only trusted while the jail directory exists.
     */
    VmRecord DescribeVm(const core::ChallengeInstance& instance) const;

    /// Tracked record, or a described one when its jail is still on disk
    std::optional<VmRecord> LocateVm(const core::ChallengeInstance& instance) const;

    utils::CommandResult RunTool(const std::vector<std::string>& argv, std::chrono::milliseconds timeout);

    core::MicroVmProviderConfig config_;
    std::shared_ptr<utils::CommandRunner> runner_;

    mutable std::mutex vms_mutex_;
    std::map<std::string, VmRecord> vms_;   ///< instance id -> VM
};

} // namespace providers
} // namespace cerberus
