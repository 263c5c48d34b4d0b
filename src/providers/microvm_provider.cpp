/**
 * @file microvm_provider.cpp
 * @brief Firecracker/jailer VM lifecycle
 *
 * **Spawn Workflow**:
 * 1. Derive vm_id, MAC and guest IP from the instance id
 * 2. Build the jail tree, device nodes and per-VM image copies
 * 3. Create the TAP device and attach it to the bridge
 * 4. Launch jailer → firecracker with the API socket inside the jail
 * 5. Configure machine, boot source, rootfs and eth0 over the API socket
 * 6. InstanceStart, then TCP-probe the guest's readiness port
 *
 * Every failed step tears down everything created before it.
 *
 * @date 2025
 */

#include "cerberus/providers/microvm_provider.hpp"
#include "cerberus/core/errors.hpp"
#include "cerberus/utils/hash_utils.hpp"
#include "cerberus/utils/net_utils.hpp"
#include "cerberus/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <thread>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace cerberus {
namespace providers {

using utils::StringUtils;

namespace {

constexpr const char* kGuestGateway = "172.16.0.1";
constexpr const char* kGuestNetmask = "255.255.0.0";
constexpr const char* kApiSocketInJail = "/run/firecracker.socket";
constexpr std::chrono::milliseconds kToolTimeout{10000};
constexpr std::chrono::milliseconds kSocketPollInterval{100};
constexpr std::chrono::seconds kStopGrace{5};

struct DeviceNode {
    const char* name;
    int major;
    int minor;
};

// jailer creates kvm, net/tun and urandom itself
constexpr DeviceNode kDeviceNodes[] = {
    {"null", 1, 3},
    {"zero", 1, 5},
    {"random", 1, 8},
    {"tty", 5, 0},
};

std::chrono::milliseconds Remaining(Deadline deadline) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
}

} // anonymous namespace

// ============================================================================
// CONSTRUCTOR / HELPERS
// ============================================================================

MicroVmProvider::MicroVmProvider(core::MicroVmProviderConfig config,
                                 std::shared_ptr<utils::CommandRunner> runner)
    : config_(std::move(config)), runner_(std::move(runner)) {
    spdlog::debug("MicroVM provider: jail base {}, bridge {}", config_.jail_base_dir, config_.bridge_name);
}

VmAddressing MicroVmProvider::Addressing(const std::string& instance_id) const {
    VmAddressing addr;

    std::string hex;
    for (char c : instance_id) {
        if (std::isxdigit(static_cast<unsigned char>(c))) {
            hex.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }
    }
    addr.vm_id = hex.substr(0, 8);
    if (addr.vm_id.size() < 8) {
        // Non-UUID ids still need a stable 8-char jail name
        addr.vm_id = utils::HashUtils::ComputeSHA256(instance_id).substr(0, 8);
    }
    addr.tap_device = config_.tap_prefix + "-" + addr.vm_id;

    auto digest = utils::HashUtils::ComputeSHA256Raw(instance_id);
    char buf[32];
    std::snprintf(buf, sizeof(buf), "02:FC:00:00:%02X:%02X", digest[0], digest[1]);
    addr.guest_mac = buf;
    std::snprintf(buf, sizeof(buf), "172.16.%u.%u",
                  static_cast<unsigned>(digest[0]), static_cast<unsigned>(digest[1] % 240 + 10));
    addr.guest_ip = buf;

    return addr;
}

fs::path MicroVmProvider::JailRoot(const std::string& vm_id) const {
    // jailer builds <chroot-base-dir>/<exec-file name>/<id>/root
    return fs::path(config_.jail_base_dir) / fs::path(config_.firecracker_binary).filename() / vm_id / "root";
}

std::size_t MicroVmProvider::TrackedCount() const {
    std::lock_guard<std::mutex> lock(vms_mutex_);
    return vms_.size();
}

std::optional<MicroVmProvider::VmRecord> MicroVmProvider::FindVm(const std::string& instance_id) const {
    std::lock_guard<std::mutex> lock(vms_mutex_);
    auto it = vms_.find(instance_id);
    if (it == vms_.end()) {
        return std::nullopt;
    }
    return it->second;
}

MicroVmProvider::VmRecord MicroVmProvider::DescribeVm(const core::ChallengeInstance& instance) const {
    VmRecord vm;
    vm.addressing = Addressing(instance.id);
    vm.jail_root = JailRoot(vm.addressing.vm_id);
    vm.api_socket = vm.jail_root / "run" / "firecracker.socket";
    vm.tap_created = true;

    std::error_code ec;
    if (!fs::exists(vm.jail_root, ec)) {
        return vm;
    }

    const auto& metadata = instance.provider_metadata;
    if (metadata.is_object() && metadata.contains(kPidMetadataKey) &&
        metadata[kPidMetadataKey].is_number_integer()) {
        vm.pid = metadata[kPidMetadataKey].get<long>();
        return vm;
    }

    // jailer writes <exec-file name>.pid into the chroot
    const fs::path pid_file = vm.jail_root / (fs::path(config_.firecracker_binary).filename().string() + ".pid");
    std::ifstream file(pid_file);
    long pid = -1;
    if (file >> pid && pid > 0) {
        vm.pid = pid;
    }
    return vm;
}

std::optional<MicroVmProvider::VmRecord> MicroVmProvider::LocateVm(const core::ChallengeInstance& instance) const {
    if (auto tracked = FindVm(instance.id)) {
        return tracked;
    }
    VmRecord vm = DescribeVm(instance);
    std::error_code ec;
    if (!fs::exists(vm.jail_root, ec)) {
        return std::nullopt;
    }
    return vm;
}

utils::CommandResult MicroVmProvider::RunTool(const std::vector<std::string>& argv,
                                              std::chrono::milliseconds timeout) {
    utils::CommandSpec spec;
    spec.argv = argv;
    spec.timeout = timeout;
    return runner_->Run(spec);
}

// ============================================================================
// SPAWN
// ============================================================================

core::SpawnResult MicroVmProvider::Spawn(core::ChallengeInstance& instance, Deadline deadline) {
    const MicroVmSpec spec = ParseMicroVmSpec(instance.provider_metadata, config_.default_image);

    VmRecord vm;
    vm.addressing = Addressing(instance.id);
    vm.jail_root = JailRoot(vm.addressing.vm_id);
    vm.api_socket = vm.jail_root / "run" / "firecracker.socket";

    spdlog::info("Spawning microVM {} for instance {} (image {})", vm.addressing.vm_id, instance.id, spec.image);
    const auto started = std::chrono::steady_clock::now();

    try {
        PrepareJail(vm, spec, deadline);
        CreateTap(vm, deadline);
        StartJailer(vm, deadline);
        WaitForApiSocket(vm, deadline);
        ConfigureVm(vm, instance, deadline);
        ApiPut(vm, "/actions", json{{"action_type", "InstanceStart"}}, deadline);
        WaitForBoot(vm, spec.readiness_port, deadline);

    } catch (const core::ProviderError& e) {
        spdlog::error("MicroVM spawn failed for {}: {}", instance.id, e.what());
        Teardown(vm);
        return core::SpawnResult::Failure(core::ErrorKind::PROVIDER,
                                          std::string("Firecracker spawn failed: ") + e.what(),
                                          e.IsRetryable());
    } catch (const std::exception& e) {
        spdlog::error("MicroVM spawn failed for {}: {}", instance.id, e.what());
        Teardown(vm);
        throw;
    }

    const auto boot_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started).count();

    instance.provider_instance_id = vm.jail_root.string();
    instance.provider_metadata[kPidMetadataKey] = vm.pid;
    instance.network.internal_ip = vm.addressing.guest_ip;
    instance.network.mac_address = vm.addressing.guest_mac;
    instance.network.hostname = "vm-" + vm.addressing.vm_id;
    instance.network.port_mappings.clear();
    if (spec.is_windows) {
        instance.network.port_mappings[3389] = 3389;
        instance.access_url = "rdp://" + vm.addressing.guest_ip + ":3389";
    } else {
        instance.network.port_mappings[22] = 22;
        instance.network.port_mappings[80] = 80;
        instance.access_url = "ssh://root@" + vm.addressing.guest_ip + ":22";
    }

    {
        std::lock_guard<std::mutex> lock(vms_mutex_);
        vms_[instance.id] = vm;
    }

    spdlog::info("MicroVM {} ready in {} ms at {}", vm.addressing.vm_id, boot_ms, vm.addressing.guest_ip);
    return core::SpawnResult::Success(instance);
}

void MicroVmProvider::PrepareJail(const VmRecord& vm, const MicroVmSpec& spec, Deadline deadline) {
    const fs::path kernel = fs::path(config_.images_dir) / (spec.image + "-vmlinux");
    const fs::path rootfs = fs::path(config_.images_dir) / (spec.image + "-rootfs.ext4");

    if (!fs::exists(kernel) || !fs::exists(rootfs)) {
        throw core::ProviderError("VM image not found: " + spec.image, false);
    }

    std::error_code ec;
    for (const char* subdir : {"run", "dev", "logs", "images"}) {
        fs::create_directories(vm.jail_root / subdir, ec);
        if (ec) {
            throw core::ProviderError("Cannot create jail directory " +
                                      (vm.jail_root / subdir).string() + ": " + ec.message(), false);
        }
    }

    for (const auto& dev : kDeviceNodes) {
        const fs::path node = vm.jail_root / "dev" / dev.name;
        if (fs::exists(node)) {
            continue;
        }
        auto result = RunTool({"mknod", node.string(), "c", std::to_string(dev.major), std::to_string(dev.minor)},
                              RemainingBudget(deadline, kToolTimeout));
        if (!result.Ok()) {
            spdlog::warn("mknod {} failed: {}", node.string(), result.ErrorText());
        }
    }

    // Kernel is shared read-only; every VM writes to its own rootfs copy
    const fs::path jail_kernel = vm.jail_root / "images" / "vmlinux";
    fs::create_hard_link(kernel, jail_kernel, ec);
    if (ec) {
        ec.clear();
        fs::copy_file(kernel, jail_kernel, fs::copy_options::overwrite_existing, ec);
        if (ec) {
            throw core::ProviderError("Cannot stage kernel image: " + ec.message(), false);
        }
    }

    auto copied = RunTool({"cp", "--reflink=auto", "--sparse=always", rootfs.string(),
                           (vm.jail_root / "images" / "rootfs.ext4").string()},
                          RemainingBudget(deadline, std::chrono::milliseconds::max()));
    if (!copied.Ok()) {
        if (copied.timed_out) {
            throw core::SpawnTimeoutError("Copying rootfs exceeded the spawn deadline");
        }
        if (StringUtils::ContainsIgnoreCase(copied.ErrorText(), "no space left")) {
            throw core::ResourceExhaustedError("No space left for VM rootfs");
        }
        throw core::ProviderError("Cannot stage rootfs image: " + copied.ErrorText(), false);
    }

    const std::string owner = std::to_string(config_.jailer_uid) + ":" + std::to_string(config_.jailer_gid);
    auto chowned = RunTool({"chown", "-R", owner, vm.jail_root.string()}, RemainingBudget(deadline, kToolTimeout));
    if (!chowned.Ok()) {
        throw core::ProviderError("Cannot chown jail: " + chowned.ErrorText(), false);
    }
}

void MicroVmProvider::CreateTap(VmRecord& vm, Deadline deadline) {
    const std::string& tap = vm.addressing.tap_device;

    auto added = RunTool({"ip", "tuntap", "add", tap, "mode", "tap"}, RemainingBudget(deadline, kToolTimeout));
    if (!added.Ok()) {
        throw core::ProviderError("Failed to create TAP " + tap + ": " + added.ErrorText(), false);
    }
    vm.tap_created = true;

    for (const auto& argv : std::vector<std::vector<std::string>>{
             {"ip", "link", "set", tap, "up"},
             {"ip", "link", "set", tap, "master", config_.bridge_name}}) {
        auto result = RunTool(argv, RemainingBudget(deadline, kToolTimeout));
        if (!result.Ok()) {
            throw core::ProviderError("Failed to configure TAP " + tap + ": " + result.ErrorText(), false);
        }
    }
}

void MicroVmProvider::StartJailer(VmRecord& vm, Deadline deadline) {
    // Throws once the deadline has passed
    RemainingBudget(deadline, kToolTimeout);

    utils::CommandSpec spec;
    spec.argv = {
        config_.jailer_binary,
        "--id", vm.addressing.vm_id,
        "--uid", std::to_string(config_.jailer_uid),
        "--gid", std::to_string(config_.jailer_gid),
        "--chroot-base-dir", config_.jail_base_dir,
        "--exec-file", config_.firecracker_binary,
        "--",
        "--api-sock", kApiSocketInJail,
        "--log-path", "/logs/firecracker.log",
        "--level", "Info",
        "--show-log-origin",
        "--show-log-level",
    };
    // Guest serial console is firecracker's stdout
    spec.output_file = (vm.jail_root / "logs" / "serial.log").string();

    vm.pid = runner_->StartBackground(spec);
    if (vm.pid <= 0) {
        throw core::ProviderError("Failed to start jailer", false);
    }
    spdlog::debug("jailer for {} started as pid {}", vm.addressing.vm_id, vm.pid);
}

void MicroVmProvider::WaitForApiSocket(const VmRecord& vm, Deadline deadline) {
    const auto limit = std::min(deadline, std::chrono::steady_clock::now() + config_.api_socket_timeout);

    while (std::chrono::steady_clock::now() < limit) {
        if (fs::exists(vm.api_socket)) {
            return;
        }
        if (!runner_->IsRunning(vm.pid)) {
            throw core::ProviderError("Firecracker exited before its API socket appeared", false);
        }
        std::this_thread::sleep_for(kSocketPollInterval);
    }

    if (std::chrono::steady_clock::now() >= deadline) {
        throw core::SpawnTimeoutError("Spawn deadline exceeded waiting for the Firecracker API socket");
    }
    throw core::ProviderError("Firecracker API socket not ready", true);
}

void MicroVmProvider::ConfigureVm(const VmRecord& vm, const core::ChallengeInstance& instance, Deadline deadline) {
    const int vcpus = instance.resources.cpu_quota
        ? std::max(1, static_cast<int>(std::ceil(*instance.resources.cpu_quota)))
        : config_.default_vcpus;
    const int memory_mb = instance.resources.memory_limit_mb.value_or(config_.default_memory_mb);

    ApiPut(vm, "/machine-config", json{
        {"vcpu_count", vcpus},
        {"mem_size_mib", memory_mb},
        {"smt", false},
        {"track_dirty_pages", false},
    }, deadline);

    // Static guest addressing through the kernel command line
    const std::string boot_args = config_.boot_args + " ip=" + vm.addressing.guest_ip + "::" + kGuestGateway +
                                  ":" + kGuestNetmask + "::eth0:off";

    // Paths are relative to the jail root
    ApiPut(vm, "/boot-source", json{
        {"kernel_image_path", "/images/vmlinux"},
        {"boot_args", boot_args},
    }, deadline);

    ApiPut(vm, "/drives/rootfs", json{
        {"drive_id", "rootfs"},
        {"path_on_host", "/images/rootfs.ext4"},
        {"is_root_device", true},
        {"is_read_only", false},
    }, deadline);

    ApiPut(vm, "/network-interfaces/eth0", json{
        {"iface_id", "eth0"},
        {"guest_mac", vm.addressing.guest_mac},
        {"host_dev_name", vm.addressing.tap_device},
    }, deadline);
}

void MicroVmProvider::ApiPut(const VmRecord& vm, const std::string& path, const json& body, Deadline deadline) {
    const auto timeout = RemainingBudget(
        deadline, std::chrono::duration_cast<std::chrono::milliseconds>(config_.api_socket_timeout));

    utils::HttpResponse response;
    try {
        response = utils::NetUtils::UnixSocketRequest(vm.api_socket.string(), "PUT", path, body.dump(), timeout);
    } catch (const utils::NetworkError& e) {
        throw core::ProviderError("Firecracker API " + path + ": " + e.what(), false);
    }

    if (response.status_code != 200 && response.status_code != 204) {
        std::string fault = StringUtils::Trim(response.body);
        try {
            auto parsed = json::parse(response.body);
            fault = parsed.value("fault_message", fault);
        } catch (const json::exception&) {
            // Non-JSON body, keep raw text
        }
        throw core::ProviderError("Firecracker API " + path + " returned " +
                                  std::to_string(response.status_code) + ": " + fault, false);
    }
}

void MicroVmProvider::WaitForBoot(const VmRecord& vm, int port, Deadline deadline) {
    const auto limit = std::min(deadline, std::chrono::steady_clock::now() + config_.boot_timeout);

    while (std::chrono::steady_clock::now() < limit) {
        if (!runner_->IsRunning(vm.pid)) {
            throw core::ProviderError("Firecracker exited during boot", false);
        }
        const auto slice = std::clamp(Remaining(limit), std::chrono::milliseconds(1), config_.boot_probe_interval);
        if (utils::NetUtils::TcpProbe(vm.addressing.guest_ip, port, slice)) {
            return;
        }
        std::this_thread::sleep_for(slice);
    }

    if (std::chrono::steady_clock::now() >= deadline) {
        throw core::SpawnTimeoutError("Spawn deadline exceeded waiting for the guest to boot");
    }
    throw core::ProviderError("Guest did not open port " + std::to_string(port) + " within " +
                              std::to_string(config_.boot_timeout.count()) + "s", true);
}

// ============================================================================
// TEARDOWN
// ============================================================================

void MicroVmProvider::Teardown(const VmRecord& vm) {
    try {
        if (vm.pid > 0 && runner_->IsRunning(vm.pid)) {
            runner_->Terminate(vm.pid, kStopGrace);
        }

        auto deleted = RunTool({"ip", "link", "delete", vm.addressing.tap_device}, kToolTimeout);
        if (!deleted.Ok() && vm.tap_created) {
            spdlog::warn("Failed to delete TAP {}: {}", vm.addressing.tap_device, deleted.ErrorText());
        }

        std::error_code ec;
        const fs::path vm_dir = vm.jail_root.parent_path();
        fs::remove_all(vm_dir, ec);
        if (ec) {
            spdlog::warn("Failed to remove jail {}: {}", vm_dir.string(), ec.message());
        }
    } catch (const std::exception& e) {
        spdlog::error("MicroVM teardown of {} failed: {}", vm.addressing.vm_id, e.what());
    }
}

bool MicroVmProvider::Destroy(const core::ChallengeInstance& instance) {
    std::optional<VmRecord> tracked;
    {
        std::lock_guard<std::mutex> lock(vms_mutex_);
        auto it = vms_.find(instance.id);
        if (it != vms_.end()) {
            tracked = it->second;
            vms_.erase(it);
        }
    }

    // Not launched by this process: clean up by the deterministic names
    const VmRecord vm = tracked ? *tracked : DescribeVm(instance);
    if (!tracked && vm.pid > 0) {
        spdlog::info("Stopping untracked microVM {} (pid {})", vm.addressing.vm_id, vm.pid);
    }

    Teardown(vm);
    spdlog::info("MicroVM {} destroyed", vm.addressing.vm_id);
    return true;
}

bool MicroVmProvider::Exists(const core::ChallengeInstance& instance) {
    auto vm = LocateVm(instance);
    if (!vm) {
        return false;
    }
    if (runner_->IsRunning(vm->pid)) {
        std::lock_guard<std::mutex> lock(vms_mutex_);
        if (vms_.emplace(instance.id, *vm).second) {
            spdlog::info("Re-attached microVM {} (pid {})", vm->addressing.vm_id, vm->pid);
        }
        return true;
    }

    spdlog::warn("Firecracker process {} for {} is gone", vm->pid, instance.id);
    {
        std::lock_guard<std::mutex> lock(vms_mutex_);
        vms_.erase(instance.id);
    }
    Teardown(*vm);
    return false;
}

// ============================================================================
// QUERIES
// ============================================================================

std::string MicroVmProvider::GetLogs(const core::ChallengeInstance& instance, int tail_lines) {
    auto vm = LocateVm(instance);
    if (!vm) {
        return "";
    }

    for (const char* name : {"serial.log", "firecracker.log"}) {
        const fs::path log_path = vm->jail_root / "logs" / name;
        std::ifstream file(log_path);
        if (!file) {
            continue;
        }
        std::stringstream buffer;
        buffer << file.rdbuf();
        if (!buffer.str().empty()) {
            return StringUtils::TailLines(buffer.str(), tail_lines);
        }
    }
    return "";
}

ExecResult MicroVmProvider::ExecCommand(const core::ChallengeInstance&, const std::vector<std::string>&) {
    ExecResult exec;
    exec.error = "Command execution is not supported for microVMs";
    return exec;
}

json MicroVmProvider::GetStats(const core::ChallengeInstance& instance) {
    auto vm = LocateVm(instance);
    if (!vm) {
        return json::object();
    }

    try {
        auto response = utils::NetUtils::UnixSocketRequest(
            vm->api_socket.string(), "GET", "/machine-config", "",
            std::chrono::duration_cast<std::chrono::milliseconds>(config_.api_socket_timeout));
        if (response.status_code != 200) {
            return json::object();
        }
        auto machine = json::parse(response.body);
        return json{
            {"vcpus", machine.value("vcpu_count", 0)},
            {"memory_mb", machine.value("mem_size_mib", 0)},
            {"pid", vm->pid},
            {"guest_ip", vm->addressing.guest_ip},
        };
    } catch (const std::exception& e) {
        spdlog::error("Failed to get VM stats for {}: {}", instance.id, e.what());
        return json::object();
    }
}

} // namespace providers
} // namespace cerberus
