#include "lib/partitioner.hpp"
#include "lib/dev_handler.hpp"
#include "lib/errors.hpp"
#include "utils/logs.hpp"
#include <cstdio>
#include <regex>

namespace Partitioner {

    namespace {
        const std::regex SIZE_EXPRESSION(R"(^\+?([0-9]+)([KMGTkmgt](iB)?)?$)");

        std::string hexCode(PartitionType type) {
            char buffer[3];
            std::snprintf(buffer, sizeof(buffer), "%02x", static_cast<unsigned>(type));
            return buffer;
        }

        std::string seconds(std::chrono::milliseconds duration) {
            char buffer[32];
            std::snprintf(buffer, sizeof(buffer), "%.1fs", duration.count() / 1000.0);
            return buffer;
        }
    }

    bool isValidSizeExpression(const std::string& expression) {
        std::smatch match;
        if (!std::regex_match(expression, match, SIZE_EXPRESSION)) {
            return false;
        }

        return match[1].str().find_first_not_of('0') != std::string::npos;
    }

    PartitionPlan makePlan(const std::string& sizeExpression) {
        if (!isValidSizeExpression(sizeExpression)) {
            throw BootCardException(ErrorKind::InvalidArgument,
                                    "Invalid partition size '" + sizeExpression +
                                    "' (expected e.g. +64M, +1G or a sector count)");
        }

        PartitionPlan plan;
        plan.sizeExpression = sizeExpression;
        return plan;
    }

    std::string buildSfdiskScript(const PartitionPlan& plan) {
        std::string script = "label: dos\n";
        script += "start=" + std::to_string(plan.startSector);
        script += ", size=" + plan.sizeExpression;
        script += ", type=" + hexCode(plan.type);
        if (plan.bootable) {
            script += ", bootable";
        }
        script += "\n";
        return script;
    }

    void writePartitionTable(Platform::System& system, const std::string& device,
                             const PartitionPlan& plan) {
        Logs::info("Creating new partition table and partition (" + plan.sizeExpression + ")...");

        auto result = system.run({"sfdisk", "--wipe", "always", device}, buildSfdiskScript(plan));
        if (!result.succeeded()) {
            Logs::error("sfdisk output: " + result.output);
            throw PartitionError(ErrorKind::PartitioningFailed, device,
                                 "sfdisk exited with status " + std::to_string(result.exitStatus));
        }
    }

    std::string waitForPartition(Platform::System& system, const std::string& device,
                                 const SettleTiming& timing) {
        std::string partition = DeviceHandler::partitionPath(device, 1);

        Logs::info("Waiting for " + partition + " to be recognized...");

        if (!system.rereadPartitionTable(device)) {
            Logs::debug("Partition table re-read request on " + device + " failed, polling anyway");
        }

        std::chrono::milliseconds waited{0};
        std::chrono::milliseconds sinceReread{0};

        while (!system.isBlockDevice(partition)) {
            if (waited >= timing.timeout) {
                throw PartitionError(ErrorKind::PartitionNotReady, device,
                                     partition + " did not appear within " + seconds(timing.timeout));
            }

            system.sleepFor(timing.pollInterval);
            waited += timing.pollInterval;
            sinceReread += timing.pollInterval;

            if (sinceReread >= timing.rereadInterval) {
                system.rereadPartitionTable(device);
                sinceReread = std::chrono::milliseconds{0};
            }
        }

        Logs::debug(partition + " ready after " + seconds(waited));
        return partition;
    }

    void markBootable(Platform::System& system, const std::string& device) {
        Logs::info("Marking partition as bootable...");

        auto result = system.run({"parted", "-s", device, "set", "1", "boot", "on"});
        if (!result.succeeded()) {
            Logs::error("parted output: " + result.output);
            throw PartitionError(ErrorKind::PartitioningFailed, device,
                                 "cannot set boot flag on partition 1");
        }
    }

    std::string partitionDevice(Platform::System& system, const std::string& device,
                                const PartitionPlan& plan, const SettleTiming& timing) {
        Logs::info("Preparing SD card: " + device);

        DeviceHandler::unmountDevice(system, device);
        DeviceHandler::wipeDevice(system, device);

        writePartitionTable(system, device, plan);
        std::string partition = waitForPartition(system, device, timing);
        markBootable(system, device);

        Logs::success("Partition created: " + partition);
        return partition;
    }
}
