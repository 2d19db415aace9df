#ifndef PARTITIONER_HPP
#define PARTITIONER_HPP

#include "lib/platform.hpp"
#include <chrono>
#include <cstdint>
#include <string>

namespace Partitioner {

    enum class PartitionType : uint8_t {
        // The historical fdisk dialog typed `e` at the type prompt, which
        // fdisk reads as hex 0x0E (W95 FAT16 LBA). Boot ROMs accept it.
        // Not an extended partition (0x05) despite the keystroke: an
        // extended entry is a container and cannot hold the FAT32 payload.
        LEGACY_BOOT = 0x0E
    };

    struct SettleTiming {
        std::chrono::milliseconds pollInterval{250};
        std::chrono::milliseconds rereadInterval{1000};
        std::chrono::milliseconds timeout{10000};
    };

    struct PartitionPlan {
        std::string sizeExpression;
        uint64_t startSector = 2048;
        PartitionType type = PartitionType::LEGACY_BOOT;
        bool bootable = true;
    };

    // [+]<digits>[K|M|G|T][iB], any unit case, non-zero. A bare number
    // counts sectors. sfdisk reads all of these as binary multiples.
    bool isValidSizeExpression(const std::string& expression);

    // Throws BootCardException (InvalidArgument) on a malformed size.
    PartitionPlan makePlan(const std::string& sizeExpression);

    std::string buildSfdiskScript(const PartitionPlan& plan);

    void writePartitionTable(Platform::System& system, const std::string& device,
                             const PartitionPlan& plan);
    std::string waitForPartition(Platform::System& system, const std::string& device,
                                 const SettleTiming& timing);
    void markBootable(Platform::System& system, const std::string& device);

    // Unmount, wipe, write the table, wait for the kernel, set the boot flag.
    // Returns the path of the new first partition.
    std::string partitionDevice(Platform::System& system, const std::string& device,
                                const PartitionPlan& plan, const SettleTiming& timing);
}

#endif // PARTITIONER_HPP
