#include "lib/session.hpp"
#include "lib/dev_handler.hpp"
#include "lib/fs_provisioner.hpp"
#include "lib/payload.hpp"
#include "lib/preconditions.hpp"
#include "utils/logs.hpp"

namespace Session {

    std::string stateName(State state) {
        switch (state) {
            case State::START: return "START";
            case State::PRECONDITIONS_CHECKED: return "PRECONDITIONS_CHECKED";
            case State::DEVICE_VALIDATED: return "DEVICE_VALIDATED";
            case State::USER_CONFIRMED: return "USER_CONFIRMED";
            case State::PARTITIONED: return "PARTITIONED";
            case State::PROVISIONED: return "PROVISIONED";
            case State::PAYLOAD_INSTALLED: return "PAYLOAD_INSTALLED";
            case State::CLEANED_UP: return "CLEANED_UP";
            case State::DONE: return "DONE";
            case State::FAILED: return "FAILED";
        }
        return "UNKNOWN";
    }

    SessionConfig::SessionConfig()
        : imagesDir(Board::DEFAULT_IMAGES_DIR),
          board(Board::beagleBoneBlack()),
          requiredTools(Preconditions::REQUIRED_TOOLS) {
    }

    SessionController::SessionController(Platform::System& sys, Prompt::Prompter& prompt,
                                         const SessionConfig& cfg)
        : system(sys), prompter(prompt), config(cfg), wasCancelled(false) {
        if (config.sizeExpression.empty()) {
            config.sizeExpression = config.board.defaultSize;
        }
    }

    int SessionController::run() {
        states.clear();
        failureKind.reset();
        wasCancelled = false;

        transition(State::START);

        try {
            Partitioner::PartitionPlan plan = Partitioner::makePlan(config.sizeExpression);
            auto artifacts = Board::resolveArtifacts(config.board, config.imagesDir);

            Logs::info("Validating build environment...");
            Preconditions::checkArtifacts(system, artifacts);
            Preconditions::checkTools(system, config.requiredTools);
            Logs::info("Environment validation passed");
            transition(State::PRECONDITIONS_CHECKED);

            DeviceHandler::TargetDevice target = DeviceHandler::inspectDevice(system, config.device);
            if (target.sensitive && !confirmSensitiveDevice(target.path)) {
                return cancel();
            }
            Logs::info("Device validation passed");
            transition(State::DEVICE_VALIDATED);

            if (!confirmDestruction(target.path)) {
                return cancel();
            }
            transition(State::USER_CONFIRMED);

            std::string partition = Partitioner::partitionDevice(system, target.path, plan, config.timing);
            transition(State::PARTITIONED);

            FilesystemProvisioner::formatPartition(system, partition);
            FilesystemProvisioner::labelPartition(system, partition, config.board.volumeLabel);

            {
                auto mount = FilesystemProvisioner::mountPartition(system, partition);
                transition(State::PROVISIONED);

                Payload::installPayload(system, mount->path(), artifacts);
                transition(State::PAYLOAD_INSTALLED);
            }
            transition(State::CLEANED_UP);

            Logs::success("SD card preparation complete!");
            Logs::info("Success! Insert the SD card into " + config.board.displayName + " and boot.");
            Logs::info("The board should boot with " + config.board.bootloader + " bootloader.");
            transition(State::DONE);
            return 0;

        } catch (const BootCardException& e) {
            failureKind = e.kind();
            return fail(ErrorHandler::kindName(e.kind()) + ": " + e.what());
        } catch (const std::exception& e) {
            return fail("Unexpected error: " + std::string(e.what()));
        }
    }

    State SessionController::state() const {
        return states.empty() ? State::START : states.back();
    }

    void SessionController::transition(State next) {
        Logs::debug("Session state: " + stateName(next));
        states.push_back(next);
    }

    int SessionController::cancel() {
        Logs::info("Operation cancelled by user");
        wasCancelled = true;
        transition(State::DONE);
        return 0;
    }

    int SessionController::fail(const std::string& message) {
        // The mount session, if any, was released while unwinding.
        transition(State::CLEANED_UP);
        Logs::fatal(message);
        transition(State::FAILED);
        return 1;
    }

    bool SessionController::confirmSensitiveDevice(const std::string& device) {
        Logs::warning("WARNING: " + device + " might be your system drive!");
        return prompter.confirm("Are you sure you want to continue?");
    }

    bool SessionController::confirmDestruction(const std::string& device) {
        Logs::warning("This will DESTROY all data on " + device + "!");
        return prompter.confirm("Continue?");
    }
}
