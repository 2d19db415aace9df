#ifndef SESSION_HPP
#define SESSION_HPP

#include "lib/board_profile.hpp"
#include "lib/errors.hpp"
#include "lib/partitioner.hpp"
#include "lib/platform.hpp"
#include "lib/prompt.hpp"
#include <optional>
#include <string>
#include <vector>

namespace Session {

    enum class State {
        START,
        PRECONDITIONS_CHECKED,
        DEVICE_VALIDATED,
        USER_CONFIRMED,
        PARTITIONED,
        PROVISIONED,
        PAYLOAD_INSTALLED,
        CLEANED_UP,
        DONE,
        FAILED
    };

    std::string stateName(State state);

    struct SessionConfig {
        std::string device;
        // Empty selects the board's default size.
        std::string sizeExpression;
        std::string imagesDir;
        Board::BoardProfile board;
        std::vector<std::string> requiredTools;
        Partitioner::SettleTiming timing;

        SessionConfig();
    };

    class SessionController {
    private:
        Platform::System& system;
        Prompt::Prompter& prompter;
        SessionConfig config;
        std::vector<State> states;
        std::optional<ErrorKind> failureKind;
        bool wasCancelled;

    public:
        SessionController(Platform::System& sys, Prompt::Prompter& prompt, const SessionConfig& cfg);

        // Runs the whole workflow once. Returns the process exit status:
        // 0 on success or operator cancellation, 1 on any failure.
        int run();

        State state() const;
        const std::vector<State>& history() const { return states; }
        bool cancelled() const { return wasCancelled; }
        std::optional<ErrorKind> failure() const { return failureKind; }

    private:
        void transition(State next);
        int cancel();
        int fail(const std::string& message);
        bool confirmSensitiveDevice(const std::string& device);
        bool confirmDestruction(const std::string& device);
    };
}

#endif // SESSION_HPP
