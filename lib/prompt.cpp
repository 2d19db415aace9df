#include "lib/prompt.hpp"
#include "utils/colors.hpp"

namespace Prompt {

    const std::string AFFIRMATIVE = "yes";

    ConsolePrompter::ConsolePrompter(std::istream& in, std::ostream& out)
        : input(in), output(out) {}

    bool ConsolePrompter::confirm(const std::string& question) {
        output << Colors::bold(question + " (yes/no): ");
        output.flush();

        std::string answer;
        if (!std::getline(input, answer)) {
            output << std::endl;
            return false;
        }

        if (!answer.empty() && answer.back() == '\r') {
            answer.pop_back();
        }

        return answer == AFFIRMATIVE;
    }
}
