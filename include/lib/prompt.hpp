#ifndef PROMPT_HPP
#define PROMPT_HPP

#include <istream>
#include <ostream>
#include <string>

namespace Prompt {

    extern const std::string AFFIRMATIVE;

    class Prompter {
    public:
        virtual ~Prompter() = default;

        // True only when the operator answers exactly "yes".
        virtual bool confirm(const std::string& question) = 0;
    };

    class ConsolePrompter : public Prompter {
    private:
        std::istream& input;
        std::ostream& output;

    public:
        ConsolePrompter(std::istream& in, std::ostream& out);
        bool confirm(const std::string& question) override;
    };
}

#endif // PROMPT_HPP
