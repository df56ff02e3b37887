#pragma once

#include <iosfwd>
#include <string>
#include <utility>

namespace lode {

// ============================================================================
// Interactive Prompts
// ============================================================================

class Prompter {
public:
    virtual ~Prompter() = default;

    // Show a line of output
    virtual void say(const std::string& message) = 0;

    // Show `question` and read one line of input (without the newline).
    // End of input yields an empty answer.
    virtual std::string ask(const std::string& question) = 0;

    // Ask and treat answers starting with 'y' or 'Y' as yes
    virtual bool confirm(const std::string& question);
};

// True for answers starting with 'y' or 'Y'
bool is_affirmative(const std::string& answer);

// Prompts on a pair of streams (std::cin / std::cout in the CLI)
class ConsolePrompter : public Prompter {
public:
    ConsolePrompter(std::istream& in, std::ostream& out) : in_(in), out_(out) {}

    void say(const std::string& message) override;
    std::string ask(const std::string& question) override;

private:
    std::istream& in_;
    std::ostream& out_;
};

// Answers every question affirmatively; `ask` returns `selection`
class AssumeYesPrompter : public Prompter {
public:
    AssumeYesPrompter(std::ostream& out, std::string selection)
        : out_(out), selection_(std::move(selection)) {}

    void say(const std::string& message) override;
    std::string ask(const std::string& question) override;
    bool confirm(const std::string& question) override;

private:
    std::ostream& out_;
    std::string selection_;
};

} // namespace lode
