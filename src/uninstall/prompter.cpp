#include "lode/prompter.hpp"

#include <istream>
#include <ostream>

namespace lode {

bool is_affirmative(const std::string& answer) {
    size_t pos = answer.find_first_not_of(" \t");
    if (pos == std::string::npos) return false;
    return answer[pos] == 'y' || answer[pos] == 'Y';
}

bool Prompter::confirm(const std::string& question) {
    return is_affirmative(ask(question));
}

void ConsolePrompter::say(const std::string& message) {
    out_ << message << std::endl;
}

std::string ConsolePrompter::ask(const std::string& question) {
    out_ << question << std::flush;
    std::string line;
    if (!std::getline(in_, line)) {
        out_ << std::endl;
        return "";
    }
    if (!line.empty() && line.back() == '\r') line.pop_back();
    return line;
}

void AssumeYesPrompter::say(const std::string& message) {
    out_ << message << std::endl;
}

std::string AssumeYesPrompter::ask(const std::string& question) {
    out_ << question << selection_ << std::endl;
    return selection_;
}

bool AssumeYesPrompter::confirm(const std::string& question) {
    out_ << question << " y" << std::endl;
    return true;
}

} // namespace lode
