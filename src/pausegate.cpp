#include "pausegate.hpp"
#include <algorithm>
#include <cctype>
#include <iomanip>

namespace {

std::string normalizeAnswer(std::string answer) {
    auto notSpace = [](unsigned char c) { return !std::isspace(c); };
    answer.erase(answer.begin(), std::find_if(answer.begin(), answer.end(), notSpace));
    answer.erase(std::find_if(answer.rbegin(), answer.rend(), notSpace).base(), answer.end());
    std::transform(answer.begin(), answer.end(), answer.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return answer;
}

} // namespace

std::string pauseDecisionName(PauseDecision decision) {
    switch (decision) {
        case PauseDecision::Continue: return "continue";
        case PauseDecision::Force: return "force";
        case PauseDecision::Abort: return "abort";
    }
    return "unknown";
}

TerminalPauseDecisionProvider::TerminalPauseDecisionProvider(std::istream& in, std::ostream& out)
    : in(in), out(out) {}

PauseDecision TerminalPauseDecisionProvider::decide(const Shortfall& shortfall) {
    out << std::fixed << std::setprecision(1)
        << "\nConversion PAUSED due to predicted disk space shortage.\n"
        << "You need approximately " << shortfall.estimatedNeedMb << "MB for the remaining "
        << shortfall.remainingFiles << " files but only " << shortfall.freeMb << "MB is available.\n"
        << "Options:\n"
        << "1. Free up disk space and press Enter to continue\n"
        << "2. Type 'force' to continue anyway (may fail)\n"
        << "3. Type 'exit' to stop and save progress\n"
        << "Your choice: " << std::flush;
    out.unsetf(std::ios::floatfield);

    std::string line;
    if (!std::getline(in, line)) {
        out << "\nNo input available, saving progress and exiting..." << std::endl;
        return PauseDecision::Abort;
    }

    std::string answer = normalizeAnswer(line);
    if (answer == "exit") {
        out << "Saving progress and exiting..." << std::endl;
        return PauseDecision::Abort;
    }
    if (answer == "force") {
        out << "Continuing conversion despite space warning..." << std::endl;
        return PauseDecision::Force;
    }
    out << "Resuming conversion..." << std::endl;
    return PauseDecision::Continue;
}

TerminalConfirmationProvider::TerminalConfirmationProvider(const std::string& expectedAnswer,
                                                           std::istream& in, std::ostream& out)
    : expectedAnswer(normalizeAnswer(expectedAnswer)), in(in), out(out) {}

bool TerminalConfirmationProvider::confirm(const std::string& prompt) {
    out << prompt << " " << std::flush;
    std::string line;
    if (!std::getline(in, line)) {
        out << std::endl;
        return false;
    }
    return normalizeAnswer(line) == expectedAnswer;
}
