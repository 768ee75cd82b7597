#ifndef PAUSEGATE_HPP
#define PAUSEGATE_HPP

#include <iostream>
#include <string>
#include "diskspacemonitor.hpp"

enum class PauseDecision {
    Continue,   // re-measure free space and resume
    Force,      // ignore further shortfall warnings for the rest of the run
    Abort       // flush progress and end the run early
};

std::string pauseDecisionName(PauseDecision decision);

/**
 * @brief Human decision point consulted when a disk shortfall is predicted
 * Calls block the conversion thread until a decision is available.
 */
class PauseDecisionProvider {
public:
    virtual ~PauseDecisionProvider() = default;
    virtual PauseDecision decide(const Shortfall& shortfall) = 0;
};

/**
 * @brief Yes/no gate in front of actions the user has to approve
 */
class ConfirmationProvider {
public:
    virtual ~ConfirmationProvider() = default;
    virtual bool confirm(const std::string& prompt) = 0;
};

// Reads the decision from a terminal; end of input counts as Abort
class TerminalPauseDecisionProvider : public PauseDecisionProvider {
public:
    explicit TerminalPauseDecisionProvider(std::istream& in = std::cin, std::ostream& out = std::cout);
    PauseDecision decide(const Shortfall& shortfall) override;

private:
    std::istream& in;
    std::ostream& out;
};

// Confirms only when the typed answer equals expectedAnswer (case-insensitive)
class TerminalConfirmationProvider : public ConfirmationProvider {
public:
    explicit TerminalConfirmationProvider(const std::string& expectedAnswer,
                                          std::istream& in = std::cin, std::ostream& out = std::cout);
    bool confirm(const std::string& prompt) override;

private:
    std::string expectedAnswer;
    std::istream& in;
    std::ostream& out;
};

#endif // PAUSEGATE_HPP
