#pragma once

#include "app/Command.hpp"
#include "app/SelectionPolicy.hpp"
#include "domain/LinkConfigurator.hpp"
#include "domain/Report.hpp"

#include <iostream>
#include <memory>

struct MacServiceOptions {
    bool json = false;  // suppress human output, the caller prints the Report
};

class MacService {
public:
    MacService(SelectionPolicy policy,
               std::shared_ptr<LinkConfigurator> link,
               MacServiceOptions opt = {},
               std::ostream& out = std::cout,
               std::ostream& err = std::cerr)
        : policy_(std::move(policy)), link_(std::move(link)), opt_(opt), out_(out), err_(err) {}

    // Calls LinkConfigurator::applyMac at most once; advisories are printed
    // as they are raised, so they show even if resolution throws. Propagates
    // std::system_error and FatalInvariantViolation.
    Report run(const Command& cmd);

private:
    SelectionPolicy policy_;
    std::shared_ptr<LinkConfigurator> link_;
    MacServiceOptions opt_;
    std::ostream& out_;
    std::ostream& err_;
};
