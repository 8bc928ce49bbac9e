// Ctrl-C handling of the command line tool.
#include <csignal>
#include <string>

#include "deduppipeline.h"
#include "interrupthandler.h"
#include "test_helpers.hpp"

namespace {

bool check(bool cond, const std::string &msg) {
    return test_helpers::check("interrupt_unit", cond, msg);
}

// Current SIGINT disposition; leaves SIG_DFL installed afterwards
bool default_action_installed() {
    auto previous = std::signal(SIGINT, SIG_IGN);
    std::signal(SIGINT, SIG_DFL);
    return previous == SIG_DFL;
}

bool test_first_interrupt_cancels() {
    DedupPipeline pipeline{AppConfig()};
    InterruptHandler::install(&pipeline);
    bool ok = check(!default_action_installed(), "install replaces the default action");

    // The check above put SIG_DFL back
    InterruptHandler::install(&pipeline);
    ok &= check(!pipeline.isCancelRequested(), "precondition: pipeline not cancelled");
    std::raise(SIGINT);
    ok &= check(pipeline.isCancelRequested(), "interrupt requests cancellation");
    ok &= check(default_action_installed(), "second interrupt would terminate the process");

    InterruptHandler::uninstall();
    return ok;
}

bool test_uninstall() {
    DedupPipeline pipeline{AppConfig()};
    InterruptHandler::install(&pipeline);
    InterruptHandler::uninstall();
    bool ok = check(default_action_installed(), "uninstall restores the default action");
    ok &= check(!pipeline.isCancelRequested(), "uninstall does not cancel");
    return ok;
}

}  // namespace

int main() {
    bool ok = true;
    ok &= test_first_interrupt_cancels();
    ok &= test_uninstall();
    return ok ? 0 : 1;
}
