#include "interrupthandler.h"
#include "deduppipeline.h"
#include <atomic>
#include <csignal>

namespace {

// Read from the signal handler, so it must be a lock-free atomic
std::atomic<DedupPipeline*> g_pipeline(nullptr);

} // namespace

void InterruptHandler::install(DedupPipeline* pipeline)
{
    g_pipeline.store(pipeline);
    std::signal(SIGINT, &InterruptHandler::handleInterrupt);
}

void InterruptHandler::uninstall()
{
    std::signal(SIGINT, SIG_DFL);
    g_pipeline.store(nullptr);
}

void InterruptHandler::handleInterrupt(int)
{
    // Only atomic stores happen below
    DedupPipeline* pipeline = g_pipeline.load();
    if (pipeline) {
        pipeline->requestCancel();
    }
    std::signal(SIGINT, SIG_DFL);
}
