#ifndef INTERRUPTHANDLER_H
#define INTERRUPTHANDLER_H

class DedupPipeline;

/**
 * @brief Routes Ctrl-C (SIGINT) to DedupPipeline::requestCancel()
 *
 * The first interrupt asks the pipeline to stop and restores the default
 * action, so a second interrupt terminates the process.
 */
class InterruptHandler
{
public:
    static void install(DedupPipeline* pipeline);
    static void uninstall();

private:
    static void handleInterrupt(int signalNumber);
};

#endif // INTERRUPTHANDLER_H
