#include "CliSignal.h"

#include <QtGlobal>

#ifdef Q_OS_WIN
#include <windows.h>
#include <cstdio>
#else
#include <csignal>
#include <unistd.h>
#endif

/**
 * @file CliSignal.cpp
 * @brief Implementation of Ctrl+C handling.
 *
 * @see CliSignal.h for API documentation
 */

namespace Cli {

static std::atomic<bool> g_cancelled(false);

static const char CANCEL_MESSAGE[] =
    "\nCancelling. The current output is finished before stopping...\n";

#ifdef Q_OS_WIN

static BOOL WINAPI consoleCtrlHandler(DWORD ctrlType)
{
    if (ctrlType != CTRL_C_EVENT && ctrlType != CTRL_BREAK_EVENT) {
        // Close, logoff and shutdown keep the default termination
        return FALSE;
    }

    if (!g_cancelled.exchange(true)) {
        std::fputs(CANCEL_MESSAGE, stderr);
        std::fflush(stderr);
    }
    return TRUE;
}

void installSignalHandlers()
{
    SetConsoleCtrlHandler(consoleCtrlHandler, TRUE);
}

#else

// Async-signal-safe: atomic store and write(2) only
static void cancelHandler(int)
{
    if (!g_cancelled.exchange(true)) {
        ssize_t ignored = ::write(STDERR_FILENO, CANCEL_MESSAGE, sizeof(CANCEL_MESSAGE) - 1);
        (void)ignored;
    }
}

void installSignalHandlers()
{
    struct sigaction sa;
    sa.sa_handler = cancelHandler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;

    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
}

#endif

std::atomic<bool>* getCancellationFlag()
{
    return &g_cancelled;
}

void requestCancellation()
{
    g_cancelled = true;
}

bool wasCancelled()
{
    return g_cancelled.load();
}

void resetCancellation()
{
    g_cancelled = false;
}

} // namespace Cli
