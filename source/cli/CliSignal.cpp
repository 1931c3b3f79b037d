#include "CliSignal.h"

#include <QDebug>

#ifdef Q_OS_WIN
#include <windows.h>
#endif

namespace Cli {

namespace {

std::atomic<bool> g_interrupted(false);

#ifdef Q_OS_WIN

BOOL WINAPI onConsoleInterrupt(DWORD ctrlType)
{
    if (ctrlType == CTRL_C_EVENT || ctrlType == CTRL_BREAK_EVENT) {
        g_interrupted.store(true);
        return TRUE;
    }
    return FALSE;
}

#else

// Only the atomic store is async-signal-safe here
void onInterrupt(int)
{
    g_interrupted.store(true);
}

#endif

} // namespace

InterruptScope::InterruptScope()
{
    g_interrupted.store(false);

#ifdef Q_OS_WIN
    if (!SetConsoleCtrlHandler(onConsoleInterrupt, TRUE)) {
        qWarning() << "InterruptScope: console handler not installed, error" << GetLastError();
    }
#else
    struct sigaction action;
    action.sa_handler = onInterrupt;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;

    if (sigaction(SIGINT, &action, &m_previousInt) != 0
        || sigaction(SIGTERM, &action, &m_previousTerm) != 0) {
        qWarning() << "InterruptScope: could not install SIGINT/SIGTERM handlers";
    }
#endif
}

InterruptScope::~InterruptScope()
{
#ifdef Q_OS_WIN
    SetConsoleCtrlHandler(onConsoleInterrupt, FALSE);
#else
    sigaction(SIGINT, &m_previousInt, nullptr);
    sigaction(SIGTERM, &m_previousTerm, nullptr);
#endif
}

const std::atomic<bool>* InterruptScope::abortToken() const
{
    return &g_interrupted;
}

bool InterruptScope::interrupted() const
{
    return g_interrupted.load();
}

} // namespace Cli
