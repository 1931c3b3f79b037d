#ifndef CLISIGNAL_H
#define CLISIGNAL_H

/**
 * @file CliSignal.h
 * @brief Interrupt handling around a headless export.
 *
 * Outside an export, Ctrl+C and SIGTERM keep their default meaning and end
 * the process. While an InterruptScope is alive they only raise the scope's
 * abort token, which Compositor::exportPattern() polls between tile columns.
 */

#include <QtGlobal>

#include <atomic>

#ifndef Q_OS_WIN
#include <csignal>
#endif

namespace Cli {

/**
 * @brief RAII guard that turns an interrupt into an export abort.
 *
 * The constructor clears the token and installs the handlers; the destructor
 * puts the previous handlers back. One scope at a time.
 */
class InterruptScope {
public:
    InterruptScope();
    ~InterruptScope();

    InterruptScope(const InterruptScope&) = delete;
    InterruptScope& operator=(const InterruptScope&) = delete;

    /// Abort token for Compositor::exportPattern(). Never null.
    const std::atomic<bool>* abortToken() const;

    /// True once an interrupt arrived inside this scope.
    bool interrupted() const;

private:
#ifndef Q_OS_WIN
    struct sigaction m_previousInt {};
    struct sigaction m_previousTerm {};
#endif
};

} // namespace Cli

#endif // CLISIGNAL_H
