#pragma once

#include <QObject>
#include <QString>

#include "core/process/ProcessSupervisor.hpp"
#include "core/process/RunEvents.hpp"

namespace pyrunner {

/**
 * Forwards supervisor events as Qt signals.
 *
 * The supervisor calls the RunListener methods on its worker thread. The
 * bridge lives on the GUI thread, so connections made with the default
 * connection type are delivered queued, in emission order.
 */
class SupervisorBridge : public QObject, public RunListener {
    Q_OBJECT

public:
    explicit SupervisorBridge(ProcessSupervisor::Options options, QObject* parent = nullptr);
    ~SupervisorBridge() override;

    // Throws std::logic_error while a run is active
    void start(ExecutionSession session);
    void stop();
    bool isRunning() const { return supervisor.isRunning(); }

    void onOutput(const OutputEvent& event) override;
    void onFinished(const RunOutcome& outcome) override;

signals:
    void outputLine(const QString& line);
    void completed(int exitCode, double elapsedSeconds);
    void timedOut(double elapsedSeconds);
    void stopped(double elapsedSeconds);
    void failed(const QString& message);

private:
    ProcessSupervisor supervisor;
};

} // namespace pyrunner
