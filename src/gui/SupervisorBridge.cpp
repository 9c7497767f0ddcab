#include "SupervisorBridge.hpp"
#include "utils/Util.hpp"

namespace pyrunner {

SupervisorBridge::SupervisorBridge(ProcessSupervisor::Options options, QObject* parent)
    : QObject(parent), supervisor(options) {}

SupervisorBridge::~SupervisorBridge() {
    // While this object is still whole; the worker emits until it is joined
    supervisor.requestStop();
    supervisor.wait();
}

void SupervisorBridge::start(ExecutionSession session) {
    supervisor.start(std::move(session), *this);
}

void SupervisorBridge::stop() {
    supervisor.requestStop();
}

void SupervisorBridge::onOutput(const OutputEvent& event) {
    emit outputLine(QString::fromStdString(event.line));
}

void SupervisorBridge::onFinished(const RunOutcome& outcome) {
    std::visit(overloaded{
        [this](const Completed& c) { emit completed(c.exitCode, c.elapsedSeconds); },
        [this](const TimedOut& t) { emit timedOut(t.elapsedSeconds); },
        [this](const Stopped& s) { emit stopped(s.elapsedSeconds); },
        [this](const SupervisorError& e) { emit failed(QString::fromStdString(e.message)); },
    }, outcome);
}

} // namespace pyrunner
