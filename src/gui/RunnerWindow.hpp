#pragma once

#include "qt.hpp"
#include <QElapsedTimer>
#include <memory>

#include "core/process/ExecutionSession.hpp"
#include "core/util/SignalWatcher.hpp"
#include "SupervisorBridge.hpp"

namespace pyrunner {

class Configs;

class RunnerWindow : public QMainWindow {
    Q_OBJECT

public:
    explicit RunnerWindow(const Configs& config, QWidget* parent = nullptr);
    ~RunnerWindow() override;

    bool isRunning() const { return bridge->isRunning(); }

    // The request the form currently describes
    SessionRequest currentRequest() const;

    // Watches SIGINT/SIGTERM and quits through the normal path
    void setupSignalHandling();

public slots:
    void runScript();
    void stopScript();
    void clearOutput();
    void showWindow();
    // Asks for confirmation while a script is running
    void quitApplication();

protected:
    void closeEvent(QCloseEvent* event) override;

private slots:
    void selectInterpreter();
    void selectScript();
    void addDependencyPath();
    void addPackagePath();
    void removeDependency();
    void clearDependencies();

    void appendOutput(const QString& text);
    void onCompleted(int exitCode, double elapsedSeconds);
    void onTimedOut(double elapsedSeconds);
    void onStopped(double elapsedSeconds);
    void onFailed(const QString& message);
    void updateElapsed();
    void onTrayActivated(QSystemTrayIcon::ActivationReason reason);
    void onSignalCheck();

private:
    void setupUI();
    void setupTrayIcon();
    QWidget* createSettingsGroup();
    QWidget* createDependencyGroup();
    QWidget* createOutputGroup();
    void addDependency(const QString& kind, const QString& dir);
    void setRunning(bool running);
    void finishRun(const QString& status, double elapsedSeconds);
    void appendNotice(const QString& text, const QString& color = QString());

    const Configs& config;
    SupervisorBridge* bridge;

    QLineEdit* interpreterEdit;
    QLineEdit* environmentEdit;
    QCheckBox* utf8Check;
    QLineEdit* scriptEdit;
    QListWidget* dependencyList;
    QSpinBox* timeoutSpin;
    QPushButton* runButton;
    QPushButton* stopButton;
    QPlainTextEdit* outputView;
    QLabel* statusLabel;
    QLabel* timeLabel;

    QTimer* elapsedTimer;
    QElapsedTimer runClock;

    std::unique_ptr<QSystemTrayIcon> trayIcon;
    std::unique_ptr<QMenu> trayMenu;

    std::unique_ptr<util::SignalWatcher> signalWatcher;
    QTimer* signalTimer = nullptr;
    bool quitting = false;

    static constexpr int ELAPSED_INTERVAL_MS = 100;
    static constexpr int SIGNAL_CHECK_INTERVAL_MS = 200;
};

} // namespace pyrunner
