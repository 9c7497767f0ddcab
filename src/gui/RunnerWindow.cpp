#include "RunnerWindow.hpp"
#include <QStyle>
#include <QTextCursor>
#include <optional>
#include <spdlog/spdlog.h>

#include "core/ConfigManager.hpp"

namespace pyrunner {

namespace {

QString seconds(double value, int precision = 2) {
    return QString::number(value, 'f', precision);
}

} // namespace

RunnerWindow::RunnerWindow(const Configs& config, QWidget* parent)
    : QMainWindow(parent), config(config) {
    bridge = new SupervisorBridge(ProcessSupervisor::optionsFrom(config), this);
    setupUI();

    connect(bridge, &SupervisorBridge::outputLine, this, &RunnerWindow::appendOutput);
    connect(bridge, &SupervisorBridge::completed, this, &RunnerWindow::onCompleted);
    connect(bridge, &SupervisorBridge::timedOut, this, &RunnerWindow::onTimedOut);
    connect(bridge, &SupervisorBridge::stopped, this, &RunnerWindow::onStopped);
    connect(bridge, &SupervisorBridge::failed, this, &RunnerWindow::onFailed);

    elapsedTimer = new QTimer(this);
    elapsedTimer->setInterval(ELAPSED_INTERVAL_MS);
    connect(elapsedTimer, &QTimer::timeout, this, &RunnerWindow::updateElapsed);

    setupTrayIcon();
}

RunnerWindow::~RunnerWindow() {
    signalWatcher.reset();
    // Joins the worker while the window can still receive its signals
    delete bridge;
    bridge = nullptr;
}

void RunnerWindow::setupUI() {
    setWindowTitle("Python Script Runner");
    resize(900, 700);

    auto* central = new QWidget(this);
    auto* mainLayout = new QVBoxLayout(central);
    setCentralWidget(central);

    mainLayout->addWidget(createSettingsGroup());
    mainLayout->addWidget(createDependencyGroup());

    // Run controls
    auto* controlLayout = new QHBoxLayout();
    controlLayout->addWidget(new QLabel("Timeout:"));
    timeoutSpin = new QSpinBox();
    timeoutSpin->setObjectName("timeoutSpin");
    timeoutSpin->setRange(0, Configs::MAX_TIMEOUT_SECONDS);
    timeoutSpin->setSuffix(" s");
    timeoutSpin->setSpecialValueText("Unlimited");
    timeoutSpin->setValue(config.GetTimeoutSeconds());
    controlLayout->addWidget(timeoutSpin);
    controlLayout->addStretch();

    runButton = new QPushButton(QIcon::fromTheme("media-playback-start"), "Run");
    runButton->setObjectName("runButton");
    stopButton = new QPushButton(QIcon::fromTheme("media-playback-stop"), "Stop");
    stopButton->setObjectName("stopButton");
    stopButton->setEnabled(false);
    connect(runButton, &QPushButton::clicked, this, &RunnerWindow::runScript);
    connect(stopButton, &QPushButton::clicked, this, &RunnerWindow::stopScript);
    controlLayout->addWidget(runButton);
    controlLayout->addWidget(stopButton);
    mainLayout->addLayout(controlLayout);

    mainLayout->addWidget(createOutputGroup(), 1);

    auto* clearButton = new QPushButton(QIcon::fromTheme("edit-clear"), "Clear Output");
    clearButton->setObjectName("clearButton");
    connect(clearButton, &QPushButton::clicked, this, &RunnerWindow::clearOutput);
    mainLayout->addWidget(clearButton);

    statusLabel = new QLabel("Ready");
    statusLabel->setObjectName("statusLabel");
    timeLabel = new QLabel("Run time: 0.0s");
    timeLabel->setObjectName("timeLabel");
    statusBar()->addWidget(statusLabel, 1);
    statusBar()->addPermanentWidget(timeLabel);
}

QWidget* RunnerWindow::createSettingsGroup() {
    auto* group = new QGroupBox("Interpreter and Script");
    auto* form = new QFormLayout(group);

    interpreterEdit = new QLineEdit(QString::fromStdString(
        SessionFactory::resolveInterpreter(config.GetInterpreter())));
    interpreterEdit->setObjectName("interpreterEdit");
    auto* interpreterButton = new QPushButton("Browse...");
    connect(interpreterButton, &QPushButton::clicked, this, &RunnerWindow::selectInterpreter);
    auto* interpreterRow = new QHBoxLayout();
    interpreterRow->addWidget(interpreterEdit, 1);
    interpreterRow->addWidget(interpreterButton);
    form->addRow("Interpreter:", interpreterRow);

    environmentEdit = new QLineEdit();
    environmentEdit->setObjectName("environmentEdit");
    environmentEdit->setPlaceholderText("KEY=VALUE;KEY2=VALUE2");
    form->addRow("Environment:", environmentEdit);

    utf8Check = new QCheckBox("Force UTF-8 output");
    utf8Check->setObjectName("utf8Check");
    utf8Check->setChecked(config.GetForceUtf8());
    form->addRow("", utf8Check);

    scriptEdit = new QLineEdit();
    scriptEdit->setObjectName("scriptEdit");
    auto* scriptButton = new QPushButton("Browse...");
    connect(scriptButton, &QPushButton::clicked, this, &RunnerWindow::selectScript);
    auto* scriptRow = new QHBoxLayout();
    scriptRow->addWidget(scriptEdit, 1);
    scriptRow->addWidget(scriptButton);
    form->addRow("Script:", scriptRow);

    return group;
}

QWidget* RunnerWindow::createDependencyGroup() {
    auto* group = new QGroupBox("Dependencies");
    auto* layout = new QHBoxLayout(group);

    dependencyList = new QListWidget();
    dependencyList->setObjectName("dependencyList");
    layout->addWidget(dependencyList, 1);

    auto* buttons = new QVBoxLayout();
    auto* addPathButton = new QPushButton("Add Path");
    auto* addPackageButton = new QPushButton("Add Package");
    auto* removeButton = new QPushButton("Remove Selected");
    auto* clearButton = new QPushButton("Clear");
    connect(addPathButton, &QPushButton::clicked, this, &RunnerWindow::addDependencyPath);
    connect(addPackageButton, &QPushButton::clicked, this, &RunnerWindow::addPackagePath);
    connect(removeButton, &QPushButton::clicked, this, &RunnerWindow::removeDependency);
    connect(clearButton, &QPushButton::clicked, this, &RunnerWindow::clearDependencies);
    buttons->addWidget(addPathButton);
    buttons->addWidget(addPackageButton);
    buttons->addWidget(removeButton);
    buttons->addWidget(clearButton);
    buttons->addStretch();
    layout->addLayout(buttons);

    return group;
}

QWidget* RunnerWindow::createOutputGroup() {
    auto* group = new QGroupBox("Output");
    auto* layout = new QVBoxLayout(group);

    outputView = new QPlainTextEdit();
    outputView->setObjectName("outputView");
    outputView->setReadOnly(true);
    outputView->setPlaceholderText("Script output will appear here...");
    layout->addWidget(outputView);

    return group;
}

void RunnerWindow::setupTrayIcon() {
    if (!QSystemTrayIcon::isSystemTrayAvailable()) {
        spdlog::warn("System tray is not available, closing the window quits");
        return;
    }

    trayIcon = std::make_unique<QSystemTrayIcon>(this);
    trayIcon->setIcon(style()->standardIcon(QStyle::SP_ComputerIcon));
    trayIcon->setToolTip("Python Script Runner");

    trayMenu = std::make_unique<QMenu>();
    trayMenu->addAction("Show Window", this, &RunnerWindow::showWindow);
    trayMenu->addSeparator();
    trayMenu->addAction("Quit", this, &RunnerWindow::quitApplication);
    trayIcon->setContextMenu(trayMenu.get());

    connect(trayIcon.get(), &QSystemTrayIcon::activated,
            this, &RunnerWindow::onTrayActivated);

    trayIcon->show();
    spdlog::info("System tray icon created");
}

void RunnerWindow::setupSignalHandling() {
    signalWatcher = std::make_unique<util::SignalWatcher>();
    signalWatcher->start();

    signalTimer = new QTimer(this);
    connect(signalTimer, &QTimer::timeout, this, &RunnerWindow::onSignalCheck);
    signalTimer->start(SIGNAL_CHECK_INTERVAL_MS);
}

void RunnerWindow::onSignalCheck() {
    if (quitting || !signalWatcher || !signalWatcher->shouldExitNow()) {
        return;
    }
    spdlog::info("Termination signal received, shutting down");
    quitting = true;
    bridge->stop();
    QApplication::quit();
}

SessionRequest RunnerWindow::currentRequest() const {
    SessionRequest request;
    request.interpreterPath = SessionFactory::resolveInterpreter(interpreterEdit->text().trimmed().toStdString());
    request.scriptPath = scriptEdit->text().trimmed().toStdString();
    for (int i = 0; i < dependencyList->count(); i++) {
        request.extraSearchPaths.push_back(
            dependencyList->item(i)->data(Qt::UserRole).toString().toStdString());
    }
    request.timeoutSeconds = timeoutSpin->value();
    request.environmentText = environmentEdit->text().toStdString();
    request.searchPathVariable = config.GetSearchPathVariable();
    request.forceUtf8 = utf8Check->isChecked();
    return request;
}

void RunnerWindow::runScript() {
    if (isRunning()) {
        return;
    }

    SessionRequest request = currentRequest();
    std::optional<ExecutionSession> session;
    try {
        session = SessionFactory::create(request);
    } catch (const ValidationError& e) {
        spdlog::warn("Refusing to run: {}", e.what());
        statusLabel->setText(QString("Invalid settings: %1").arg(QString::fromStdString(e.what())));
        QMessageBox::warning(this, "Warning", QString::fromStdString(e.what()));
        return;
    }

    outputView->clear();
    try {
        bridge->start(std::move(*session));
    } catch (const std::exception& e) {
        spdlog::error("Failed to start {}: {}", request.scriptPath, e.what());
        QMessageBox::critical(this, "Error", QString::fromStdString(e.what()));
        return;
    }

    spdlog::info("Running {} with {}", request.scriptPath, request.interpreterPath);
    setRunning(true);
    statusLabel->setText("Running...");
    timeLabel->setText("Run time: 0.0s");
    runClock.start();
    elapsedTimer->start();
}

void RunnerWindow::stopScript() {
    if (!isRunning()) {
        return;
    }
    spdlog::info("Stop requested by the user");
    statusLabel->setText("Stopping...");
    stopButton->setEnabled(false);
    bridge->stop();
}

void RunnerWindow::clearOutput() {
    outputView->clear();
}

void RunnerWindow::appendOutput(const QString& text) {
    outputView->appendPlainText(text);
    outputView->moveCursor(QTextCursor::End);
}

void RunnerWindow::appendNotice(const QString& text, const QString& color) {
    if (color.isEmpty()) {
        appendOutput(text);
        return;
    }
    outputView->appendHtml(QString("<span style='color: %1;'>%2</span>").arg(color, text.toHtmlEscaped()));
    outputView->moveCursor(QTextCursor::End);
}

void RunnerWindow::onCompleted(int exitCode, double elapsedSeconds) {
    finishRun(QString("Finished (exit code %1, run time %2s)").arg(exitCode).arg(seconds(elapsedSeconds)),
              elapsedSeconds);
    appendNotice("");
    appendNotice("=== Script finished ===");
    appendNotice(QString("Exit code: %1").arg(exitCode));
    appendNotice(QString("Run time: %1s").arg(seconds(elapsedSeconds)));
}

void RunnerWindow::onTimedOut(double elapsedSeconds) {
    finishRun(QString("Timed out after %1s").arg(seconds(elapsedSeconds)), elapsedSeconds);
    appendNotice(QString("Script timed out after %1 seconds").arg(timeoutSpin->value()), "red");
}

void RunnerWindow::onStopped(double elapsedSeconds) {
    finishRun("Stopped", elapsedSeconds);
}

void RunnerWindow::onFailed(const QString& message) {
    finishRun(QString("Error: %1").arg(message), runClock.isValid() ? runClock.elapsed() / 1000.0 : 0.0);
    appendNotice(message, "red");
}

void RunnerWindow::finishRun(const QString& status, double elapsedSeconds) {
    elapsedTimer->stop();
    setRunning(false);
    statusLabel->setText(status);
    timeLabel->setText(QString("Run time: %1s").arg(seconds(elapsedSeconds)));
    spdlog::info("{}", status.toStdString());
}

void RunnerWindow::updateElapsed() {
    if (runClock.isValid()) {
        timeLabel->setText(QString("Run time: %1s").arg(seconds(runClock.elapsed() / 1000.0, 1)));
    }
}

void RunnerWindow::setRunning(bool running) {
    runButton->setEnabled(!running);
    stopButton->setEnabled(running);
    if (trayIcon) {
        trayIcon->setToolTip(running ? "Python Script Runner - running" : "Python Script Runner");
    }
}

void RunnerWindow::selectInterpreter() {
    QString path = QFileDialog::getOpenFileName(this, "Select Interpreter", QString(), "All files (*)");
    if (!path.isEmpty()) {
        interpreterEdit->setText(path);
    }
}

void RunnerWindow::selectScript() {
    QString path = QFileDialog::getOpenFileName(this, "Select Script", QString(),
                                                "Python files (*.py);;All files (*)");
    if (!path.isEmpty()) {
        scriptEdit->setText(path);
    }
}

void RunnerWindow::addDependency(const QString& kind, const QString& dir) {
    auto* item = new QListWidgetItem(QString("%1: %2").arg(kind, dir));
    item->setData(Qt::UserRole, dir);
    dependencyList->addItem(item);
}

void RunnerWindow::addDependencyPath() {
    QString dir = QFileDialog::getExistingDirectory(this, "Select Dependency Path");
    if (!dir.isEmpty()) {
        addDependency("Path", dir);
    }
}

void RunnerWindow::addPackagePath() {
    QString dir = QFileDialog::getExistingDirectory(this, "Select Package Path");
    if (!dir.isEmpty()) {
        addDependency("Package", dir);
    }
}

void RunnerWindow::removeDependency() {
    int row = dependencyList->currentRow();
    if (row >= 0) {
        delete dependencyList->takeItem(row);
    }
}

void RunnerWindow::clearDependencies() {
    dependencyList->clear();
}

void RunnerWindow::onTrayActivated(QSystemTrayIcon::ActivationReason reason) {
    if (reason == QSystemTrayIcon::DoubleClick) {
        showWindow();
    }
}

void RunnerWindow::showWindow() {
    show();
    raise();
    activateWindow();
}

void RunnerWindow::quitApplication() {
    if (isRunning()) {
        auto reply = QMessageBox::question(this, "Confirm Exit",
                                           "A script is still running. Quit anyway?",
                                           QMessageBox::Yes | QMessageBox::No);
        if (reply != QMessageBox::Yes) {
            return;
        }
        bridge->stop();
    }
    quitting = true;
    spdlog::info("Quitting");
    QApplication::quit();
}

void RunnerWindow::closeEvent(QCloseEvent* event) {
    if (!quitting && trayIcon && trayIcon->isVisible()) {
        hide();
        event->ignore();
        return;
    }
    if (!quitting) {
        quitApplication();
        if (!quitting) {
            event->ignore();
            return;
        }
    }
    event->accept();
}

} // namespace pyrunner
