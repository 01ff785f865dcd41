#include <QtCore/QCommandLineParser>
#include <QtCore/QCoreApplication>
#include <QtCore/QFile>
#include <QtCore/QJsonDocument>
#include <QtCore/QJsonObject>
#include <QtCore/QTextStream>

#include <cstdio>
#include <memory>

#include "core/common/Config.hpp"
#include "core/common/Logger.hpp"
#include "core/sandbox/SandboxInterpreter.hpp"
#include "core/session/SessionScope.hpp"

namespace {

enum ExitCode {
    ExitSuccess = 0,
    ExitExecutionFailed = 1,
    ExitRejected = 2,
    ExitInfrastructure = 3,
    ExitUsage = 64
};

QTextStream& standardOutput() {
    static QTextStream stream(stdout);
    return stream;
}

QTextStream& standardError() {
    static QTextStream stream(stderr);
    return stream;
}

int usageError(const QString& message) {
    standardError() << "enclave: " << message << Qt::endl;
    return ExitUsage;
}

// Reads the snippet from a file, or from stdin when path is empty or "-"
Enclave::Expected<QString, QString> readSource(const QString& path) {
    QFile file;
    bool opened = false;
    if (path.isEmpty() || path == QLatin1String("-")) {
        opened = file.open(stdin, QIODevice::ReadOnly);
    } else {
        file.setFileName(path);
        opened = file.open(QIODevice::ReadOnly);
    }
    if (!opened) {
        return Enclave::makeUnexpected(QString("cannot read %1: %2")
                                           .arg(path.isEmpty() ? QString("stdin") : path, file.errorString()));
    }
    return QString::fromUtf8(file.readAll());
}

int exitCodeFor(Enclave::ExecutionStatus status) {
    using Enclave::ExecutionStatus;
    switch (status) {
    case ExecutionStatus::Success:
        return ExitSuccess;
    case ExecutionStatus::ExecutionFailed:
    case ExecutionStatus::Timeout:
        return ExitExecutionFailed;
    case ExecutionStatus::ParseError:
    case ExecutionStatus::PolicyViolation:
        return ExitRejected;
    case ExecutionStatus::InfrastructureUnavailable:
    case ExecutionStatus::ImageMissing:
    case ExecutionStatus::LaunchFailed:
    case ExecutionStatus::Unexpected:
        return ExitInfrastructure;
    }
    return ExitInfrastructure;
}

struct Options {
    QCommandLineOption session{"session", "Session id (generated when omitted).", "id"};
    QCommandLineOption context{"context", "JSON object made available as globals.", "json"};
    QCommandLineOption timeout{"timeout", "Wall-clock limit in seconds.", "seconds"};
    QCommandLineOption memory{"memory", "Memory ceiling, e.g. 512m or 1g.", "size"};
    QCommandLineOption cpuQuota{"cpu-quota", "CPU quota in microseconds per 100ms period.", "us"};
    QCommandLineOption network{"network", "Give the container network access."};
    QCommandLineOption skipPolicy{"skip-policy", "Do not run the import policy gate."};
    QCommandLineOption discard{"discard", "Remove the session directory when the run finishes."};
    QCommandLineOption config{"config", "INI file with settings.", "file"};
    QCommandLineOption logLevel{"log-level", "trace, debug, info, warn, error, critical or off.", "level"};
    QCommandLineOption logFile{"log-file", "Log file path; empty for console only.", "file"};
};

int runSnippet(Enclave::SandboxInterpreter& interpreter, const QCommandLineParser& parser,
               const Options& options, const QStringList& args) {
    auto source = readSource(args.value(1));
    if (source.hasError()) {
        return usageError(source.error());
    }

    QVariantMap context;
    if (parser.isSet(options.context)) {
        QJsonParseError parseError;
        const QJsonDocument document = QJsonDocument::fromJson(parser.value(options.context).toUtf8(), &parseError);
        if (parseError.error != QJsonParseError::NoError || !document.isObject()) {
            return usageError("--context must be a JSON object");
        }
        context = document.object().toVariantMap();
    }

    Enclave::ResourceLimits limits = interpreter.defaultLimits();
    if (parser.isSet(options.timeout)) {
        bool ok = false;
        limits.timeoutSeconds = parser.value(options.timeout).toInt(&ok);
        if (!ok || limits.timeoutSeconds <= 0) {
            return usageError("--timeout must be a positive number of seconds");
        }
    }
    if (parser.isSet(options.memory)) {
        limits.memoryLimit = parser.value(options.memory);
        if (Enclave::parseMemoryLimit(limits.memoryLimit) < 0) {
            return usageError("--memory must be a size such as 512m or 1g");
        }
    }
    if (parser.isSet(options.cpuQuota)) {
        bool ok = false;
        limits.cpuQuota = parser.value(options.cpuQuota).toLongLong(&ok);
        if (!ok || limits.cpuQuota < 0) {
            return usageError("--cpu-quota must be a non-negative integer");
        }
    }
    if (parser.isSet(options.network)) {
        limits.enableNetwork = true;
    }
    interpreter.setDefaultLimits(limits);
    interpreter.setPolicyEnabled(!parser.isSet(options.skipPolicy));

    QString sessionId = parser.value(options.session);
    std::unique_ptr<Enclave::SessionScope> scope;
    if (parser.isSet(options.discard)) {
        if (sessionId.isEmpty()) {
            sessionId = Enclave::SessionStore::generateSessionId();
        }
        scope = std::make_unique<Enclave::SessionScope>(interpreter.sessionStore(), sessionId,
                                                        Enclave::CleanupPolicy::DestroyOnExit);
        if (!scope->isValid()) {
            return usageError("cannot use session '" + sessionId + "': " + toString(scope->error()));
        }
    }

    const Enclave::ExecutionResult result = interpreter.run(source.value(), context, sessionId);

    QTextStream& stream = result.succeeded() ? standardOutput() : standardError();
    stream << Enclave::SandboxInterpreter::formatResult(result);
    if (!result.succeeded() || !result.output.endsWith(QLatin1Char('\n'))) {
        stream << Qt::endl;
    }
    stream.flush();

    standardError() << "session: " << result.sessionId << Qt::endl;
    return exitCodeFor(result.status);
}

int validateSnippet(Enclave::SandboxInterpreter& interpreter, const QStringList& args) {
    auto source = readSource(args.value(1));
    if (source.hasError()) {
        return usageError(source.error());
    }

    const Enclave::AllowListVerdict verdict = interpreter.validate(source.value());
    if (verdict.accepted) {
        standardOutput() << "OK" << Qt::endl;
        return ExitSuccess;
    }
    standardError() << verdict.message << Qt::endl;
    return ExitRejected;
}

int listArtifacts(Enclave::SandboxInterpreter& interpreter, const QStringList& args) {
    if (args.size() < 2) {
        return usageError("list needs a session id");
    }
    auto artifacts = interpreter.sessionStore().listArtifacts(args.at(1));
    if (artifacts.hasError()) {
        return usageError(Enclave::toString(artifacts.error()));
    }
    for (const QString& path : artifacts.value()) {
        standardOutput() << path << '\n';
    }
    standardOutput().flush();
    return ExitSuccess;
}

int readArtifact(Enclave::SandboxInterpreter& interpreter, const QStringList& args) {
    if (args.size() < 3) {
        return usageError("read needs a session id and a relative path");
    }
    auto content = interpreter.sessionStore().readArtifact(args.at(1), args.at(2));
    if (content.hasError()) {
        standardError() << "enclave: " << args.at(2) << ": "
                        << Enclave::toString(content.error()) << Qt::endl;
        return ExitExecutionFailed;
    }

    QFile out;
    if (!out.open(stdout, QIODevice::WriteOnly) || out.write(content.value()) != content.value().size()) {
        standardError() << "enclave: failed to write to stdout" << Qt::endl;
        return ExitExecutionFailed;
    }
    return ExitSuccess;
}

int cleanupSession(Enclave::SandboxInterpreter& interpreter, const QStringList& args) {
    if (args.size() < 2) {
        return usageError("cleanup needs a session id");
    }
    auto removed = interpreter.sessionStore().destroy(args.at(1));
    if (removed.hasError()) {
        standardError() << "enclave: " << Enclave::toString(removed.error()) << Qt::endl;
        return ExitExecutionFailed;
    }
    return ExitSuccess;
}

int checkEngine(Enclave::SandboxInterpreter& interpreter) {
    const Enclave::AvailabilityReport report = interpreter.executor().checkAvailability();
    if (!report.available) {
        standardError() << report.message << Qt::endl;
        return ExitInfrastructure;
    }
    standardOutput() << "Docker is available and image '"
                     << interpreter.executor().options().image() << "' is present" << Qt::endl;
    return ExitSuccess;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("enclave");
    app.setApplicationVersion("1.0.0");
    app.setOrganizationName("Enclave");

    QCommandLineParser parser;
    parser.setApplicationDescription("Run untrusted Python snippets in isolated containers.");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("command", "run, validate, list, read, cleanup or check.");
    parser.addPositionalArgument("args", "Command arguments.", "[args...]");

    Options options;
    parser.addOptions({options.session, options.context, options.timeout, options.memory,
                       options.cpuQuota, options.network, options.skipPolicy, options.discard, options.config,
                       options.logLevel, options.logFile});
    parser.process(app);

    const QStringList args = parser.positionalArguments();
    if (args.isEmpty()) {
        parser.showHelp(ExitUsage);
    }

    Enclave::Config& config = Enclave::Config::instance();
    if (parser.isSet(options.config)) {
        config.initializeFromFile(parser.value(options.config));
    } else {
        config.initialize();
    }

    Enclave::Config::LogSettings logSettings = config.getLogSettings();
    if (parser.isSet(options.logLevel)) {
        logSettings.level = parser.value(options.logLevel);
    }
    if (parser.isSet(options.logFile)) {
        logSettings.filePath = parser.value(options.logFile);
    }
    Enclave::Logger::Level level = Enclave::Logger::Level::Warn;
    if (!Enclave::Logger::parseLevel(logSettings.level.toStdString(), level)) {
        return usageError("unknown log level '" + logSettings.level + "'");
    }
    Enclave::Logger::instance().initialize(logSettings.filePath.toStdString(), level);

    try {
        auto interpreter = Enclave::SandboxInterpreter::fromConfig(config);
        if (interpreter.hasError()) {
            standardError() << "enclave: " << Enclave::toString(interpreter.error()) << Qt::endl;
            return ExitUsage;
        }
        Enclave::SandboxInterpreter& sandbox = *interpreter.value();

        const QString command = args.first();
        if (command == QLatin1String("run")) {
            return runSnippet(sandbox, parser, options, args);
        }
        if (command == QLatin1String("validate")) {
            return validateSnippet(sandbox, args);
        }
        if (command == QLatin1String("list")) {
            return listArtifacts(sandbox, args);
        }
        if (command == QLatin1String("read")) {
            return readArtifact(sandbox, args);
        }
        if (command == QLatin1String("cleanup")) {
            return cleanupSession(sandbox, args);
        }
        if (command == QLatin1String("check")) {
            return checkEngine(sandbox);
        }
        return usageError("unknown command '" + command + "'");

    } catch (const std::exception& e) {
        ENCLAVE_CRITICAL("Fatal error: {}", e.what());
        return ExitInfrastructure;
    }
}
