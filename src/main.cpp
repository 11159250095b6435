#include <QCoreApplication>
#include <QCommandLineParser>
#include <QDateTime>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QTextStream>

#include "canonical/codec.h"
#include "client/client_config.h"
#include "client/llm_client.h"
#include "client/qt_transport.h"
#include "convert/convert.h"
#include "core/log_manager.h"

namespace {

QTextStream& out()
{
    static QTextStream stream(stdout);
    return stream;
}

QTextStream& err()
{
    static QTextStream stream(stderr);
    return stream;
}

int reportFailure(const Failure& failure)
{
    err() << QJsonDocument(failure.toJson()).toJson(QJsonDocument::Indented);
    err().flush();
    return 1;
}

int printJson(const QJsonObject& obj)
{
    out() << QJsonDocument(obj).toJson(QJsonDocument::Indented);
    out().flush();
    return 0;
}

Result<QJsonObject> readInput(const QString& path)
{
    QFile file;
    if (path.isEmpty() || path == QStringLiteral("-")) {
        if (!file.open(stdin, QIODevice::ReadOnly))
            return std::unexpected(Failure::malformedInput(QStringLiteral("stdin"), QStringLiteral("无法读取标准输入")));
    } else {
        file.setFileName(path);
        if (!file.open(QIODevice::ReadOnly))
            return std::unexpected(Failure::malformedInput(QStringLiteral("unreadable_input"),
                                                           QStringLiteral("无法读取文件: %1").arg(path)));
    }
    return CanonicalCodec::parseObject(file.readAll(), QStringLiteral("Input"));
}

int runConvert(const QString& direction, const QString& inputPath, const ConversionOptions& options)
{
    auto input = readInput(inputPath);
    if (!input)
        return reportFailure(input.error());

    if (direction == QStringLiteral("alternate-request")) {
        auto req = Convert::alternateRequestToCanonical(*input);
        return req ? printJson(CanonicalCodec::encodeRequest(*req)) : reportFailure(req.error());
    }
    if (direction == QStringLiteral("canonical-request")) {
        auto req = CanonicalCodec::decodeRequest(*input);
        if (!req)
            return reportFailure(req.error());
        auto converted = Convert::canonicalRequestToAlternate(*req, options);
        return converted ? printJson(*converted) : reportFailure(converted.error());
    }
    if (direction == QStringLiteral("canonical-response")) {
        auto resp = CanonicalCodec::decodeResponse(*input);
        if (!resp)
            return reportFailure(resp.error());
        auto converted = Convert::canonicalResponseToAlternate(*resp, options);
        return converted ? printJson(*converted) : reportFailure(converted.error());
    }
    if (direction == QStringLiteral("alternate-response")) {
        auto resp = Convert::alternateResponseToCanonical(*input);
        return resp ? printJson(CanonicalCodec::encodeResponse(*resp)) : reportFailure(resp.error());
    }

    err() << "unknown direction: " << direction << "\n";
    return 2;
}

}

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("llmbridge"));
    app.setApplicationVersion(QStringLiteral("1.0.0"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Anthropic / OpenAI message conversion and client"));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument(QStringLiteral("command"), QStringLiteral("convert | chat | embed"));
    parser.addPositionalArgument(QStringLiteral("args"), QStringLiteral("prompt or input texts"), QStringLiteral("[args...]"));

    const QCommandLineOption directionOpt(QStringLiteral("direction"),
        QStringLiteral("alternate-request | canonical-request | canonical-response | alternate-response"),
        QStringLiteral("direction"), QStringLiteral("alternate-request"));
    const QCommandLineOption inputOpt({QStringLiteral("i"), QStringLiteral("input")},
        QStringLiteral("JSON input file (default stdin)"), QStringLiteral("path"));
    const QCommandLineOption reasoningOpt(QStringLiteral("reasoning-effort"),
        QStringLiteral("Emit reasoning_effort on alternate requests"));
    const QCommandLineOption configOpt({QStringLiteral("c"), QStringLiteral("config")},
        QStringLiteral("Client configuration JSON"), QStringLiteral("path"));
    const QCommandLineOption systemOpt({QStringLiteral("s"), QStringLiteral("system")},
        QStringLiteral("System prompt for chat"), QStringLiteral("text"));
    const QCommandLineOption logFileOpt(QStringLiteral("log-file"),
        QStringLiteral("Append logs to this file"), QStringLiteral("path"));
    const QCommandLineOption verboseOpt({QStringLiteral("v"), QStringLiteral("verbose")},
        QStringLiteral("Debug logging on stderr"));
    parser.addOptions({directionOpt, inputOpt, reasoningOpt, configOpt, systemOpt, logFileOpt, verboseOpt});
    parser.process(app);

    // --- 1. Log ---
    LogManager& log = LogManager::instance();
    log.setEchoToStderr(parser.isSet(verboseOpt));
    log.setMinimumLevel(parser.isSet(verboseOpt) ? LogManager::Debug : LogManager::Warning);
    if (parser.isSet(logFileOpt))
        log.openFile(parser.value(logFileOpt));

    const QStringList args = parser.positionalArguments();
    if (args.isEmpty())
        parser.showHelp(2);
    const QString command = args.first();

    // --- 2. Offline conversion ---
    if (command == QStringLiteral("convert")) {
        ConversionOptions options;
        options.dialect.supportsReasoningEffort = parser.isSet(reasoningOpt);
        options.createdAt = QDateTime::currentSecsSinceEpoch();
        return runConvert(parser.value(directionOpt), parser.value(inputOpt), options);
    }

    // --- 3. Config + client ---
    if (!parser.isSet(configOpt)) {
        err() << "--config is required for " << command << "\n";
        return 2;
    }
    auto config = ClientConfig::loadFile(parser.value(configOpt));
    if (!config)
        return reportFailure(config.error());

    QtTransport transport(config->timeoutMs);
    const LlmClient client(*config, &transport);

    if (command == QStringLiteral("chat")) {
        const QString prompt = args.mid(1).join(QLatin1Char(' '));
        auto resp = client.complete(parser.value(systemOpt), prompt);
        if (!resp)
            return reportFailure(resp.error());
        out() << resp->text() << "\n";
        out().flush();
        return 0;
    }

    if (command == QStringLiteral("embed")) {
        auto resp = client.embed(args.mid(1));
        return resp ? printJson(CanonicalCodec::encodeEmbeddingResponse(*resp)) : reportFailure(resp.error());
    }

    err() << "unknown command: " << command << "\n";
    return 2;
}
