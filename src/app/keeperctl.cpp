#include <QCoreApplication>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTcpSocket>
#include <QTextStream>

#ifndef APP_VERSION
#define APP_VERSION "0.1.0"
#endif

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("keeperctl"));
    QCoreApplication::setApplicationVersion(QStringLiteral(APP_VERSION));

    QTextStream out(stdout);
    QTextStream err(stderr);

    const QStringList args = app.arguments().mid(1);
    if (args.isEmpty()) {
        err << "usage: keeperctl GET_STATUS | PAUSE <job> | RESUME <job> | STOP <job>\n";
        return 2;
    }

    QJsonObject command;
    command.insert("Command", args.at(0).toUpper());
    if (args.size() > 1) command.insert("JobName", args.at(1));

    bool portOk = false;
    int port = qEnvironmentVariableIntValue("KEEPER_PORT", &portOk);
    if (!portOk || port <= 0 || port > 65535) port = 12345;

    QTcpSocket socket;
    socket.connectToHost(QStringLiteral("localhost"), static_cast<quint16>(port));
    if (!socket.waitForConnected(3000)) {
        err << "Cannot connect to localhost:" << port << ": " << socket.errorString() << '\n';
        return 1;
    }

    socket.write(QJsonDocument(command).toJson(QJsonDocument::Compact) + '\n');
    if (!socket.waitForBytesWritten(3000)) {
        err << "Cannot send command: " << socket.errorString() << '\n';
        return 1;
    }

    QByteArray reply;
    while (!reply.contains('\n')) {
        if (!socket.waitForReadyRead(5000)) {
            err << "No reply: " << socket.errorString() << '\n';
            return 1;
        }
        reply += socket.readAll();
    }

    const QByteArray line = reply.left(reply.indexOf('\n')).trimmed();
    out << line << '\n';
    const QJsonDocument doc = QJsonDocument::fromJson(line);
    return (doc.isObject() && doc.object().contains("error")) ? 1 : 0;
}
