module;
#include <QByteArray>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QLoggingCategory>
#include <QTcpServer>
#include <QTcpSocket>

module keeper.services.remote_server;

import keeper.core.jobtypes;
import keeper.core.jobregistry;
import keeper.core.backupengine;
import keeper.services.remote_command;

Q_LOGGING_CATEGORY(lcRemote, "keeper.remote")

RemoteControlServer::RemoteControlServer(JobRegistry* registry, BackupEngine* engine, QObject* parent)
    : QObject(parent)
    , m_registry(registry)
    , m_engine(engine)
{
    connect(&m_server, &QTcpServer::newConnection, this, &RemoteControlServer::onNewConnection);
}

bool RemoteControlServer::listen(quint16 port, const QHostAddress& address)
{
    if (!m_server.listen(address, port)) {
        qCWarning(lcRemote) << "Cannot listen on port" << port << m_server.errorString();
        return false;
    }
    qCInfo(lcRemote) << "Remote control listening on port" << m_server.serverPort();
    return true;
}

void RemoteControlServer::close()
{
    m_server.close();
    const QList<QTcpSocket*> sockets = m_buffers.keys();
    for (QTcpSocket* socket : sockets) socket->abort();
}

void RemoteControlServer::onNewConnection()
{
    while (QTcpSocket* socket = m_server.nextPendingConnection()) {
        m_buffers.insert(socket, QByteArray());
        connect(socket, &QTcpSocket::readyRead, this, [this, socket]() { onReadyRead(socket); });
        connect(socket, &QTcpSocket::disconnected, this, [this, socket]() { onDisconnected(socket); });
        qCDebug(lcRemote) << "Client connected" << socket->peerAddress().toString();
        emit connectionCountChanged();
    }
}

void RemoteControlServer::onDisconnected(QTcpSocket* socket)
{
    if (m_buffers.remove(socket) > 0) {
        qCDebug(lcRemote) << "Client disconnected";
        emit connectionCountChanged();
    }
    socket->deleteLater();
}

void RemoteControlServer::onReadyRead(QTcpSocket* socket)
{
    auto it = m_buffers.find(socket);
    if (it == m_buffers.end()) return;
    it->append(socket->readAll());

    for (;;) {
        const qsizetype newline = it->indexOf('\n');
        if (newline < 0) {
            if (it->size() > maxCommandLineLength) {
                qCWarning(lcRemote) << "Dropping client sending an oversized line";
                socket->write(errorResponse(QStringLiteral("Request line too long")) + '\n');
                m_buffers.erase(it);
                emit connectionCountChanged();
                socket->disconnectFromHost();
            }
            return;
        }

        QByteArray line = it->left(newline);
        it->remove(0, newline + 1);
        if (line.endsWith('\r')) line.chop(1);
        if (line.trimmed().isEmpty()) continue;

        bool closeConnection = false;
        const QByteArray response = handleLine(line, &closeConnection);
        socket->write(response + '\n');
        if (closeConnection) {
            m_buffers.erase(it);
            emit connectionCountChanged();
            socket->disconnectFromHost();
            return;
        }
    }
}

QByteArray RemoteControlServer::handleLine(const QByteArray& line, bool* closeConnection)
{
    if (closeConnection) *closeConnection = false;

    const CommandParseResult parsed = parseRemoteCommand(line);
    if (!parsed.ok()) {
        qCDebug(lcRemote) << "Rejected request:" << parsed.message;
        if (closeConnection) *closeConnection = closesConnection(parsed.error);
        return errorResponse(parsed.message);
    }

    const RemoteCommand& command = *parsed.command;
    if (command.kind == CommandKind::GetStatus) return statusResponse();

    ControlResult result;
    switch (command.kind) {
    case CommandKind::Pause:
        result = m_engine->pause(command.jobName);
        break;
    case CommandKind::Resume:
        result = m_engine->resume(command.jobName);
        break;
    case CommandKind::Stop:
        result = m_engine->stop(command.jobName);
        break;
    case CommandKind::GetStatus:
        break;
    }

    if (!result.ok()) {
        qCDebug(lcRemote) << commandKindToString(command.kind) << command.jobName << "rejected:"
                          << commandErrorToString(commandErrorFor(result.error)) << result.message;
        return errorResponse(result.message);
    }
    qCInfo(lcRemote) << "Remote" << commandKindToString(command.kind) << command.jobName;
    return QByteArrayLiteral("{}");
}

QByteArray RemoteControlServer::statusResponse() const
{
    QJsonArray jobs;
    const QList<JobSnapshot> snapshots = m_registry->snapshot();
    for (const JobSnapshot& snap : snapshots) {
        QJsonObject obj;
        obj.insert("Name", snap.job.name);
        obj.insert("Status", jobStatusToString(snap.state.status));
        obj.insert("Progress", snap.state.progressPercentage);
        obj.insert("Source", snap.job.sourcePath);
        obj.insert("Destination", snap.job.targetPath);
        obj.insert("Type", backupTypeToString(snap.job.type));
        obj.insert("PausedByBusinessSoftware", snap.state.pausedByBusinessSoftware);
        obj.insert("CurrentFile", snap.state.currentFile);
        obj.insert("Error", snap.state.errorMessage);
        jobs.append(obj);
    }
    return QJsonDocument(jobs).toJson(QJsonDocument::Compact);
}
