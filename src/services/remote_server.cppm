/*!
 * @file        remote_server.cppm
 * @brief       TCP control and monitoring channel.
 * @details     Accepts any number of concurrent clients speaking a
 *              newline-delimited JSON protocol. Every request line receives
 *              exactly one response line:
 *              - GET_STATUS returns an array of job snapshots
 *              - PAUSE, RESUME and STOP return {} or {"error": "..."}
 *
 *              Connections are independent. A malformed line is answered with
 *              an error and closes only that connection; a client that
 *              disconnects mid-request affects nobody else.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       18 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/keeper/blob/main/LICENSE.md
 */

module;
#include <QByteArray>
#include <QHash>
#include <QHostAddress>
#include <QObject>
#include <QString>
#include <QTcpServer>
#include <QTcpSocket>

#ifndef Q_MOC_RUN
export module keeper.services.remote_server;
import keeper.core.jobregistry;
import keeper.core.backupengine;
#endif

#ifdef Q_MOC_RUN
#define KEEPER_MODULE_EXPORT
#else
#define KEEPER_MODULE_EXPORT export
#endif

/**
 * @brief Remote control server bound to a JobRegistry and a BackupEngine.
 */
KEEPER_MODULE_EXPORT class RemoteControlServer : public QObject {

    Q_OBJECT

    //!< @brief Number of open client connections.
    Q_PROPERTY(int connectionCount READ connectionCount NOTIFY connectionCountChanged)

public:
    /**
     * @brief Construct a server.
     * @param registry Job store read by GET_STATUS (not owned).
     * @param engine Target of PAUSE, RESUME and STOP (not owned).
     * @param parent Optional parent QObject.
     */
    RemoteControlServer(JobRegistry* registry, BackupEngine* engine, QObject* parent = nullptr);

    /**
     * @brief Starts listening.
     * @param port TCP port, 0 for any free port.
     * @param address Bind address.
     * @return false on failure, see errorString().
     */
    bool listen(quint16 port, const QHostAddress& address = QHostAddress::Any);

    //!< @brief Stops listening and drops every client.
    void close();

    //!< @brief True while listening.
    bool isListening() const { return m_server.isListening(); }

    //!< @brief Bound port.
    quint16 serverPort() const { return m_server.serverPort(); }

    //!< @brief Last listen error.
    QString errorString() const { return m_server.errorString(); }

    //!< @brief Number of open client connections.
    int connectionCount() const { return m_buffers.size(); }

    /**
     * @brief Executes one request line.
     * @param line Request without the trailing newline.
     * @param closeConnection Set to true when the connection must be closed.
     * @return Response without the trailing newline.
     */
    QByteArray handleLine(const QByteArray& line, bool* closeConnection = nullptr);

    //!< @brief Encodes every job snapshot as the GET_STATUS array.
    QByteArray statusResponse() const;

signals:
    void connectionCountChanged();

private slots:
    void onNewConnection();

private:
    void onReadyRead(QTcpSocket* socket);
    void onDisconnected(QTcpSocket* socket);

    JobRegistry* m_registry = nullptr;          //!< Not owned.
    BackupEngine* m_engine = nullptr;           //!< Not owned.
    QTcpServer m_server;                        //!< Listener.
    QHash<QTcpSocket*, QByteArray> m_buffers;   //!< Pending input per client.
};

#include "remote_server.moc"
