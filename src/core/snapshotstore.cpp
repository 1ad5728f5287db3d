module;
#include <QCryptographicHash>
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonValue>
#include <QSaveFile>
#include <QString>

module keeper.core.snapshotstore;

// Out of range entries read back as -1 and never match a live file
static qint64 fingerprintField(const QJsonValue& value)
{
    const double d = value.toDouble(-1);
    if (!(d >= 0 && d < 9.0e18)) return -1;
    return static_cast<qint64>(d);
}

SnapshotStore::SnapshotStore(const QString& stateDirectory)
    : m_directory(QDir(stateDirectory).filePath(QStringLiteral("snapshots")))
{
}

QString SnapshotStore::pathFor(const QString& job) const
{
    const QByteArray digest = QCryptographicHash::hash(job.toUtf8(), QCryptographicHash::Sha256).toHex();
    return QDir(m_directory).filePath(QString::fromLatin1(digest) + ".json");
}

FileManifest SnapshotStore::load(const QString& job) const
{
    FileManifest manifest;
    QFile file(pathFor(job));
    if (!file.exists()) return manifest;
    if (!file.open(QIODevice::ReadOnly)) {
        qWarning() << "Cannot read snapshot" << file.fileName() << file.errorString();
        return manifest;
    }

    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll());
    if (!doc.isObject()) {
        qWarning() << "Ignoring corrupt snapshot" << file.fileName();
        return manifest;
    }
    if (doc.object().value("job").toString() != job) {
        qWarning() << "Ignoring snapshot" << file.fileName() << "recorded for another job";
        return manifest;
    }

    const QJsonObject files = doc.object().value("files").toObject();
    for (auto it = files.begin(); it != files.end(); ++it) {
        const QJsonObject obj = it.value().toObject();
        FileFingerprint fp;
        fp.size = fingerprintField(obj.value("size"));
        fp.modifiedMs = fingerprintField(obj.value("modified"));
        manifest.insert(it.key(), fp);
    }
    return manifest;
}

bool SnapshotStore::save(const QString& job, const FileManifest& manifest, QString* errorString) const
{
    QJsonObject files;
    for (auto it = manifest.constBegin(); it != manifest.constEnd(); ++it) {
        QJsonObject obj;
        obj.insert("size", static_cast<double>(it->size));
        obj.insert("modified", static_cast<double>(it->modifiedMs));
        files.insert(it.key(), obj);
    }
    QJsonObject root;
    root.insert("version", 1);
    root.insert("job", job);
    root.insert("files", files);

    if (!QDir().mkpath(m_directory)) {
        if (errorString) *errorString = QString("Cannot create %1").arg(m_directory);
        return false;
    }
    QSaveFile file(pathFor(job));
    if (!file.open(QIODevice::WriteOnly)) {
        if (errorString) *errorString = file.errorString();
        return false;
    }
    file.write(QJsonDocument(root).toJson(QJsonDocument::Compact));
    if (!file.commit()) {
        if (errorString) *errorString = file.errorString();
        return false;
    }
    return true;
}

bool SnapshotStore::remove(const QString& job) const
{
    QFile file(pathFor(job));
    return !file.exists() || file.remove();
}

bool SnapshotStore::rename(const QString& from, const QString& to, QString* errorString) const
{
    if (from == to) return true;
    const bool hadManifest = QFile::exists(pathFor(from));
    if (!remove(to)) {
        if (errorString) *errorString = QString("Cannot remove %1").arg(pathFor(to));
        return false;
    }
    if (!hadManifest) return true;
    if (!save(to, load(from), errorString)) return false;
    return remove(from);
}
