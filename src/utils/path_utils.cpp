module;
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QString>
#include <QStringList>
#include <QtGlobal>

module keeper.utils.path_utils;

namespace keeper::utils {

QString normalizeExtension(const QString& extension)
{
    QString ext = extension.trimmed().toLower();
    while (ext.startsWith('.')) ext.remove(0, 1);
    if (ext.isEmpty()) return QString();
    return QStringLiteral(".") + ext;
}

QStringList normalizeExtensions(const QStringList& extensions)
{
    QStringList out;
    for (const QString& raw : extensions) {
        const QString ext = normalizeExtension(raw);
        if (ext.isEmpty() || out.contains(ext)) continue;
        out.append(ext);
    }
    return out;
}

QString extensionOf(const QString& path)
{
    const QString name = QFileInfo(path).fileName();
    const int dot = name.lastIndexOf('.');
    if (dot < 0 || dot == name.size() - 1) return QString();
    return name.mid(dot).toLower();
}

bool hasExtension(const QString& path, const QStringList& normalizedExtensions)
{
    if (normalizedExtensions.isEmpty()) return false;
    const QString ext = extensionOf(path);
    return !ext.isEmpty() && normalizedExtensions.contains(ext);
}

QString normalizeProcessName(const QString& name)
{
    QString n = name.trimmed();
    n.replace('\\', '/');
    const int slash = n.lastIndexOf('/');
    if (slash >= 0) n = n.mid(slash + 1);
    n = n.toLower();
    if (n.endsWith(QStringLiteral(".exe"))) n.chop(4);
    return n;
}

QStringList normalizeProcessNames(const QStringList& names)
{
    QStringList out;
    for (const QString& raw : names) {
        const QString n = normalizeProcessName(raw);
        if (n.isEmpty() || out.contains(n)) continue;
        out.append(n);
    }
    return out;
}

bool isSamePath(const QString& a, const QString& b)
{
    if (a.isEmpty() || b.isEmpty()) return false;
    const QString ca = QDir::cleanPath(QFileInfo(a).absoluteFilePath());
    const QString cb = QDir::cleanPath(QFileInfo(b).absoluteFilePath());
#if defined(Q_OS_WIN)
    return ca.compare(cb, Qt::CaseInsensitive) == 0;
#else
    return ca == cb;
#endif
}

bool replaceFile(const QString& from, const QString& to, QString* errorString)
{
    const QString aside = to + QStringLiteral(".keeper-old");
    const bool hadTarget = QFileInfo::exists(to);
    if (hadTarget) {
        if (QFileInfo::exists(aside) && !QFile::remove(aside)) {
            if (errorString) *errorString = QString("Cannot remove %1").arg(aside);
            return false;
        }
        if (!QFile::rename(to, aside)) {
            if (errorString) *errorString = QString("Cannot move %1 aside").arg(to);
            return false;
        }
    }

    if (!QFile::rename(from, to)) {
        if (errorString) *errorString = QString("Cannot rename %1 to %2").arg(from, to);
        if (hadTarget && !QFile::rename(aside, to) && errorString) {
            *errorString += QString(", previous file kept as %1").arg(aside);
        }
        return false;
    }

    if (hadTarget && !QFile::remove(aside)) {
        qWarning() << "Cannot remove" << aside;
    }
    return true;
}

QString formatFileSize(qint64 bytes)
{
    static const char* units[] = { "B", "KB", "MB", "GB", "TB" };
    if (bytes < 1024) return QString("%1 B").arg(qMax<qint64>(0, bytes));

    double value = static_cast<double>(bytes);
    int unit = 0;
    while (value >= 1024.0 && unit < 4) {
        value /= 1024.0;
        unit++;
    }
    return QString("%1 %2").arg(value, 0, 'f', 2).arg(QLatin1String(units[unit]));
}

} // namespace keeper::utils
