#include "PlaylistStore.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSet>
#include <QDebug>

static void setError(QString* errorMessage, const QString& text)
{
    qWarning() << "[PlaylistStore]" << text;
    if (errorMessage)
        *errorMessage = text;
}

static bool ensureParentDir(const QString& playlistPath, QString* errorMessage)
{
    QDir dir = QFileInfo(playlistPath).absoluteDir();
    if (dir.exists() || dir.mkpath(QStringLiteral(".")))
        return true;
    setError(errorMessage, QStringLiteral("Cannot create directory %1").arg(dir.absolutePath()));
    return false;
}

QString PlaylistStore::entryPathFor(const QString& filePath)
{
    const QFileInfo fi(filePath);
    const QString canonical = fi.canonicalFilePath();
    if (!canonical.isEmpty())
        return canonical;
    return QDir::cleanPath(fi.absoluteFilePath());
}

// ── entries ─────────────────────────────────────────────────────────
QStringList PlaylistStore::entries(const QString& playlistPath)
{
    QFile file(playlistPath);
    if (!file.exists())
        return {};
    if (!file.open(QIODevice::ReadOnly)) {
        qWarning() << "[PlaylistStore] Failed to open playlist:" << playlistPath << file.errorString();
        return {};
    }

    QStringList result;
    const QList<QByteArray> lines = file.readAll().split('\n');
    for (const QByteArray& line : lines) {
        const QString entry = QString::fromUtf8(line).trimmed();
        if (!entry.isEmpty())
            result.append(entry);
    }
    return result;
}

// ═══════════════════════════════════════════════════════════════════════
//  ensureMembership
// ═══════════════════════════════════════════════════════════════════════

MembershipResult PlaylistStore::ensureMembership(const QString& playlistPath,
                                                 const QString& filePath,
                                                 QString* errorMessage)
{
    const QString entry = entryPathFor(filePath);

    if (!ensureParentDir(playlistPath, errorMessage))
        return MembershipResult::Failed;

    QFile file(playlistPath);
    bool needsNewline = false;

    if (file.exists()) {
        if (!file.open(QIODevice::ReadOnly)) {
            setError(errorMessage, QStringLiteral("Cannot read playlist %1: %2")
                                       .arg(playlistPath, file.errorString()));
            return MembershipResult::Failed;
        }
        const QByteArray contents = file.readAll();
        file.close();

        QSet<QString> members;
        for (const QByteArray& line : contents.split('\n'))
            members.insert(QString::fromUtf8(line).trimmed());
        if (members.contains(entry))
            return MembershipResult::AlreadyPresent;

        // A last line without terminator would fuse with the new entry
        needsNewline = !contents.isEmpty() && !contents.endsWith('\n');
    }

    if (!file.open(QIODevice::WriteOnly | QIODevice::Append)) {
        setError(errorMessage, QStringLiteral("Cannot write playlist %1: %2")
                                   .arg(playlistPath, file.errorString()));
        return MembershipResult::Failed;
    }

    QByteArray line;
    if (needsNewline)
        line.append('\n');
    line.append(entry.toUtf8());
    line.append('\n');

    if (file.write(line) != line.size() || !file.flush()) {
        setError(errorMessage, QStringLiteral("Cannot write playlist %1: %2")
                                   .arg(playlistPath, file.errorString()));
        return MembershipResult::Failed;
    }

    qDebug() << "[PlaylistStore] Added" << entry << "to" << playlistPath;
    return MembershipResult::Added;
}

// ── discoverPlaylists ───────────────────────────────────────────────
QStringList PlaylistStore::discoverPlaylists(const QString& directory)
{
    QDir dir(directory);
    QStringList result;
    const QStringList names = dir.entryList({ QStringLiteral("*.m3u") }, QDir::Files, QDir::Name);
    for (const QString& name : names)
        result.append(dir.absoluteFilePath(name));
    return result;
}

// ── createEmptyPlaylist ─────────────────────────────────────────────
bool PlaylistStore::createEmptyPlaylist(const QString& playlistPath, QString* errorMessage)
{
    if (!ensureParentDir(playlistPath, errorMessage))
        return false;

    QFile file(playlistPath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Append)) {
        setError(errorMessage, QStringLiteral("Cannot create playlist %1: %2")
                                   .arg(playlistPath, file.errorString()));
        return false;
    }
    return true;
}
