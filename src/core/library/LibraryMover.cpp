#include "LibraryMover.h"
#include "CollisionResolver.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QDebug>

static MoveResult failure(const QString& message)
{
    qWarning() << "[LibraryMover]" << message;
    return MoveResult{false, message};
}

// ═══════════════════════════════════════════════════════════════════════
//  move
// ═══════════════════════════════════════════════════════════════════════

MoveResult LibraryMover::move(const QString& sourcePath, const QString& destinationPath)
{
    const QFileInfo srcInfo(sourcePath);
    if (!srcInfo.exists())
        return failure(QStringLiteral("Source file does not exist: %1").arg(sourcePath));
    if (!srcInfo.isFile())
        return failure(QStringLiteral("Source is not a regular file: %1").arg(sourcePath));

    if (CollisionResolver::pathTaken(destinationPath))
        return failure(QStringLiteral("Destination already exists: %1").arg(destinationPath));

    // Create destination directory if needed
    QDir destDir = QFileInfo(destinationPath).absoluteDir();
    if (!destDir.exists() && !destDir.mkpath(QStringLiteral("."))) {
        return failure(QStringLiteral("Cannot create directory %1").arg(destDir.absolutePath()));
    }

    // Same-volume rename; never overwrites
    if (QDir().rename(sourcePath, destinationPath)) {
        qDebug() << "[LibraryMover] Moved" << sourcePath << "->" << destinationPath;
        return MoveResult{true, QString()};
    }

    // Different volume (or rename refused): copy, verify, then delete
    return copyThenRemove(sourcePath, destinationPath);
}

// ═══════════════════════════════════════════════════════════════════════
//  copyThenRemove
// ═══════════════════════════════════════════════════════════════════════

MoveResult LibraryMover::copyThenRemove(const QString& sourcePath, const QString& destinationPath)
{
    QFile source(sourcePath);
    if (!source.copy(destinationPath)) {
        return failure(QStringLiteral("Cannot copy %1 to %2: %3")
                           .arg(sourcePath, destinationPath, source.errorString()));
    }

    const qint64 expected = QFileInfo(sourcePath).size();
    const qint64 written = QFileInfo(destinationPath).size();
    if (written != expected) {
        QFile::remove(destinationPath);
        return failure(QStringLiteral("Incomplete copy of %1 (%2 of %3 bytes)")
                           .arg(sourcePath).arg(written).arg(expected));
    }

    if (!source.remove()) {
        const QString reason = source.errorString();
        // Keep exactly one copy: the original
        QFile::remove(destinationPath);
        return failure(QStringLiteral("Cannot remove original %1 after copy: %2")
                           .arg(sourcePath, reason));
    }

    qDebug() << "[LibraryMover] Copied" << sourcePath << "->" << destinationPath << "(cross-device move)";
    return MoveResult{true, QString()};
}
