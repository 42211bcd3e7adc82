#include "CollisionResolver.h"

#include <QDir>
#include <QFileInfo>
#include <QDebug>

bool CollisionResolver::pathTaken(const QString& path)
{
    const QFileInfo fi(path);
    return fi.exists() || fi.isSymLink();
}

QString CollisionResolver::candidate(const QString& desiredPath, int counter)
{
    const QFileInfo fi(desiredPath);
    const QString counterText = QStringLiteral(" (%1)").arg(counter);

    // ".hidden" has no stem; the whole name is the base
    if (fi.completeBaseName().isEmpty())
        return QDir(fi.path()).filePath(fi.fileName() + counterText);

    QString name = fi.completeBaseName() + counterText;
    if (!fi.suffix().isEmpty())
        name += QLatin1Char('.') + fi.suffix();
    return QDir(fi.path()).filePath(name);
}

QString CollisionResolver::resolve(const QString& desiredPath)
{
    if (!pathTaken(desiredPath))
        return desiredPath;

    for (int counter = 1;; ++counter) {
        const QString path = candidate(desiredPath, counter);
        if (!pathTaken(path)) {
            qDebug() << "[CollisionResolver]" << QFileInfo(desiredPath).fileName()
                     << "is taken, using" << QFileInfo(path).fileName();
            return path;
        }
    }
}
