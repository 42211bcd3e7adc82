#include "FilenameSynthesizer.h"

#include <QFileInfo>
#include <QDebug>

static const QString kIllegalChars = QStringLiteral("<>:\"/\\|?*");
static const QString kUnknown = QStringLiteral("Unknown");

const QStringList& FilenameSynthesizer::placeholders()
{
    static const QStringList names = {
        QStringLiteral("artist"), QStringLiteral("title"), QStringLiteral("album"),
        QStringLiteral("genre"), QStringLiteral("track")
    };
    return names;
}

// ═══════════════════════════════════════════════════════════════════════
//  cleaning
// ═══════════════════════════════════════════════════════════════════════

QString FilenameSynthesizer::stripIllegal(const QString& name)
{
    QString result;
    result.reserve(name.size());
    for (const QChar ch : name) {
        if (kIllegalChars.contains(ch))
            continue;
        if (ch == QLatin1Char('\n') || ch == QLatin1Char('\r'))
            result.append(QLatin1Char(' '));
        else
            result.append(ch);
    }
    return result.trimmed();
}

QString FilenameSynthesizer::cleanComponent(const QString& name)
{
    const QString cleaned = stripIllegal(name);
    return cleaned.isEmpty() ? kUnknown : cleaned;
}

// ═══════════════════════════════════════════════════════════════════════
//  pattern expansion
// ═══════════════════════════════════════════════════════════════════════

// values == nullptr only checks the pattern.
bool FilenameSynthesizer::expand(const QString& pattern, const QHash<QString, QString>* values,
                                 QString* result, QString* errorMessage)
{
    QString out;
    const int n = pattern.size();

    for (int i = 0; i < n; ++i) {
        const QChar ch = pattern.at(i);

        if (ch == QLatin1Char('{')) {
            if (i + 1 < n && pattern.at(i + 1) == QLatin1Char('{')) {
                out.append(QLatin1Char('{'));
                ++i;
                continue;
            }
            const int close = pattern.indexOf(QLatin1Char('}'), i + 1);
            if (close < 0) {
                if (errorMessage)
                    *errorMessage = QStringLiteral("Naming pattern \"%1\": unterminated '{' at position %2")
                                        .arg(pattern).arg(i);
                return false;
            }
            const QString name = pattern.mid(i + 1, close - i - 1);
            if (!placeholders().contains(name)) {
                if (errorMessage)
                    *errorMessage = QStringLiteral("Naming pattern \"%1\": unknown placeholder {%2} (expected one of {%3})")
                                        .arg(pattern, name, placeholders().join(QStringLiteral("}, {")));
                return false;
            }
            if (values)
                out.append(values->value(name));
            i = close;
        } else if (ch == QLatin1Char('}')) {
            if (i + 1 < n && pattern.at(i + 1) == QLatin1Char('}')) {
                out.append(QLatin1Char('}'));
                ++i;
                continue;
            }
            if (errorMessage)
                *errorMessage = QStringLiteral("Naming pattern \"%1\": single '}' at position %2")
                                    .arg(pattern).arg(i);
            return false;
        } else if (ch == QLatin1Char('/') || ch == QLatin1Char('\\')) {
            // The library is a single folder
            if (errorMessage)
                *errorMessage = QStringLiteral("Naming pattern \"%1\": path separator at position %2")
                                    .arg(pattern).arg(i);
            return false;
        } else {
            out.append(ch);
        }
    }

    if (result)
        *result = out;
    return true;
}

bool FilenameSynthesizer::validatePattern(const QString& pattern, QString* errorMessage)
{
    return expand(pattern, nullptr, nullptr, errorMessage);
}

std::optional<QString> FilenameSynthesizer::synthesize(const TrackMetadata& meta, QString* errorMessage) const
{
    QHash<QString, QString> values;
    values.insert(QStringLiteral("artist"), cleanComponent(meta.artist));
    values.insert(QStringLiteral("title"),  cleanComponent(meta.title));
    values.insert(QStringLiteral("album"),  cleanComponent(meta.album));
    values.insert(QStringLiteral("genre"),  stripIllegal(meta.genre));
    values.insert(QStringLiteral("track"),  stripIllegal(meta.trackNumber));

    QString name;
    if (!expand(m_pattern, &values, &name, errorMessage))
        return std::nullopt;

    name = name.trimmed();
    if (name.isEmpty())
        name = kUnknown;
    return name;
}

std::optional<QString> FilenameSynthesizer::fileNameFor(const TrackMetadata& meta, QString* errorMessage) const
{
    std::optional<QString> name = synthesize(meta, errorMessage);
    if (!name)
        return std::nullopt;

    const QString suffix = QFileInfo(meta.sourcePath).suffix();
    if (suffix.isEmpty())
        return name;
    return *name + QLatin1Char('.') + suffix;
}
