#pragma once

#include <QHash>
#include <QString>
#include <QStringList>
#include <optional>

#include "../MusicData.h"

class FilenameSynthesizer {
public:
    // Placeholders: {artist}, {title}, {album}, {genre}, {track}
    // "{{" and "}}" stand for literal braces.
    explicit FilenameSynthesizer(const QString& pattern = QStringLiteral("{artist} - {title}"))
        : m_pattern(pattern) {}

    void setPattern(const QString& pattern) { m_pattern = pattern; }
    QString pattern() const { return m_pattern; }

    // False for an unknown placeholder, unbalanced braces or a path
    // separator in the literal text.
    static bool validatePattern(const QString& pattern, QString* errorMessage = nullptr);

    // Name without extension, std::nullopt if the pattern is invalid.
    std::optional<QString> synthesize(const TrackMetadata& meta, QString* errorMessage = nullptr) const;

    // synthesize() plus the source file's extension, unchanged.
    std::optional<QString> fileNameFor(const TrackMetadata& meta, QString* errorMessage = nullptr) const;

    // Removes < > : " / \ | ? *, turns newlines into spaces and trims.
    static QString stripIllegal(const QString& name);
    // stripIllegal() with "Unknown" for an empty result.
    static QString cleanComponent(const QString& name);

    static const QStringList& placeholders();

private:
    static bool expand(const QString& pattern, const QHash<QString, QString>* values,
                       QString* result, QString* errorMessage);

    QString m_pattern;
};
