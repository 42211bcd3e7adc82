#pragma once

#include <QHash>
#include <QString>
#include <QStringList>
#include <optional>

// Raw tag values keyed by lower-case field name ("title", "artist", "album",
// "genre", "bpm", "date", "tracknumber"). A field can carry several values.
using RawTags = QHash<QString, QStringList>;

// Tag back-end over one container library. TagLibTagSource and
// FFmpegTagSource both implement this.
class ITagSource {
public:
    virtual ~ITagSource() = default;

    // std::nullopt when the library cannot open the container at all.
    // A readable container without tags yields an empty map.
    virtual std::optional<RawTags> readTags(const QString& filePath) const = 0;

    virtual QString name() const = 0;
};
