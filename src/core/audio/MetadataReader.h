#pragma once

#include <QString>
#include <QStringList>
#include <memory>
#include <vector>

#include "ITagSource.h"
#include "../MusicData.h"

// Reads and normalizes tags. Never fails: a file no back-end can open, or
// one without usable tags, yields the fallback record.
class MetadataReader {
public:
    // TagLib first, FFmpeg for containers TagLib rejects
    MetadataReader();
    explicit MetadataReader(std::vector<std::unique_ptr<ITagSource>> sources);

    MetadataReader(MetadataReader&&) = default;
    MetadataReader& operator=(MetadataReader&&) = default;

    TrackMetadata read(const QString& filePath) const;

    bool hasSources() const { return !m_sources.empty(); }
    QStringList sourceNames() const;

    static TrackMetadata fallback(const QString& filePath);
    static TrackMetadata normalize(const RawTags& tags, const QString& filePath);

    // "128", "127.6" -> 127; anything else (or negative) -> 0
    static int parseTempo(const QString& value);
    // "3/12" -> "3"
    static QString parseTrackNumber(const QString& value);

private:
    std::vector<std::unique_ptr<ITagSource>> m_sources;
};
