#include "MetadataReader.h"
#include "FFmpegTagSource.h"
#include "TagLibTagSource.h"

#include <QFileInfo>
#include <QDebug>
#include <cmath>
#include <exception>
#include <limits>

// First value of a multi-valued tag, trimmed; empty when absent.
static QString firstValue(const RawTags& tags, const QString& key)
{
    const auto it = tags.constFind(key);
    if (it == tags.constEnd() || it->isEmpty())
        return {};
    return it->first().trimmed();
}

MetadataReader::MetadataReader()
{
    m_sources.push_back(std::make_unique<TagLibTagSource>());
    m_sources.push_back(std::make_unique<FFmpegTagSource>());
}

MetadataReader::MetadataReader(std::vector<std::unique_ptr<ITagSource>> sources)
    : m_sources(std::move(sources))
{
}

QStringList MetadataReader::sourceNames() const
{
    QStringList names;
    for (const auto& source : m_sources)
        names.append(source->name());
    return names;
}

// ═══════════════════════════════════════════════════════════════════════
//  read
// ═══════════════════════════════════════════════════════════════════════

TrackMetadata MetadataReader::read(const QString& filePath) const
{
    for (const auto& source : m_sources) {
        std::optional<RawTags> tags;
        try {
            tags = source->readTags(filePath);
        } catch (const std::exception& e) {
            qWarning() << "[MetadataReader]" << source->name() << "failed on" << filePath << ":" << e.what();
            continue;
        }

        if (tags.has_value())
            return normalize(*tags, filePath);
    }

    qDebug() << "[MetadataReader] No readable tags, using fallback for" << filePath;
    return fallback(filePath);
}

// ═══════════════════════════════════════════════════════════════════════
//  normalization
// ═══════════════════════════════════════════════════════════════════════

TrackMetadata MetadataReader::fallback(const QString& filePath)
{
    const QFileInfo fi(filePath);

    TrackMetadata meta;
    meta.title = fi.completeBaseName();
    if (meta.title.isEmpty())
        meta.title = fi.fileName();
    meta.sourcePath = filePath;
    return meta;
}

TrackMetadata MetadataReader::normalize(const RawTags& tags, const QString& filePath)
{
    TrackMetadata meta = fallback(filePath);

    const QString title  = firstValue(tags, QStringLiteral("title"));
    const QString artist = firstValue(tags, QStringLiteral("artist"));
    const QString album  = firstValue(tags, QStringLiteral("album"));
    const QString genre  = firstValue(tags, QStringLiteral("genre"));

    if (!title.isEmpty())  meta.title = title;
    if (!artist.isEmpty()) meta.artist = artist;
    if (!album.isEmpty())  meta.album = album;
    if (!genre.isEmpty())  meta.genre = genre;

    meta.tempo       = parseTempo(firstValue(tags, QStringLiteral("bpm")));
    meta.date        = firstValue(tags, QStringLiteral("date"));
    meta.trackNumber = parseTrackNumber(firstValue(tags, QStringLiteral("tracknumber")));
    return meta;
}

int MetadataReader::parseTempo(const QString& value)
{
    bool ok = false;
    const double bpm = value.trimmed().toDouble(&ok);
    if (!ok || !std::isfinite(bpm) || bpm < 0.0)
        return 0;
    if (bpm >= static_cast<double>(std::numeric_limits<int>::max()))
        return 0;
    return static_cast<int>(bpm);
}

QString MetadataReader::parseTrackNumber(const QString& value)
{
    const int slashPos = value.indexOf(QLatin1Char('/'));
    const QString number = (slashPos >= 0) ? value.left(slashPos) : value;
    return number.trimmed();
}
