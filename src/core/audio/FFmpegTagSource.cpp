#include "FFmpegTagSource.h"

extern "C" {
#include <libavformat/avformat.h>
#include <libavutil/dict.h>
#include <libavutil/log.h>
}

#include <QFile>
#include <QDebug>

// FFmpeg spells a few keys differently from the tag names used elsewhere.
static QString normalizedKey(const char* key)
{
    const QString lower = QString::fromUtf8(key).toLower();
    if (lower == QStringLiteral("track"))
        return QStringLiteral("tracknumber");
    if (lower == QStringLiteral("tbpm"))
        return QStringLiteral("bpm");
    return lower;
}

static void collectTags(AVDictionary* dict, RawTags& tags)
{
    AVDictionaryEntry* entry = nullptr;
    while ((entry = av_dict_get(dict, "", entry, AV_DICT_IGNORE_SUFFIX))) {
        const QString key = normalizedKey(entry->key);
        // Container-level tags win over stream-level duplicates
        if (tags.contains(key))
            continue;
        tags.insert(key, QStringList{ QString::fromUtf8(entry->value) });
    }
}

FFmpegTagSource::FFmpegTagSource()
{
    // Probing non-audio files is expected; keep libav quiet about it
    av_log_set_level(AV_LOG_ERROR);
}

std::optional<RawTags> FFmpegTagSource::readTags(const QString& filePath) const
{
    AVFormatContext* fmtCtx = nullptr;
    if (avformat_open_input(&fmtCtx, QFile::encodeName(filePath).constData(), nullptr, nullptr) < 0)
        return std::nullopt;

    if (avformat_find_stream_info(fmtCtx, nullptr) < 0) {
        avformat_close_input(&fmtCtx);
        return std::nullopt;
    }

    int audioIdx = av_find_best_stream(fmtCtx, AVMEDIA_TYPE_AUDIO, -1, -1, nullptr, 0);
    if (audioIdx < 0) {
        avformat_close_input(&fmtCtx);
        return std::nullopt;
    }

    RawTags tags;
    collectTags(fmtCtx->metadata, tags);
    // Ogg/Opus keep their comments on the stream rather than the container
    collectTags(fmtCtx->streams[audioIdx]->metadata, tags);

    avformat_close_input(&fmtCtx);
    return tags;
}

QString FFmpegTagSource::name() const
{
    const unsigned version = avformat_version();
    return QStringLiteral("libavformat %1.%2.%3")
        .arg(AV_VERSION_MAJOR(version))
        .arg(AV_VERSION_MINOR(version))
        .arg(AV_VERSION_MICRO(version));
}
