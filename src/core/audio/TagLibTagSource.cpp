#include "TagLibTagSource.h"

#include <QDebug>
#include <QFile>

#include <taglib/fileref.h>
#include <taglib/tag.h>
#include <taglib/taglib.h>
#include <taglib/tpropertymap.h>

namespace {

struct FieldMapping {
    const char* property;   // TagLib PropertyMap key
    const char* field;      // RawTags key
};

constexpr FieldMapping kFields[] = {
    { "TITLE",       "title" },
    { "ARTIST",      "artist" },
    { "ALBUM",       "album" },
    { "GENRE",       "genre" },
    { "BPM",         "bpm" },
    { "DATE",        "date" },
    { "TRACKNUMBER", "tracknumber" },
};

} // namespace

std::optional<RawTags> TagLibTagSource::readTags(const QString& filePath) const
{
    TagLib::FileRef f(QFile::encodeName(filePath).constData());
    if (f.isNull() || !f.file()->isValid())
        return std::nullopt;

    RawTags tags;
    TagLib::PropertyMap props = f.file()->properties();
    for (const FieldMapping& mapping : kFields) {
        if (!props.contains(mapping.property))
            continue;

        QStringList values;
        for (const TagLib::String& value : props[mapping.property])
            values.append(QString::fromStdString(value.to8Bit(true)));
        if (!values.isEmpty())
            tags.insert(QString::fromLatin1(mapping.field), values);
    }

    return tags;
}

QString TagLibTagSource::name() const
{
    return QStringLiteral("TagLib %1.%2.%3")
        .arg(TAGLIB_MAJOR_VERSION)
        .arg(TAGLIB_MINOR_VERSION)
        .arg(TAGLIB_PATCH_VERSION);
}
