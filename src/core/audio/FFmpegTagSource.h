#pragma once

#include "ITagSource.h"

// Fallback for containers TagLib rejects. libavformat probes the content
// instead of trusting the file extension.
class FFmpegTagSource : public ITagSource {
public:
    FFmpegTagSource();

    std::optional<RawTags> readTags(const QString& filePath) const override;
    QString name() const override;
};
