#pragma once

#include "ITagSource.h"

class TagLibTagSource : public ITagSource {
public:
    std::optional<RawTags> readTags(const QString& filePath) const override;
    QString name() const override;
};
