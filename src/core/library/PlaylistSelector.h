#pragma once

#include <QString>
#include <QStringList>
#include <QVector>

#include "../MusicData.h"
#include "RuleMatcher.h"

struct OrganizedTrack {
    TrackMetadata metadata;
    QString libraryPath;    // where the file lives now
};

// Decides which playlists a freshly organized track joins. The pipeline
// only sees this interface; automatic and interactive selection are two
// implementations of it.
class IPlaylistSelector {
public:
    virtual ~IPlaylistSelector() = default;

    // Absolute playlist file paths.
    virtual QStringList selectPlaylists(const OrganizedTrack& track) = 0;
};

// Every smart playlist whose rule matches, in playlist-name order.
class SmartPlaylistSelector : public IPlaylistSelector {
public:
    SmartPlaylistSelector(const QString& playlistsDir,
                          QVector<SmartPlaylistRule> rules,
                          const RuleMatcher& matcher = RuleMatcher());

    QStringList selectPlaylists(const OrganizedTrack& track) override;

    const QVector<SmartPlaylistRule>& rules() const { return m_rules; }
    QString playlistsDir() const { return m_playlistsDir; }

private:
    QString m_playlistsDir;
    QVector<SmartPlaylistRule> m_rules;
    RuleMatcher m_matcher;
};
