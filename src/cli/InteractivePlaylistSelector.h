#pragma once

#include <QTextStream>
#include <QVector>

#include "library/PlaylistSelector.h"

// Asks on the console which playlists a track joins:
//   comma-separated numbers, "a" for the smart playlists, "n" for none.
// Unparseable input selects nothing for that track.
class InteractivePlaylistSelector : public IPlaylistSelector {
public:
    InteractivePlaylistSelector(const QString& playlistsDir,
                                SmartPlaylistSelector& autoSelector,
                                QTextStream& in,
                                QTextStream& out);

    QStringList selectPlaylists(const OrganizedTrack& track) override;

private:
    bool offerSamplePlaylists();
    QString prompt(const QString& question);

    QString m_playlistsDir;
    SmartPlaylistSelector& m_autoSelector;
    QTextStream& m_in;
    QTextStream& m_out;
};
