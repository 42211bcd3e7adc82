#pragma once

#include <QString>
#include <QStringList>

enum class MembershipResult {
    Added,
    AlreadyPresent,
    Failed
};

// Flat .m3u playlists: one absolute path per line, UTF-8, no header.
// Files only grow; nothing here truncates or reorders a playlist.
class PlaylistStore {
public:
    // Appends the file's absolute path unless a line (trimmed) already holds
    // it. Creates the playlist and its parent directories when missing.
    static MembershipResult ensureMembership(const QString& playlistPath,
                                             const QString& filePath,
                                             QString* errorMessage = nullptr);

    // Non-empty trimmed lines, in file order. Empty for a missing file.
    static QStringList entries(const QString& playlistPath);

    // *.m3u files in directory, absolute paths sorted by name.
    static QStringList discoverPlaylists(const QString& directory);

    // Leaves an existing playlist untouched.
    static bool createEmptyPlaylist(const QString& playlistPath, QString* errorMessage = nullptr);

    // Symlink-resolved absolute path, or the cleaned absolute path for a
    // file that does not exist.
    static QString entryPathFor(const QString& filePath);
};
