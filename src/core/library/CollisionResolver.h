#pragma once

#include <QString>

// Picks a free name in the destination directory:
//   "name.ext" -> "name (1).ext" -> "name (2).ext" ...
//
// The check-then-use sequence assumes nobody else writes to the directory
// between resolve() and the move. Concurrent callers must serialize
// resolve + move per destination directory.
class CollisionResolver {
public:
    static QString resolve(const QString& desiredPath);

    // "dir/name (counter).ext"
    static QString candidate(const QString& desiredPath, int counter);

    // A dangling symlink counts as taken.
    static bool pathTaken(const QString& path);
};
