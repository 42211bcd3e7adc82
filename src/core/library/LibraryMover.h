#pragma once

#include <QString>

struct MoveResult {
    bool ok = false;
    QString errorString;    // names the offending path
};

// Relocates a file into the library. Renames when source and destination
// share a volume, otherwise copies and removes the original once the copy
// is verified. On any failure the source file is left in place and an
// existing destination is never overwritten.
class LibraryMover {
public:
    static MoveResult move(const QString& sourcePath, const QString& destinationPath);

    // Cross-volume path of move(). The copy is checked against the source
    // size and removed again if the original cannot be deleted.
    static MoveResult copyThenRemove(const QString& sourcePath, const QString& destinationPath);
};
