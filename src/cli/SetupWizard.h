#pragma once

#include <QTextStream>

#include "Settings.h"

// First-run questions: music root, library folder, extra source folders.
// An empty answer keeps the current value.
class SetupWizard {
public:
    SetupWizard(QTextStream& in, QTextStream& out) : m_in(in), m_out(out) {}

    void run(OrganizerSettings& settings);

    static void printConfiguration(const OrganizerSettings& settings, QTextStream& out);

private:
    QString ask(const QString& question);

    QTextStream& m_in;
    QTextStream& m_out;
};
