#pragma once
// rendering/snapshot_printer.hpp - Console readout of engine snapshots
//
// Prints each ring of a Snapshot as a boxed terminal panel.  Consumes
// Snapshots read-only; works on any POSIX terminal.

#include "engine/snapshot.hpp"
#include <ostream>
#include <string>

namespace chronoring {

// -----------------------------------------------------------------------
// SnapshotPrinter
// -----------------------------------------------------------------------
class SnapshotPrinter {
public:
    /// Width of the panel (characters)
    int viewport_w{72};

    /// Print the full panel: time rings, sun, rotation, pulsars.
    void renderSnapshot(std::ostream& out, const engine::Snapshot& snap) const;

    /// Print one line per pulsar with a phase bar.
    void renderPulsars(std::ostream& out, const engine::Snapshot& snap) const;

    /// One-line summary, used for compact tick output.
    std::string summaryLine(const engine::Snapshot& snap) const;

private:
    /// Map pulse intensity [0..1] to a glyph character.
    static char intensityGlyph(double intensity);

    /// Draw a horizontal separator line.
    static void hline(std::ostream& out, int w, char c = '-');
};

} // namespace chronoring
