// rendering/snapshot_printer.cpp
#include "rendering/snapshot_printer.hpp"
#include "calendar/hebrew_calendar.hpp"
#include <iomanip>
#include <sstream>
#include <cmath>
#include <algorithm>

namespace chronoring {

namespace {

std::string fmtd(double v, int prec = 2) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(prec) << v;
    return ss.str();
}

std::string fmtMicros(Duration d) {
    return fmtd(static_cast<double>(d.count()) / 1000.0, 3) + " ms";
}

} // anonymous namespace

// -----------------------------------------------------------------------
// Glyph table: . + * o @  (index 0 = off-pulse)
// -----------------------------------------------------------------------
char SnapshotPrinter::intensityGlyph(double intensity) {
    if (intensity < 0.05) return '.';
    if (intensity < 0.25) return '+';
    if (intensity < 0.50) return '*';
    if (intensity < 0.80) return 'o';
    return '@';
}

void SnapshotPrinter::hline(std::ostream& out, int w, char c) {
    out << '+';
    for (int i = 0; i < w - 2; ++i) out << c;
    out << '+' << '\n';
}

// -----------------------------------------------------------------------
// renderSnapshot
// -----------------------------------------------------------------------
void SnapshotPrinter::renderSnapshot(std::ostream& out,
                                     const engine::Snapshot& snap) const {
    auto row = [&](const std::string& lbl, const std::string& val) {
        out << "| " << std::left << std::setw(20) << lbl
            << " : " << std::left << std::setw(viewport_w - 26) << val
            << "|\n";
    };

    hline(out, viewport_w, '=');
    out << "| CHRONORING  tick #" << std::left << std::setw(viewport_w - 21)
        << snap.sequence << "|\n";
    hline(out, viewport_w, '-');

    // Atomic ring
    const auto& at = snap.atomic;
    row("Local time", timing::LocalClock::format(snap.local));
    row("Sync", std::string(timing::to_string(at.status)) +
                (at.last_server.empty() ? "" : " via " + at.last_server));
    row("Offset", fmtMicros(at.applied_offset));
    if (at.last_round_trip) row("Round trip", fmtMicros(*at.last_round_trip));
    row("Hands h/m/s", fmtd(snap.local.hour_hand_deg, 1) + " / "
                       + fmtd(snap.local.minute_hand_deg, 1) + " / "
                       + fmtd(snap.local.second_hand_deg, 1) + " deg");
    hline(out, viewport_w, '-');

    // Hebrew ring
    if (snap.hebrew.date) {
        const auto& hd = *snap.hebrew.date;
        row("Hebrew date", std::to_string(hd.day) + " "
                           + std::string(snap.hebrew.month_name) + " "
                           + std::to_string(hd.year));
        row("Year", std::string(hd.leap_year ? "leap, " : "common, ")
                    + std::to_string(hd.days_in_year) + " days ("
                    + fmtd(snap.hebrew.year_progress * 100.0, 1) + "%)");
        if (snap.hebrew.holiday) row("Festival", std::string(*snap.hebrew.holiday));
    } else {
        row("Hebrew date", "unavailable ("
                           + std::string(snap.hebrew.error ? to_string(*snap.hebrew.error) : "unknown")
                           + ")");
    }
    hline(out, viewport_w, '-');

    // Sun
    const auto& sun = snap.solar;
    row("Ecliptic longitude", fmtd(sun.ecliptic_longitude_deg, 3) + " deg");
    row("RA / Dec", fmtd(sun.right_ascension_deg, 3) + " / "
                    + fmtd(sun.declination_deg, 3) + " deg");
    row("Distance", fmtd(sun.distance_au, 5) + " AU");
    row("Season", std::string(astro::to_string(sun.season)) + " ("
                  + fmtd(sun.season_progress * 100.0, 1) + "%)");
    row("Zodiac", std::string(astro::to_string(sun.zodiac)) + " ("
                  + fmtd(sun.zodiac_progress * 100.0, 1) + "%)");
    hline(out, viewport_w, '-');

    // Earth rotation
    const auto& rot = snap.rotation;
    row("Subsolar point", fmtd(rot.subsolar_latitude_deg, 2) + ", "
                          + fmtd(rot.subsolar_longitude_deg, 2) + " deg");
    row("Rotation angle", fmtd(rot.local_rotation_angle_deg, 2) + " deg");
    row("Sidereal angle", fmtd(rot.sidereal_angle_deg, 2) + " deg");
    row("Sun altitude", fmtd(rot.sun_altitude_deg, 2) + " deg ("
                        + (rot.is_daytime ? "day" : "night") + ")");
    row("Daylight", fmtd(rot.day_fraction_visible * 24.0, 2) + " h");
    hline(out, viewport_w, '-');

    renderPulsars(out, snap);
    hline(out, viewport_w, '=');
}

// -----------------------------------------------------------------------
// renderPulsars
// -----------------------------------------------------------------------
void SnapshotPrinter::renderPulsars(std::ostream& out,
                                    const engine::Snapshot& snap) const {
    constexpr int kBarWidth = 20;
    const int name_w = std::max(8, viewport_w - kBarWidth - 30);

    for (const auto& p : snap.pulsars) {
        // Phase bar: marker at the current phase, glyph shows intensity
        std::string bar(kBarWidth, '-');
        const int pos = std::clamp(static_cast<int>(p.current_phase * kBarWidth), 0, kBarWidth - 1);
        bar[static_cast<std::size_t>(pos)] = intensityGlyph(p.intensity);

        std::string name = p.display_name;
        if (static_cast<int>(name.size()) > name_w) name.resize(static_cast<std::size_t>(name_w));

        out << "| " << std::left << std::setw(name_w) << name
            << " [" << bar << "] "
            << std::right << std::setw(5) << fmtd(p.current_phase, 3)
            << (p.pulsed ? " *" : "  ")
            << std::setw(4) << std::min<u64>(p.pulses_in_interval, 999)
            << std::setw(viewport_w - name_w - kBarWidth - 18) << "" << "|\n";
    }
}

std::string SnapshotPrinter::summaryLine(const engine::Snapshot& snap) const {
    std::ostringstream ss;
    ss << '#' << snap.sequence << ' ' << timing::LocalClock::format(snap.local)
       << " [" << timing::to_string(snap.atomic.status) << "] sun "
       << fmtd(snap.solar.ecliptic_longitude_deg, 2) << " deg";
    if (snap.hebrew.date) {
        ss << ", " << snap.hebrew.date->day << ' ' << snap.hebrew.month_name
           << ' ' << snap.hebrew.date->year;
    }
    return ss.str();
}

} // namespace chronoring
