#pragma once

// ============================================================================
// MixerSettings - Persisted defaults for page operations
// ============================================================================
// Stored under QSettings("PdfMixer", "App"). Values are validated on load so
// a hand-edited or stale settings file can never produce an invalid job.
// Command-line options override these for a single run.
// ============================================================================

#include <QString>

class QSettings;

struct MixerSettings {
    // Image to PDF
    QString pageSize = QStringLiteral("A4");    ///< A4, A3, Letter or Legal
    double marginMm = 10.0;                     ///< 0..50
    int dpi = 300;                              ///< 72..600
    bool fitToPage = true;
    bool keepAspect = true;
    bool center = true;
    bool sortByName = true;

    // Page operations
    int rotateDegrees = 90;                     ///< Multiple of 90, never 0
    int splitSize = 10;                         ///< Pages per chunk, >= 1
    QString interleaveMode = QStringLiteral("alternate");

    // Output
    bool overwrite = false;

    static constexpr int MIN_DPI = 72;
    static constexpr int MAX_DPI = 600;
    static constexpr double MAX_MARGIN_MM = 50.0;

    /**
     * @brief Load from the application settings store.
     */
    static MixerSettings load();

    /**
     * @brief Load from an explicit store (tests use an INI file).
     */
    static MixerSettings load(QSettings& settings);

    void save() const;
    void save(QSettings& settings) const;

    /**
     * @brief Clamp or replace every out-of-range field with a valid value.
     */
    void validate();
};
