// ============================================================================
// MixerSettings - Persisted defaults for page operations
// ============================================================================

#include "MixerSettings.h"
#include "PageTransforms.h"

#include <QDebug>
#include <QSettings>
#include <QStringList>

static const char* SETTINGS_GROUP = "Mixer";

MixerSettings MixerSettings::load()
{
    QSettings settings("PdfMixer", "App");
    return load(settings);
}

MixerSettings MixerSettings::load(QSettings& settings)
{
    MixerSettings defaults;
    MixerSettings result;

    settings.beginGroup(SETTINGS_GROUP);
    result.pageSize = settings.value("pageSize", defaults.pageSize).toString();
    result.marginMm = settings.value("marginMm", defaults.marginMm).toDouble();
    result.dpi = settings.value("dpi", defaults.dpi).toInt();
    result.fitToPage = settings.value("fitToPage", defaults.fitToPage).toBool();
    result.keepAspect = settings.value("keepAspect", defaults.keepAspect).toBool();
    result.center = settings.value("center", defaults.center).toBool();
    result.sortByName = settings.value("sortByName", defaults.sortByName).toBool();
    result.rotateDegrees = settings.value("rotateDegrees", defaults.rotateDegrees).toInt();
    result.splitSize = settings.value("splitSize", defaults.splitSize).toInt();
    result.interleaveMode = settings.value("interleaveMode", defaults.interleaveMode).toString();
    result.overwrite = settings.value("overwrite", defaults.overwrite).toBool();
    settings.endGroup();

    result.validate();
    return result;
}

void MixerSettings::save() const
{
    QSettings settings("PdfMixer", "App");
    save(settings);
}

void MixerSettings::save(QSettings& settings) const
{
    settings.beginGroup(SETTINGS_GROUP);
    settings.setValue("pageSize", pageSize);
    settings.setValue("marginMm", marginMm);
    settings.setValue("dpi", dpi);
    settings.setValue("fitToPage", fitToPage);
    settings.setValue("keepAspect", keepAspect);
    settings.setValue("center", center);
    settings.setValue("sortByName", sortByName);
    settings.setValue("rotateDegrees", rotateDegrees);
    settings.setValue("splitSize", splitSize);
    settings.setValue("interleaveMode", interleaveMode);
    settings.setValue("overwrite", overwrite);
    settings.endGroup();
}

void MixerSettings::validate()
{
    static const QStringList knownSizes = {
        QStringLiteral("A4"), QStringLiteral("A3"),
        QStringLiteral("Letter"), QStringLiteral("Legal")
    };

    bool matched = false;
    for (const QString& known : knownSizes) {
        if (pageSize.compare(known, Qt::CaseInsensitive) == 0) {
            pageSize = known;
            matched = true;
            break;
        }
    }
    if (!matched) {
        qWarning() << "[MixerSettings] Unknown page size" << pageSize << "- using A4";
        pageSize = QStringLiteral("A4");
    }

    dpi = qBound(MIN_DPI, dpi, MAX_DPI);
    marginMm = qBound(0.0, marginMm, MAX_MARGIN_MM);
    splitSize = qMax(1, splitSize);

    rotateDegrees = Page::normalizeRotation(rotateDegrees);
    if (rotateDegrees % 90 != 0 || rotateDegrees == 0) {
        rotateDegrees = 90;
    }

    bool ok = false;
    const PageOps::InterleaveMode mode = PageOps::interleaveModeFromName(interleaveMode, &ok);
    if (!ok) {
        qWarning() << "[MixerSettings] Unknown interleave mode" << interleaveMode;
    }
    interleaveMode = PageOps::interleaveModeName(mode);
}
