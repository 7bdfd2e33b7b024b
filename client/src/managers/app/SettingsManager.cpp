#include "managers/app/SettingsManager.h"
#include "backend/domain/scene/SceneModel.h"
#include <QSettings>
#include <QDebug>

namespace {
    const QSize DEFAULT_EXPORT_SIZE(2000, 1500);
    const QString DEFAULT_EXPORT_FILE_NAME = "mockup.png";
    constexpr qreal DEFAULT_RESIZE_HANDLE_SIZE = 10.0;
    constexpr qreal DEFAULT_RESIZE_HIT_TOLERANCE = 12.0;
}

SettingsManager::SettingsManager(const QString& organization, const QString& application, QObject* parent)
    : QObject(parent)
    , m_organization(organization)
    , m_application(application)
    , m_exportSize(DEFAULT_EXPORT_SIZE)
    , m_exportFileName(DEFAULT_EXPORT_FILE_NAME)
    , m_resizeHandleSize(DEFAULT_RESIZE_HANDLE_SIZE)
    , m_resizeHitTolerance(DEFAULT_RESIZE_HIT_TOLERANCE)
    , m_backgroundColor(SceneDefaults::BACKGROUND_COLOR)
{
}

void SettingsManager::loadSettings() {
    QSettings settings(m_organization, m_application);
    const LayoutParameters defaults;

    const QSize size = settings.value("export/size", DEFAULT_EXPORT_SIZE).toSize();
    m_exportSize = size.isValid() && !size.isEmpty() ? size : DEFAULT_EXPORT_SIZE;
    m_exportFileName = settings.value("export/fileName", DEFAULT_EXPORT_FILE_NAME).toString();
    if (m_exportFileName.trimmed().isEmpty()) m_exportFileName = DEFAULT_EXPORT_FILE_NAME;

    settings.beginGroup("layout");
    const QString modeName = settings.value("mode", layoutModeToString(defaults.mode)).toString();
    const QString fitName = settings.value("fit", fitPolicyToString(defaults.fit)).toString();
    m_layoutParameters.mode = layoutModeFromString(modeName).value_or(defaults.mode);
    m_layoutParameters.fit = fitPolicyFromString(fitName).value_or(defaults.fit);
    m_layoutParameters.gap = settings.value("gap", defaults.gap).toDouble();
    m_layoutParameters.globalZoom = settings.value("globalZoom", defaults.globalZoom).toDouble();
    m_layoutParameters.focalZoom = settings.value("focalZoom", defaults.focalZoom).toDouble();
    m_layoutParameters.backdropBlur = settings.value("backdropBlur", defaults.backdropBlur).toDouble();
    m_layoutParameters.backdropOpacity = settings.value("backdropOpacity", defaults.backdropOpacity).toDouble();
    settings.endGroup();

    m_resizeHandleSize = settings.value("selection/handleSize", DEFAULT_RESIZE_HANDLE_SIZE).toDouble();
    m_resizeHitTolerance = settings.value("selection/hitTolerance", DEFAULT_RESIZE_HIT_TOLERANCE).toDouble();
    m_backgroundColor = settings.value("background/color", SceneDefaults::BACKGROUND_COLOR).toString();

    qDebug() << "SettingsManager: Settings loaded - export:" << m_exportSize << m_exportFileName
             << "layout:" << layoutModeToString(m_layoutParameters.mode)
             << "gap:" << m_layoutParameters.gap;
}

void SettingsManager::saveSettings() {
    QSettings settings(m_organization, m_application);
    settings.setValue("export/size", m_exportSize);
    settings.setValue("export/fileName", m_exportFileName);

    settings.beginGroup("layout");
    settings.setValue("mode", layoutModeToString(m_layoutParameters.mode));
    settings.setValue("fit", fitPolicyToString(m_layoutParameters.fit));
    settings.setValue("gap", m_layoutParameters.gap);
    settings.setValue("globalZoom", m_layoutParameters.globalZoom);
    settings.setValue("focalZoom", m_layoutParameters.focalZoom);
    settings.setValue("backdropBlur", m_layoutParameters.backdropBlur);
    settings.setValue("backdropOpacity", m_layoutParameters.backdropOpacity);
    settings.endGroup();

    settings.setValue("selection/handleSize", m_resizeHandleSize);
    settings.setValue("selection/hitTolerance", m_resizeHitTolerance);
    settings.setValue("background/color", m_backgroundColor);
    settings.sync();

    if (settings.status() != QSettings::NoError) {
        qWarning() << "SettingsManager: Failed to write settings to" << settings.fileName();
    } else {
        qDebug() << "SettingsManager: Settings saved";
    }
    emit settingsChanged();
}

void SettingsManager::resetToDefaults() {
    m_exportSize = DEFAULT_EXPORT_SIZE;
    m_exportFileName = DEFAULT_EXPORT_FILE_NAME;
    m_layoutParameters = LayoutParameters();
    m_resizeHandleSize = DEFAULT_RESIZE_HANDLE_SIZE;
    m_resizeHitTolerance = DEFAULT_RESIZE_HIT_TOLERANCE;
    m_backgroundColor = SceneDefaults::BACKGROUND_COLOR;
    saveSettings();
}

void SettingsManager::setExportSize(const QSize& size) {
    if (size.isEmpty()) {
        qWarning() << "SettingsManager: Ignoring empty export size" << size;
        return;
    }
    if (m_exportSize != size) {
        m_exportSize = size;
        saveSettings();
    }
}

void SettingsManager::setExportFileName(const QString& fileName) {
    const QString trimmed = fileName.trimmed();
    if (trimmed.isEmpty()) {
        qWarning() << "SettingsManager: Ignoring empty export file name";
        return;
    }
    if (m_exportFileName != trimmed) {
        m_exportFileName = trimmed;
        saveSettings();
    }
}

void SettingsManager::setDefaultLayoutParameters(const LayoutParameters& parameters) {
    m_layoutParameters = parameters;
    saveSettings();
}

void SettingsManager::setResizeHandleSize(qreal size) {
    if (size > 0.0 && m_resizeHandleSize != size) {
        m_resizeHandleSize = size;
        saveSettings();
    }
}

void SettingsManager::setResizeHitTolerance(qreal tolerance) {
    if (tolerance >= 0.0 && m_resizeHitTolerance != tolerance) {
        m_resizeHitTolerance = tolerance;
        saveSettings();
    }
}

void SettingsManager::setBackgroundColor(const QString& css) {
    if (m_backgroundColor != css) {
        m_backgroundColor = css;
        saveSettings();
    }
}
