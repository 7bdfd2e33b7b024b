#ifndef SETTINGSMANAGER_H
#define SETTINGSMANAGER_H

#include <QObject>
#include <QSize>
#include <QString>

#include "backend/domain/scene/SceneTypes.h"

/**
 * SettingsManager
 * Persists user-tunable defaults of the composer.
 * Handles:
 * - Export target size and default file name
 * - Default layout parameters for new scenes
 * - Selection chrome (resize glyph size, resize hit tolerance)
 * - Default background color
 */
class SettingsManager : public QObject {
    Q_OBJECT

public:
    explicit SettingsManager(const QString& organization = QStringLiteral("Montage"),
                             const QString& application = QStringLiteral("Composer"),
                             QObject* parent = nullptr);
    ~SettingsManager() = default;

    // Settings persistence
    void loadSettings();
    void saveSettings();
    void resetToDefaults();

    // Getters
    QSize getExportSize() const { return m_exportSize; }
    QString getExportFileName() const { return m_exportFileName; }
    LayoutParameters getDefaultLayoutParameters() const { return m_layoutParameters; }
    qreal getResizeHandleSize() const { return m_resizeHandleSize; }
    qreal getResizeHitTolerance() const { return m_resizeHitTolerance; }
    QString getBackgroundColor() const { return m_backgroundColor; }

    // Setters
    void setExportSize(const QSize& size);
    void setExportFileName(const QString& fileName);
    void setDefaultLayoutParameters(const LayoutParameters& parameters);
    void setResizeHandleSize(qreal size);
    void setResizeHitTolerance(qreal tolerance);
    void setBackgroundColor(const QString& css);

signals:
    void settingsChanged();

private:
    QString m_organization;
    QString m_application;

    // Settings values
    QSize m_exportSize;
    QString m_exportFileName;
    LayoutParameters m_layoutParameters;
    qreal m_resizeHandleSize;
    qreal m_resizeHitTolerance;
    QString m_backgroundColor;
};

#endif // SETTINGSMANAGER_H
