#pragma once

// ============================================================================
// PatternWindow - Main window: preview canvas plus the control panel
// ============================================================================
// Sliders are bound through ParameterMapper: while a slider is being dragged
// the value follows it continuously; on release (or on a keyboard step) the
// value is snapped and the handle is moved to the snapped position.
//
// Persistent preferences live in QSettings("PatternProof", "App"):
//   canvas/maxSize, export/defaultSize, export/defaultFormat,
//   mockups/directory, session/lastSnapshot
// ============================================================================

#include "core/PatternSession.h"
#include "export/PatternExporter.h"
#include "mockups/MockupLibrary.h"

#include <QMainWindow>

class QCheckBox;
class QComboBox;
class QLabel;
class QSlider;
class PatternViewport;

class PatternWindow : public QMainWindow
{
    Q_OBJECT

public:
    explicit PatternWindow(QWidget* parent = nullptr);
    ~PatternWindow() override;

    /// Load a pattern file into the session. Shows a message box on failure.
    bool openPatternFile(const QString& path);

    PatternSession& session() { return m_session; }

protected:
    void dragEnterEvent(QDragEnterEvent* event) override;
    void dropEvent(QDropEvent* event) override;
    void closeEvent(QCloseEvent* event) override;

private slots:
    void openPattern();
    void showExportDialog();
    void chooseMockupDirectory();
    void restoreLastSettings();
    void resetView();

    void onPatternChanged();
    void onScaleChanged(qreal scale);
    void onZoomChanged(qreal zoom);
    void onExportStarted(int size);
    void onExportFinished(const ExportResult& result);
    void onExportRejected(const ExportResult& result);

private:
    void setupUi();
    void setupMenus();
    QWidget* createControlPanel();
    void loadSettings();
    void saveSettings();

    // Slider handlers: continuous while dragged, snapped on release
    void onOffsetSlider(QSlider* slider, QLabel* label, bool horizontal, bool release);
    void onScaleSlider(bool release);
    void onZoomSlider(bool release);

    void updateValueLabels();
    void syncControlsFromState();

    PatternSession m_session;
    MockupLibrary m_mockups;
    PatternExporter m_exporter;

    PatternViewport* m_viewport = nullptr;

    QSlider* m_offsetXSlider = nullptr;
    QSlider* m_offsetYSlider = nullptr;
    QSlider* m_scaleSlider = nullptr;
    QSlider* m_zoomSlider = nullptr;
    QSlider* m_mockupZoomSlider = nullptr;
    QSlider* m_mockupRotateSlider = nullptr;

    QLabel* m_offsetXLabel = nullptr;
    QLabel* m_offsetYLabel = nullptr;
    QLabel* m_scaleLabel = nullptr;
    QLabel* m_zoomLabel = nullptr;
    QLabel* m_mockupZoomLabel = nullptr;
    QLabel* m_mockupRotateLabel = nullptr;

    QComboBox* m_qualityCombo = nullptr;
    QComboBox* m_repeatCombo = nullptr;
    QComboBox* m_viewModeCombo = nullptr;
    QComboBox* m_backgroundCombo = nullptr;
    QComboBox* m_gridCombo = nullptr;
    QCheckBox* m_seamlessCheck = nullptr;

    QAction* m_exportAction = nullptr;

    int m_defaultExportSize = ExportRequest::DEFAULT_CUSTOM_SIZE;
    ExportFormat m_defaultExportFormat = ExportFormat::Png;
    bool m_updatingControls = false;
};
