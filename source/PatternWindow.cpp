#include "PatternWindow.h"
#include "core/ParameterMapper.h"
#include "core/SettingsSnapshot.h"
#include "viewport/PatternViewport.h"

#include <QAction>
#include <QApplication>
#include <QCheckBox>
#include <QCloseEvent>
#include <QColorDialog>
#include <QComboBox>
#include <QCoreApplication>
#include <QDebug>
#include <QDialog>
#include <QDialogButtonBox>
#include <QDir>
#include <QDockWidget>
#include <QDragEnterEvent>
#include <QDropEvent>
#include <QFile>
#include <QFileDialog>
#include <QFileInfo>
#include <QFormLayout>
#include <QHBoxLayout>
#include <QImageReader>
#include <QLabel>
#include <QMenuBar>
#include <QMessageBox>
#include <QMimeData>
#include <QPushButton>
#include <QSettings>
#include <QSignalBlocker>
#include <QSlider>
#include <QSpinBox>
#include <QStatusBar>
#include <QToolBar>
#include <QUrl>
#include <QVBoxLayout>

namespace {

const int QUALITY_PRESETS[] = {800, 1200, 1600, 2000};
const int EXPORT_PRESETS[] = {1200, 2400, 3600, 4800};
const int GRID_SIZES[] = {0, 1, 2, 6, 12};

QString defaultMockupDirectory()
{
    return QDir(QCoreApplication::applicationDirPath()).filePath(QStringLiteral("mockups"));
}

QSlider* makeSlider(int min, int max, int value, QWidget* parent)
{
    QSlider* slider = new QSlider(Qt::Horizontal, parent);
    slider->setRange(min, max);
    slider->setValue(value);
    return slider;
}

} // namespace

PatternWindow::PatternWindow(QWidget* parent)
    : QMainWindow(parent)
    , m_exporter(m_session)
{
    setWindowTitle(tr("PatternProof"));
    setAcceptDrops(true);

    loadSettings();
    setupUi();
    setupMenus();

    connect(&m_session, &PatternSession::patternChanged, this, &PatternWindow::onPatternChanged);
    connect(&m_session, &PatternSession::scaleChanged, this, &PatternWindow::onScaleChanged);
    connect(&m_session, &PatternSession::zoomChanged, this, &PatternWindow::onZoomChanged);
    connect(&m_exporter, &PatternExporter::exportStarted, this, &PatternWindow::onExportStarted);
    connect(&m_exporter, &PatternExporter::exportFinished, this, &PatternWindow::onExportFinished);
    connect(&m_exporter, &PatternExporter::exportRejected, this, &PatternWindow::onExportRejected);

    syncControlsFromState();
    onPatternChanged();
    resize(1400, 900);
}

PatternWindow::~PatternWindow() = default;

// ============================================================================
// Settings
// ============================================================================

void PatternWindow::loadSettings()
{
    QSettings settings("PatternProof", "App");

    m_session.setMaxCanvasSize(settings.value("canvas/maxSize", RenderState::DEFAULT_CANVAS_SIZE).toInt());

    m_defaultExportSize = qBound(ExportRequest::MIN_SIZE,
                                 settings.value("export/defaultSize", ExportRequest::DEFAULT_CUSTOM_SIZE).toInt(),
                                 ExportRequest::MAX_SIZE);
    m_defaultExportFormat = exportFormatFromString(settings.value("export/defaultFormat", "png").toString());

    const QString mockupDir = settings.value("mockups/directory", defaultMockupDirectory()).toString();
    m_mockups.loadFromDirectory(mockupDir);
}

void PatternWindow::saveSettings()
{
    QSettings settings("PatternProof", "App");
    settings.setValue("canvas/maxSize", m_session.state().maxCanvasSize());
    settings.setValue("export/defaultSize", m_defaultExportSize);
    settings.setValue("export/defaultFormat", exportFormatToString(m_defaultExportFormat));
    settings.setValue("mockups/directory", m_mockups.directory());
    if (m_session.hasPattern()) {
        settings.setValue("session/lastSnapshot",
                          QString::fromUtf8(SettingsSnapshot::capture(m_session.state()).toJsonBytes()));
    }
}

void PatternWindow::restoreLastSettings()
{
    QSettings settings("PatternProof", "App");
    const QString json = settings.value("session/lastSnapshot").toString();
    if (json.isEmpty()) {
        statusBar()->showMessage(tr("No saved settings"), 3000);
        return;
    }

    bool ok = false;
    const SettingsSnapshot snapshot = SettingsSnapshot::fromJsonBytes(json.toUtf8(), &ok);
    if (!ok) {
        statusBar()->showMessage(tr("Saved settings are unreadable"), 3000);
        return;
    }

    snapshot.applyTo(m_session);
    syncControlsFromState();
    statusBar()->showMessage(tr("Settings restored"), 3000);
}

void PatternWindow::closeEvent(QCloseEvent* event)
{
    m_exporter.cancel();
    saveSettings();
    event->accept();
}

// ============================================================================
// UI setup
// ============================================================================

void PatternWindow::setupUi()
{
    m_viewport = new PatternViewport(m_session, m_mockups, this);
    setCentralWidget(m_viewport);
    connect(m_viewport, &PatternViewport::openPatternRequested, this, &PatternWindow::openPattern);

    QDockWidget* dock = new QDockWidget(tr("Controls"), this);
    dock->setObjectName("controlsDock");
    dock->setFeatures(QDockWidget::DockWidgetMovable);
    dock->setWidget(createControlPanel());
    addDockWidget(Qt::RightDockWidgetArea, dock);
}

void PatternWindow::setupMenus()
{
    QAction* openAction = new QAction(tr("&Open Pattern..."), this);
    openAction->setShortcut(QKeySequence::Open);
    connect(openAction, &QAction::triggered, this, &PatternWindow::openPattern);

    m_exportAction = new QAction(tr("&Export..."), this);
    m_exportAction->setShortcut(QKeySequence(Qt::CTRL | Qt::Key_E));
    connect(m_exportAction, &QAction::triggered, this, &PatternWindow::showExportDialog);

    QAction* mockupDirAction = new QAction(tr("Choose &Mockup Folder..."), this);
    connect(mockupDirAction, &QAction::triggered, this, &PatternWindow::chooseMockupDirectory);

    QAction* restoreAction = new QAction(tr("&Restore Last Settings"), this);
    connect(restoreAction, &QAction::triggered, this, &PatternWindow::restoreLastSettings);

    QAction* resetAction = new QAction(tr("Reset &View"), this);
    resetAction->setShortcut(QKeySequence(Qt::CTRL | Qt::Key_0));
    connect(resetAction, &QAction::triggered, this, &PatternWindow::resetView);

    QAction* quitAction = new QAction(tr("&Quit"), this);
    quitAction->setShortcut(QKeySequence::Quit);
    connect(quitAction, &QAction::triggered, this, &QWidget::close);

    QMenu* fileMenu = menuBar()->addMenu(tr("&File"));
    fileMenu->addAction(openAction);
    fileMenu->addAction(m_exportAction);
    fileMenu->addSeparator();
    fileMenu->addAction(mockupDirAction);
    fileMenu->addSeparator();
    fileMenu->addAction(quitAction);

    QMenu* viewMenu = menuBar()->addMenu(tr("&View"));
    viewMenu->addAction(resetAction);
    viewMenu->addAction(restoreAction);

    QToolBar* toolbar = addToolBar(tr("Main"));
    toolbar->setObjectName("mainToolbar");
    toolbar->setMovable(false);
    toolbar->addAction(openAction);
    toolbar->addAction(m_exportAction);
}

QWidget* PatternWindow::createControlPanel()
{
    QWidget* panel = new QWidget(this);
    QFormLayout* form = new QFormLayout(panel);

    auto sliderRow = [panel](QSlider* slider, QLabel*& label) {
        QWidget* row = new QWidget(panel);
        QHBoxLayout* layout = new QHBoxLayout(row);
        layout->setContentsMargins(0, 0, 0, 0);
        label = new QLabel(row);
        label->setMinimumWidth(48);
        label->setAlignment(Qt::AlignRight | Qt::AlignVCenter);
        layout->addWidget(slider, 1);
        layout->addWidget(label);
        return row;
    };

    // ----- Canvas quality -----
    m_qualityCombo = new QComboBox(panel);
    for (int size : QUALITY_PRESETS) {
        m_qualityCombo->addItem(tr("%1 px").arg(size), size);
    }
    connect(m_qualityCombo, QOverload<int>::of(&QComboBox::currentIndexChanged), this, [this](int index) {
        if (m_updatingControls || index < 0) return;
        m_session.setMaxCanvasSize(m_qualityCombo->itemData(index).toInt());
    });
    form->addRow(tr("Canvas quality"), m_qualityCombo);

    // ----- Repeat type -----
    m_repeatCombo = new QComboBox(panel);
    m_repeatCombo->addItem(tr("Full drop"), repeatTypeToString(RepeatType::Full));
    m_repeatCombo->addItem(tr("Half drop"), repeatTypeToString(RepeatType::HalfDrop));
    m_repeatCombo->addItem(tr("Brick"), repeatTypeToString(RepeatType::Brick));
    connect(m_repeatCombo, QOverload<int>::of(&QComboBox::currentIndexChanged), this, [this](int index) {
        if (m_updatingControls || index < 0) return;
        m_session.setRepeatType(repeatTypeFromString(m_repeatCombo->itemData(index).toString()));
    });
    form->addRow(tr("Repeat"), m_repeatCombo);

    // ----- View mode -----
    m_viewModeCombo = new QComboBox(panel);
    m_viewModeCombo->addItem(tr("Tile"), viewModeToString(ViewMode::tile()));
    m_viewModeCombo->addItem(tr("Tile + grid"), viewModeToString(ViewMode::tileGrid()));
    for (MockupKind kind : ALL_MOCKUP_KINDS) {
        m_viewModeCombo->addItem(mockupLabel(kind), viewModeToString(ViewMode::forMockup(kind)));
    }
    m_viewModeCombo->addItem(tr("Fabric swatch"), viewModeToString(ViewMode::fabric()));
    connect(m_viewModeCombo, QOverload<int>::of(&QComboBox::currentIndexChanged), this, [this](int index) {
        if (m_updatingControls || index < 0) return;
        m_session.setViewMode(viewModeFromString(m_viewModeCombo->itemData(index).toString()));
    });
    form->addRow(tr("View"), m_viewModeCombo);

    // ----- Background -----
    m_backgroundCombo = new QComboBox(panel);
    m_backgroundCombo->addItem(tr("Checker"), QStringLiteral("checker"));
    m_backgroundCombo->addItem(tr("Black"), QStringLiteral("#000000"));
    m_backgroundCombo->addItem(tr("White"), QStringLiteral("#ffffff"));
    m_backgroundCombo->addItem(tr("Custom..."), QString());
    connect(m_backgroundCombo, QOverload<int>::of(&QComboBox::currentIndexChanged), this, [this](int index) {
        if (m_updatingControls || index < 0) return;
        QString value = m_backgroundCombo->itemData(index).toString();
        if (value.isEmpty()) {
            const QColor initial = m_session.state().background().isChecker()
                ? QColor(Qt::white) : m_session.state().background().color();
            const QColor color = QColorDialog::getColor(initial, this, tr("Background colour"));
            if (!color.isValid()) {
                syncControlsFromState();
                return;
            }
            m_session.setBackground(Background::solid(color));
            return;
        }
        m_session.setBackground(Background::fromString(value));
    });
    form->addRow(tr("Background"), m_backgroundCombo);

    // ----- Measurement grid -----
    m_gridCombo = new QComboBox(panel);
    for (int inches : GRID_SIZES) {
        m_gridCombo->addItem(inches == 0 ? tr("Off") : tr("%n inch(es)", nullptr, inches), inches);
    }
    connect(m_gridCombo, QOverload<int>::of(&QComboBox::currentIndexChanged), this, [this](int index) {
        if (m_updatingControls || index < 0) return;
        m_session.setGridOverlaySize(m_gridCombo->itemData(index).toInt());
    });
    form->addRow(tr("Measurement grid"), m_gridCombo);

    // ----- Seamless test -----
    m_seamlessCheck = new QCheckBox(tr("Outline tile edges"), panel);
    connect(m_seamlessCheck, &QCheckBox::toggled, this, [this](bool checked) {
        if (m_updatingControls) return;
        m_session.setSeamlessTestMode(checked);
    });
    form->addRow(tr("Seamless test"), m_seamlessCheck);

    // ----- Offsets -----
    m_offsetXSlider = makeSlider(0, 100, 0, panel);
    m_offsetYSlider = makeSlider(0, 100, 0, panel);
    form->addRow(tr("Offset X"), sliderRow(m_offsetXSlider, m_offsetXLabel));
    form->addRow(tr("Offset Y"), sliderRow(m_offsetYSlider, m_offsetYLabel));

    connect(m_offsetXSlider, &QSlider::valueChanged, this, [this]() {
        onOffsetSlider(m_offsetXSlider, m_offsetXLabel, true, !m_offsetXSlider->isSliderDown());
    });
    connect(m_offsetXSlider, &QSlider::sliderReleased, this, [this]() {
        onOffsetSlider(m_offsetXSlider, m_offsetXLabel, true, true);
    });
    connect(m_offsetYSlider, &QSlider::valueChanged, this, [this]() {
        onOffsetSlider(m_offsetYSlider, m_offsetYLabel, false, !m_offsetYSlider->isSliderDown());
    });
    connect(m_offsetYSlider, &QSlider::sliderReleased, this, [this]() {
        onOffsetSlider(m_offsetYSlider, m_offsetYLabel, false, true);
    });

    // ----- Scale / zoom -----
    m_scaleSlider = makeSlider(ParameterMapper::SLIDER_MIN, ParameterMapper::SLIDER_MAX,
                               ParameterMapper::SLIDER_MID, panel);
    m_zoomSlider = makeSlider(ParameterMapper::SLIDER_MIN, ParameterMapper::SLIDER_MAX,
                              ParameterMapper::SLIDER_MID, panel);
    form->addRow(tr("Scale"), sliderRow(m_scaleSlider, m_scaleLabel));
    form->addRow(tr("Zoom"), sliderRow(m_zoomSlider, m_zoomLabel));

    connect(m_scaleSlider, &QSlider::valueChanged, this, [this]() {
        onScaleSlider(!m_scaleSlider->isSliderDown());
    });
    connect(m_scaleSlider, &QSlider::sliderReleased, this, [this]() { onScaleSlider(true); });
    connect(m_zoomSlider, &QSlider::valueChanged, this, [this]() {
        onZoomSlider(!m_zoomSlider->isSliderDown());
    });
    connect(m_zoomSlider, &QSlider::sliderReleased, this, [this]() { onZoomSlider(true); });

    // ----- Mockup zoom / rotate (not snapped) -----
    m_mockupZoomSlider = makeSlider(100, 150, 100, panel);
    m_mockupRotateSlider = makeSlider(0, 360, 0, panel);
    form->addRow(tr("Mockup zoom"), sliderRow(m_mockupZoomSlider, m_mockupZoomLabel));
    form->addRow(tr("Mockup rotate"), sliderRow(m_mockupRotateSlider, m_mockupRotateLabel));

    connect(m_mockupZoomSlider, &QSlider::valueChanged, this, [this](int value) {
        if (m_updatingControls) return;
        m_session.setMockupZoom(value / 100.0);
        updateValueLabels();
    });
    connect(m_mockupRotateSlider, &QSlider::valueChanged, this, [this](int value) {
        if (m_updatingControls) return;
        m_session.setMockupRotate(value);
        updateValueLabels();
    });

    return panel;
}

// ============================================================================
// Slider binding
// ============================================================================

void PatternWindow::onOffsetSlider(QSlider* slider, QLabel* label, bool horizontal, bool release)
{
    if (m_updatingControls) return;

    int percent = slider->value();
    if (release) {
        const ParameterMapper::SnappedValue snapped = ParameterMapper::releaseOffset(percent);
        percent = snapped.sliderPosition;
        QSignalBlocker blocker(slider);
        slider->setValue(snapped.sliderPosition);
    }

    if (horizontal) {
        m_session.setOffsetPercentX(percent / 100.0);
    } else {
        m_session.setOffsetPercentY(percent / 100.0);
    }
    // The label shows the slider (100% stays 100% even though the offset wraps to 0)
    label->setText(tr("%1%").arg(percent));
}

void PatternWindow::onScaleSlider(bool release)
{
    if (m_updatingControls) return;

    m_updatingControls = true;
    if (release) {
        const ParameterMapper::SnappedValue snapped = ParameterMapper::releaseScale(m_scaleSlider->value());
        m_scaleSlider->setValue(snapped.sliderPosition);
        m_session.setScale(snapped.value);
    } else {
        m_session.setScale(ParameterMapper::scaleFromSlider(m_scaleSlider->value()));
    }
    m_updatingControls = false;
    updateValueLabels();
}

void PatternWindow::onZoomSlider(bool release)
{
    if (m_updatingControls) return;

    m_updatingControls = true;
    if (release) {
        const ParameterMapper::SnappedValue snapped = ParameterMapper::releaseZoom(m_zoomSlider->value());
        m_zoomSlider->setValue(snapped.sliderPosition);
        m_session.setZoom(snapped.value);
    } else {
        m_session.setZoom(ParameterMapper::zoomFromSlider(m_zoomSlider->value()));
    }
    m_updatingControls = false;
    updateValueLabels();
}

void PatternWindow::onScaleChanged(qreal scale)
{
    if (m_updatingControls) return;
    QSignalBlocker blocker(m_scaleSlider);
    m_scaleSlider->setValue(ParameterMapper::sliderFromScale(scale));
    updateValueLabels();
}

void PatternWindow::onZoomChanged(qreal zoom)
{
    if (m_updatingControls) return;
    QSignalBlocker blocker(m_zoomSlider);
    m_zoomSlider->setValue(ParameterMapper::sliderFromZoom(zoom));
    updateValueLabels();
}

void PatternWindow::updateValueLabels()
{
    const RenderState& state = m_session.state();
    m_scaleLabel->setText(QString::number(state.scale(), 'f', 2) + QChar(0x00D7));
    m_zoomLabel->setText(tr("%1%").arg(ParameterMapper::zoomPercent(state.zoom())));
    m_offsetXLabel->setText(tr("%1%").arg(m_offsetXSlider->value()));
    m_offsetYLabel->setText(tr("%1%").arg(m_offsetYSlider->value()));
    m_mockupZoomLabel->setText(tr("%1%").arg(m_mockupZoomSlider->value()));
    m_mockupRotateLabel->setText(QString::number(m_mockupRotateSlider->value()) + QChar(0x00B0));
}

void PatternWindow::syncControlsFromState()
{
    const RenderState& state = m_session.state();
    m_updatingControls = true;

    m_scaleSlider->setValue(ParameterMapper::sliderFromScale(state.scale()));
    m_zoomSlider->setValue(ParameterMapper::sliderFromZoom(state.zoom()));
    m_offsetXSlider->setValue(qRound(state.offsetPercentX() * 100.0));
    m_offsetYSlider->setValue(qRound(state.offsetPercentY() * 100.0));
    m_mockupZoomSlider->setValue(qRound(state.mockupZoom() * 100.0));
    m_mockupRotateSlider->setValue(qRound(state.mockupRotate()));

    m_qualityCombo->setCurrentIndex(qMax(0, m_qualityCombo->findData(state.maxCanvasSize())));
    m_repeatCombo->setCurrentIndex(qMax(0, m_repeatCombo->findData(repeatTypeToString(state.repeatType()))));
    m_viewModeCombo->setCurrentIndex(qMax(0, m_viewModeCombo->findData(viewModeToString(state.viewMode()))));
    m_gridCombo->setCurrentIndex(qMax(0, m_gridCombo->findData(state.gridOverlaySize())));
    m_seamlessCheck->setChecked(state.seamlessTestMode());

    int bgIndex = m_backgroundCombo->findData(state.background().toString());
    if (bgIndex < 0) {
        bgIndex = m_backgroundCombo->count() - 1;  // Custom
    }
    m_backgroundCombo->setCurrentIndex(bgIndex);

    m_updatingControls = false;
    updateValueLabels();
}

void PatternWindow::resetView()
{
    m_session.setZoomAndPan(1.0, QPointF(0, 0));
    syncControlsFromState();
}

// ============================================================================
// Pattern loading
// ============================================================================

bool PatternWindow::openPatternFile(const QString& path)
{
    PatternImagePtr pattern = PatternImage::loadFromFile(path);
    if (!pattern) {
        QMessageBox::warning(this, tr("Open Pattern"),
                             tr("Could not read an image from\n%1").arg(QDir::toNativeSeparators(path)));
        return false;
    }

    m_session.setPattern(pattern);
    statusBar()->showMessage(tr("%1 (%2 x %3)")
                                 .arg(QFileInfo(path).fileName())
                                 .arg(pattern->width())
                                 .arg(pattern->height()), 5000);
    return true;
}

void PatternWindow::openPattern()
{
    QStringList filters;
    for (const QByteArray& format : QImageReader::supportedImageFormats()) {
        filters << QStringLiteral("*.%1").arg(QString::fromLatin1(format));
    }

    const QString path = QFileDialog::getOpenFileName(
        this, tr("Open Pattern"), QString(),
        tr("Images (%1)").arg(filters.join(QLatin1Char(' '))));
    if (!path.isEmpty()) {
        openPatternFile(path);
    }
}

void PatternWindow::onPatternChanged()
{
    m_exportAction->setEnabled(m_session.hasPattern() && !m_exporter.isExporting());
}

void PatternWindow::dragEnterEvent(QDragEnterEvent* event)
{
    const QMimeData* mime = event->mimeData();
    if (mime->hasImage() || (mime->hasUrls() && !mime->urls().isEmpty() && mime->urls().first().isLocalFile())) {
        event->acceptProposedAction();
        return;
    }
    event->ignore();
}

void PatternWindow::dropEvent(QDropEvent* event)
{
    const QMimeData* mime = event->mimeData();
    if (mime->hasUrls() && !mime->urls().isEmpty() && mime->urls().first().isLocalFile()) {
        openPatternFile(mime->urls().first().toLocalFile());
        event->acceptProposedAction();
        return;
    }

    if (mime->hasImage()) {
        PatternImagePtr pattern = PatternImage::fromImage(qvariant_cast<QImage>(mime->imageData()));
        if (pattern) {
            m_session.setPattern(pattern);
            event->acceptProposedAction();
            return;
        }
    }
    event->ignore();
}

void PatternWindow::chooseMockupDirectory()
{
    const QString dir = QFileDialog::getExistingDirectory(this, tr("Mockup Folder"), m_mockups.directory());
    if (dir.isEmpty()) {
        return;
    }

    m_mockups.clear();
    const int loaded = m_mockups.loadFromDirectory(dir);
    statusBar()->showMessage(tr("Loaded %1 of %2 mockups").arg(loaded).arg(static_cast<int>(ALL_MOCKUP_KINDS.size())), 5000);
    m_viewport->update();
}

// ============================================================================
// Export
// ============================================================================

void PatternWindow::showExportDialog()
{
    if (!m_session.hasPattern()) {
        return;
    }

    QDialog dialog(this);
    dialog.setWindowTitle(tr("Export Pattern"));
    QFormLayout* form = new QFormLayout(&dialog);

    const int current = m_session.state().maxCanvasSize();
    QComboBox* sizeCombo = new QComboBox(&dialog);
    sizeCombo->addItem(tr("Current canvas (%1 px)").arg(current), current);
    for (int size : EXPORT_PRESETS) {
        sizeCombo->addItem(tr("%1 px").arg(size), size);
    }
    sizeCombo->addItem(tr("Custom"), 0);

    QSpinBox* customSize = new QSpinBox(&dialog);
    customSize->setRange(ExportRequest::MIN_SIZE, ExportRequest::MAX_SIZE);
    customSize->setSuffix(tr(" px"));
    customSize->setValue(m_defaultExportSize);
    customSize->setEnabled(false);
    connect(sizeCombo, QOverload<int>::of(&QComboBox::currentIndexChanged), customSize, [sizeCombo, customSize](int) {
        customSize->setEnabled(sizeCombo->currentData().toInt() == 0);
    });

    QComboBox* formatCombo = new QComboBox(&dialog);
    formatCombo->addItem(tr("PNG"), exportFormatToString(ExportFormat::Png));
    formatCombo->addItem(tr("JPEG"), exportFormatToString(ExportFormat::Jpg));
    formatCombo->setCurrentIndex(m_defaultExportFormat == ExportFormat::Jpg ? 1 : 0);

    QDialogButtonBox* buttons = new QDialogButtonBox(QDialogButtonBox::Ok | QDialogButtonBox::Cancel, &dialog);
    buttons->button(QDialogButtonBox::Ok)->setText(tr("Export"));
    connect(buttons, &QDialogButtonBox::accepted, &dialog, &QDialog::accept);
    connect(buttons, &QDialogButtonBox::rejected, &dialog, &QDialog::reject);

    form->addRow(tr("Resolution"), sizeCombo);
    form->addRow(tr("Custom size"), customSize);
    form->addRow(tr("Format"), formatCombo);
    form->addRow(buttons);

    if (dialog.exec() != QDialog::Accepted) {
        return;
    }

    ExportRequest request;
    request.size = sizeCombo->currentData().toInt();
    if (request.size == 0) {
        request.size = customSize->value();
        m_defaultExportSize = request.size;
    }
    request.format = exportFormatFromString(formatCombo->currentData().toString());
    m_defaultExportFormat = request.format;

    m_exporter.requestExport(request);
}

void PatternWindow::onExportStarted(int size)
{
    m_exportAction->setEnabled(false);
    statusBar()->showMessage(tr("Exporting %1 px...").arg(size));
    QApplication::setOverrideCursor(Qt::WaitCursor);
}

void PatternWindow::onExportFinished(const ExportResult& result)
{
    QApplication::restoreOverrideCursor();
    onPatternChanged();

    if (!result.succeeded()) {
        statusBar()->clearMessage();
        if (result.status != ExportStatus::Cancelled) {
            QMessageBox::warning(this, tr("Export Pattern"), tr("Export failed: %1").arg(result.message));
        }
        return;
    }

    const QString path = QFileDialog::getSaveFileName(
        this, tr("Save Export"), result.suggestedFileName(),
        result.request.format == ExportFormat::Jpg ? tr("JPEG (*.jpg)") : tr("PNG (*.png)"));
    if (path.isEmpty()) {
        statusBar()->clearMessage();
        return;
    }

    QFile file(path);
    if (!file.open(QIODevice::WriteOnly) || file.write(result.data) != result.data.size()) {
        QMessageBox::warning(this, tr("Export Pattern"),
                             tr("Could not write %1: %2").arg(QDir::toNativeSeparators(path), file.errorString()));
        return;
    }
    statusBar()->showMessage(tr("Saved %1").arg(QDir::toNativeSeparators(path)), 5000);
}

void PatternWindow::onExportRejected(const ExportResult& result)
{
    statusBar()->showMessage(result.message, 3000);
}
