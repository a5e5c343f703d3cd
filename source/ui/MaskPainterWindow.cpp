#include "MaskPainterWindow.h"

#include "../core/MaskDocument.h"
#include "../core/MaskSession.h"
#include "../core/StrokeOrchestrator.h"
#include "../viewport/MaskCanvasWidget.h"

#include <QVBoxLayout>
#include <QHBoxLayout>
#include <QGroupBox>
#include <QLabel>
#include <QSlider>
#include <QPushButton>
#include <QRadioButton>
#include <QCheckBox>
#include <QColorDialog>
#include <QMessageBox>
#include <QShortcut>
#include <QKeySequence>
#include <QSignalBlocker>
#include <QDebug>
#include <QtMath>

// ============================================================================
// Constructor
// ============================================================================

MaskPainterWindow::MaskPainterWindow(MaskDocument* document, const MaskSettings& settings,
                                     QWidget* parent)
    : QDialog(parent)
    , m_document(document)
    , m_settings(settings)
{
    setWindowTitle(tr("Paint Mask"));
    setModal(true);
    m_settings.sanitize();

    if (m_document) {
        m_session = m_document->openSession(m_settings);
    }
    if (!m_session) {
        qWarning() << "MaskPainterWindow: no session could be opened";
    } else {
        m_orchestrator = new StrokeOrchestrator(m_session.get(), this);
    }

    setupUi();
    resize(1000, 750);
}

MaskPainterWindow::~MaskPainterWindow()
{
    // Detach the canvas before the session goes away
    if (m_canvas) {
        m_canvas->setOrchestrator(nullptr);
    }
    if (m_session && m_session->isOpen()) {
        m_session->cancel();
    }
}

// ============================================================================
// Setup UI
// ============================================================================

void MaskPainterWindow::setupUi()
{
    QVBoxLayout* mainLayout = new QVBoxLayout(this);
    mainLayout->setSpacing(8);
    mainLayout->setContentsMargins(12, 12, 12, 12);

    // ===== Brush Controls =====
    QGroupBox* brushGroup = new QGroupBox(tr("Brush"));
    QHBoxLayout* brushLayout = new QHBoxLayout(brushGroup);
    brushLayout->setSpacing(8);

    brushLayout->addWidget(new QLabel(tr("Size:")));
    m_brushSizeSlider = new QSlider(Qt::Horizontal);
    m_brushSizeSlider->setRange(MaskSettings::MIN_BRUSH_SIZE, MaskSettings::MAX_BRUSH_SIZE);
    m_brushSizeSlider->setValue(m_settings.brushSize);
    m_brushSizeSlider->setMinimumWidth(150);
    brushLayout->addWidget(m_brushSizeSlider);
    m_brushSizeLabel = new QLabel(QString::number(m_settings.brushSize));
    m_brushSizeLabel->setMinimumWidth(30);
    brushLayout->addWidget(m_brushSizeLabel);

    m_paintRadio = new QRadioButton(tr("Paint"));
    m_paintRadio->setChecked(true);
    m_eraseRadio = new QRadioButton(tr("Erase"));
    brushLayout->addWidget(m_paintRadio);
    brushLayout->addWidget(m_eraseRadio);

    m_colorButton = new QPushButton();
    m_colorButton->setFixedSize(32, 24);
    m_colorButton->setToolTip(tr("Mask color"));
    brushLayout->addWidget(m_colorButton);

    m_clearButton = new QPushButton(tr("Clear"));
    brushLayout->addWidget(m_clearButton);
    m_undoButton = new QPushButton(tr("Undo"));
    m_undoButton->setToolTip(tr("Undo (Ctrl+Z)"));
    m_undoButton->setEnabled(false);
    brushLayout->addWidget(m_undoButton);
    brushLayout->addStretch();
    mainLayout->addWidget(brushGroup);

    // ===== Canvas =====
    m_canvas = new MaskCanvasWidget();
    m_canvas->setCheckerboard(&m_checkerboard);
    mainLayout->addWidget(m_canvas, 1);

    // ===== View Controls =====
    QHBoxLayout* viewLayout = new QHBoxLayout();
    viewLayout->setSpacing(8);
    viewLayout->addWidget(new QLabel(tr("Zoom:")));
    m_zoomSlider = new QSlider(Qt::Horizontal);
    m_zoomSlider->setRange(qRound(m_settings.zoomMin * 100), qRound(m_settings.zoomMax * 100));
    m_zoomSlider->setValue(100);
    m_zoomSlider->setMinimumWidth(200);
    viewLayout->addWidget(m_zoomSlider);
    m_zoomLabel = new QLabel(QStringLiteral("100%"));
    m_zoomLabel->setMinimumWidth(50);
    viewLayout->addWidget(m_zoomLabel);
    m_fitButton = new QPushButton(tr("Fit"));
    viewLayout->addWidget(m_fitButton);
    m_maskOnlyCheck = new QCheckBox(tr("Show mask only"));
    viewLayout->addWidget(m_maskOnlyCheck);
    viewLayout->addStretch();

    m_saveButton = new QPushButton(tr("Save"));
    m_saveButton->setDefault(true);
    m_cancelButton = new QPushButton(tr("Cancel"));
    viewLayout->addWidget(m_saveButton);
    viewLayout->addWidget(m_cancelButton);
    mainLayout->addLayout(viewLayout);

    updateColorSwatch();

    // ===== Connections =====
    connect(m_saveButton, &QPushButton::clicked, this, &MaskPainterWindow::accept);
    connect(m_cancelButton, &QPushButton::clicked, this, &MaskPainterWindow::reject);

    if (!m_orchestrator) {
        // Nothing to edit: only Cancel stays usable
        for (QWidget* w : {static_cast<QWidget*>(brushGroup), static_cast<QWidget*>(m_zoomSlider),
                           static_cast<QWidget*>(m_fitButton), static_cast<QWidget*>(m_maskOnlyCheck),
                           static_cast<QWidget*>(m_saveButton)}) {
            w->setEnabled(false);
        }
        return;
    }

    m_orchestrator->setBrushSize(m_settings.brushSize);
    m_orchestrator->setBrushColor(m_settings.brushColor);
    m_canvas->setOrchestrator(m_orchestrator);

    connect(m_brushSizeSlider, &QSlider::valueChanged, this, &MaskPainterWindow::onBrushSizeChanged);
    connect(m_paintRadio, &QRadioButton::toggled, this, [this](bool checked) {
        m_orchestrator->setBrushTool(checked ? BrushTool::Paint : BrushTool::Erase);
    });
    connect(m_colorButton, &QPushButton::clicked, this, &MaskPainterWindow::onColorClicked);
    connect(m_clearButton, &QPushButton::clicked, this, [this]() { clearMask(true); });
    connect(m_undoButton, &QPushButton::clicked, m_orchestrator, &StrokeOrchestrator::undo);
    connect(m_orchestrator, &StrokeOrchestrator::undoAvailableChanged,
            this, &MaskPainterWindow::onUndoAvailableChanged);

    QShortcut* undoShortcut = new QShortcut(QKeySequence::Undo, this);
    connect(undoShortcut, &QShortcut::activated, m_orchestrator, &StrokeOrchestrator::undo);

    connect(m_zoomSlider, &QSlider::valueChanged, this, &MaskPainterWindow::onZoomSliderChanged);
    connect(m_canvas, &MaskCanvasWidget::zoomChanged, this, &MaskPainterWindow::onZoomChanged);
    connect(m_fitButton, &QPushButton::clicked, m_canvas, &MaskCanvasWidget::fitToView);
    connect(m_maskOnlyCheck, &QCheckBox::toggled, m_canvas, &MaskCanvasWidget::setMaskOnlyView);

    onZoomChanged(m_orchestrator->transform().zoom());
}

// ============================================================================
// Slots
// ============================================================================

void MaskPainterWindow::onBrushSizeChanged(int size)
{
    m_brushSizeLabel->setText(QString::number(size));
    m_orchestrator->setBrushSize(size);
}

void MaskPainterWindow::onColorClicked()
{
    QColor color = QColorDialog::getColor(m_orchestrator->brushColor(), this, tr("Mask Color"));
    if (!color.isValid()) {
        return;
    }
    m_orchestrator->setBrushColor(color);
    updateColorSwatch();
}

void MaskPainterWindow::updateColorSwatch()
{
    const QColor color = m_orchestrator ? m_orchestrator->brushColor() : m_settings.brushColor;
    m_colorButton->setStyleSheet(QStringLiteral("background-color: %1; border: 1px solid black;")
                                     .arg(color.name()));
}

void MaskPainterWindow::onZoomSliderChanged(int percent)
{
    const QPointF center(m_canvas->width() / 2.0, m_canvas->height() / 2.0);
    m_orchestrator->setZoom(percent / 100.0, center);
}

void MaskPainterWindow::onZoomChanged(qreal zoom)
{
    const int percent = qRound(zoom * 100);
    m_zoomLabel->setText(QStringLiteral("%1%").arg(percent));

    // Keep the slider in sync without feeding the value back
    QSignalBlocker blocker(m_zoomSlider);
    m_zoomSlider->setValue(percent);
}

void MaskPainterWindow::onUndoAvailableChanged(bool available)
{
    m_undoButton->setEnabled(available);
}

void MaskPainterWindow::clearMask(bool confirm)
{
    if (!m_orchestrator) {
        return;
    }
    if (confirm) {
        const auto answer = QMessageBox::question(this, tr("Clear Mask"),
                                                  tr("Clear the entire mask?"),
                                                  QMessageBox::Yes | QMessageBox::No,
                                                  QMessageBox::No);
        if (answer != QMessageBox::Yes) {
            return;
        }
    }
    m_orchestrator->resetMask();
}

MaskSettings MaskPainterWindow::brushSettings() const
{
    MaskSettings s = m_settings;
    if (m_orchestrator) {
        s.brushSize = m_orchestrator->brushSize();
        s.brushColor = m_orchestrator->brushColor();
    }
    return s;
}

// ============================================================================
// Save / Cancel
// ============================================================================

void MaskPainterWindow::accept()
{
    if (!m_session || !m_session->isOpen()) {
        QDialog::reject();
        return;
    }
    m_orchestrator->cancelActiveGesture();
    m_canvas->setOrchestrator(nullptr);

    if (!m_session->commit()) {
        qWarning() << "MaskPainterWindow: commit failed";
        QDialog::reject();
        return;
    }
    QDialog::accept();
}

void MaskPainterWindow::reject()
{
    if (m_session && m_session->isOpen()) {
        m_orchestrator->cancelActiveGesture();
        m_canvas->setOrchestrator(nullptr);
        m_session->cancel();
    }
    QDialog::reject();
}
