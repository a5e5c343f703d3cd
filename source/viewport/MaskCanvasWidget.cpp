// ============================================================================
// MaskCanvasWidget - Implementation
// ============================================================================

#include "MaskCanvasWidget.h"
#include "CheckerboardPattern.h"
#include "../core/StrokeOrchestrator.h"
#include "../core/MaskSession.h"

#include <QPainter>
#include <QPaintEvent>
#include <QMouseEvent>
#include <QWheelEvent>
#include <QDebug>
#include <QElapsedTimer>

MaskCanvasWidget::MaskCanvasWidget(QWidget* parent)
    : QWidget(parent)
{
    // Every paint covers the whole widget
    setAttribute(Qt::WA_OpaquePaintEvent, true);
    setMouseTracking(true);
    setFocusPolicy(Qt::StrongFocus);
    setCursor(Qt::BlankCursor);
    setMinimumSize(200, 150);
}

// ===== Configuration =====

void MaskCanvasWidget::setOrchestrator(StrokeOrchestrator* orchestrator)
{
    if (m_orchestrator == orchestrator) {
        return;
    }
    if (m_orchestrator) {
        disconnect(m_orchestrator, nullptr, this, nullptr);
    }

    m_orchestrator = orchestrator;

    if (m_orchestrator) {
        connect(m_orchestrator, &StrokeOrchestrator::displayChanged,
                this, &MaskCanvasWidget::onDisplayChanged);
        connect(m_orchestrator, &StrokeOrchestrator::previewChanged,
                this, &MaskCanvasWidget::onPreviewChanged);
        connect(m_orchestrator, &StrokeOrchestrator::liveModeChanged,
                this, &MaskCanvasWidget::onLiveModeChanged);
        connect(m_orchestrator, &StrokeOrchestrator::transformChanged,
                this, &MaskCanvasWidget::onTransformChanged);
        connect(m_orchestrator, &StrokeOrchestrator::brushChanged,
                this, [this]() { update(); });
        fitToView();
    }
    update();
}

void MaskCanvasWidget::setCheckerboard(const CheckerboardPattern* pattern)
{
    m_checkerboard = pattern;
    if (m_maskOnly) {
        update();
    }
}

void MaskCanvasWidget::setMaskOnlyView(bool maskOnly)
{
    if (m_maskOnly == maskOnly) {
        return;
    }
    m_maskOnly = maskOnly;
    update();
}

void MaskCanvasWidget::fitToView()
{
    if (!m_orchestrator) {
        return;
    }
    // transformChanged() triggers the repaint and zoomChanged()
    m_orchestrator->fitToViewport(QSizeF(size()));
}

bool MaskCanvasWidget::hasSession() const
{
    return m_orchestrator && m_orchestrator->hasSession();
}

QRectF MaskCanvasWidget::cursorRect() const
{
    if (!m_orchestrator) {
        return QRectF();
    }
    // A dab of radius r covers 2r+1 image pixels
    const qreal radius = (m_orchestrator->brushRadius() + 0.5) * m_orchestrator->transform().zoom();
    return QRectF(m_cursorPos.x() - radius, m_cursorPos.y() - radius, radius * 2, radius * 2);
}

// ===== Painting =====

void MaskCanvasWidget::paintEvent(QPaintEvent* event)
{
#ifdef MASKPAINTER_DEBUG
    static int paintCount = 0;
    QElapsedTimer timer;
    timer.start();
    ++paintCount;
#endif

    QPainter painter(this);
    painter.fillRect(event->rect(), QColor(64, 64, 64));

    if (!hasSession()) {
        return;
    }

    // Pixel-exact upscaling: nearest-neighbor, no smoothing
    painter.setRenderHint(QPainter::SmoothPixmapTransform, false);

    const bool live = m_orchestrator->session()->compositor().isLive();
    if (m_maskOnly) {
        paintMaskOnly(painter);
    } else if (live) {
        paintLive(painter);
    } else {
        paintDisplay(painter);
    }

    paintCursor(painter);

#ifdef MASKPAINTER_DEBUG
    if (paintCount % 100 == 1) {
        qDebug() << "MaskCanvasWidget::paintEvent #" << paintCount
                 << "live:" << live
                 << "maskOnly:" << m_maskOnly
                 << "dirty:" << event->rect()
                 << "took(us):" << (timer.nsecsElapsed() / 1000);
    }
#endif
}

void MaskCanvasWidget::paintMaskOnly(QPainter& painter)
{
    const ViewportTransform& vt = m_orchestrator->transform();
    const QRectF imageRect = vt.imageScreenRect();

    if (m_checkerboard) {
        painter.save();
        painter.setBrushOrigin(imageRect.topLeft());
        painter.fillRect(imageRect, QBrush(m_checkerboard->tile()));
        painter.restore();
    } else {
        painter.fillRect(imageRect, Qt::white);
    }

    const DualResolutionCompositor& compositor = m_orchestrator->session()->compositor();
    if (compositor.isLive()) {
        painter.drawImage(imageRect, compositor.previewOverlayImage());
    } else {
        painter.drawImage(imageRect, compositor.maskLayer().image());
    }
}

void MaskCanvasWidget::paintLive(QPainter& painter)
{
    const DualResolutionCompositor& compositor = m_orchestrator->session()->compositor();
    const QRectF target = m_orchestrator->transform().imageScreenRect();

    // Preview pair covers the whole working image at previewScale
    painter.drawImage(target, compositor.previewBaseImage());
    painter.drawImage(target, compositor.previewOverlayImage());
}

void MaskCanvasWidget::paintDisplay(QPainter& painter)
{
    const DualResolutionCompositor& compositor = m_orchestrator->session()->compositor();
    painter.drawImage(m_orchestrator->transform().imageScreenRect(), compositor.displayImage());
}

void MaskCanvasWidget::paintCursor(QPainter& painter)
{
    if (!m_cursorVisible) {
        return;
    }
    painter.save();
    painter.setRenderHint(QPainter::Antialiasing, true);
    QPen pen(Qt::black);
    pen.setWidthF(1.0);
    pen.setCosmetic(true);
    painter.setPen(pen);
    painter.setBrush(Qt::NoBrush);
    painter.drawEllipse(cursorRect());
    painter.restore();
}

// ===== Mouse Input =====

void MaskCanvasWidget::mousePressEvent(QMouseEvent* event)
{
    if (!hasSession()) {
        QWidget::mousePressEvent(event);
        return;
    }

    PointerEvent pe;
    pe.type = PointerEvent::Press;
    pe.screenPos = event->position();
    pe.button = event->button();
    pe.buttons = event->buttons();

    moveCursor(pe.screenPos);
    m_orchestrator->handlePointerEvent(pe);
    event->accept();
}

void MaskCanvasWidget::mouseMoveEvent(QMouseEvent* event)
{
    moveCursor(event->position());
    if (!hasSession()) {
        return;
    }

    PointerEvent pe;
    pe.type = PointerEvent::Move;
    pe.screenPos = event->position();
    pe.buttons = event->buttons();

    m_orchestrator->handlePointerEvent(pe);
    event->accept();
}

void MaskCanvasWidget::mouseReleaseEvent(QMouseEvent* event)
{
    if (!hasSession()) {
        QWidget::mouseReleaseEvent(event);
        return;
    }

    PointerEvent pe;
    pe.type = PointerEvent::Release;
    pe.screenPos = event->position();
    pe.button = event->button();
    pe.buttons = event->buttons();

    m_orchestrator->handlePointerEvent(pe);
    event->accept();
}

void MaskCanvasWidget::wheelEvent(QWheelEvent* event)
{
    if (!hasSession()) {
        QWidget::wheelEvent(event);
        return;
    }
    const int delta = event->angleDelta().y();
    if (delta != 0) {
        m_orchestrator->handleWheel(delta, event->position());
        moveCursor(event->position());
    }
    event->accept();
}

void MaskCanvasWidget::resizeEvent(QResizeEvent* event)
{
    QWidget::resizeEvent(event);
    fitToView();
}

void MaskCanvasWidget::leaveEvent(QEvent* event)
{
    QWidget::leaveEvent(event);
    if (m_cursorVisible) {
        update(cursorRect().toAlignedRect().adjusted(-2, -2, 2, 2));
        m_cursorVisible = false;
    }
}

void MaskCanvasWidget::focusOutEvent(QFocusEvent* event)
{
    QWidget::focusOutEvent(event);
    // Never leave the compositor stuck in live mode
    if (m_orchestrator) {
        m_orchestrator->cancelActiveGesture();
    }
}

void MaskCanvasWidget::moveCursor(const QPointF& pos)
{
    const QRect oldRect = cursorRect().toAlignedRect().adjusted(-2, -2, 2, 2);
    m_cursorPos = pos;
    m_cursorVisible = true;
    const QRect newRect = cursorRect().toAlignedRect().adjusted(-2, -2, 2, 2);
    update(oldRect.united(newRect));
}

// ===== Orchestrator Signals =====

void MaskCanvasWidget::updateImageRect(const QRect& imageRect)
{
    if (!m_orchestrator || imageRect.isEmpty()) {
        return;
    }
    const QRectF screen = m_orchestrator->transform().imageRectToScreen(QRectF(imageRect));
    update(screen.toAlignedRect().adjusted(-1, -1, 1, 1));
}

void MaskCanvasWidget::onDisplayChanged(const QRect& imageRect)
{
    updateImageRect(imageRect);
}

void MaskCanvasWidget::onPreviewChanged(const QRect& previewRect)
{
    if (!hasSession()) {
        return;
    }
    updateImageRect(m_orchestrator->session()->compositor().previewRectToImage(previewRect));
}

void MaskCanvasWidget::onLiveModeChanged(bool live)
{
    Q_UNUSED(live);
    // Switching paint paths redraws the whole image area
    update();
}

void MaskCanvasWidget::onTransformChanged()
{
    if (m_orchestrator) {
        emit zoomChanged(m_orchestrator->transform().zoom());
    }
    update();
}
