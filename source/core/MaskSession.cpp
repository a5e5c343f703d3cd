// ============================================================================
// MaskSession - Implementation
// ============================================================================

#include "MaskSession.h"
#include "MaskDocument.h"

#include <QDebug>
#include <QtMath>

std::unique_ptr<MaskSession> MaskSession::open(const PixelBuffer& source,
                                               const PixelBuffer& priorMask,
                                               const MaskSettings& settings)
{
    if (source.isNull()) {
        qWarning() << "MaskSession: refusing to open a session on a missing or empty image";
        return nullptr;
    }

    auto session = std::make_unique<MaskSession>(ConstructionKey());
    session->m_settings = settings;
    session->m_settings.sanitize();
    session->m_originalImage = source;
    session->m_originalSize = source.size();

    // Scale down to the working bound on the larger side for editing performance
    const QSize workingSize = workingSizeFor(source.size(),
                                             session->m_settings.maxWorkingDimension,
                                             &session->m_workingScale);
    const PixelBuffer working = (workingSize == source.size())
                                ? source
                                : source.scaledSmooth(workingSize);

    session->m_compositor.setPreviewScale(session->m_settings.previewScale);
    session->m_compositor.setWorkingImage(working);
    session->m_undo.setCapacity(session->m_settings.undoCapacity);

    // Seed from the prior mask only if it matches the ORIGINAL image size
    if (!priorMask.isNull()) {
        if (priorMask.size() == source.size()) {
            const PixelBuffer seeded = (workingSize == priorMask.size())
                                       ? priorMask.clone()
                                       : priorMask.scaledNearest(workingSize);
            session->m_compositor.setMaskLayer(seeded);
        } else {
            qDebug() << "MaskSession: discarding prior mask of size" << priorMask.size()
                     << "(image is" << source.size() << ")";
        }
    }

    session->m_open = true;

    qDebug() << "MaskSession: opened" << source.size() << "-> working" << workingSize
             << "scale" << session->m_workingScale
             << "preview" << session->m_compositor.previewSize();
    return session;
}

MaskSession::~MaskSession()
{
    // Closing without commit is a cancel
    if (m_open) {
        cancel();
    }
}

QSize MaskSession::workingSizeFor(const QSize& originalSize, int maxDimension, qreal* scaleOut)
{
    qreal scale = 1.0;
    QSize result = originalSize;

    const int maxDim = qMax(originalSize.width(), originalSize.height());
    if (maxDimension > 0 && maxDim > maxDimension) {
        scale = static_cast<qreal>(maxDimension) / maxDim;
        result = QSize(qMax(1, qRound(originalSize.width() * scale)),
                       qMax(1, qRound(originalSize.height() * scale)));
    }

    if (scaleOut) {
        *scaleOut = scale;
    }
    return result;
}

std::optional<PixelBuffer> MaskSession::commit()
{
    if (!m_open) {
        return std::nullopt;
    }

    const PixelBuffer& mask = m_compositor.maskLayer();
    PixelBuffer finalMask = (m_workingScale < 1.0 || mask.size() != m_originalSize)
                            ? mask.scaledNearest(m_originalSize)
                            : mask.clone();

    qDebug() << "MaskSession: committed mask" << finalMask.size()
             << "painted pixels:" << finalMask.countNonTransparent();

    if (m_document) {
        m_document->updateMask(finalMask);
    }
    release();
    return finalMask;
}

void MaskSession::cancel()
{
    if (!m_open) {
        return;
    }
    qDebug() << "MaskSession: cancelled, discarding mask and" << m_undo.size() << "undo snapshots";
    release();
}

void MaskSession::release()
{
    m_open = false;
    m_undo.clear();
    m_compositor.setWorkingImage(PixelBuffer());
    m_originalImage = PixelBuffer();

    if (m_document) {
        m_document->sessionClosed(this);
        m_document = nullptr;
    }
}
