// ============================================================================
// MaskDocument - Implementation
// ============================================================================

#include "MaskDocument.h"
#include "MaskSession.h"
#include "DualResolutionCompositor.h"

#include <QDebug>

MaskDocument::~MaskDocument()
{
    // Detach a session that outlives us so it never writes back into freed memory
    if (m_session) {
        qWarning() << "MaskDocument: destroyed while a session is still open";
        m_session->attachDocument(nullptr);
        m_session = nullptr;
    }
}

// ===== Input Image =====

bool MaskDocument::setInputImage(const QImage& image)
{
    if (m_session) {
        qWarning() << "MaskDocument: cannot replace the image while a session is open";
        return false;
    }

    PixelBuffer input(image);
    if (input.isNull()) {
        qWarning() << "MaskDocument: ignoring null input image";
        return false;
    }

    const bool sameSize = (input.size() == m_input.size());
    m_input = input;
    if (!sameSize || m_mask.size() != m_input.size()) {
        m_mask = PixelBuffer(m_input.width(), m_input.height());
    }
    return true;
}

// ===== Mask =====

void MaskDocument::resetMask()
{
    if (!hasImage()) {
        return;
    }
    m_mask = PixelBuffer(m_input.width(), m_input.height());
}

bool MaskDocument::updateMask(const PixelBuffer& mask)
{
    if (!hasImage() || mask.size() != m_input.size()) {
        qWarning() << "MaskDocument: rejected mask of size" << mask.size()
                   << "for image" << m_input.size();
        return false;
    }
    m_mask = mask;
    return true;
}

// ===== Derived Output =====

PixelBuffer MaskDocument::maskedImage() const
{
    if (!hasImage()) {
        return PixelBuffer();
    }

    PixelBuffer result(m_input.width(), m_input.height());
    for (int y = 0; y < m_input.height(); ++y) {
        const QRgb* imageRow = m_input.constScanLine(y);
        const QRgb* maskRow = m_mask.constScanLine(y);
        QRgb* out = result.scanLine(y);
        for (int x = 0; x < m_input.width(); ++x) {
            out[x] = DualResolutionCompositor::blendPixel(imageRow[x], maskRow[x]);
        }
    }
    return result;
}

int MaskDocument::maskedPixelCount() const
{
    return m_mask.countNonTransparent();
}

qreal MaskDocument::maskCoverage() const
{
    if (!hasImage()) {
        return 0.0;
    }
    const qint64 total = static_cast<qint64>(m_input.width()) * m_input.height();
    return static_cast<qreal>(maskedPixelCount()) / total;
}

QString MaskDocument::info() const
{
    if (!hasImage()) {
        return QStringLiteral("No image loaded");
    }
    return QStringLiteral("Image: %1x%2, Masked: %3 pixels (%4%)")
        .arg(m_input.width())
        .arg(m_input.height())
        .arg(maskedPixelCount())
        .arg(maskCoverage() * 100.0, 0, 'f', 2);
}

// ===== Editing =====

std::unique_ptr<MaskSession> MaskDocument::openSession(const MaskSettings& settings)
{
    if (m_session) {
        qWarning() << "MaskDocument: a mask session is already open";
        return nullptr;
    }

    std::unique_ptr<MaskSession> session = MaskSession::open(m_input, m_mask, settings);
    if (!session) {
        return nullptr;
    }
    session->attachDocument(this);
    m_session = session.get();
    return session;
}

void MaskDocument::sessionClosed(MaskSession* session)
{
    if (m_session == session) {
        m_session = nullptr;
    }
}
