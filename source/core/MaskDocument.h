#pragma once

// ============================================================================
// MaskDocument - Host-side image + mask pair
// ============================================================================
// MaskDocument is what the rest of an application hands to the mask painter:
// - the input image (original resolution, never modified by painting)
// - the current mask (same size as the input image, transparent = unmasked)
//
// Editing happens in a MaskSession opened from the document. Committing the
// session writes the final mask back here. At most one session is open per
// document at a time.
// ============================================================================

#include "PixelBuffer.h"
#include "MaskSettings.h"

#include <QImage>
#include <QString>
#include <memory>

class MaskSession;

class MaskDocument {
public:
    MaskDocument() = default;
    ~MaskDocument();

    // Non-copyable: an open session points back at its document
    MaskDocument(const MaskDocument&) = delete;
    MaskDocument& operator=(const MaskDocument&) = delete;

    // ===== Input Image =====

    /**
     * @brief Replace the input image.
     *
     * The mask is kept if the new image has the same dimensions, otherwise it
     * is reset to fully transparent at the new size.
     *
     * @return false if @p image is null (document left unchanged) or a
     *         session is open.
     */
    bool setInputImage(const QImage& image);
    const PixelBuffer& inputImage() const { return m_input; }
    bool hasImage() const { return !m_input.isNull(); }

    // ===== Mask =====

    const PixelBuffer& maskLayer() const { return m_mask; }

    /**
     * @brief Clear the mask to fully transparent.
     */
    void resetMask();

    /**
     * @brief Replace the mask. Rejected unless it matches the input image size.
     */
    bool updateMask(const PixelBuffer& mask);

    // ===== Derived Output =====

    /**
     * @brief Input image with the mask blended on top (opaque result).
     */
    PixelBuffer maskedImage() const;

    /**
     * @brief Number of mask pixels with non-zero alpha.
     */
    int maskedPixelCount() const;

    /**
     * @brief Fraction of masked pixels in [0, 1] (0 for an empty document).
     */
    qreal maskCoverage() const;

    /**
     * @brief One-line summary: "Image: WxH, Masked: N pixels (P.PP%)".
     */
    QString info() const;

    // ===== Editing =====

    /**
     * @brief Open an editing session seeded with the current mask.
     * @return The session, or nullptr if there is no image or a session is
     *         already open. The document must outlive the returned session.
     */
    std::unique_ptr<MaskSession> openSession(const MaskSettings& settings = MaskSettings());

    bool hasOpenSession() const { return m_session != nullptr; }

private:
    friend class MaskSession;
    void sessionClosed(MaskSession* session);

    PixelBuffer m_input;
    PixelBuffer m_mask;
    MaskSession* m_session = nullptr;   ///< Open session (not owned)
};
