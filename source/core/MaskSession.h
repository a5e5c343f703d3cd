#pragma once

// ============================================================================
// MaskSession - One open mask editing session over a source image
// ============================================================================
// Owns every working-resolution buffer for the lifetime of the edit:
// - the working image (source downscaled to maxWorkingDimension)
// - the compositor (full-res mask + preview pair + display)
// - the undo history
//
// The session ends with exactly one of:
// - commit(): mask scaled back to the source resolution and handed out
// - cancel(): everything discarded, nothing produced
//
// Sessions are single-threaded and exclusive: MaskDocument refuses to open a
// second session while one is still open.
// ============================================================================

#include "PixelBuffer.h"
#include "DualResolutionCompositor.h"
#include "UndoManager.h"
#include "MaskSettings.h"

#include <QSize>
#include <memory>
#include <optional>

class MaskDocument;

class MaskSession {
    // Only open() can mint a key, so sessions are always created through it
    struct ConstructionKey {
        explicit ConstructionKey() = default;
    };

public:
    /**
     * @brief Open a session.
     * @param source Source image at original resolution.
     * @param priorMask Previously painted mask at the source resolution, or a
     *        null buffer. A mask of any other size is discarded.
     * @param settings Editor settings (working size bound, preview scale,
     *        undo capacity).
     * @return The session, or nullptr if @p source is null or zero-sized.
     */
    static std::unique_ptr<MaskSession> open(const PixelBuffer& source,
                                             const PixelBuffer& priorMask,
                                             const MaskSettings& settings = MaskSettings());

    explicit MaskSession(ConstructionKey) {}
    ~MaskSession();

    // Non-copyable: the session exclusively owns its buffers
    MaskSession(const MaskSession&) = delete;
    MaskSession& operator=(const MaskSession&) = delete;

    /**
     * @brief Working size for a source, bounded by @p maxDimension on the larger side.
     * @param scaleOut Receives working/original ratio (1.0 if not downscaled).
     */
    static QSize workingSizeFor(const QSize& originalSize, int maxDimension, qreal* scaleOut = nullptr);

    // ===== State =====

    bool isOpen() const { return m_open; }

    const PixelBuffer& originalImage() const { return m_originalImage; }
    const PixelBuffer& workingImage() const { return m_compositor.workingImage(); }
    const PixelBuffer& maskLayer() const { return m_compositor.maskLayer(); }
    QSize originalSize() const { return m_originalSize; }
    qreal workingScale() const { return m_workingScale; }
    const MaskSettings& settings() const { return m_settings; }

    DualResolutionCompositor& compositor() { return m_compositor; }
    const DualResolutionCompositor& compositor() const { return m_compositor; }
    UndoManager& undoManager() { return m_undo; }
    const UndoManager& undoManager() const { return m_undo; }

    // ===== Ending the Session =====

    /**
     * @brief Finish editing and produce the mask at the original resolution.
     *
     * Nearest-neighbor upscales the working mask if the working image was
     * downscaled, writes it back to the attached document (if any) and
     * releases all working buffers.
     *
     * @return The final mask, or std::nullopt if the session is not open.
     */
    std::optional<PixelBuffer> commit();

    /**
     * @brief Discard the mask, preview buffers and undo history.
     */
    void cancel();

private:
    friend class MaskDocument;

    void attachDocument(MaskDocument* document) { m_document = document; }
    void release();

    PixelBuffer m_originalImage;
    QSize m_originalSize;
    qreal m_workingScale = 1.0;
    MaskSettings m_settings;

    DualResolutionCompositor m_compositor;
    UndoManager m_undo;

    MaskDocument* m_document = nullptr;   ///< Not owned; must outlive the session
    bool m_open = false;
};
