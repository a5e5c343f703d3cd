#pragma once

// ============================================================================
// MaskPainterWindow - Modal mask editor dialog
// ============================================================================
// Opens a MaskSession on a MaskDocument and hosts the canvas plus controls:
// brush size, Paint/Erase, color, Clear, Undo, zoom slider, Fit, mask-only
// toggle, Save and Cancel.
//
// Save commits the session (mask written back to the document) and accepts
// the dialog. Cancel, Escape or closing the window cancels the session.
// ============================================================================

#include "../core/MaskSettings.h"
#include "../viewport/CheckerboardPattern.h"

#include <QDialog>
#include <memory>

class MaskDocument;
class MaskSession;
class StrokeOrchestrator;
class MaskCanvasWidget;
class QSlider;
class QLabel;
class QPushButton;
class QRadioButton;
class QCheckBox;

class MaskPainterWindow : public QDialog {
    Q_OBJECT

public:
    /**
     * @param document Document to edit (not owned, must outlive the dialog).
     * @param settings Editor settings; brush defaults seed the controls.
     */
    explicit MaskPainterWindow(MaskDocument* document,
                               const MaskSettings& settings = MaskSettings(),
                               QWidget* parent = nullptr);
    ~MaskPainterWindow() override;

    /**
     * @brief True if a session could be opened (document has an image and no
     *        other session is open).
     */
    bool isValid() const { return m_session != nullptr; }

    MaskCanvasWidget* canvas() const { return m_canvas; }
    StrokeOrchestrator* orchestrator() const { return m_orchestrator; }
    MaskSession* session() const { return m_session.get(); }

    /**
     * @brief Brush size and color the user ended with (for persisting).
     */
    MaskSettings brushSettings() const;

public slots:
    void accept() override;
    void reject() override;

    /**
     * @brief Clear the mask, asking first if @p confirm is set.
     */
    void clearMask(bool confirm = true);

private slots:
    void onBrushSizeChanged(int size);
    void onColorClicked();
    void onZoomSliderChanged(int percent);
    void onZoomChanged(qreal zoom);
    void onUndoAvailableChanged(bool available);

private:
    void setupUi();
    void updateColorSwatch();

    MaskDocument* m_document = nullptr;
    MaskSettings m_settings;
    std::unique_ptr<MaskSession> m_session;
    CheckerboardPattern m_checkerboard;

    StrokeOrchestrator* m_orchestrator = nullptr;   // QObject child
    MaskCanvasWidget* m_canvas = nullptr;

    QSlider* m_brushSizeSlider = nullptr;
    QLabel* m_brushSizeLabel = nullptr;
    QRadioButton* m_paintRadio = nullptr;
    QRadioButton* m_eraseRadio = nullptr;
    QPushButton* m_colorButton = nullptr;
    QPushButton* m_clearButton = nullptr;
    QPushButton* m_undoButton = nullptr;
    QSlider* m_zoomSlider = nullptr;
    QLabel* m_zoomLabel = nullptr;
    QPushButton* m_fitButton = nullptr;
    QCheckBox* m_maskOnlyCheck = nullptr;
    QPushButton* m_saveButton = nullptr;
    QPushButton* m_cancelButton = nullptr;
};
