// ============================================================================
// MaskSettings - Implementation
// ============================================================================

#include "MaskSettings.h"

#include <QDebug>
#include <QSettings>
#include <QtGlobal>

void MaskSettings::sanitize()
{
    const MaskSettings defaults;

    if (maxWorkingDimension < 16) {
        maxWorkingDimension = defaults.maxWorkingDimension;
    }
    if (!(previewScale > 0) || previewScale > 1.0) {
        previewScale = defaults.previewScale;
    }
    undoCapacity = qBound(1, undoCapacity, 200);

    if (!(zoomMin > 0) || !(zoomMax > 0) || zoomMin > zoomMax) {
        zoomMin = defaults.zoomMin;
        zoomMax = defaults.zoomMax;
    }
    if (!(wheelZoomStep > 0) || wheelZoomStep >= 1.0) {
        wheelZoomStep = defaults.wheelZoomStep;
    }

    brushSize = qBound(MIN_BRUSH_SIZE, brushSize, MAX_BRUSH_SIZE);
    if (!brushColor.isValid()) {
        brushColor = defaults.brushColor;
    }
    // Mask color is always fully opaque
    brushColor.setAlpha(255);
}

MaskSettings MaskSettings::load()
{
    QSettings settings("MaskPainter", "App");
    return load(settings);
}

MaskSettings MaskSettings::load(QSettings& settings)
{
    MaskSettings s;
    s.maxWorkingDimension = settings.value("maxWorkingDimension", s.maxWorkingDimension).toInt();
    s.previewScale = settings.value("previewScale", s.previewScale).toDouble();
    s.undoCapacity = settings.value("undoCapacity", s.undoCapacity).toInt();
    s.zoomMin = settings.value("zoomMin", s.zoomMin).toDouble();
    s.zoomMax = settings.value("zoomMax", s.zoomMax).toDouble();
    s.wheelZoomStep = settings.value("wheelZoomStep", s.wheelZoomStep).toDouble();
    s.brushSize = settings.value("brushSize", s.brushSize).toInt();
    s.brushColor = QColor(settings.value("brushColor", s.brushColor.name()).toString());

    s.sanitize();

    qDebug() << "MaskSettings: workingMax=" << s.maxWorkingDimension
             << "previewScale=" << s.previewScale
             << "undoCapacity=" << s.undoCapacity
             << "zoom=[" << s.zoomMin << "," << s.zoomMax << "]";
    return s;
}

void MaskSettings::saveBrushDefaults() const
{
    QSettings settings("MaskPainter", "App");
    saveBrushDefaults(settings);
}

void MaskSettings::saveBrushDefaults(QSettings& settings) const
{
    settings.setValue("brushSize", brushSize);
    settings.setValue("brushColor", brushColor.name());
}
