// ============================================================================
// MaskPainter - Main Entry Point
// ============================================================================

#include <QApplication>
#include <QDir>
#include <QFileInfo>
#include <QImage>
#include <QDebug>
#include <cstdio>

#include "core/MaskDocument.h"
#include "core/MaskSettings.h"
#include "ui/MaskPainterWindow.h"

// Test includes
#include "core/BrushStampEngineTests.h"
#include "core/CompositorTests.h"
#include "core/UndoManagerTests.h"
#include "core/ViewportTransformTests.h"
#include "core/MaskSessionTests.h"
#include "ui/MaskCanvasWidgetTests.h"

// ============================================================================
// Command Line
// ============================================================================

static void printUsage()
{
    printf("Usage: maskpainter <image> [options]\n"
           "\n"
           "Options:\n"
           "  --mask <file>           Mask to continue editing (must match the image size)\n"
           "  --output <file>         Where to save the mask (default: <image>_mask.png)\n"
           "  --masked-output <file>  Also save the image with the mask blended on top\n"
           "  --brush-size <n>        Initial brush diameter in pixels\n"
           "  --color <#rrggbb>       Initial mask color\n"
           "\n"
           "Tests:\n"
           "  --test-brush --test-compositor --test-undo --test-viewport\n"
           "  --test-session --test-canvas\n");
}

static QString defaultMaskPath(const QString& imagePath)
{
    const QFileInfo info(imagePath);
    return info.dir().filePath(info.completeBaseName() + "_mask.png");
}

// ============================================================================
// Test Runners
// ============================================================================

static int runTests(const QString& testType)
{
    bool success = false;

    if (testType == "brush") {
        success = BrushStampEngineTests::runAllTests();
    } else if (testType == "compositor") {
        success = CompositorTests::runAllTests();
    } else if (testType == "undo") {
        success = UndoManagerTests::runAllTests();
    } else if (testType == "viewport") {
        success = ViewportTransformTests::runAllTests();
    } else if (testType == "session") {
        success = MaskSessionTests::runAllTests();
    } else if (testType == "canvas") {
        MaskCanvasWidgetTests tests;
        return QTest::qExec(&tests);
    }

    return success ? 0 : 1;
}

// ============================================================================
// Main Entry Point
// ============================================================================

int main(int argc, char* argv[])
{
    QApplication app(argc, argv);
    app.setOrganizationName("MaskPainter");
    app.setApplicationName("App");

    // ========== Parse Command Line Arguments ==========
    QString inputFile;
    QString maskFile;
    QString outputFile;
    QString maskedOutputFile;
    int brushSize = 0;
    QColor brushColor;
    QString testToRun;

    for (int i = 1; i < argc; ++i) {
        QString arg = QString::fromLocal8Bit(argv[i]);

        if (arg == "--mask" && i + 1 < argc) {
            maskFile = QString::fromLocal8Bit(argv[++i]);
        } else if (arg == "--output" && i + 1 < argc) {
            outputFile = QString::fromLocal8Bit(argv[++i]);
        } else if (arg == "--masked-output" && i + 1 < argc) {
            maskedOutputFile = QString::fromLocal8Bit(argv[++i]);
        } else if (arg == "--brush-size" && i + 1 < argc) {
            brushSize = QString::fromLocal8Bit(argv[++i]).toInt();
        } else if (arg == "--color" && i + 1 < argc) {
            brushColor = QColor(QString::fromLocal8Bit(argv[++i]));
            if (!brushColor.isValid()) {
                qWarning() << "Ignoring invalid color" << argv[i];
            }
        } else if (arg == "--test-brush") {
            testToRun = "brush";
        } else if (arg == "--test-compositor") {
            testToRun = "compositor";
        } else if (arg == "--test-undo") {
            testToRun = "undo";
        } else if (arg == "--test-viewport") {
            testToRun = "viewport";
        } else if (arg == "--test-session") {
            testToRun = "session";
        } else if (arg == "--test-canvas") {
            testToRun = "canvas";
        } else if (arg == "--help" || arg == "-h") {
            printUsage();
            return 0;
        } else if (!arg.startsWith("--") && inputFile.isEmpty()) {
            inputFile = arg;
        } else {
            qWarning() << "Ignoring unknown argument" << arg;
        }
    }

    // Handle test commands
    if (!testToRun.isEmpty()) {
        return runTests(testToRun);
    }

    if (inputFile.isEmpty()) {
        printUsage();
        return 1;
    }

    // ========== Load Inputs ==========
    const QImage image(inputFile);
    if (image.isNull()) {
        qWarning() << "Could not load image" << inputFile;
        return 1;
    }

    MaskDocument document;
    if (!document.setInputImage(image)) {
        return 1;
    }

    if (!maskFile.isEmpty()) {
        const QImage prior(maskFile);
        if (prior.isNull()) {
            qWarning() << "Could not load mask" << maskFile << "- starting with an empty mask";
        } else if (prior.size() != image.size()) {
            qDebug() << "Mask" << maskFile << "is" << prior.size()
                     << "but the image is" << image.size() << "- starting with an empty mask";
        } else {
            document.updateMask(PixelBuffer(prior));
        }
    }

    MaskSettings settings = MaskSettings::load();
    if (brushSize > 0) {
        settings.brushSize = brushSize;
    }
    if (brushColor.isValid()) {
        settings.brushColor = brushColor;
    }
    settings.sanitize();

    if (outputFile.isEmpty()) {
        outputFile = defaultMaskPath(inputFile);
    }

    // ========== Edit ==========
    MaskPainterWindow window(&document, settings);
    if (!window.isValid()) {
        return 1;
    }
    window.setWindowTitle(QObject::tr("Paint Mask - %1").arg(QFileInfo(inputFile).fileName()));

    if (window.exec() != QDialog::Accepted) {
        qDebug() << "Mask editing cancelled, nothing saved";
        return 0;
    }

    window.brushSettings().saveBrushDefaults();

    // ========== Save Outputs ==========
    if (!document.maskLayer().image().save(outputFile)) {
        qWarning() << "Could not save mask to" << outputFile;
        return 1;
    }
    qDebug() << "Saved mask to" << outputFile;

    if (!maskedOutputFile.isEmpty()) {
        if (!document.maskedImage().image().save(maskedOutputFile)) {
            qWarning() << "Could not save masked image to" << maskedOutputFile;
            return 1;
        }
        qDebug() << "Saved masked image to" << maskedOutputFile;
    }

    printf("%s\n", qPrintable(document.info()));
    return 0;
}
