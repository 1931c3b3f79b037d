// ============================================================================
// CompositorTests - Unit tests for frame and export rendering
// ============================================================================
// Run with: patternproof --test-compositor
//
// Uses RecordingSurface so draw calls can be checked without rasterizing,
// plus a few real exports decoded back from PNG/JPEG bytes.
// ============================================================================

#pragma once

#include "Compositor.h"
#include "RecordingSurface.h"
#include "../mockups/MockupLibrary.h"

#include <QImage>
#include <QtMath>
#include <atomic>
#include <cstdio>

/**
 * @brief Test suite for Compositor.
 */
class CompositorTests {
public:

    // ===== Helpers =====

    static PatternImagePtr solidPattern(int w, int h, const QColor& color = Qt::red) {
        QImage image(w, h, QImage::Format_ARGB32);
        image.fill(color);
        return PatternImage::fromImage(image);
    }

    static bool fuzzyEqual(qreal a, qreal b) {
        return qAbs(a - b) < 1e-6;
    }

    static bool fuzzyEqualRect(const QRectF& a, const QRectF& b) {
        return fuzzyEqual(a.x(), b.x()) && fuzzyEqual(a.y(), b.y())
            && fuzzyEqual(a.width(), b.width()) && fuzzyEqual(a.height(), b.height());
    }

    // ===== Unit Tests =====

    /**
     * @brief With nothing loaded, only the placeholder is drawn.
     */
    static bool testPlaceholder() {
        printf("  testPlaceholder... ");

        RenderState state;
        RecordingSurface surface(QSize(400, 300));
        Compositor::render(surface, state, nullptr);

        const auto& calls = surface.calls();
        if (calls.isEmpty() || calls.first().op != RecordingSurface::Op::Clear) {
            printf("FAILED: frame should start with a clear\n");
            return false;
        }
        if (calls.first().color.alpha() != 0) {
            printf("FAILED: frame should be cleared to transparent\n");
            return false;
        }
        if (surface.count(RecordingSurface::Op::DrawImage) != 0) {
            printf("FAILED: placeholder must not draw tiles\n");
            return false;
        }

        const auto fills = surface.calls(RecordingSurface::Op::FillRect);
        if (fills.isEmpty() || fills.first().color != QColor(0x2a, 0x2a, 0x2a)
            || !fuzzyEqualRect(fills.first().rect, QRectF(0, 0, 400, 300))) {
            printf("FAILED: placeholder base should be a full #2a2a2a fill\n");
            return false;
        }
        if (fills[1].color != QColor(0x1a, 0x1a, 0x1a)
            || !fuzzyEqualRect(fills[1].rect, QRectF(0, 0, 20, 20))) {
            printf("FAILED: top-left checker square should be #1a1a1a\n");
            return false;
        }

        const auto texts = surface.calls(RecordingSurface::Op::DrawText);
        if (texts.size() != 1 || !texts.first().text.contains("pattern")) {
            printf("FAILED: placeholder prompt missing\n");
            return false;
        }

        printf("PASSED\n");
        return true;
    }

    /**
     * @brief Checker background: #ccc base with #999 squares starting at (0,0).
     */
    static bool testBackground() {
        printf("  testBackground... ");

        RecordingSurface surface(QSize(40, 40));
        Compositor::drawBackground(surface, Background::checker());

        const auto fills = surface.calls(RecordingSurface::Op::FillRect);
        if (fills.size() != 3) {
            printf("FAILED: 40x40 checker should be 1 base + 2 squares, got %d\n", static_cast<int>(fills.size()));
            return false;
        }
        if (fills[0].color != QColor(0xcc, 0xcc, 0xcc)) {
            printf("FAILED: checker base should be #cccccc\n");
            return false;
        }
        if (!fuzzyEqualRect(fills[1].rect, QRectF(0, 0, 20, 20)) || !fuzzyEqualRect(fills[2].rect, QRectF(20, 20, 20, 20))
            || fills[1].color != QColor(0x99, 0x99, 0x99)) {
            printf("FAILED: #999999 squares should sit at (0,0) and (20,20)\n");
            return false;
        }

        surface.reset();
        Compositor::drawBackground(surface, Background::solid(Qt::black));
        if (surface.count(RecordingSurface::Op::FillRect) != 1
            || surface.calls().first().color != QColor(Qt::black)) {
            printf("FAILED: solid background should be one black fill\n");
            return false;
        }

        printf("PASSED\n");
        return true;
    }

    /**
     * @brief Preview tiles land at pan + zoom * logical position.
     */
    static bool testPreviewTransform() {
        printf("  testPreviewTransform... ");

        auto pattern = solidPattern(100, 100);
        RenderState state;
        state.setScale(1.0);
        state.setZoom(2.0);
        state.setPan(QPointF(30, 40));

        RecordingSurface surface(QSize(400, 400));
        Compositor::render(surface, state, pattern.get(), nullptr, true);

        const TileLayoutParams params = Compositor::previewParams(state, 100, QSizeF(400, 400));
        const int expected = static_cast<int>(TileLayout::coveringRange(params).tileCount());
        const auto draws = surface.calls(RecordingSurface::Op::DrawImage);
        if (static_cast<int>(draws.size()) != expected) {
            printf("FAILED: expected %d tile draws, got %d\n", expected, static_cast<int>(draws.size()));
            return false;
        }

        bool foundOrigin = false;
        for (const auto& call : draws) {
            if (fuzzyEqualRect(call.rect, QRectF(0, 0, 100, 100))) {
                foundOrigin = true;
                if (!fuzzyEqualRect(call.deviceRect(), QRectF(30, 40, 200, 200))) {
                    printf("FAILED: tile (0,0) should land at (30,40,200,200)\n");
                    return false;
                }
            }
        }
        if (!foundOrigin) {
            printf("FAILED: tile (0,0) not drawn\n");
            return false;
        }

        if (!surface.highQualityResampling()) {
            printf("FAILED: idle preview should use smooth resampling\n");
            return false;
        }
        if (surface.currentTransform() != QTransform()) {
            printf("FAILED: transform should be restored after rendering\n");
            return false;
        }

        surface.reset();
        Compositor::render(surface, state, pattern.get(), nullptr, false);
        if (surface.highQualityResampling()) {
            printf("FAILED: gesture preview should use fast resampling\n");
            return false;
        }

        printf("PASSED\n");
        return true;
    }

    /**
     * @brief A 2x export puts every tile at exactly twice its preview position.
     */
    static bool testExportFraming() {
        printf("  testExportFraming... ");

        RenderState state;
        state.setMaxCanvasSize(400);
        state.setZoom(0.75);
        state.setPan(QPointF(-37, 12));
        state.setOffsetPercentX(0.2);
        state.setRepeatType(RepeatType::HalfDrop);
        const qreal ts = 90.0;
        const QImage tile(90, 90, QImage::Format_ARGB32_Premultiplied);

        if (!fuzzyEqual(Compositor::exportFactor(state, 800), 2.0)) {
            printf("FAILED: export factor should be 2\n");
            return false;
        }

        RecordingSurface preview(QSize(400, 400));
        Compositor::drawTiles(preview, tile, Compositor::previewParams(state, ts, QSizeF(400, 400)));

        RecordingSurface exported(QSize(800, 800));
        Compositor::drawTiles(exported, tile, Compositor::exportParams(state, ts, 800));

        const auto a = preview.calls(RecordingSurface::Op::DrawImage);
        const auto b = exported.calls(RecordingSurface::Op::DrawImage);
        if (a.size() != b.size() || a.isEmpty()) {
            printf("FAILED: export should draw the same tiles (%d vs %d)\n", static_cast<int>(a.size()), static_cast<int>(b.size()));
            return false;
        }
        for (int k = 0; k < a.size(); ++k) {
            const QRectF p = a[k].deviceRect();
            const QRectF e = b[k].deviceRect();
            if (!fuzzyEqualRect(e, QRectF(p.x() * 2, p.y() * 2, p.width() * 2, p.height() * 2))) {
                printf("FAILED: tile %d not at twice its preview position\n", k);
                return false;
            }
        }

        printf("PASSED\n");
        return true;
    }

    /**
     * @brief The abort token stops the tile loop and the export yields nothing.
     */
    static bool testAbort() {
        printf("  testAbort... ");

        auto pattern = solidPattern(50, 50);
        RenderState state;
        std::atomic<bool> abort(true);

        RecordingSurface surface(QSize(200, 200));
        const bool completed = Compositor::drawTiles(
            surface, pattern->image(),
            Compositor::previewParams(state, 50, QSizeF(200, 200)), &abort);
        if (completed || surface.count(RecordingSurface::Op::DrawImage) != 0) {
            printf("FAILED: aborted loop should draw nothing and report false\n");
            return false;
        }
        if (surface.currentTransform() != QTransform()) {
            printf("FAILED: aborted loop should still restore the transform\n");
            return false;
        }

        ExportRequest request;
        request.size = 300;
        ExportResult result = Compositor::exportPattern(state, pattern.get(), request, &abort);
        if (result.status != ExportStatus::Cancelled || !result.data.isEmpty()) {
            printf("FAILED: aborted export should be Cancelled with no bytes\n");
            return false;
        }

        printf("PASSED\n");
        return true;
    }

    /**
     * @brief Export status handling and the encoded output.
     */
    static bool testExportPattern() {
        printf("  testExportPattern... ");

        RenderState state;
        state.setMaxCanvasSize(256);
        ExportRequest request;
        request.size = 64;
        request.format = ExportFormat::Png;

        ExportResult none = Compositor::exportPattern(state, nullptr, request);
        if (none.status != ExportStatus::NoPattern || !none.data.isEmpty()) {
            printf("FAILED: export without a pattern should be NoPattern\n");
            return false;
        }

        // 40px tiles at f = 0.25 are 10 device pixels, so pixel centres avoid tile seams
        auto pattern = solidPattern(40, 40, Qt::red);
        ExportRequest bad = request;
        bad.size = 0;
        if (Compositor::exportPattern(state, pattern.get(), bad).status != ExportStatus::InvalidRequest) {
            printf("FAILED: size 0 should be rejected\n");
            return false;
        }
        bad.size = ExportRequest::MAX_SIZE + 1;
        if (Compositor::exportPattern(state, pattern.get(), bad).status != ExportStatus::InvalidRequest) {
            printf("FAILED: size above the maximum should be rejected\n");
            return false;
        }

        ExportResult png = Compositor::exportPattern(state, pattern.get(), request);
        if (!png.succeeded()) {
            printf("FAILED: PNG export failed: %s\n", qPrintable(png.message));
            return false;
        }
        QImage decoded = QImage::fromData(png.data, "PNG");
        if (decoded.size() != QSize(64, 64)) {
            printf("FAILED: PNG export should be 64x64\n");
            return false;
        }
        // Tiles cover the whole square, so the centre is opaque pattern colour
        const QColor centre = decoded.pixelColor(35, 35);
        if (centre.red() < 250 || centre.green() > 5 || centre.alpha() != 255) {
            printf("FAILED: export centre should be opaque red\n");
            return false;
        }
        if (png.suggestedFileName() != QStringLiteral("pattern-64px.png")) {
            printf("FAILED: suggested file name %s\n", qPrintable(png.suggestedFileName()));
            return false;
        }

        request.format = ExportFormat::Jpg;
        ExportResult jpg = Compositor::exportPattern(state, pattern.get(), request);
        if (!jpg.succeeded() || jpg.data.size() < 2
            || static_cast<uchar>(jpg.data[0]) != 0xFF || static_cast<uchar>(jpg.data[1]) != 0xD8) {
            printf("FAILED: JPEG export should produce JPEG bytes\n");
            return false;
        }

        printf("PASSED\n");
        return true;
    }

    /**
     * @brief Transparent areas become white when encoded as JPEG.
     */
    static bool testJpegFlattensOntoWhite() {
        printf("  testJpegFlattensOntoWhite... ");

        QImage clear(16, 16, QImage::Format_ARGB32_Premultiplied);
        clear.fill(Qt::transparent);
        QString error;
        QByteArray bytes = Compositor::encode(clear, ExportFormat::Jpg, &error);
        QImage decoded = QImage::fromData(bytes, "JPG");
        if (decoded.isNull()) {
            printf("FAILED: JPEG did not decode (%s)\n", qPrintable(error));
            return false;
        }
        const QColor c = decoded.pixelColor(8, 8);
        if (c.red() < 245 || c.green() < 245 || c.blue() < 245) {
            printf("FAILED: transparent pixel should become white\n");
            return false;
        }

        if (!Compositor::encode(QImage(), ExportFormat::Png, &error).isEmpty() || error.isEmpty()) {
            printf("FAILED: encoding a null image should fail with a message\n");
            return false;
        }

        printf("PASSED\n");
        return true;
    }

    /**
     * @brief Fabric swatch: rounded fill, outline, clip, then local tiles.
     */
    static bool testFabricSwatch() {
        printf("  testFabricSwatch... ");

        auto pattern = solidPattern(40, 40);
        RenderState state;
        state.setScale(1.0);
        state.setViewMode(ViewMode::fabric());

        RecordingSurface surface(QSize(500, 400));
        Compositor::render(surface, state, pattern.get());

        // 0.6 * 400 * 0.95 = 228 wide, 182.4 high
        const auto paths = surface.calls(RecordingSurface::Op::FillPath);
        if (paths.size() != 1 || !fuzzyEqualRect(paths.first().rect, QRectF(-114, -91.2, 228, 182.4))) {
            printf("FAILED: swatch should be a 228x182.4 rounded rect\n");
            return false;
        }
        if (paths.first().deviceRect().center() != QPointF(250, 200)) {
            printf("FAILED: swatch should be centred\n");
            return false;
        }
        if (surface.count(RecordingSurface::Op::Clip) != 1
            || surface.count(RecordingSurface::Op::StrokePath) != 1) {
            printf("FAILED: swatch should be outlined and clipped\n");
            return false;
        }

        const int expected = TileLayout::computeLocal(QPointF(-114, -91.2), QSizeF(228, 182.4), 40,
                                                      0, 0, RepeatType::Full).size();
        if (surface.count(RecordingSurface::Op::DrawImage) != expected) {
            printf("FAILED: expected %d swatch tiles\n", expected);
            return false;
        }

        printf("PASSED\n");
        return true;
    }

    /**
     * @brief A pan far from the origin still fills the frame, one tile per covering slot.
     */
    static bool testLargePanRenders() {
        printf("  testLargePanRenders... ");

        auto pattern = solidPattern(100, 100);
        RenderState state;
        state.setScale(1.0);
        state.setRepeatType(RepeatType::Brick);
        state.setPan(QPointF(1e12 + 30, -1e12 - 30));

        RecordingSurface surface(QSize(400, 400));
        Compositor::render(surface, state, pattern.get());

        const TileLayoutParams params = Compositor::previewParams(state, 100, QSizeF(400, 400));
        const qint64 expected = TileLayout::coveringRange(TileLayout::wrapPan(params)).tileCount();
        const auto draws = surface.calls(RecordingSurface::Op::DrawImage);
        if (expected == 0 || draws.size() != expected) {
            printf("FAILED: expected %lld tile draws, got %d\n",
                   static_cast<long long>(expected), static_cast<int>(draws.size()));
            return false;
        }

        // Every device pixel of the frame lies inside some tile
        QRectF covered;
        for (const auto& call : draws) {
            covered = covered.united(call.deviceRect());
        }
        if (!covered.contains(QRectF(0, 0, 400, 400))) {
            printf("FAILED: tiles do not cover the frame\n");
            return false;
        }
        if (surface.currentTransform() != QTransform()) {
            printf("FAILED: transform should be restored after rendering\n");
            return false;
        }

        printf("PASSED\n");
        return true;
    }

    /**
     * @brief Overlays only appear in the modes that ask for them.
     */
    static bool testOverlaySelection() {
        printf("  testOverlaySelection... ");

        auto pattern = solidPattern(100, 100);
        RenderState state;
        state.setScale(1.0);

        RecordingSurface surface(QSize(300, 300));
        Compositor::render(surface, state, pattern.get());
        if (surface.count(RecordingSurface::Op::StrokeLine) != 0
            || surface.count(RecordingSurface::Op::StrokeRect) != 0) {
            printf("FAILED: plain tile mode should draw no overlays\n");
            return false;
        }

        state.setViewMode(ViewMode::tileGrid());
        surface.reset();
        Compositor::render(surface, state, pattern.get());
        if (surface.count(RecordingSurface::Op::StrokeLine) == 0) {
            printf("FAILED: tile-grid mode should draw boundary lines\n");
            return false;
        }

        state.setViewMode(ViewMode::tile());
        state.setSeamlessTestMode(true);
        surface.reset();
        Compositor::render(surface, state, pattern.get());
        if (surface.count(RecordingSurface::Op::StrokeRect) != surface.count(RecordingSurface::Op::DrawImage)) {
            printf("FAILED: seamless mode should outline every tile\n");
            return false;
        }

        // Mockup view with no texture: background only
        state.setSeamlessTestMode(false);
        state.setViewMode(ViewMode::forMockup(MockupKind::Mug));
        MockupLibrary empty;
        surface.reset();
        Compositor::render(surface, state, pattern.get(), &empty);
        if (surface.count(RecordingSurface::Op::DrawImage) != 0
            || surface.count(RecordingSurface::Op::FillRect) == 0) {
            printf("FAILED: missing mockup texture should leave only the background\n");
            return false;
        }

        printf("PASSED\n");
        return true;
    }

    // ===== Run All Unit Tests =====

    static bool runUnitTests() {
        printf("\n=== Compositor Unit Tests ===\n\n");

        int passed = 0;
        int failed = 0;

        auto runTest = [&](bool (*test)(), const char* name) {
            if (test()) {
                passed++;
            } else {
                failed++;
                printf("  [FAILED] %s\n", name);
            }
        };

        runTest(testPlaceholder, "testPlaceholder");
        runTest(testBackground, "testBackground");
        runTest(testPreviewTransform, "testPreviewTransform");
        runTest(testExportFraming, "testExportFraming");
        runTest(testAbort, "testAbort");
        runTest(testExportPattern, "testExportPattern");
        runTest(testJpegFlattensOntoWhite, "testJpegFlattensOntoWhite");
        runTest(testFabricSwatch, "testFabricSwatch");
        runTest(testOverlaySelection, "testOverlaySelection");
        runTest(testLargePanRenders, "testLargePanRenders");

        printf("\n=== Results: %d passed, %d failed ===\n\n", passed, failed);

        return failed == 0;
    }
};
