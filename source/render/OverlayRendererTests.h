#pragma once

// ============================================================================
// OverlayRendererTests - Unit tests for the tile grid, seamless test and
// measurement grid overlays
// ============================================================================
// Run with: patternproof --test-overlay
// ============================================================================

#include "OverlayRenderer.h"
#include "RecordingSurface.h"
#include <QDebug>
#include <QtMath>

namespace OverlayRendererTests {

inline bool same(qreal a, qreal b)
{
    return qAbs(a - b) < 1e-9;
}

/**
 * @brief Tile boundary lines: one per edge, extended a tile past the range.
 */
inline bool testTileGridLines()
{
    qDebug() << "=== Test: Tile Grid Lines ===";
    bool success = true;

    TileRange range;
    range.startX = -1;
    range.startY = -1;
    range.countX = 2;
    range.countY = 2;

    QVector<QLineF> lines = OverlayRenderer::tileGridLines(range, 100, 0, 0);
    if (lines.size() != 6) {
        qDebug() << "FAIL: 2x2 range should give 3 vertical + 3 horizontal lines, got" << lines.size();
        return false;
    }

    const QLineF first = lines.first();
    if (!same(first.x1(), -100) || !same(first.y1(), -200) || !same(first.y2(), 200)) {
        qDebug() << "FAIL: first vertical line" << first << "expected x=-100 from -200 to 200";
        success = false;
    }
    const QLineF horizontal = lines[3];
    if (!same(horizontal.y1(), -100) || !same(horizontal.x1(), -200) || !same(horizontal.x2(), 200)) {
        qDebug() << "FAIL: first horizontal line" << horizontal;
        success = false;
    }

    // Offsets move the lines with the tiles
    lines = OverlayRenderer::tileGridLines(range, 100, 0.25, 0.5);
    if (!same(lines[0].x1(), -75) || !same(lines[2].x1(), 125) || !same(lines[3].y1(), -50)) {
        qDebug() << "FAIL: offset grid lines" << lines[0] << lines[2] << lines[3];
        success = false;
    }

    if (!OverlayRenderer::tileGridLines(TileRange(), 100, 0, 0).isEmpty()) {
        qDebug() << "FAIL: empty range should give no lines";
        success = false;
    }

    if (success) {
        qDebug() << "PASS: Tile grid lines";
    }
    return success;
}

/**
 * @brief Measurement grid spacing, anchoring and extent.
 */
inline bool testMeasurementGridLines()
{
    qDebug() << "=== Test: Measurement Grid Lines ===";
    bool success = true;

    // 1 inch = 150px; a 300px view needs 2 cells + 2 spare = 4 cells, 5 lines per axis
    QVector<QLineF> lines = OverlayRenderer::measurementGridLines(1, QSizeF(300, 300), QPointF(0, 0), 1.0);
    if (lines.size() != 10) {
        qDebug() << "FAIL: expected 10 lines, got" << lines.size();
        return false;
    }
    if (!same(lines[0].x1(), 0) || !same(lines[4].x1(), 600) || !same(lines[0].y2(), 600)) {
        qDebug() << "FAIL: 1in grid should run 0..600, got" << lines[0] << lines[4];
        success = false;
    }

    // Panning right by 100 exposes the cell starting at -150
    lines = OverlayRenderer::measurementGridLines(1, QSizeF(300, 300), QPointF(100, 0), 1.0);
    if (!same(lines[0].x1(), -150) || !same(lines[1].x1(), 0)) {
        qDebug() << "FAIL: panned grid should start at -150, got" << lines[0].x1();
        success = false;
    }

    // 2x zoom halves the visible extent: 1 cell + 2 spare
    lines = OverlayRenderer::measurementGridLines(1, QSizeF(300, 300), QPointF(0, 0), 2.0);
    if (lines.size() != 8) {
        qDebug() << "FAIL: 2x zoom should give 4 lines per axis, got" << lines.size();
        success = false;
    }

    // 12in spacing
    lines = OverlayRenderer::measurementGridLines(12, QSizeF(300, 300), QPointF(0, 0), 1.0);
    if (lines.size() < 2 || !same(lines[1].x1(), 1800)) {
        qDebug() << "FAIL: 12in spacing should be 1800px";
        success = false;
    }

    if (!OverlayRenderer::measurementGridLines(0, QSizeF(300, 300), QPointF(), 1.0).isEmpty()) {
        qDebug() << "FAIL: grid size 0 should draw nothing";
        success = false;
    }

    if (success) {
        qDebug() << "PASS: Measurement grid lines";
    }
    return success;
}

/**
 * @brief Line widths and dashes stay constant in device pixels.
 */
inline bool testStylesCompensateZoom()
{
    qDebug() << "=== Test: Zoom-Compensated Styles ===";
    bool success = true;

    StrokeStyle grid = OverlayRenderer::tileGridStyle(2.0);
    if (!same(grid.width, 0.5) || grid.color != QColor(255, 255, 255, 102) || grid.isDashed()) {
        qDebug() << "FAIL: tile grid style at 2x";
        success = false;
    }

    StrokeStyle seam = OverlayRenderer::seamlessTestStyle(0.5);
    if (!same(seam.width, 6.0) || seam.color != QColor(255, 0, 0, 204)) {
        qDebug() << "FAIL: seamless style at 0.5x";
        success = false;
    }

    StrokeStyle measure = OverlayRenderer::measurementGridStyle(2.0);
    if (!same(measure.width, 1.0) || measure.dashPattern.size() != 2
        || !same(measure.dashPattern[0], 2.5) || !same(measure.dashPattern[1], 2.5)) {
        qDebug() << "FAIL: measurement style at 2x";
        success = false;
    }

    // Drawn under scale(zoom), every line comes out 2 device pixels wide
    RecordingSurface surface(QSize(300, 300));
    surface.scale(4.0, 4.0);
    OverlayRenderer::drawMeasurementGrid(surface, 2, QSizeF(300, 300), QPointF(), 4.0);
    const auto strokes = surface.calls(RecordingSurface::Op::StrokeLine);
    if (strokes.isEmpty()) {
        qDebug() << "FAIL: measurement grid drew nothing";
        success = false;
    }
    for (const auto& call : strokes) {
        if (!same(call.style.width * call.transform.m11(), 2.0)) {
            qDebug() << "FAIL: device width" << call.style.width * call.transform.m11();
            success = false;
            break;
        }
    }

    if (success) {
        qDebug() << "PASS: Zoom-compensated styles";
    }
    return success;
}

/**
 * @brief Seamless test outlines every placement and leaves the state balanced.
 */
inline bool testSeamlessOutlines()
{
    qDebug() << "=== Test: Seamless Outlines ===";
    bool success = true;

    TileLayoutParams params;
    params.viewportSize = QSizeF(100, 100);
    params.tileSize = 50;
    params.repeatType = RepeatType::Brick;
    const QVector<TilePlacement> placements = TileLayout::compute(params);

    RecordingSurface surface(QSize(100, 100));
    OverlayRenderer::drawSeamlessTest(surface, TileLayout::coveringRange(params), params);

    const auto rects = surface.calls(RecordingSurface::Op::StrokeRect);
    if (rects.size() != placements.size()) {
        qDebug() << "FAIL: expected" << placements.size() << "outlines, got" << rects.size();
        success = false;
    } else {
        for (int k = 0; k < rects.size(); ++k) {
            if (rects[k].rect != placements[k].rect) {
                qDebug() << "FAIL: outline" << k << "does not match its tile";
                success = false;
                break;
            }
        }
    }
    if (surface.count(RecordingSurface::Op::Save) != surface.count(RecordingSurface::Op::Restore)) {
        qDebug() << "FAIL: unbalanced save/restore";
        success = false;
    }

    if (success) {
        qDebug() << "PASS: Seamless outlines";
    }
    return success;
}

/**
 * @brief Run all OverlayRenderer tests.
 * @return True if all tests pass.
 */
inline bool runAllTests()
{
    qDebug() << "\n========================================";
    qDebug() << "Running OverlayRenderer Unit Tests";
    qDebug() << "========================================\n";

    bool allPass = true;

    allPass &= testTileGridLines();
    qDebug() << "";

    allPass &= testMeasurementGridLines();
    qDebug() << "";

    allPass &= testStylesCompensateZoom();
    qDebug() << "";

    allPass &= testSeamlessOutlines();

    qDebug() << "\n========================================";
    if (allPass) {
        qDebug() << "ALL TESTS PASSED!";
    } else {
        qDebug() << "SOME TESTS FAILED!";
    }
    qDebug() << "========================================\n";

    return allPass;
}

} // namespace OverlayRendererTests
