#include "Compositor.h"
#include "ChromaKeyCompositor.h"
#include "OverlayRenderer.h"
#include "PainterSurface.h"
#include "../mockups/MockupLibrary.h"

#include <QBuffer>
#include <QCoreApplication>
#include <QDebug>
#include <QImageWriter>
#include <QPainter>
#include <QPainterPath>

namespace Compositor {

namespace {

void fillChecker(RenderSurface& surface, const QColor& even, const QColor& odd)
{
    const QSize size = surface.size();
    surface.fillRect(QRectF(QPointF(0, 0), QSizeF(size)), odd);
    for (int y = 0, row = 0; y < size.height(); y += CHECKER_SQUARE, ++row) {
        for (int x = 0, col = 0; x < size.width(); x += CHECKER_SQUARE, ++col) {
            if ((row + col) % 2 == 0) {
                surface.fillRect(QRectF(x, y, CHECKER_SQUARE, CHECKER_SQUARE), even);
            }
        }
    }
}

void renderTiled(RenderSurface& surface, const RenderState& state, const PatternImage& pattern)
{
    const TileLayoutParams params = previewParams(state, state.tileSizeFor(pattern.width()),
                                                  QSizeF(surface.size()));
    drawTiles(surface, pattern.image(), params);

    const bool tileGrid = state.viewMode().kind == ViewMode::TileGrid;
    if (tileGrid || state.seamlessTestMode()) {
        // Same wrapped frame drawTiles used, so outlines sit on the tiles
        const TileLayoutParams wrapped = TileLayout::wrapPan(params);
        const TileRange range = TileLayout::coveringRange(wrapped);

        surface.save();
        surface.translate(wrapped.pan.x(), wrapped.pan.y());
        surface.scale(wrapped.zoom, wrapped.zoom);
        if (tileGrid) {
            OverlayRenderer::drawTileGrid(surface, range, wrapped);
        }
        if (state.seamlessTestMode()) {
            OverlayRenderer::drawSeamlessTest(surface, range, wrapped);
        }
        surface.restore();
    }

    // Anchored at logical 0, which the tile period does not preserve
    if (state.gridOverlaySize() > 0) {
        surface.save();
        surface.translate(params.pan.x(), params.pan.y());
        surface.scale(params.zoom, params.zoom);
        OverlayRenderer::drawMeasurementGrid(surface, state.gridOverlaySize(),
                                             params.viewportSize, params.pan, params.zoom);
        surface.restore();
    }
}

} // namespace

TileLayoutParams previewParams(const RenderState& state, qreal tileSize, const QSizeF& viewportSize)
{
    TileLayoutParams params;
    params.viewportSize = viewportSize;
    params.tileSize = tileSize;
    params.pan = state.pan();
    params.zoom = state.zoom();
    params.offsetPercentX = state.offsetPercentX();
    params.offsetPercentY = state.offsetPercentY();
    params.repeatType = state.repeatType();
    return params;
}

qreal exportFactor(const RenderState& state, int exportSize)
{
    return static_cast<qreal>(exportSize) / state.maxCanvasSize();
}

TileLayoutParams exportParams(const RenderState& state, qreal tileSize, int exportSize)
{
    const qreal f = exportFactor(state, exportSize);
    TileLayoutParams params = previewParams(state, tileSize, QSizeF(exportSize, exportSize));
    params.pan = state.pan() * f;
    params.zoom = state.zoom() * f;
    return params;
}

bool drawTiles(RenderSurface& surface, const QImage& tile, const TileLayoutParams& layout,
               const std::atomic<bool>* abort)
{
    const TileLayoutParams params = TileLayout::wrapPan(layout);
    const TileRange range = TileLayout::coveringRange(params);
    if (range.isEmpty()) {
        return true;
    }

    surface.save();
    surface.translate(params.pan.x(), params.pan.y());
    surface.scale(params.zoom, params.zoom);

    bool completed = true;
    for (qint64 i = range.startX; i < range.endX(); ++i) {
        if (abort && abort->load()) {
            completed = false;
            break;
        }
        for (qint64 j = range.startY; j < range.endY(); ++j) {
            const QPointF pos = TileLayout::placeTile(TileIndex(i, j), params.tileSize,
                                                      params.offsetPercentX, params.offsetPercentY,
                                                      params.repeatType);
            surface.drawImage(QRectF(pos, QSizeF(params.tileSize, params.tileSize)), tile);
        }
    }

    surface.restore();
    return completed;
}

void drawBackground(RenderSurface& surface, const Background& background)
{
    if (background.isChecker()) {
        fillChecker(surface, QColor(0x99, 0x99, 0x99), QColor(0xcc, 0xcc, 0xcc));
    } else {
        surface.fillRect(QRectF(QPointF(0, 0), QSizeF(surface.size())), background.color());
    }
}

void drawPlaceholder(RenderSurface& surface)
{
    fillChecker(surface, QColor(0x1a, 0x1a, 0x1a), QColor(0x2a, 0x2a, 0x2a));
    surface.drawText(QRectF(QPointF(0, 0), QSizeF(surface.size())),
                     QCoreApplication::translate("Compositor", "Drop or open a pattern"),
                     QColor(0xaa, 0xaa, 0xaa));
}

void drawFabricSwatch(RenderSurface& surface, const RenderState& state, const PatternImage& pattern)
{
    const QSize size = surface.size();
    const qreal maxSize = qMin(size.width(), size.height()) * 0.6;
    const qreal fabricWidth = maxSize * 0.95;
    const qreal fabricHeight = fabricWidth * 0.8;
    const QRectF swatch(-fabricWidth / 2.0, -fabricHeight / 2.0, fabricWidth, fabricHeight);

    QPainterPath path;
    path.addRoundedRect(swatch, FABRIC_CORNER_RADIUS, FABRIC_CORNER_RADIUS);

    surface.save();
    surface.translate(size.width() / 2.0, size.height() / 2.0);
    surface.fillPath(path, QColor(0x2a, 0x2a, 0x2a));
    surface.strokePath(path, StrokeStyle(QColor(0x44, 0x44, 0x44), 2.0));
    surface.clipToPath(path);

    const QVector<TilePlacement> placements = TileLayout::computeLocal(
        swatch.topLeft(), swatch.size(), state.tileSizeFor(pattern.width()),
        state.offsetPercentX(), state.offsetPercentY(), state.repeatType());
    for (const TilePlacement& placement : placements) {
        surface.drawImage(placement.rect, pattern.image());
    }

    surface.restore();
}

void render(RenderSurface& surface, const RenderState& state, const PatternImage* pattern,
            const MockupLibrary* mockups, bool highQuality)
{
    surface.clear(Qt::transparent);

    if (!pattern) {
        drawPlaceholder(surface);
        return;
    }

    drawBackground(surface, state.background());
    surface.setHighQualityResampling(highQuality);

    const ViewMode mode = state.viewMode();
    switch (mode.kind) {
        case ViewMode::Tile:
        case ViewMode::TileGrid:
            renderTiled(surface, state, *pattern);
            break;
        case ViewMode::Mockup:
            if (mockups && mockups->hasTexture(mode.mockup)) {
                const QImage composite = ChromaKeyCompositor::compose(
                    mockups->texture(mode.mockup), state, *pattern, surface.size());
                ChromaKeyCompositor::draw(surface, composite, state.mockupRotate());
            }
            break;
        case ViewMode::Fabric:
            drawFabricSwatch(surface, state, *pattern);
            break;
    }
}

QImage renderExportImage(const RenderState& state, const PatternImage& pattern, int exportSize,
                         const std::atomic<bool>* abort)
{
    QImage image(exportSize, exportSize, QImage::Format_ARGB32_Premultiplied);
    if (image.isNull()) {
        qWarning() << "Compositor: could not allocate" << exportSize << "x" << exportSize << "export buffer";
        return QImage();
    }
    image.fill(Qt::transparent);

    const TileLayoutParams params = exportParams(state, state.tileSizeFor(pattern.width()), exportSize);

    QPainter painter(&image);
    PainterSurface surface(painter, image.size());
    surface.setHighQualityResampling(true);
    const bool completed = drawTiles(surface, pattern.image(), params, abort);
    painter.end();

    if (!completed) {
        return QImage();
    }
    return image;
}

QByteArray encode(const QImage& image, ExportFormat format, QString* errorMessage)
{
    if (image.isNull()) {
        if (errorMessage) *errorMessage = QStringLiteral("Nothing to encode");
        return QByteArray();
    }

    QImage output = image;
    if (format == ExportFormat::Jpg) {
        output = QImage(image.size(), QImage::Format_RGB32);
        output.fill(Qt::white);
        QPainter painter(&output);
        painter.drawImage(0, 0, image);
        painter.end();
    }

    QByteArray bytes;
    QBuffer buffer(&bytes);
    buffer.open(QIODevice::WriteOnly);

    QImageWriter writer(&buffer, format == ExportFormat::Jpg ? "jpg" : "png");
    if (format == ExportFormat::Jpg) {
        writer.setQuality(EXPORT_JPEG_QUALITY);
    }

    if (!writer.write(output)) {
        if (errorMessage) *errorMessage = writer.errorString();
        qWarning() << "Compositor: encode failed:" << writer.errorString();
        return QByteArray();
    }
    return bytes;
}

ExportResult exportPattern(const RenderState& state, const PatternImage* pattern,
                           const ExportRequest& request, const std::atomic<bool>* abort)
{
    ExportResult result;
    result.request = request;

    if (!pattern) {
        result.status = ExportStatus::NoPattern;
        result.message = QStringLiteral("No pattern loaded");
        return result;
    }
    if (!request.isValid()) {
        result.status = ExportStatus::InvalidRequest;
        result.message = QStringLiteral("Export size must be between %1 and %2")
                             .arg(ExportRequest::MIN_SIZE).arg(ExportRequest::MAX_SIZE);
        return result;
    }

    const QImage image = renderExportImage(state, *pattern, request.size, abort);
    if (image.isNull()) {
        if (abort && abort->load()) {
            result.status = ExportStatus::Cancelled;
            result.message = QStringLiteral("Export cancelled");
        } else {
            result.status = ExportStatus::EncodeFailed;
            result.message = QStringLiteral("Could not render %1px export").arg(request.size);
        }
        return result;
    }

    QString error;
    result.data = encode(image, request.format, &error);
    if (result.data.isEmpty()) {
        result.status = ExportStatus::EncodeFailed;
        result.message = error;
        return result;
    }

    result.status = ExportStatus::Success;
    return result;
}

} // namespace Compositor
