// ============================================================================
// PatternImage - Implementation
// ============================================================================

#include "PatternImage.h"
#include "RenderState.h"

#include <QDebug>
#include <QImageReader>

namespace {
constexpr qreal AUTO_FIT_WIDTH = 300.0;
}

PatternImage::PatternImage(const QImage& image, const QString& sourcePath)
    : m_image(image.convertToFormat(QImage::Format_ARGB32_Premultiplied))
    , m_sourcePath(sourcePath)
{
}

std::shared_ptr<const PatternImage> PatternImage::fromImage(const QImage& image,
                                                            const QString& sourcePath)
{
    if (image.isNull() || image.width() <= 0 || image.height() <= 0) {
        qWarning() << "PatternImage: rejected empty image" << sourcePath;
        return nullptr;
    }

    // Constructor is private, so make_shared can't reach it
    return std::shared_ptr<const PatternImage>(new PatternImage(image, sourcePath));
}

std::shared_ptr<const PatternImage> PatternImage::loadFromFile(const QString& path)
{
    QImageReader reader(path);
    reader.setAutoTransform(true);

    QImage image = reader.read();
    if (image.isNull()) {
        qWarning() << "PatternImage: cannot decode" << path << "-" << reader.errorString();
        return nullptr;
    }

    qDebug() << "PatternImage: loaded" << path << image.size();
    return fromImage(image, path);
}

std::shared_ptr<const PatternImage> PatternImage::loadFromData(const QByteArray& data,
                                                               const char* format)
{
    QImage image;
    if (!image.loadFromData(data, format)) {
        qWarning() << "PatternImage: cannot decode" << data.size() << "bytes of image data";
        return nullptr;
    }
    return fromImage(image);
}

qreal PatternImage::autoFitScale() const
{
    return qBound(RenderState::MIN_SCALE, AUTO_FIT_WIDTH / width(), RenderState::MAX_SCALE);
}
