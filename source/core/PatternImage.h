#pragma once

// ============================================================================
// PatternImage - The decoded tile that gets repeated
// ============================================================================
// A PatternImage is immutable once created and is shared (never copied) by
// the session, the preview and any export job through a shared_ptr. The only
// way to build one is through the factory functions below, which reject null
// and zero-sized rasters, so width() and height() are always > 0.
// ============================================================================

#include <QImage>
#include <QString>
#include <memory>

class PatternImage {
public:
    /**
     * @brief Wrap an already decoded image.
     * @param image Decoded raster.
     * @param sourcePath Where it came from (informational, may be empty).
     * @return The pattern, or nullptr if the image is null or has a zero dimension.
     */
    static std::shared_ptr<const PatternImage> fromImage(const QImage& image,
                                                         const QString& sourcePath = QString());

    /**
     * @brief Decode an image file.
     * @return The pattern, or nullptr if the file could not be decoded.
     */
    static std::shared_ptr<const PatternImage> loadFromFile(const QString& path);

    /**
     * @brief Decode image bytes (clipboard, drag and drop, network payloads).
     * @param format Optional format hint such as "PNG".
     */
    static std::shared_ptr<const PatternImage> loadFromData(const QByteArray& data,
                                                            const char* format = nullptr);

    int width() const { return m_image.width(); }
    int height() const { return m_image.height(); }
    QSize size() const { return m_image.size(); }

    /// The raster, converted to premultiplied ARGB32 for fast blitting.
    const QImage& image() const { return m_image; }

    const QString& sourcePath() const { return m_sourcePath; }

    /**
     * @brief Scale that makes the pattern about 300px wide, clamped to [0.05, 5.0].
     *
     * Applied when a pattern is first loaded.
     */
    qreal autoFitScale() const;

private:
    PatternImage(const QImage& image, const QString& sourcePath);

    QImage m_image;
    QString m_sourcePath;
};

using PatternImagePtr = std::shared_ptr<const PatternImage>;
