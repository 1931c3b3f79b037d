#include "MockupLibrary.h"

#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QImageReader>

int MockupLibrary::loadFromDirectory(const QString& directory)
{
    m_directory = directory;

    QDir dir(directory);
    if (!dir.exists()) {
        qWarning() << "MockupLibrary: directory does not exist:" << directory;
        return 0;
    }

    int loaded = 0;
    for (MockupKind kind : ALL_MOCKUP_KINDS) {
        const QString path = dir.filePath(mockupFileName(kind));
        if (!QFileInfo::exists(path)) {
            qDebug() << "MockupLibrary: no texture for" << mockupKey(kind) << "at" << path;
            continue;
        }
        if (loadTexture(kind, path)) {
            ++loaded;
        }
    }

    qDebug() << "MockupLibrary: loaded" << loaded << "of" << static_cast<int>(ALL_MOCKUP_KINDS.size())
             << "mockups from" << directory;
    return loaded;
}

bool MockupLibrary::loadTexture(MockupKind kind, const QString& path)
{
    QImageReader reader(path);
    reader.setAutoTransform(true);
    QImage image = reader.read();
    if (image.isNull()) {
        qWarning() << "MockupLibrary:" << mockupKey(kind) << "mockup failed to load:"
                   << reader.errorString();
        return false;
    }

    setTexture(kind, image);
    return true;
}

void MockupLibrary::setTexture(MockupKind kind, const QImage& image)
{
    m_textures[indexOf(kind)] = image;
}

void MockupLibrary::clear()
{
    for (QImage& texture : m_textures) {
        texture = QImage();
    }
}

const QImage& MockupLibrary::texture(MockupKind kind) const
{
    return m_textures[indexOf(kind)];
}

bool MockupLibrary::hasTexture(MockupKind kind) const
{
    return !m_textures[indexOf(kind)].isNull();
}

int MockupLibrary::textureCount() const
{
    int count = 0;
    for (const QImage& texture : m_textures) {
        if (!texture.isNull()) ++count;
    }
    return count;
}
