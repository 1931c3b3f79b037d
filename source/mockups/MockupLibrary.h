#pragma once

// ============================================================================
// MockupLibrary - Decoded product mockup textures, one per MockupKind
// ============================================================================
// Textures are loaded once (at startup, or when the user points the app at a
// different mockup directory) and kept in memory. A missing texture is not an
// error for rendering: the mockup view simply shows nothing for that kind.
// ============================================================================

#include "MockupKind.h"

#include <QImage>
#include <QString>
#include <array>

class MockupLibrary {
public:
    MockupLibrary() = default;

    /**
     * @brief Load every known texture from @p directory.
     *
     * File names come from mockupFileName(). Kinds whose file is missing or
     * unreadable keep their previous texture (if any).
     *
     * @return Number of textures successfully loaded.
     */
    int loadFromDirectory(const QString& directory);

    /**
     * @brief Load a single texture file.
     * @return false if the file could not be decoded (the old texture is kept).
     */
    bool loadTexture(MockupKind kind, const QString& path);

    /// Install an already decoded texture (tests, embedded resources).
    void setTexture(MockupKind kind, const QImage& image);

    void clear();

    /// The texture for @p kind, or a null image if none is loaded.
    const QImage& texture(MockupKind kind) const;
    bool hasTexture(MockupKind kind) const;

    /// Number of kinds with a texture.
    int textureCount() const;

    /// Directory of the last loadFromDirectory() call.
    const QString& directory() const { return m_directory; }

private:
    static int indexOf(MockupKind kind) { return static_cast<int>(kind); }

    std::array<QImage, ALL_MOCKUP_KINDS.size()> m_textures;
    QString m_directory;
};
