#pragma once

// ============================================================================
// MockupKind - Closed set of product mockups the pattern can be previewed on
// ============================================================================

#include <QString>
#include <array>

/**
 * @brief Product mockup textures that carry a chroma-key region.
 *
 * Adding a value here forces every switch over MockupKind to handle it
 * (the switches intentionally have no default branch).
 */
enum class MockupKind {
    Phone,
    IPad,
    Tote,
    Bandana,
    Bedspread,
    Mug,
    Bottle,
    Sweatshirt
};

/// All mockup kinds, in the order they are offered in the UI.
constexpr std::array<MockupKind, 8> ALL_MOCKUP_KINDS = {
    MockupKind::Phone, MockupKind::IPad, MockupKind::Tote, MockupKind::Bandana,
    MockupKind::Bedspread, MockupKind::Mug, MockupKind::Bottle, MockupKind::Sweatshirt
};

/**
 * @brief Stable string key used in view-mode strings and on the command line.
 */
QString mockupKey(MockupKind kind);

/**
 * @brief Human readable label for menus.
 */
QString mockupLabel(MockupKind kind);

/**
 * @brief Texture file name inside the mockup directory.
 */
QString mockupFileName(MockupKind kind);

/**
 * @brief Parse a mockup key.
 * @param key Key as produced by mockupKey().
 * @param ok Set to false if the key is unknown (may be null).
 * @return The parsed kind, or MockupKind::Phone when unknown.
 */
MockupKind mockupKindFromKey(const QString& key, bool* ok = nullptr);
