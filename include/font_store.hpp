// font_store.hpp - user overrides for the 3x5 LED font, persisted to font_overrides.json
#pragma once
#include <string>
#include "font.hpp"

// font_overrides.json layout: { "A": [[0,1,0],[1,0,1],[1,1,1],[1,0,1],[1,0,1]], ... }
// Only overridden characters are stored.
class FontStore {
public:
    explicit FontStore(std::string path);

    // Missing or malformed file leaves no overrides. Glyphs that are not 5x3 are skipped.
    bool load();
    bool save() const;

    FontOverrides get_overrides() const { return overrides_; }
    void set_overrides(const FontOverrides &overrides);
    // Character is upper-cased; values are coerced to 0/1.
    void set_glyph(char ch, const Glyph &glyph);
    void clear_glyph(char ch);
    bool get_glyph(char ch, Glyph &out) const;
    const std::string &path() const { return path_; }

private:
    std::string path_;
    FontOverrides overrides_;
};
