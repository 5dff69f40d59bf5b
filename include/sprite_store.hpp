// sprite_store.hpp - user-editable pixel art persisted to sprites.json
#pragma once
#include <map>
#include <string>
#include <utility>
#include "color.hpp"

class LEDGrid;

// Sparse sprite: only lit pixels are stored.
struct Sprite {
    int w = 0, h = 0;
    std::map<std::pair<int,int>, Color> pixels; // (x,y) -> colour

    // Out-of-bounds writes are ignored.
    void set(int x, int y, const Color &c);
    void erase(int x, int y);
    bool get(int x, int y, Color &out) const;
};

// sprites.json layout:
//   { "<name>": { "w": int, "h": int, "pixels": { "x,y": [r,g,b], ... } }, ... }
class SpriteStore {
public:
    explicit SpriteStore(std::string path);

    // Missing or malformed file leaves the store empty. Entries with a bad shape are skipped.
    bool load();
    bool save() const;

    Sprite* get(const std::string &name);
    const Sprite* get(const std::string &name) const;
    // Returns the named sprite, replacing it with an empty one if the size differs.
    Sprite& get_or_create(const std::string &name, int w, int h);
    void remove(const std::string &name) { sprites_.erase(name); }
    size_t size() const { return sprites_.size(); }
    const std::string &path() const { return path_; }

private:
    std::string path_;
    std::map<std::string, Sprite> sprites_;
};

void draw_sprite(LEDGrid &grid, const Sprite &sprite, int ox, int oy);
