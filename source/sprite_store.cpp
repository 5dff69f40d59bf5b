// sprite_store.cpp - cJSON backed sprite persistence
#include <algorithm>
#include <climits>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include "cJSON.h"
#include "sprite_store.hpp"
#include "led_grid.hpp"
#include "storage.hpp"
#include "hardware.hpp"

void Sprite::set(int x, int y, const Color &c) {
    if (x < 0 || x >= w || y < 0 || y >= h) return;
    pixels[{x, y}] = c;
}

void Sprite::erase(int x, int y) {
    pixels.erase({x, y});
}

bool Sprite::get(int x, int y, Color &out) const {
    auto it = pixels.find({x, y});
    if (it == pixels.end()) return false;
    out = it->second;
    return true;
}

// Clamp in the double domain so out-of-range JSON numbers never overflow the cast.
static int json_int(double v, double lo, double hi) {
    return (int)std::max(lo, std::min(hi, v));
}

static constexpr double kMaxCoord = 1e6;

SpriteStore::SpriteStore(std::string path) : path_(std::move(path)) {}

// "x,y" -> ints; rejects anything else
static bool parse_pixel_key(const char* key, int &x, int &y) {
    if (!key) return false;
    char* end = nullptr;
    long long lx = std::strtoll(key, &end, 10);
    if (end == key || *end != ',') return false;
    const char* ys = end + 1;
    long long ly = std::strtoll(ys, &end, 10);
    if (end == ys || *end != '\0') return false;
    if (lx < INT_MIN || lx > INT_MAX || ly < INT_MIN || ly > INT_MAX) return false;
    x = (int)lx; y = (int)ly;
    return true;
}

static bool parse_sprite(const cJSON* obj, Sprite &out) {
    if (!cJSON_IsObject(obj)) return false;
    const cJSON* w = cJSON_GetObjectItem(obj, "w");
    const cJSON* h = cJSON_GetObjectItem(obj, "h");
    if (!cJSON_IsNumber(w) || !cJSON_IsNumber(h)) return false;
    out.w = json_int(w->valuedouble, -kMaxCoord, kMaxCoord);
    out.h = json_int(h->valuedouble, -kMaxCoord, kMaxCoord);
    out.pixels.clear();
    const cJSON* pixels = cJSON_GetObjectItem(obj, "pixels");
    if (!pixels || cJSON_IsNull(pixels)) return true;
    if (!cJSON_IsObject(pixels)) return false;
    const cJSON* px = nullptr;
    cJSON_ArrayForEach(px, pixels) {
        int x, y;
        if (!parse_pixel_key(px->string, x, y)) return false;
        if (!cJSON_IsArray(px) || cJSON_GetArraySize(px) != 3) return false;
        int ch[3];
        for (int i = 0; i < 3; ++i) {
            const cJSON* v = cJSON_GetArrayItem(px, i);
            if (!cJSON_IsNumber(v)) return false;
            ch[i] = json_int(v->valuedouble, 0.0, 255.0);
        }
        out.pixels[{x, y}] = Color(ch[0], ch[1], ch[2]);
    }
    return true;
}

bool SpriteStore::load() {
    sprites_.clear();
    std::string text;
    if (!storage::read_file(path_, text)) return false;
    cJSON* root = cJSON_Parse(text.c_str());
    if (!root || !cJSON_IsObject(root)) {
        char buf[96];
        std::snprintf(buf, sizeof buf, "sprites: bad json %s\n", path_.c_str());
        hw_log(buf);
        cJSON_Delete(root);
        return false;
    }
    const cJSON* item = nullptr;
    int skipped = 0;
    cJSON_ArrayForEach(item, root) {
        Sprite s;
        if (item->string && parse_sprite(item, s)) sprites_[item->string] = std::move(s);
        else ++skipped;
    }
    cJSON_Delete(root);
    if (skipped) {
        char buf[64];
        std::snprintf(buf, sizeof buf, "sprites: skipped %d\n", skipped);
        hw_log(buf);
    }
    return true;
}

bool SpriteStore::save() const {
    cJSON* root = cJSON_CreateObject();
    for (const auto &kv : sprites_) {
        const Sprite &s = kv.second;
        cJSON* obj = cJSON_CreateObject();
        cJSON_AddNumberToObject(obj, "h", s.h);
        // Pixel keys sorted as text to keep the file stable between saves
        std::map<std::string, Color> sorted;
        for (const auto &p : s.pixels)
            sorted[std::to_string(p.first.first) + "," + std::to_string(p.first.second)] = p.second;
        cJSON* pixels = cJSON_CreateObject();
        for (const auto &p : sorted) {
            int rgb[3] = {p.second.r, p.second.g, p.second.b};
            cJSON_AddItemToObject(pixels, p.first.c_str(), cJSON_CreateIntArray(rgb, 3));
        }
        cJSON_AddItemToObject(obj, "pixels", pixels);
        cJSON_AddNumberToObject(obj, "w", s.w);
        cJSON_AddItemToObject(root, kv.first.c_str(), obj);
    }
    char* json = cJSON_Print(root);
    cJSON_Delete(root);
    if (!json) { hw_log("sprites: print failed\n"); return false; }
    bool ok = storage::write_file(path_, json);
    cJSON_free(json);
    return ok;
}

Sprite* SpriteStore::get(const std::string &name) {
    auto it = sprites_.find(name);
    return it == sprites_.end() ? nullptr : &it->second;
}

const Sprite* SpriteStore::get(const std::string &name) const {
    auto it = sprites_.find(name);
    return it == sprites_.end() ? nullptr : &it->second;
}

Sprite& SpriteStore::get_or_create(const std::string &name, int w, int h) {
    Sprite &s = sprites_[name];
    if (s.w != w || s.h != h) {
        s.w = w; s.h = h;
        s.pixels.clear();
    }
    return s;
}

void draw_sprite(LEDGrid &grid, const Sprite &sprite, int ox, int oy) {
    for (const auto &p : sprite.pixels)
        grid.set_pixel(ox + p.first.first, oy + p.first.second, p.second);
}
