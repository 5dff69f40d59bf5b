// font_store.cpp - cJSON backed glyph overrides
#include <cstdio>
#include <utility>
#include "cJSON.h"
#include "font_store.hpp"
#include "storage.hpp"
#include "hardware.hpp"

static Glyph coerce(const Glyph &g) {
    Glyph out{};
    for (int y = 0; y < font::GLYPH_H; ++y)
        for (int x = 0; x < font::GLYPH_W; ++x)
            out[y][x] = g[y][x] ? 1 : 0;
    return out;
}

// Exactly 5 rows of 3 numbers, anything non-zero is lit.
static bool parse_glyph(const cJSON* arr, Glyph &out) {
    if (!cJSON_IsArray(arr) || cJSON_GetArraySize(arr) != font::GLYPH_H) return false;
    int y = 0;
    const cJSON* row = nullptr;
    cJSON_ArrayForEach(row, arr) {
        if (!cJSON_IsArray(row) || cJSON_GetArraySize(row) != font::GLYPH_W) return false;
        int x = 0;
        const cJSON* v = nullptr;
        cJSON_ArrayForEach(v, row) {
            if (!cJSON_IsNumber(v) && !cJSON_IsBool(v)) return false;
            bool lit = cJSON_IsBool(v) ? cJSON_IsTrue(v) : v->valuedouble != 0.0;
            out[y][x++] = lit ? 1 : 0;
        }
        ++y;
    }
    return true;
}

FontStore::FontStore(std::string path) : path_(std::move(path)) {}

bool FontStore::load() {
    overrides_.clear();
    std::string text;
    if (!storage::read_file(path_, text)) return false;
    cJSON* root = cJSON_Parse(text.c_str());
    if (!root || !cJSON_IsObject(root)) {
        char buf[96];
        std::snprintf(buf, sizeof buf, "font: bad json %s\n", path_.c_str());
        hw_log(buf);
        cJSON_Delete(root);
        return false;
    }
    const cJSON* item = nullptr;
    cJSON_ArrayForEach(item, root) {
        if (!item->string || item->string[0] == '\0' || item->string[1] != '\0') continue;
        Glyph g{};
        if (!parse_glyph(item, g)) continue;
        overrides_[font::normalize(item->string[0])] = g;
    }
    cJSON_Delete(root);
    return true;
}

bool FontStore::save() const {
    cJSON* root = cJSON_CreateObject();
    for (const auto &kv : overrides_) {
        cJSON* rows = cJSON_CreateArray();
        for (const auto &r : kv.second) {
            int vals[3] = {r[0], r[1], r[2]};
            cJSON_AddItemToArray(rows, cJSON_CreateIntArray(vals, 3));
        }
        char key[2] = {kv.first, '\0'};
        cJSON_AddItemToObject(root, key, rows);
    }
    char* json = cJSON_Print(root);
    cJSON_Delete(root);
    if (!json) { hw_log("font: print failed\n"); return false; }
    bool ok = storage::write_file(path_, json);
    cJSON_free(json);
    return ok;
}

void FontStore::set_overrides(const FontOverrides &overrides) {
    overrides_.clear();
    for (const auto &kv : overrides) overrides_[font::normalize(kv.first)] = coerce(kv.second);
}

void FontStore::set_glyph(char ch, const Glyph &glyph) {
    overrides_[font::normalize(ch)] = coerce(glyph);
}

void FontStore::clear_glyph(char ch) {
    overrides_.erase(font::normalize(ch));
}

bool FontStore::get_glyph(char ch, Glyph &out) const {
    auto it = overrides_.find(font::normalize(ch));
    if (it == overrides_.end()) return false;
    out = it->second;
    return true;
}
