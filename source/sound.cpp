#include "sound.hpp"

#ifdef PLATFORM_3DS
#include <3ds.h>
#include <3ds/ndsp/ndsp.h>
#endif
#include <cmath>
#include <cstdio>
#include <cstring>
#include <cstdarg>
#include <string>
#include <unordered_map>

#include "hardware.hpp" // for hw_log

namespace sound {

static constexpr double kPi = 3.14159265358979323846;
static bool g_enabled = true;
static bool g_inited = false;

// Lightweight debug logging helper
static void dbg_logf(const char* fmt, ...) {
#if defined(DEBUG)
    char buf[256];
    va_list ap; va_start(ap, fmt);
    vsnprintf(buf, sizeof(buf), fmt, ap);
    va_end(ap);
    hw_log(buf);
#else
    (void)fmt;
#endif
}

std::vector<int16_t> synth_beep(int frequency, int durationMs, float volume) {
    std::vector<int16_t> pcm;
    long n = std::lround(durationMs / 1000.0 * kSampleRate);
    if (n <= 0) return pcm;
    float v = volume < 0.0f ? 0.0f : (volume > 1.0f ? 1.0f : volume);
    int amp = (int)(32767.0f * v);
    pcm.resize((size_t)n);
    const double w = 2.0 * kPi * (double)frequency / kSampleRate;
    for (long i = 0; i < n; ++i) pcm[(size_t)i] = (int16_t)(int)(amp * std::sin(w * (double)i));
    return pcm;
}

void set_enabled(bool enabled) { g_enabled = enabled; }
bool toggle_enabled() { g_enabled = !g_enabled; return g_enabled; }
bool is_enabled() { return g_enabled; }
bool is_available() { return g_inited; }

#ifdef PLATFORM_3DS

static constexpr int kMaxSfxChannels = 8;  // logical channels, round-robin
static constexpr int kBaseNdspChannel = 0; // starting NDSP channel index for SFX

struct SfxState {
    ndspWaveBuf wave{};
    bool active = false;
};
static SfxState g_sfx[kMaxSfxChannels];
static int g_nextChannel = 0;

// Beep cache: each (freq, ms, volume) tone lives once in linear memory.
struct Clip {
    void* data = nullptr;   // linear-allocated PCM16 mono
    size_t bytes = 0;
    u32 nsamples = 0;
};
static std::unordered_map<std::string, Clip> g_clipCache;

static Clip* cache_clip(const std::string& key, const std::vector<int16_t>& pcm) {
    auto it = g_clipCache.find(key);
    if (it != g_clipCache.end()) return &it->second;
    if (pcm.empty()) return nullptr;
    Clip c{};
    c.bytes = pcm.size() * sizeof(int16_t);
    c.nsamples = (u32)pcm.size();
    c.data = linearAlloc(c.bytes);
    if (!c.data) { dbg_logf("sfx linearAlloc fail (%zu)\n", c.bytes); return nullptr; }
    memcpy(c.data, pcm.data(), c.bytes);
    DSP_FlushDataCache(c.data, c.bytes);
    auto res = g_clipCache.emplace(key, c);
    dbg_logf("beep cached: %s bytes=%zu\n", key.c_str(), c.bytes);
    return &res.first->second;
}

static void play_clip(const Clip& clip) {
    int channel = g_nextChannel;
    g_nextChannel = (g_nextChannel + 1) % kMaxSfxChannels;
    int ndspCh = kBaseNdspChannel + channel;
    ndspChnWaveBufClear(ndspCh);
    ndspChnReset(ndspCh);
    ndspChnSetInterp(ndspCh, NDSP_INTERP_NONE);
    ndspChnSetRate(ndspCh, (float)kSampleRate);
    ndspChnSetFormat(ndspCh, NDSP_FORMAT_MONO_PCM16);
    {
        float mix[12] = {0}; mix[0] = 1.0f; mix[1] = 1.0f; ndspChnSetMix(ndspCh, mix);
    }
    SfxState &S = g_sfx[channel];
    memset(&S.wave, 0, sizeof(S.wave));
    S.wave.data_vaddr = clip.data;
    S.wave.nsamples = clip.nsamples;
    S.wave.looping = false;
    ndspChnWaveBufAdd(ndspCh, &S.wave);
    S.active = true;
}

bool init() {
    if (g_inited) return true;
    if (ndspInit() != 0) {
        hw_log("ndspInit failed, audio disabled\n");
        // Probe for DSP firmware dump (required for 3DSX homebrew)
        FILE* df = fopen("sdmc:/3ds/dspfirm.cdc", "rb");
        if (df) { fclose(df); dbg_logf("dspfirm.cdc present (NDSP still failed)\n"); }
        else { dbg_logf("dspfirm.cdc NOT found at sdmc:/3ds/dspfirm.cdc\n"); }
        return false;
    }
    ndspSetOutputMode(NDSP_OUTPUT_STEREO);
    ndspSetMasterVol(1.0f);
    for (int i = 0; i < kMaxSfxChannels; ++i) {
        int ndspCh = kBaseNdspChannel + i;
        ndspChnReset(ndspCh);
        ndspChnSetInterp(ndspCh, NDSP_INTERP_NONE);
        ndspChnSetRate(ndspCh, (float)kSampleRate);
        ndspChnSetFormat(ndspCh, NDSP_FORMAT_MONO_PCM16);
    }
    g_inited = true;
    dbg_logf("sound init ok\n");
    return true;
}

void shutdown() {
    if (!g_inited) return;
    for (int i = 0; i < kMaxSfxChannels; ++i) { ndspChnWaveBufClear(kBaseNdspChannel + i); g_sfx[i].active = false; }
    for (auto &kv : g_clipCache) { if (kv.second.data) linearFree(kv.second.data); }
    g_clipCache.clear();
    ndspExit();
    g_inited = false;
    dbg_logf("sound shutdown\n");
}

void update() {
    if (!g_inited) return;
    for (int i = 0; i < kMaxSfxChannels; ++i) {
        if (g_sfx[i].active && g_sfx[i].wave.status == NDSP_WBUF_DONE) g_sfx[i].active = false;
    }
}

void play_beep(int frequency, int durationMs, float volume) {
    if (!g_enabled || !g_inited) return;
    char key[48];
    snprintf(key, sizeof key, "%d/%d/%.3f", frequency, durationMs, volume);
    std::string k(key);
    Clip* clip = g_clipCache.count(k) ? &g_clipCache[k] : cache_clip(k, synth_beep(frequency, durationMs, volume));
    if (clip) play_clip(*clip);
}

void play_melody(const std::vector<int>& frequencies, int noteMs, float volume) {
    if (!g_enabled || !g_inited || frequencies.empty()) return;
    std::string k = "melody";
    std::vector<int16_t> pcm;
    for (int f : frequencies) {
        k += "/" + std::to_string(f);
        std::vector<int16_t> note = synth_beep(f, noteMs, volume);
        pcm.insert(pcm.end(), note.begin(), note.end());
    }
    k += "/" + std::to_string(noteMs) + "/" + std::to_string(volume);
    Clip* clip = cache_clip(k, pcm);
    if (clip) play_clip(*clip);
}

#else

bool init() {
    dbg_logf("sound: no audio backend on this platform\n");
    return false;
}
void shutdown() {}
void update() {}
void play_beep(int frequency, int durationMs, float volume) {
    (void)frequency; (void)durationMs; (void)volume;
}
void play_melody(const std::vector<int>& frequencies, int noteMs, float volume) {
    (void)frequencies; (void)noteMs; (void)volume;
}

#endif // PLATFORM_3DS

} // namespace sound
