#pragma once

#include <cstdint>
#include <vector>

// Procedural beeps over NDSP.
// - Sine tones are synthesized on demand (16-bit mono, 22050 Hz) and cached in linear memory
// - Playback round-robins over a small pool of SFX channels so beeps can overlap
// - Off the 3DS there is no audio backend; calls are accepted and ignored

namespace sound {

static constexpr int kSampleRate = 22050;

// Initialize/shutdown the audio system. Must be called from the main thread.
bool init();
void shutdown();

// Call once per frame to recycle finished channels.
void update();

// Global on/off switch (persisted by options). Disabled beeps are dropped.
void set_enabled(bool enabled);
bool toggle_enabled(); // returns the new state
bool is_enabled();
// True once the audio backend initialised successfully.
bool is_available();

// Sine tone: round(ms/1000*22050) samples, amplitude 32767*clamp(volume,0,1).
std::vector<int16_t> synth_beep(int frequency, int durationMs, float volume = 0.3f);

// Play a tone if enabled and available. Errors never reach the caller.
void play_beep(int frequency, int durationMs = 50, float volume = 0.3f);

// Notes back to back in one clip.
void play_melody(const std::vector<int>& frequencies, int noteMs, float volume = 0.3f);

}
