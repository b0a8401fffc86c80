#pragma once

#include <cstdint>
#include <utility>
#include <vector>

#include "PixelBuffer.h"

/// Display-intensity bounds.  Always 0 <= min < max <= 255.
struct LevelsPair
{
    int min = 0;
    int max = 255;
};

/// Contrast window: one global pair plus one pair per channel.
///
/// The selection picks which pair the min/max controls edit: -1 ("All")
/// edits the global pair and windows every channel with it; k >= 0 turns
/// on per-channel mode and edits channel k's pair.
class LevelsWindow {
public:
    LevelsWindow() = default;
    explicit LevelsWindow(int channelCount) { reset(channelCount); }

    /// Restore (0, 255) everywhere and select "All".
    /// channelCount is 0 for 2-D images (no per-channel mode).
    void reset(int channelCount);

    int channelCount() const { return static_cast<int>(channels_.size()); }
    bool perChannel() const { return selected_ >= 0; }

    /// -1 selects the global pair; out-of-range channels are ignored.
    void select(int channel);
    int selected() const { return selected_; }

    const LevelsPair& global() const { return global_; }
    const LevelsPair& channel(int k) const { return channels_[k]; }

    /// Pair edited by the min/max controls.
    const LevelsPair& active() const { return selected_ < 0 ? global_ : channels_[selected_]; }

    /// Set the active minimum.  A minimum at or above the maximum pushes
    /// the maximum to min + 1.
    void setMin(int value);

    /// Set the active maximum.  A maximum at or below the minimum pushes
    /// the minimum to max - 1.
    void setMax(int value);

    /// Set the global pair, as auto-contrast does.
    void setGlobal(int lo, int hi);

private:
    LevelsPair& activeMut() { return selected_ < 0 ? global_ : channels_[selected_]; }

    LevelsPair global_;
    std::vector<LevelsPair> channels_;
    int selected_ = -1;
};

/// Convert raw samples into 8-bit display intensities.
///
/// This is a coarse, fast heuristic rather than a real dynamic-range
/// normalisation.  A divisor is picked from the raw maximum m:
///   m >= 4096 -> v / 265,  m >= 1024 -> v / 16,  m >= 256 -> v / 4,
///   m <= 1    -> v * 256,  otherwise unchanged.
/// The result is truncated toward zero and wrapped to 8 bits, exactly as a
/// float to uint8 cast of the scaled array behaves.  In particular a
/// sample of 1.0 in [0, 1] data wraps to 0.
ByteImage normalize(const PixelBuffer& raw);

/// Scale factor normalize() applies for a given raw maximum.
double normalizeScale(double rawMax);

/// Map normalised samples through the contrast window.  Values below min
/// are raised to min, (v - min) / (max - min) is clamped to 1 and scaled to
/// [0, 255].  In per-channel mode each channel uses its own pair.
ByteImage applyWindow(const ByteImage& normalized, const LevelsWindow& window);

/// Smallest and largest sample of an 8-bit image.  (0, 0) when empty.
std::pair<int, int> valueRange(const ByteImage& image);
