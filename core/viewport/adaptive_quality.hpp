#pragma once

#include <cstddef>
#include <string>

namespace clubnet {

enum class RenderQuality { Low, Medium, High };

std::string toString(RenderQuality quality);

/// Rendering budget handed to the renderer.
struct PerformanceSettings {
    bool enable_animations = true;
    int animation_duration_ms = 300;
    size_t max_nodes = 1000;
    size_t max_edges = 2000;
    bool enable_labels = true;
    bool enable_shadows = true;
    RenderQuality render_quality = RenderQuality::High;
    int update_frequency = 60;  // Hz
    bool enable_virtualization = false;

    bool operator==(const PerformanceSettings& o) const {
        return enable_animations == o.enable_animations &&
               animation_duration_ms == o.animation_duration_ms &&
               max_nodes == o.max_nodes && max_edges == o.max_edges &&
               enable_labels == o.enable_labels && enable_shadows == o.enable_shadows &&
               render_quality == o.render_quality && update_frequency == o.update_frequency &&
               enable_virtualization == o.enable_virtualization;
    }
    bool operator!=(const PerformanceSettings& o) const { return !(*this == o); }
};

/// Host-reported device characteristics.
struct DeviceProfile {
    bool is_mobile = false;
    bool is_low_end = false;
    bool supports_webgl = true;
    bool low_power_mode = false;
    bool prefers_reduced_motion = false;
};

/// Initial settings for a device. Rules apply in order: mobile,
/// low-end, no WebGL, low-power, reduced motion.
PerformanceSettings settingsForDevice(const DeviceProfile& profile);

enum class MemoryPressure { Nominal, Fair, Serious, Critical };

std::string toString(MemoryPressure pressure);

/// used/limit > 0.9 critical, > 0.75 serious, > 0.6 fair.
MemoryPressure classifyMemoryPressure(double used_ratio);

// ─── Adaptive Quality ──────────────────────────────────────────
// Owns the current PerformanceSettings and moves them one step at a
// time in response to frame rate and memory pressure samples.

class AdaptiveQuality {
public:
    explicit AdaptiveQuality(DeviceProfile profile = {});

    const PerformanceSettings& settings() const { return settings_; }
    const DeviceProfile& profile() const { return profile_; }

    /// Replace the device profile and re-derive settings from it.
    void setProfile(const DeviceProfile& profile);

    /// One step down: quality tier, update frequency -10 (floor 15),
    /// max nodes -50 (floor 100), animations and shadows off.
    void degrade();

    /// One step up: low→medium, medium→high unless mobile, update
    /// frequency +5 (cap 60) unless mobile. Refused on low-end devices
    /// and in low-power mode. Returns whether it applied.
    bool improve();

    /// Feed a closed FPS window. Returns -1 after a degradation,
    /// +1 after an improvement, 0 otherwise.
    int onFps(double fps, double low_fps = 30.0, double high_fps = 50.0);

    /// Hidden pages drop to 10 Hz without animations; visible pages
    /// re-derive settings from the device profile.
    void setPageVisible(bool visible);
    bool pageVisible() const { return page_visible_; }

    /// Feed one memory sample. More than `limit` consecutive
    /// serious/critical samples degrade once and reset the streak.
    /// Returns whether a degradation happened.
    bool recordMemorySample(MemoryPressure pressure, int limit = 3);
    MemoryPressure memoryPressure() const { return memory_pressure_; }

    bool shouldReduceAnimations() const;
    bool shouldSimplifyRendering() const;

    /// Items per incremental render batch: low 5, medium 10, high 20.
    size_t recommendedBatchSize() const;

    double lastFps() const { return last_fps_; }

private:
    DeviceProfile profile_;
    PerformanceSettings settings_;
    bool page_visible_ = true;
    MemoryPressure memory_pressure_ = MemoryPressure::Nominal;
    int pressure_streak_ = 0;
    double last_fps_ = 60.0;
};

} // namespace clubnet
