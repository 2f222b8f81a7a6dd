#include "viewport/adaptive_quality.hpp"
#include "util/log.hpp"

#include <algorithm>

namespace clubnet {

std::string toString(RenderQuality quality) {
    switch (quality) {
        case RenderQuality::Low:    return "low";
        case RenderQuality::Medium: return "medium";
        case RenderQuality::High:   return "high";
    }
    return "high";
}

std::string toString(MemoryPressure pressure) {
    switch (pressure) {
        case MemoryPressure::Nominal:  return "nominal";
        case MemoryPressure::Fair:     return "fair";
        case MemoryPressure::Serious:  return "serious";
        case MemoryPressure::Critical: return "critical";
    }
    return "nominal";
}

PerformanceSettings settingsForDevice(const DeviceProfile& profile) {
    PerformanceSettings s;

    if (profile.is_mobile) {
        s.animation_duration_ms = 200;
        s.max_nodes = 500;
        s.max_edges = 1000;
        s.render_quality = RenderQuality::Medium;
        s.update_frequency = 30;
        s.enable_virtualization = true;
    }
    if (profile.is_low_end) {
        s.enable_animations = false;
        s.enable_shadows = false;
        s.max_nodes = 250;
        s.max_edges = 500;
        s.render_quality = RenderQuality::Low;
        s.update_frequency = 20;
        s.enable_virtualization = true;
    }
    if (!profile.supports_webgl) {
        s.render_quality = RenderQuality::Low;
        s.enable_shadows = false;
    }
    if (profile.low_power_mode) {
        s.enable_animations = false;
        s.update_frequency = 15;
        s.render_quality = RenderQuality::Low;
    }
    if (profile.prefers_reduced_motion) {
        s.enable_animations = false;
    }
    return s;
}

MemoryPressure classifyMemoryPressure(double used_ratio) {
    if (used_ratio > 0.9) return MemoryPressure::Critical;
    if (used_ratio > 0.75) return MemoryPressure::Serious;
    if (used_ratio > 0.6) return MemoryPressure::Fair;
    return MemoryPressure::Nominal;
}

// ─── Adaptive Quality ──────────────────────────────────────────

AdaptiveQuality::AdaptiveQuality(DeviceProfile profile)
    : profile_(profile), settings_(settingsForDevice(profile)) {}

void AdaptiveQuality::setProfile(const DeviceProfile& profile) {
    profile_ = profile;
    settings_ = settingsForDevice(profile_);
}

void AdaptiveQuality::degrade() {
    if (settings_.render_quality == RenderQuality::High) {
        settings_.render_quality = RenderQuality::Medium;
    } else if (settings_.render_quality == RenderQuality::Medium) {
        settings_.render_quality = RenderQuality::Low;
    }
    if (settings_.update_frequency > 15) {
        settings_.update_frequency = std::max(15, settings_.update_frequency - 10);
    }
    if (settings_.max_nodes > 100) {
        settings_.max_nodes = std::max<size_t>(100, settings_.max_nodes - 50);
    }
    settings_.enable_animations = false;
    settings_.enable_shadows = false;

    CLUBNET_LOG_INFO("quality degraded to %s, %d Hz, max %zu nodes",
                     toString(settings_.render_quality).c_str(),
                     settings_.update_frequency, settings_.max_nodes);
}

bool AdaptiveQuality::improve() {
    if (profile_.is_low_end || profile_.low_power_mode) return false;

    const PerformanceSettings before = settings_;
    if (settings_.render_quality == RenderQuality::Low) {
        settings_.render_quality = RenderQuality::Medium;
    } else if (settings_.render_quality == RenderQuality::Medium && !profile_.is_mobile) {
        settings_.render_quality = RenderQuality::High;
    }
    if (settings_.update_frequency < 60 && !profile_.is_mobile) {
        settings_.update_frequency = std::min(60, settings_.update_frequency + 5);
    }

    if (settings_ == before) return false;
    CLUBNET_LOG_INFO("quality improved to %s, %d Hz",
                     toString(settings_.render_quality).c_str(), settings_.update_frequency);
    return true;
}

int AdaptiveQuality::onFps(double fps, double low_fps, double high_fps) {
    last_fps_ = fps;
    if (fps < low_fps) {
        degrade();
        return -1;
    }
    if (fps > high_fps && improve()) {
        return 1;
    }
    return 0;
}

void AdaptiveQuality::setPageVisible(bool visible) {
    if (visible == page_visible_) return;
    page_visible_ = visible;
    if (visible) {
        settings_ = settingsForDevice(profile_);
    } else {
        settings_.update_frequency = 10;
        settings_.enable_animations = false;
    }
}

bool AdaptiveQuality::recordMemorySample(MemoryPressure pressure, int limit) {
    memory_pressure_ = pressure;
    if (pressure != MemoryPressure::Serious && pressure != MemoryPressure::Critical) {
        pressure_streak_ = 0;
        return false;
    }

    pressure_streak_++;
    if (pressure_streak_ <= limit) return false;

    CLUBNET_LOG_WARN("sustained %s memory pressure", toString(pressure).c_str());
    pressure_streak_ = 0;
    degrade();
    return true;
}

bool AdaptiveQuality::shouldReduceAnimations() const {
    return !settings_.enable_animations || profile_.prefers_reduced_motion ||
           profile_.low_power_mode || last_fps_ < 30.0;
}

bool AdaptiveQuality::shouldSimplifyRendering() const {
    return settings_.render_quality == RenderQuality::Low || profile_.is_low_end ||
           profile_.low_power_mode || last_fps_ < 20.0;
}

size_t AdaptiveQuality::recommendedBatchSize() const {
    switch (settings_.render_quality) {
        case RenderQuality::Low:    return 5;
        case RenderQuality::Medium: return 10;
        case RenderQuality::High:   return 20;
    }
    return 10;
}

} // namespace clubnet
