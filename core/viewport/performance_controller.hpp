#pragma once

#include "config/graph_config.hpp"
#include "graph/graph_snapshot.hpp"
#include "viewport/adaptive_quality.hpp"
#include "viewport/fps_sampler.hpp"
#include "viewport/performance_mode.hpp"
#include "viewport/task_scheduler.hpp"
#include "viewport/viewport_culler.hpp"

#include <functional>
#include <optional>
#include <vector>

namespace clubnet {

enum class PerformanceEvent {
    ModeChanged,
    VisibilityChanged,
    QualityChanged
};

// ─── Performance Controller ────────────────────────────────────
// Keeps rendering responsive as the graph grows. Owns the performance
// mode, the viewport culler, adaptive quality and the recurring tasks
// that drive them (FPS sampling, memory polling). Driven entirely by
// host callbacks: onFrame() per rendered frame, onViewportChanged()
// per pan/zoom/resize.

class PerformanceController {
public:
    /// Returns used/limit memory ratio, or nullopt if unavailable.
    using MemoryProbe = std::function<std::optional<double>()>;
    using Listener = std::function<void(PerformanceEvent)>;

    explicit PerformanceController(const EngineConfig& config = {}, DeviceProfile profile = {});
    ~PerformanceController();

    PerformanceController(const PerformanceController&) = delete;
    PerformanceController& operator=(const PerformanceController&) = delete;

    /// Schedule FPS sampling and, if a probe is set, memory polling.
    /// Calling start again restarts both tasks.
    void start(TimePoint now);

    /// Cancel every recurring task. Idempotent.
    void teardown();
    bool running() const { return running_; }

    /// Track a new snapshot: re-evaluates the automatic mode and culling.
    void attach(SnapshotPtr snapshot);

    // ── Performance mode ──
    /// Pin a mode, or return to automatic selection with Auto.
    void setPerformanceMode(PerformanceMode mode);
    PerformanceMode mode() const { return mode_; }
    PerformanceMode requestedMode() const { return requested_; }
    RendererHints hints() const { return rendererHints(mode_); }

    // ── Culling ──
    void setViewportCulling(bool enabled);
    bool onViewportChanged(const Viewport& viewport, TimePoint now);
    /// Camera restored from history; applied by the next eligible frame.
    bool restoreCamera(double zoom, Point pan) { return culler_.setCamera(zoom, pan); }
    const VisibilityState& visibility() const { return culler_.visibility(); }
    const ViewportCuller& culler() const { return culler_; }

    // ── Host callbacks ──
    void onFrame(TimePoint now);
    void setPageVisible(bool visible);
    void setMemoryProbe(MemoryProbe probe) { memory_probe_ = std::move(probe); }

    const AdaptiveQuality& quality() const { return quality_; }
    const FpsSampler& fpsSampler() const { return sampler_; }
    void setDeviceProfile(const DeviceProfile& profile);

    void subscribe(Listener listener) { listeners_.push_back(std::move(listener)); }

private:
    void updateMode();
    void sampleFps(TimePoint now);
    void pollMemory();
    void syncNodeCap();
    void emit(PerformanceEvent event);

    EngineConfig config_;
    SnapshotPtr snapshot_;
    PerformanceMode requested_ = PerformanceMode::Auto;
    PerformanceMode mode_ = PerformanceMode::Standard;
    ViewportCuller culler_;
    AdaptiveQuality quality_;
    FpsSampler sampler_;
    TaskScheduler scheduler_;
    TaskHandle fps_task_;
    TaskHandle memory_task_;
    MemoryProbe memory_probe_;
    std::vector<Listener> listeners_;
    bool running_ = false;
};

} // namespace clubnet
