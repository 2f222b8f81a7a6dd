#include "viewport/performance_controller.hpp"
#include "util/log.hpp"

namespace clubnet {

namespace {

CullingOptions cullingOptionsFrom(const EngineConfig& config) {
    CullingOptions options;
    options.threshold = config.culling_threshold;
    options.max_visible_nodes = config.max_visible_nodes;
    options.throttle = std::chrono::milliseconds(config.cull_throttle_ms);
    options.margin = config.cull_margin;
    return options;
}

} // namespace

PerformanceController::PerformanceController(const EngineConfig& config, DeviceProfile profile)
    : config_(config),
      culler_(cullingOptionsFrom(config)),
      quality_(profile),
      sampler_(std::chrono::milliseconds(config.fps_window_ms)) {
    syncNodeCap();
}

PerformanceController::~PerformanceController() {
    teardown();
}

void PerformanceController::start(TimePoint now) {
    teardown();
    sampler_.start(now);
    fps_task_ = scheduler_.scheduleRecurring(
        "fps-sample", std::chrono::milliseconds(config_.fps_window_ms),
        [this](TimePoint t) { sampleFps(t); }, now);
    if (memory_probe_) {
        memory_task_ = scheduler_.scheduleRecurring(
            "memory-poll", std::chrono::milliseconds(config_.memory_poll_ms),
            [this](TimePoint) { pollMemory(); }, now);
    }
    running_ = true;
}

void PerformanceController::teardown() {
    fps_task_.cancel();
    memory_task_.cancel();
    scheduler_.cancelAll();
    if (running_) CLUBNET_LOG_INFO("performance controller stopped");
    running_ = false;
}

void PerformanceController::attach(SnapshotPtr snapshot) {
    snapshot_ = std::move(snapshot);
    culler_.setSnapshot(snapshot_);
    updateMode();
    emit(PerformanceEvent::VisibilityChanged);
}

// ─── Performance mode ──────────────────────────────────────────

void PerformanceController::setPerformanceMode(PerformanceMode mode) {
    requested_ = mode;
    updateMode();
}

void PerformanceController::updateMode() {
    PerformanceMode next = requested_;
    if (next == PerformanceMode::Auto) {
        const size_t n = snapshot_ ? snapshot_->graph.nodeCount() : 0;
        next = modeForNodeCount(n, config_.high_performance_threshold, config_.ultra_threshold);
    }
    if (next == mode_) return;

    CLUBNET_LOG_INFO("performance mode %s -> %s%s", toString(mode_).c_str(), toString(next).c_str(),
                     requested_ == PerformanceMode::Auto ? " (auto)" : "");
    mode_ = next;
    emit(PerformanceEvent::ModeChanged);
}

// ─── Culling ───────────────────────────────────────────────────

void PerformanceController::setViewportCulling(bool enabled) {
    if (culler_.enabled() == enabled) return;
    culler_.setEnabled(enabled);
    emit(PerformanceEvent::VisibilityChanged);
}

bool PerformanceController::onViewportChanged(const Viewport& viewport, TimePoint now) {
    const bool ran = culler_.requestUpdate(viewport, now);
    if (ran && culler_.active()) emit(PerformanceEvent::VisibilityChanged);
    return ran;
}

// ─── Host callbacks ────────────────────────────────────────────

void PerformanceController::onFrame(TimePoint now) {
    sampler_.frame();
    if (culler_.onFrame(now) && culler_.active()) {
        emit(PerformanceEvent::VisibilityChanged);
    }
    scheduler_.tick(now);
}

void PerformanceController::setPageVisible(bool visible) {
    if (visible == quality_.pageVisible()) return;
    quality_.setPageVisible(visible);
    syncNodeCap();
    emit(PerformanceEvent::QualityChanged);
}

void PerformanceController::setDeviceProfile(const DeviceProfile& profile) {
    quality_.setProfile(profile);
    syncNodeCap();
    emit(PerformanceEvent::QualityChanged);
}

void PerformanceController::sampleFps(TimePoint now) {
    auto fps = sampler_.sample(now);
    if (!fps) return;
    if (quality_.onFps(*fps, config_.low_fps, config_.high_fps) != 0) {
        syncNodeCap();
        emit(PerformanceEvent::QualityChanged);
    }
}

void PerformanceController::pollMemory() {
    if (!memory_probe_) return;
    auto ratio = memory_probe_();
    if (!ratio) return;
    if (quality_.recordMemorySample(classifyMemoryPressure(*ratio), config_.memory_warning_limit)) {
        syncNodeCap();
        emit(PerformanceEvent::QualityChanged);
    }
}

void PerformanceController::syncNodeCap() {
    culler_.setNodeCap(quality_.settings().max_nodes);
}

void PerformanceController::emit(PerformanceEvent event) {
    for (const auto& listener : listeners_) listener(event);
}

} // namespace clubnet
