/**
 * @file Vectorize.cpp
 * @brief Pass dispatch and failure handling
 */

#include <VxTrace/Trace/Vectorize.h>
#include <VxTrace/Backend/Backend.h>
#include <VxTrace/Core/Exception.h>
#include <VxTrace/Core/Validate.h>
#include <VxTrace/Platform/Log.h>
#include <VxTrace/Platform/Profiler.h>
#include <VxTrace/Platform/Timer.h>
#include <VxTrace/Preprocess/Prepare.h>
#include <VxTrace/Preprocess/ThresholdMapping.h>
#include <VxTrace/Trace/ColorAnnotate.h>
#include <VxTrace/Trace/Directional.h>
#include <VxTrace/Trace/HandDrawn.h>
#include <VxTrace/Trace/Merge.h>
#include <VxTrace/Trace/PathBuilder.h>

#include <algorithm>
#include <memory>
#include <new>
#include <string>
#include <utility>

namespace Vx::Trace {

namespace {

constexpr double MIN_PASS_DETAIL = 0.1;
constexpr double DIRECTIONAL_BUDGET_FRACTION = 0.9;

/**
 * @brief Runs passes for one Vectorize call and records their outcome
 */
class PassRunner {
public:
    PassRunner(const Preprocess::PreparedImage& prepared, const TraceConfig& config,
               Platform::ExecutionContext& ctx, TraceResult& result)
        : prepared_(prepared), config_(config), ctx_(ctx), result_(result) {}

    /// False once the run has been cut short
    bool Active() const { return !result_.truncated; }

    /**
     * @brief Run fn as one pass
     * @return True when fn completed
     */
    template<typename Fn>
    bool Guarded(const std::string& name, Fn&& fn) {
        if (!Active()) return false;
        try {
            ctx_.CheckDeadline(name);
            fn();
            ++result_.passesCompleted;
            return true;
        } catch (const TimeBudgetException& e) {
            result_.truncated = true;
            result_.diagnostics.push_back(std::string(e.what()));
            Platform::Log::Warning("{}: {}", name, e.what());
        } catch (const InvalidArgumentException&) {
            throw;
        } catch (const std::bad_alloc&) {
            result_.truncated = true;
            result_.diagnostics.push_back(name + ": out of memory");
            Platform::Log::Error("{}: out of memory", name);
        } catch (const std::exception& e) {
            ++result_.skippedFeatures;
            result_.diagnostics.push_back(name + " skipped: " + e.what());
            Platform::Log::Warning("{} skipped: {}", name, e.what());
        }
        return false;
    }

    /// Backend + path building at the given detail
    std::vector<Primitive> Produce(BackendKind kind, double detail) {
        const TraceConfig passConfig = config_.WithDetail(detail);
        auto geometry = Backend::Analyze(kind, prepared_, passConfig, detail, ctx_);
        return Build(geometry, passConfig, detail);
    }

    std::vector<Primitive> Build(const Backend::BackendGeometry& geometry,
                                 const TraceConfig& passConfig, double detail) {
        PathBuilder builder(passConfig, prepared_.width, prepared_.height, detail);
        PathBuildResult built = builder.Build(geometry);
        result_.skippedFeatures += built.skipped;
        return std::move(built.primitives);
    }

private:
    const Preprocess::PreparedImage& prepared_;
    const TraceConfig& config_;
    Platform::ExecutionContext& ctx_;
    TraceResult& result_;
};

MergeOptions MergeOptionsFrom(const TraceConfig& config) {
    MergeOptions options;
    options.tolerance = config.multipass.mergeTolerance;
    return options;
}

std::vector<Primitive> RunSinglePass(PassRunner& runner, const TraceConfig& config,
                                     Platform::ExecutionContext& ctx) {
    std::vector<Primitive> primitives;
    ctx.ReportProgress(10.0, "pass 1");
    runner.Guarded("pass 1", [&] {
        primitives = runner.Produce(config.backend, config.detail);
    });
    return primitives;
}

std::vector<Primitive> RunMultipass(PassRunner& runner, const TraceConfig& config,
                                    const Preprocess::PreparedImage& prepared,
                                    Platform::ExecutionContext& ctx) {
    const std::vector<double> details = MultipassDetails(config);
    const double conservativeMinLength = Preprocess::ThresholdMapping::FromDetail(
        details.front(), prepared.width, prepared.height).minStrokeLengthPx;
    const MergeOptions mergeOptions = MergeOptionsFrom(config);

    std::vector<Primitive> merged;
    std::unique_ptr<SupportIndex> support;

    for (size_t i = 0; i < details.size() && runner.Active(); ++i) {
        const std::string name = "pass " + std::to_string(i + 1);
        ctx.ReportProgress(10.0 + 70.0 * static_cast<double>(i) / details.size(), name);

        runner.Guarded(name, [&] {
            std::vector<Primitive> produced = runner.Produce(config.backend, details[i]);
            Platform::Log::Info("{} (detail {:.2f}): {} primitives", name, details[i],
                                produced.size());
            if (i == 0) {
                support = std::make_unique<SupportIndex>(produced, 2.0 * mergeOptions.tolerance);
                merged = MergePrimitives({}, produced, mergeOptions);
                return;
            }

            std::vector<Primitive> kept;
            kept.reserve(produced.size());
            for (auto& p : produced) {
                const bool unsupported = support == nullptr ||
                    support->Support(p) < config.multipass.supportFraction;
                if (unsupported && LengthOf(p) < conservativeMinLength) continue;
                kept.push_back(std::move(p));
            }
            merged = MergePrimitives(merged, kept, mergeOptions);
        });
    }
    ctx.ReportProgress(80.0, "merge");
    return merged;
}

std::vector<Primitive> RunDirectional(PassRunner& runner, const TraceConfig& config,
                                      const Preprocess::PreparedImage& prepared,
                                      TraceResult& result, Platform::ExecutionContext& ctx) {
    std::vector<Primitive> merged = RunSinglePass(runner, config, ctx);
    if (!runner.Active() || result.passesCompleted == 0) return merged;

    if (ctx.BudgetFractionUsed(DIRECTIONAL_BUDGET_FRACTION)) {
        result.diagnostics.push_back("directional passes skipped: time budget nearly used");
        return merged;
    }

    const DirectionalAnalysis analysis = AnalyzeDirections(prepared.gray, prepared.width,
                                                           prepared.height, merged);
    const auto scheduled = ScheduleDirectionalPasses(analysis, config, ctx.RemainingMs());
    const MergeOptions mergeOptions = MergeOptionsFrom(config);

    for (size_t i = 0; i < scheduled.size() && runner.Active(); ++i) {
        const Backend::PassDirection direction = scheduled[i];
        const std::string name = std::string("pass ") + Backend::PassDirectionName(direction);
        ctx.ReportProgress(40.0 + 40.0 * static_cast<double>(i) / scheduled.size(), name);

        runner.Guarded(name, [&] {
            auto geometry = Backend::DirectionalEdges(prepared, config, config.detail,
                                                      direction, ctx);
            auto produced = runner.Build(geometry, config, config.detail);
            merged = MergePrimitives(merged, produced, mergeOptions);
        });
    }
    ctx.ReportProgress(80.0, "merge");
    return merged;
}

} // anonymous namespace

std::vector<double> MultipassDetails(const TraceConfig& config) {
    const auto& mp = config.multipass;
    const double conservative = std::clamp(
        mp.conservativeDetail.value_or(config.detail * 0.7), MIN_PASS_DETAIL, 1.0);
    const double aggressive = std::clamp(
        mp.aggressiveDetail.value_or(config.detail * 1.3), MIN_PASS_DETAIL, 1.0);

    const int32_t count = std::max(2, mp.passCount);
    std::vector<double> details;
    details.reserve(count);
    for (int32_t i = 0; i < count; ++i) {
        const double t = static_cast<double>(i) / (count - 1);
        details.push_back(conservative + (aggressive - conservative) * t);
    }
    return details;
}

TraceResult Vectorize(const VImage& image, const TraceConfig& config) {
    Platform::ExecutionContext ctx;
    return Vectorize(image, config, ctx);
}

TraceResult Vectorize(const uint8_t* data, size_t length, int32_t width, int32_t height,
                      ChannelType channels, const TraceConfig& config) {
    config.Validate();
    Validate::RequireBufferSize(length, width, height, ChannelCount(channels), "Vectorize");
    VImage image = VImage::FromBuffer(data, length, width, height, channels);
    return Vectorize(image, config);
}

TraceResult Vectorize(const VImage& image, const TraceConfig& config,
                      Platform::ExecutionContext& ctx) {
    config.Validate();
    Validate::RequireImageValid(image, "Vectorize");

    Platform::Timer timer(true);
    ctx.StartBudget(config.maxProcessingTimeMs);

    TraceResult result;
    Platform::Log::Info("vectorize {}x{} backend={} detail={:.2f}", image.Width(),
                        image.Height(), BackendKindName(config.backend), config.detail);

    ctx.ReportProgress(0.0, "prepare");
    Preprocess::PreparedImage prepared;
    try {
        prepared = Preprocess::PrepareImage(image, config, ctx);
    } catch (const TimeBudgetException& e) {
        result.truncated = true;
        result.diagnostics.push_back(std::string(e.what()));
        result.elapsedMs = timer.ElapsedMs();
        return result;
    }
    result.diagnostics.insert(result.diagnostics.end(), prepared.diagnostics.begin(),
                              prepared.diagnostics.end());

    PassRunner runner(prepared, config, ctx, result);
    std::vector<Primitive> primitives;

    const bool directional = config.backend == BackendKind::Edge &&
                             (config.reversePass || config.diagonalPass);
    const bool multipass = config.multipass.enabled && config.multipass.passCount >= 2 &&
                           (config.backend == BackendKind::Edge ||
                            config.backend == BackendKind::Centerline);

    if (directional) {
        primitives = RunDirectional(runner, config, prepared, result, ctx);
    } else if (multipass) {
        primitives = RunMultipass(runner, config, prepared, ctx);
    } else {
        primitives = RunSinglePass(runner, config, ctx);
    }
    ctx.SnapshotMemory("passes");

    if (!primitives.empty() && (config.color.preserveLineColors || config.color.paletteReduction)) {
        ctx.ReportProgress(90.0, "colour");
        try {
            if (config.color.preserveLineColors) {
                AnnotateColors(primitives, prepared.source, config.color);
            }
            if (config.color.paletteReduction) {
                ReducePalette(primitives, config.color.paletteSize);
            }
        } catch (const std::bad_alloc&) {
            result.truncated = true;
            result.diagnostics.push_back("colour: out of memory");
        }
    }

    if (prepared.scale != 1.0) {
        for (auto& p : primitives) ScalePrimitive(p, prepared.scale);
    }

    if (!primitives.empty() && config.handDrawn.Enabled()) {
        ctx.ReportProgress(95.0, "hand-drawn");
        Platform::ScopedProfile profile(&ctx.GetProfiler(), "hand_drawn");
        ApplyHandDrawn(primitives, config.handDrawn, image.Width(), image.Height());
    }

    result.primitives = std::move(primitives);
    if (result.primitives.empty()) {
        result.diagnostics.push_back("no features detected");
    }
    result.elapsedMs = timer.ElapsedMs();
    ctx.ReportProgress(100.0, "done");

    Platform::Log::Info("vectorize done: {} primitives, {} passes, {:.1f} ms{}",
                        result.primitives.size(), result.passesCompleted, result.elapsedMs,
                        result.truncated ? " (truncated)" : "");
    return result;
}

} // namespace Vx::Trace
