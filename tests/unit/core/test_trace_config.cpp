/**
 * @file test_trace_config.cpp
 * @brief Unit tests for Core/TraceConfig.h
 */

#include <VxTrace/Core/TraceConfig.h>
#include <VxTrace/Core/Exception.h>
#include <gtest/gtest.h>

using namespace Vx::Trace;

TEST(TraceConfigTest, DefaultsAreValid) {
    EXPECT_NO_THROW(TraceConfig{}.Validate());
    for (auto kind : {BackendKind::Edge, BackendKind::Centerline,
                      BackendKind::Superpixel, BackendKind::Dots}) {
        TraceConfig cfg = TraceConfig::ForBackend(kind);
        EXPECT_EQ(cfg.backend, kind);
        EXPECT_NO_THROW(cfg.Validate()) << BackendKindName(kind);
    }
}

TEST(TraceConfigTest, DotsDefaultEnablesBackgroundRemoval) {
    EXPECT_TRUE(TraceConfig::ForBackend(BackendKind::Dots).background.enabled);
    EXPECT_FALSE(TraceConfig::ForBackend(BackendKind::Edge).background.enabled);
}

TEST(TraceConfigTest, WithDetailClamps) {
    TraceConfig cfg;
    EXPECT_DOUBLE_EQ(cfg.WithDetail(1.7).detail, 1.0);
    EXPECT_DOUBLE_EQ(cfg.WithDetail(-0.2).detail, 0.0);
    EXPECT_DOUBLE_EQ(cfg.WithDetail(0.3).detail, 0.3);
    EXPECT_DOUBLE_EQ(cfg.detail, 0.5);
}

TEST(TraceConfigTest, RejectsOutOfRangeDetail) {
    TraceConfig cfg;
    cfg.detail = 1.5;
    EXPECT_THROW(cfg.Validate(), InvalidArgumentException);
}

TEST(TraceConfigTest, RejectsBadPassCount) {
    TraceConfig cfg;
    cfg.multipass.passCount = 0;
    EXPECT_THROW(cfg.Validate(), InvalidArgumentException);
    cfg.multipass.passCount = 11;
    EXPECT_THROW(cfg.Validate(), InvalidArgumentException);
    cfg.multipass.passCount = 10;
    EXPECT_NO_THROW(cfg.Validate());
}

TEST(TraceConfigTest, RejectsInconsistentPairs) {
    TraceConfig cfg;
    cfg.dots.minRadius = 4.0;
    cfg.dots.maxRadius = 2.0;
    EXPECT_THROW(cfg.Validate(), InvalidArgumentException);

    cfg = TraceConfig{};
    cfg.edge.nmsLow = 0.5;
    cfg.edge.nmsHigh = 0.2;
    EXPECT_THROW(cfg.Validate(), InvalidArgumentException);

    cfg = TraceConfig{};
    cfg.edge.fdogSigmaC = cfg.edge.fdogSigmaS;
    EXPECT_THROW(cfg.Validate(), InvalidArgumentException);
}

TEST(TraceConfigTest, RejectsEvenSauvolaWindow) {
    TraceConfig cfg;
    cfg.centerline.windowSize = 30;
    EXPECT_THROW(cfg.Validate(), InvalidArgumentException);
}

TEST(TraceConfigTest, RejectsNegativeTimeBudget) {
    TraceConfig cfg;
    cfg.maxProcessingTimeMs = -1.0;
    EXPECT_THROW(cfg.Validate(), InvalidArgumentException);
    cfg.maxProcessingTimeMs = 0.0;
    EXPECT_NO_THROW(cfg.Validate());
}

TEST(TraceConfigTest, BackendNamesRoundTrip) {
    EXPECT_EQ(ParseBackendKind("Edge"), BackendKind::Edge);
    EXPECT_EQ(ParseBackendKind("CENTERLINE"), BackendKind::Centerline);
    EXPECT_EQ(ParseBackendKind(BackendKindName(BackendKind::Dots)), BackendKind::Dots);
    EXPECT_THROW(ParseBackendKind("potrace"), InvalidArgumentException);
    EXPECT_STREQ(BackgroundAlgorithmName(BackgroundAlgorithm::Adaptive), "adaptive");
}

TEST(TraceConfigTest, DotStylePresets) {
    DotsConfig dots;
    dots.jitter = true;
    ApplyDotStyle(dots, DotStyle::BoldPointillism);
    EXPECT_EQ(dots.style, DotStyle::BoldPointillism);
    EXPECT_DOUBLE_EQ(dots.minRadius, 1.5);
    EXPECT_DOUBLE_EQ(dots.maxRadius, 4.0);
    EXPECT_DOUBLE_EQ(dots.densityThreshold, 0.15);
    EXPECT_FALSE(dots.jitter);

    ApplyDotStyle(dots, DotStyle::TechnicalDrawing);
    EXPECT_FALSE(dots.adaptiveSizing);

    DotsConfig custom;
    custom.minRadius = 0.9;
    ApplyDotStyle(custom, DotStyle::Custom);
    EXPECT_DOUBLE_EQ(custom.minRadius, 0.9);
    EXPECT_STREQ(DotStyleName(DotStyle::Watercolor), "watercolor");

    TraceConfig cfg;
    ApplyDotStyle(cfg.dots, DotStyle::Watercolor);
    EXPECT_NO_THROW(cfg.Validate());
}

TEST(TraceConfigTest, HandDrawnPresets) {
    EXPECT_FALSE(HandDrawnConfig().Enabled());
    const HandDrawnConfig sketchy = HandDrawnConfig::FromPreset(HandDrawnPreset::Sketchy);
    EXPECT_TRUE(sketchy.Enabled());
    EXPECT_DOUBLE_EQ(sketchy.tremorStrength, 0.3);
    EXPECT_DOUBLE_EQ(sketchy.multiPassIntensity, 0.8);
    EXPECT_DOUBLE_EQ(sketchy.baseWidthMultiplier, 1.2);
    EXPECT_STREQ(HandDrawnPresetName(HandDrawnPreset::Subtle), "subtle");

    TraceConfig cfg;
    cfg.handDrawn = HandDrawnConfig::FromPreset(HandDrawnPreset::Strong);
    EXPECT_NO_THROW(cfg.Validate());
    cfg.handDrawn.tremorStrength = 1.5;
    EXPECT_THROW(cfg.Validate(), InvalidArgumentException);
}

TEST(TraceConfigTest, RejectsBadFlowTracing) {
    TraceConfig cfg;
    cfg.edge.traceStep = 0.0;
    EXPECT_THROW(cfg.Validate(), InvalidArgumentException);

    cfg = TraceConfig{};
    cfg.edge.traceMaxGap = -1;
    EXPECT_THROW(cfg.Validate(), InvalidArgumentException);

    cfg = TraceConfig{};
    cfg.edge.flowTracing = true;
    cfg.edge.etfFdog = true;
    EXPECT_NO_THROW(cfg.Validate());
}
