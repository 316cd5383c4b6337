/**
 * @file trace_image.cpp
 * @brief Trace a raster image and write the primitives as SVG
 *
 * Usage:
 *   trace_image <input> <output.svg> [options]
 *
 * Options:
 *   --backend edge|centerline|superpixel|dots
 *   --detail <0-1>
 *   --multipass <passes>        Conservative to aggressive passes (2-10)
 *   --reverse                   Reverse edge pass
 *   --diagonal                  Diagonal edge passes
 *   --background otsu|adaptive|auto
 *   --epsilon <px>              Simplification tolerance (0 = from detail)
 *   --visvalingam               Visvalingam-Whyatt instead of RDP
 *   --curves <max error px>     Fit cubic Beziers
 *   --colors                    Sample stroke colours from the image
 *   --palette <size>            Reduce every colour to a palette
 *   --time <ms>                 Processing budget
 *   --verbose                   Debug log and stage timings
 */

#include <VxTrace/Core/Exception.h>
#include <VxTrace/IO/ImageIO.h>
#include <VxTrace/Platform/Log.h>
#include <VxTrace/Trace/Vectorize.h>

#include <fmt/format.h>

#include <cstdio>
#include <fstream>
#include <initializer_list>
#include <iterator>
#include <optional>
#include <string>
#include <variant>
#include <vector>

using namespace Vx::Trace;
using Platform::Log;
using Platform::LogLevel;

namespace {

void PrintUsage() {
    fmt::print("Usage: trace_image <input> <output.svg> [--backend edge|centerline|superpixel|dots]\n"
               "       [--detail d] [--multipass n] [--reverse] [--diagonal]\n"
               "       [--background otsu|adaptive|auto] [--epsilon px] [--visvalingam]\n"
               "       [--curves err] [--colors] [--palette n] [--time ms] [--verbose]\n"
               "       [--flow] [--flow-trace] [--hand-drawn subtle|medium|strong|sketchy]\n"
               "       [--dot-style fine-stippling|bold-pointillism|sketch|technical-drawing|watercolor]\n");
}

BackgroundAlgorithm ParseBackground(const std::string& name) {
    if (name == "otsu") return BackgroundAlgorithm::Otsu;
    if (name == "adaptive") return BackgroundAlgorithm::Adaptive;
    if (name == "auto") return BackgroundAlgorithm::Auto;
    throw InvalidArgumentException("unknown background algorithm: " + name);
}

HandDrawnPreset ParseHandDrawn(const std::string& name) {
    for (HandDrawnPreset preset : {HandDrawnPreset::None, HandDrawnPreset::Subtle,
                                   HandDrawnPreset::Medium, HandDrawnPreset::Strong,
                                   HandDrawnPreset::Sketchy}) {
        if (name == HandDrawnPresetName(preset)) return preset;
    }
    throw InvalidArgumentException("unknown hand-drawn preset: " + name);
}

DotStyle ParseDotStyle(const std::string& name) {
    for (DotStyle style : {DotStyle::Custom, DotStyle::FineStippling, DotStyle::BoldPointillism,
                           DotStyle::Sketch, DotStyle::TechnicalDrawing, DotStyle::Watercolor}) {
        if (name == DotStyleName(style)) return style;
    }
    throw InvalidArgumentException("unknown dot style: " + name);
}

std::string ColorAttr(const std::optional<Color>& color) {
    return color ? color->ToHex() : std::string("#000000");
}

// =============================================================================
// SVG
// =============================================================================

void AppendPolyline(std::string& d, const VPath& path) {
    for (size_t i = 0; i < path.Size(); ++i) {
        fmt::format_to(std::back_inserter(d), "{}{:.2f} {:.2f} ", i == 0 ? "M" : "L",
                       path[i].x, path[i].y);
    }
    if (path.IsClosed()) d += "Z ";
}

void AppendCurves(std::string& d, const std::vector<CubicBezier>& curves, bool closed) {
    if (curves.empty()) return;
    fmt::format_to(std::back_inserter(d), "M{:.2f} {:.2f} ", curves[0].p0.x, curves[0].p0.y);
    for (const auto& c : curves) {
        fmt::format_to(std::back_inserter(d), "C{:.2f} {:.2f} {:.2f} {:.2f} {:.2f} {:.2f} ",
                       c.p1.x, c.p1.y, c.p2.x, c.p2.y, c.p3.x, c.p3.y);
    }
    if (closed) d += "Z ";
}

class SvgWriter {
public:
    SvgWriter(int32_t width, int32_t height) {
        fmt::format_to(std::back_inserter(body_),
                       "<svg xmlns=\"http://www.w3.org/2000/svg\" width=\"{0}\" height=\"{1}\" "
                       "viewBox=\"0 0 {0} {1}\">\n"
                       "<rect width=\"100%\" height=\"100%\" fill=\"#ffffff\"/>\n",
                       width, height);
    }

    void Add(const Primitive& primitive) {
        std::visit([this](const auto& p) { Write(p); }, primitive);
    }

    std::string Finish() {
        std::string out = body_;
        if (!defs_.empty()) {
            const size_t headerEnd = out.find('\n') + 1;
            out.insert(headerEnd, "<defs>\n" + defs_ + "</defs>\n");
        }
        out += "</svg>\n";
        return out;
    }

private:
    void Write(const StrokePrimitive& s) {
        std::string d;
        if (s.curves.empty()) {
            AppendPolyline(d, s.path);
        } else {
            AppendCurves(d, s.curves, s.path.IsClosed());
        }

        std::string stroke = ColorAttr(s.color);
        if (!s.gradient.empty() && s.path.Size() >= 2) {
            const std::string id = fmt::format("g{}", gradients_++);
            fmt::format_to(std::back_inserter(defs_),
                           "<linearGradient id=\"{}\" gradientUnits=\"userSpaceOnUse\" "
                           "x1=\"{:.2f}\" y1=\"{:.2f}\" x2=\"{:.2f}\" y2=\"{:.2f}\">\n",
                           id, s.path.Front().x, s.path.Front().y,
                           s.path.Back().x, s.path.Back().y);
            for (const auto& stop : s.gradient) {
                fmt::format_to(std::back_inserter(defs_),
                               "  <stop offset=\"{:.3f}\" stop-color=\"{}\"/>\n",
                               stop.offset, stop.color.ToHex());
            }
            defs_ += "</linearGradient>\n";
            stroke = fmt::format("url(#{})", id);
        }

        fmt::format_to(std::back_inserter(body_),
                       "<path d=\"{}\" fill=\"none\" stroke=\"{}\" stroke-width=\"{:.2f}\" "
                       "stroke-linecap=\"round\" stroke-linejoin=\"round\"/>\n",
                       d, stroke, s.width);
    }

    void Write(const FillPrimitive& f) {
        std::string d;
        for (size_t i = 0; i < f.rings.size(); ++i) {
            if (i < f.curves.size() && !f.curves[i].empty()) {
                AppendCurves(d, f.curves[i], true);
            } else {
                AppendPolyline(d, f.rings[i]);
            }
        }
        fmt::format_to(std::back_inserter(body_), "<path d=\"{}\" fill=\"{}\" fill-rule=\"{}\"/>\n",
                       d, ColorAttr(f.color), f.evenOdd ? "evenodd" : "nonzero");
    }

    void Write(const DotPrimitive& dot) {
        fmt::format_to(std::back_inserter(body_),
                       "<circle cx=\"{:.2f}\" cy=\"{:.2f}\" r=\"{:.2f}\" fill=\"{}\" "
                       "fill-opacity=\"{:.3f}\"/>\n",
                       dot.center.x, dot.center.y, dot.radius, dot.color.ToHex(), dot.opacity);
    }

    std::string body_;
    std::string defs_;
    int32_t gradients_ = 0;
};

} // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 3) {
        PrintUsage();
        return 1;
    }
    const std::string input = argv[1];
    const std::string output = argv[2];

    try {
        TraceConfig config;
        bool verbose = false;

        // Backend first so later options override its defaults
        for (int i = 3; i + 1 < argc; ++i) {
            if (std::string(argv[i]) == "--backend") {
                config = TraceConfig::ForBackend(ParseBackendKind(argv[i + 1]));
            }
        }

        for (int i = 3; i < argc; ++i) {
            const std::string arg = argv[i];
            auto value = [&]() -> std::string {
                if (i + 1 >= argc) throw InvalidArgumentException(arg + " needs a value");
                return argv[++i];
            };

            if (arg == "--backend") {
                value();
            } else if (arg == "--detail") {
                config.detail = std::stod(value());
            } else if (arg == "--multipass") {
                config.multipass.enabled = true;
                config.multipass.passCount = std::stoi(value());
            } else if (arg == "--reverse") {
                config.reversePass = true;
            } else if (arg == "--diagonal") {
                config.diagonalPass = true;
            } else if (arg == "--background") {
                config.background.enabled = true;
                config.background.algorithm = ParseBackground(value());
            } else if (arg == "--epsilon") {
                config.simplification.epsilon = std::stod(value());
            } else if (arg == "--visvalingam") {
                config.simplification.method = SimplifyMethod::Visvalingam;
            } else if (arg == "--curves") {
                config.curveFitting.enabled = true;
                config.curveFitting.maxError = std::stod(value());
            } else if (arg == "--colors") {
                config.color.preserveLineColors = true;
            } else if (arg == "--palette") {
                config.color.paletteReduction = true;
                config.color.paletteSize = std::stoi(value());
            } else if (arg == "--time") {
                config.maxProcessingTimeMs = std::stod(value());
            } else if (arg == "--flow") {
                config.edge.etfFdog = true;
            } else if (arg == "--flow-trace") {
                config.edge.etfFdog = true;
                config.edge.flowTracing = true;
            } else if (arg == "--hand-drawn") {
                config.handDrawn = HandDrawnConfig::FromPreset(ParseHandDrawn(value()));
                config.handDrawn.seed = config.randomSeed;
            } else if (arg == "--dot-style") {
                ApplyDotStyle(config.dots, ParseDotStyle(value()));
            } else if (arg == "--verbose") {
                verbose = true;
            } else {
                PrintUsage();
                return 1;
            }
        }

        if (verbose) Log::SetLevel(LogLevel::Debug);

        VImage image = IO::ReadImage(input);
        fmt::print("{}: {}x{}, backend {}, detail {:.2f}\n", input, image.Width(),
                   image.Height(), BackendKindName(config.backend), config.detail);

        Platform::ExecutionContext ctx;
        if (verbose) {
            ctx.SetProgressCallback([](double pct, const std::string& stage) {
                fmt::print("  [{:5.1f}%] {}\n", pct, stage);
            });
        }
        TraceResult result = Vectorize(image, config, ctx);

        SvgWriter svg(image.Width(), image.Height());
        for (const auto& p : result.primitives) svg.Add(p);

        std::ofstream file(output, std::ios::binary);
        if (!file) throw IOException("cannot open " + output);
        file << svg.Finish();
        if (!file) throw IOException("failed writing " + output);

        fmt::print("{} strokes, {} fills, {} dots in {} passes, {:.1f} ms{}\n",
                   result.Count(PrimitiveKind::Stroke), result.Count(PrimitiveKind::Fill),
                   result.Count(PrimitiveKind::Dot), result.passesCompleted, result.elapsedMs,
                   result.truncated ? " (truncated)" : "");
        if (result.skippedFeatures > 0) {
            fmt::print("{} features skipped\n", result.skippedFeatures);
        }
        for (const auto& d : result.diagnostics) fmt::print("  note: {}\n", d);
        if (verbose) fmt::print("{}\n", ctx.GetProfiler().Summary());
    } catch (const Exception& e) {
        fmt::print(stderr, "error: {}\n", e.what());
        return 1;
    } catch (const std::exception& e) {
        fmt::print(stderr, "error: {}\n", e.what());
        return 1;
    }
    return 0;
}
