/**
 * @file Morphology.cpp
 * @brief 3x3 binary morphology and small component removal
 */

#include <VxTrace/Internal/Morphology.h>

#include <vector>

namespace Vx::Trace::Internal {

namespace {

template<bool Erode>
BinaryMap Apply3x3(const BinaryMap& src) {
    const int32_t w = src.width;
    const int32_t h = src.height;
    BinaryMap dst(w, h);

    for (int32_t y = 0; y < h; ++y) {
        for (int32_t x = 0; x < w; ++x) {
            bool result = Erode;
            for (int32_t dy = -1; dy <= 1 && result == Erode; ++dy) {
                for (int32_t dx = -1; dx <= 1; ++dx) {
                    int32_t nx = x + dx;
                    int32_t ny = y + dy;
                    bool on = nx >= 0 && ny >= 0 && nx < w && ny < h && src.At(nx, ny);
                    if (Erode && !on) { result = false; break; }
                    if (!Erode && on) { result = true; break; }
                }
            }
            dst.Set(x, y, result);
        }
    }
    return dst;
}

} // namespace

BinaryMap Erode3x3(const BinaryMap& src) {
    return Apply3x3<true>(src);
}

BinaryMap Dilate3x3(const BinaryMap& src) {
    return Apply3x3<false>(src);
}

BinaryMap Open3x3(const BinaryMap& src) {
    return Dilate3x3(Erode3x3(src));
}

BinaryMap Close3x3(const BinaryMap& src) {
    return Erode3x3(Dilate3x3(src));
}

int32_t RemoveSmallComponents(BinaryMap& map, int32_t minArea) {
    const int32_t w = map.width;
    const int32_t h = map.height;
    std::vector<uint8_t> visited(map.data.size(), 0);
    std::vector<int32_t> stack;
    std::vector<int32_t> component;
    int32_t removed = 0;

    for (int32_t start = 0; start < w * h; ++start) {
        if (!map.data[start] || visited[start]) continue;

        component.clear();
        stack.push_back(start);
        visited[start] = 1;
        while (!stack.empty()) {
            int32_t idx = stack.back();
            stack.pop_back();
            component.push_back(idx);
            int32_t cx = idx % w;
            int32_t cy = idx / w;
            for (int32_t dy = -1; dy <= 1; ++dy) {
                for (int32_t dx = -1; dx <= 1; ++dx) {
                    int32_t nx = cx + dx;
                    int32_t ny = cy + dy;
                    if (nx < 0 || ny < 0 || nx >= w || ny >= h) continue;
                    int32_t n = ny * w + nx;
                    if (map.data[n] && !visited[n]) {
                        visited[n] = 1;
                        stack.push_back(n);
                    }
                }
            }
        }

        if (static_cast<int32_t>(component.size()) < minArea) {
            for (int32_t idx : component) map.data[idx] = 0;
            ++removed;
        }
    }
    return removed;
}

} // namespace Vx::Trace::Internal
