#ifndef POLYFLAT_EMIT_POLYGON_SINK_H
#define POLYFLAT_EMIT_POLYGON_SINK_H

#include "polyflat/core/types.h"

#include <cstdint>
#include <functional>
#include <utility>
#include <vector>

namespace polyflat::emit {

// Output boundary: receives final, transformed outlines with their layer tag.
// Encoding is entirely the sink's business. Returning anything but Ok aborts
// the conversion run.
class PolygonSink {
public:
    virtual ~PolygonSink() = default;
    virtual ConvertError emitPolygon(const std::vector<Point2>& points, std::int32_t layer) = 0;
};

class CallbackPolygonSink : public PolygonSink {
public:
    using Callback = std::function<ConvertError(const std::vector<Point2>& points, std::int32_t layer)>;

    explicit CallbackPolygonSink(Callback cb) : callback_(std::move(cb)) {}

    ConvertError emitPolygon(const std::vector<Point2>& points, std::int32_t layer) override;

private:
    Callback callback_;
};

// Keeps every polygon in submission order.
class CollectingPolygonSink : public PolygonSink {
public:
    struct Entry {
        std::vector<Point2> points;
        std::int32_t layer{0};
    };

    ConvertError emitPolygon(const std::vector<Point2>& points, std::int32_t layer) override;

    const std::vector<Entry>& entries() const noexcept { return entries_; }
    void clear() noexcept { entries_.clear(); }

private:
    std::vector<Entry> entries_;
};

} // namespace polyflat::emit

#endif // POLYFLAT_EMIT_POLYGON_SINK_H
