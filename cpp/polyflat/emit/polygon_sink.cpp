#include "polyflat/emit/polygon_sink.h"

namespace polyflat::emit {

ConvertError CallbackPolygonSink::emitPolygon(const std::vector<Point2>& points, std::int32_t layer) {
    if (!callback_) return ConvertError::Ok;
    return callback_(points, layer);
}

ConvertError CollectingPolygonSink::emitPolygon(const std::vector<Point2>& points, std::int32_t layer) {
    entries_.push_back(Entry{points, layer});
    return ConvertError::Ok;
}

} // namespace polyflat::emit
