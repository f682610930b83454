#include "gesture.hpp"

namespace droidpilot {

using json = nlohmann::json;

namespace {

double seconds(std::chrono::milliseconds ms) {
    return static_cast<double>(ms.count()) / 1000.0;
}

json touch(const Point& p, const std::optional<Offset>& offset,
           std::chrono::milliseconds wait, std::chrono::milliseconds time, bool release) {
    Offset o = offset.value_or(Offset{});
    return json{
        {"x", p.x},
        {"y", p.y},
        {"offset_x", o.x},
        {"offset_y", o.y},
        {"wait", seconds(wait)},
        {"time", seconds(time)},
        {"release", release},
    };
}

} // anonymous namespace

const char* gestureKindStr(GestureKind kind) {
    switch (kind) {
        case GestureKind::Tap:       return "tap";
        case GestureKind::DoubleTap: return "double_tap";
        case GestureKind::LongPress: return "long_press";
        case GestureKind::Swipe:     return "swipe";
        case GestureKind::Flick:     return "flick";
    }
    return "unknown";
}

GestureKind GestureDescriptor::kind() const {
    switch (shape_) {
        case Shape::Tap:       return duration_.count() > 0 ? GestureKind::LongPress : GestureKind::Tap;
        case Shape::DoubleTap: return GestureKind::DoubleTap;
        case Shape::Swipe:     return flick_ ? GestureKind::Flick : GestureKind::Swipe;
    }
    return GestureKind::Tap;
}

json GestureDescriptor::toJson() const {
    json touches = json::array();
    const std::chrono::milliseconds none{0};

    switch (shape_) {
        case Shape::Tap:
            touches.push_back(touch(from_, offset_, none, duration_, true));
            break;
        case Shape::DoubleTap:
            touches.push_back(touch(from_, offset_, none, none, true));
            touches.push_back(touch(from_, offset_, DOUBLE_TAP_INTERVAL, none, true));
            break;
        case Shape::Swipe:
            touches.push_back(touch(from_, offset_, none, none, false));
            touches.push_back(touch(to_.value_or(from_), offset_, none, duration_, true));
            break;
    }

    json out;
    out["query_string"] = query_string_ ? json(*query_string_) : json(nullptr);
    out["timeout"] = timeout_ ? json(seconds(*timeout_)) : json(nullptr);
    out["gestures"] = json::array({json{{"flick", flick_}, {"touches", touches}}});
    return out;
}

// =============================================================================
// GestureBuilder
// =============================================================================

GestureDescriptor GestureBuilder::timedTap(double x, double y, std::optional<Offset> offset,
                                           std::chrono::milliseconds time) {
    GestureDescriptor g;
    g.shape_ = GestureDescriptor::Shape::Tap;
    g.from_ = Point{x, y};
    g.offset_ = offset;
    g.duration_ = time;
    return g;
}

GestureDescriptor GestureBuilder::tap(double x, double y, std::optional<Offset> offset) {
    return timedTap(x, y, offset, std::chrono::milliseconds{0});
}

GestureDescriptor GestureBuilder::doubleTap(double x, double y, std::optional<Offset> offset) {
    GestureDescriptor g = timedTap(x, y, offset, std::chrono::milliseconds{0});
    g.shape_ = GestureDescriptor::Shape::DoubleTap;
    return g;
}

GestureDescriptor GestureBuilder::longPress(double x, double y, std::optional<Offset> offset,
                                            std::chrono::milliseconds duration) {
    return timedTap(x, y, offset, duration);
}

GestureDescriptor GestureBuilder::generateSwipe(Point from, Point to,
                                                std::chrono::milliseconds time, bool flick) {
    GestureDescriptor g;
    g.shape_ = GestureDescriptor::Shape::Swipe;
    g.from_ = from;
    g.to_ = to;
    g.duration_ = time;
    g.flick_ = flick;
    return g;
}

GestureDescriptor GestureBuilder::swipe(Point from, Point to, std::chrono::milliseconds duration) {
    return generateSwipe(from, to, duration, false);
}

GestureDescriptor GestureBuilder::flick(Point from, Point to, std::chrono::milliseconds duration) {
    return generateSwipe(from, to, duration, true);
}

GestureDescriptor GestureBuilder::withParameters(const GestureDescriptor& gesture,
                                                 std::string query_string,
                                                 std::chrono::milliseconds timeout) {
    GestureDescriptor bound = gesture;
    bound.query_string_ = std::move(query_string);
    bound.timeout_ = timeout;
    return bound;
}

} // namespace droidpilot
