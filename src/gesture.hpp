#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace droidpilot {

// Coordinates are in the test-server's element space (percent of the
// matched view, 0..100)
struct Point {
    double x = 0.0;
    double y = 0.0;
};

struct Offset {
    double x = 0.0;
    double y = 0.0;
};

enum class GestureKind { Tap, DoubleTap, LongPress, Swipe, Flick };

const char* gestureKindStr(GestureKind kind);

/**
 * Immutable multi-touch gesture description.
 *
 * Built by GestureBuilder without any target; GestureBuilder::withParameters()
 * returns a copy bound to a query string and timeout right before dispatch.
 * A long press is a tap whose duration is populated.
 */
class GestureDescriptor {
public:
    GestureKind kind() const;

    const Point& from() const { return from_; }
    const std::optional<Point>& to() const { return to_; }
    const std::optional<Offset>& offset() const { return offset_; }
    std::chrono::milliseconds duration() const { return duration_; }
    bool flick() const { return flick_; }

    const std::optional<std::string>& queryString() const { return query_string_; }
    const std::optional<std::chrono::milliseconds>& timeout() const { return timeout_; }
    bool isBound() const { return query_string_.has_value() && timeout_.has_value(); }

    // {"query_string", "timeout", "gestures": [{"flick", "touches": [...]}]}
    nlohmann::json toJson() const;

private:
    friend class GestureBuilder;

    enum class Shape { Tap, DoubleTap, Swipe };

    Shape shape_ = Shape::Tap;
    Point from_;
    std::optional<Point> to_;
    std::optional<Offset> offset_;
    std::chrono::milliseconds duration_{0};
    bool flick_ = false;

    std::optional<std::string> query_string_;
    std::optional<std::chrono::milliseconds> timeout_;
};

class GestureBuilder {
public:
    static GestureDescriptor tap(double x, double y, std::optional<Offset> offset = std::nullopt);
    static GestureDescriptor doubleTap(double x, double y, std::optional<Offset> offset = std::nullopt);
    static GestureDescriptor longPress(double x, double y, std::optional<Offset> offset,
                                       std::chrono::milliseconds duration);
    static GestureDescriptor swipe(Point from, Point to, std::chrono::milliseconds duration);
    static GestureDescriptor flick(Point from, Point to, std::chrono::milliseconds duration);

    static GestureDescriptor withParameters(const GestureDescriptor& gesture,
                                            std::string query_string,
                                            std::chrono::milliseconds timeout);

private:
    static GestureDescriptor timedTap(double x, double y, std::optional<Offset> offset,
                                      std::chrono::milliseconds time);
    static GestureDescriptor generateSwipe(Point from, Point to,
                                           std::chrono::milliseconds time, bool flick);
};

// Pause between the two touches of a double tap
constexpr std::chrono::milliseconds DOUBLE_TAP_INTERVAL{100};

} // namespace droidpilot
