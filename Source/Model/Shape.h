#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace shapegrid {

class FrameBuffer;

enum class ShapeType { Point, Rect, Triangle };

struct GridPoint {
    int x = 0, y = 0;

    bool operator==(const GridPoint& o) const { return x == o.x && y == o.y; }
    bool operator!=(const GridPoint& o) const { return !(*this == o); }
};

struct GridBounds {
    int xMin, yMin, xMax, yMax;  // inclusive
};

using Segment = std::pair<GridPoint, GridPoint>;

// ============================================================
// Shape — 1 point, 2 rectangle corners or 3 triangle vertices,
// in grid cells (origin top-left). The kind is fixed at
// construction; translation keeps it.
// ============================================================
struct Shape {
    ShapeType type = ShapeType::Point;
    std::vector<GridPoint> points;

    static Shape point(GridPoint p) { return {ShapeType::Point, {p}}; }
    static Shape rect(GridPoint a, GridPoint b) { return {ShapeType::Rect, {a, b}}; }
    static Shape triangle(GridPoint a, GridPoint b, GridPoint c) { return {ShapeType::Triangle, {a, b, c}}; }

    // Builds the shape implied by a completed press gesture
    static std::optional<Shape> fromPoints(const std::vector<GridPoint>& pts);

    bool operator==(const Shape& o) const { return type == o.type && points == o.points; }
    bool operator!=(const Shape& o) const { return !(*this == o); }

    std::string typeString() const
    {
        switch (type) {
            case ShapeType::Point:    return "point";
            case ShapeType::Rect:     return "rect";
            case ShapeType::Triangle: return "triangle";
        }
        return "point";
    }
};

int pointCountFor(ShapeType type);
std::optional<ShapeType> typeForPointCount(int count);

namespace Geometry {

    // Degenerate shapes (wrong point count, collinear triangle) never contain anything
    bool containsPoint(const Shape& shape, int x, int y);

    // Sets every covered cell to `level`; degenerate shapes draw nothing
    void draw(const Shape& shape, int level, FrameBuffer& frame);

    bool isDegenerate(const Shape& shape);

    GridBounds bounds(const Shape& shape);

    // Corner list used for overlap tests: the four corners of a rect,
    // the vertices of a triangle, the single cell of a point.
    std::vector<GridPoint> outline(const Shape& shape);

    // Point i joined to point (i+1) mod N; empty below two points
    std::vector<Segment> edges(const std::vector<GridPoint>& points);

    bool segmentsIntersect(const Segment& a, const Segment& b);

    bool shapesOverlap(const Shape& a, const Shape& b);

    Shape translated(const Shape& shape, int dx, int dy);

    bool touchesRow(const Shape& shape, int row);
    bool withinGrid(const Shape& shape, int width, int height);

} // namespace Geometry

} // namespace shapegrid
