#include "Shape.h"
#include "../Grid/FrameBuffer.h"
#include <algorithm>

namespace shapegrid {

int pointCountFor(ShapeType type)
{
    switch (type) {
        case ShapeType::Point:    return 1;
        case ShapeType::Rect:     return 2;
        case ShapeType::Triangle: return 3;
    }
    return 1;
}

std::optional<ShapeType> typeForPointCount(int count)
{
    switch (count) {
        case 1: return ShapeType::Point;
        case 2: return ShapeType::Rect;
        case 3: return ShapeType::Triangle;
        default: break;
    }
    return std::nullopt;
}

std::optional<Shape> Shape::fromPoints(const std::vector<GridPoint>& pts)
{
    auto type = typeForPointCount((int)pts.size());
    if (!type) return std::nullopt;

    if (*type == ShapeType::Rect) {
        // Normalise to (top-left, bottom-right)
        GridPoint a = pts[0], b = pts[1];
        return rect({std::min(a.x, b.x), std::min(a.y, b.y)},
                    {std::max(a.x, b.x), std::max(a.y, b.y)});
    }
    return Shape{*type, pts};
}

namespace Geometry {

namespace {

    // z-component of (b - a) x (c - a)
    long cross(GridPoint a, GridPoint b, GridPoint c)
    {
        return (long)(b.x - a.x) * (c.y - a.y) - (long)(b.y - a.y) * (c.x - a.x);
    }

    bool ccw(GridPoint a, GridPoint b, GridPoint c)
    {
        return (long)(c.y - a.y) * (b.x - a.x) > (long)(b.y - a.y) * (c.x - a.x);
    }

    bool triangleContains(const std::vector<GridPoint>& v, int x, int y)
    {
        GridPoint p {x, y};
        long d1 = cross(v[0], v[1], p);
        long d2 = cross(v[1], v[2], p);
        long d3 = cross(v[2], v[0], p);
        bool hasNeg = d1 < 0 || d2 < 0 || d3 < 0;
        bool hasPos = d1 > 0 || d2 > 0 || d3 > 0;
        // Cells on an edge count as inside
        return !(hasNeg && hasPos);
    }

} // namespace

bool isDegenerate(const Shape& shape)
{
    if ((int)shape.points.size() != pointCountFor(shape.type))
        return true;
    if (shape.type == ShapeType::Triangle)
        return cross(shape.points[0], shape.points[1], shape.points[2]) == 0;
    return false;
}

bool containsPoint(const Shape& shape, int x, int y)
{
    if (isDegenerate(shape)) return false;

    auto& pts = shape.points;
    switch (shape.type) {
        case ShapeType::Point:
            return pts[0].x == x && pts[0].y == y;
        case ShapeType::Rect: {
            auto b = bounds(shape);
            return x >= b.xMin && x <= b.xMax && y >= b.yMin && y <= b.yMax;
        }
        case ShapeType::Triangle:
            return triangleContains(pts, x, y);
    }
    return false;
}

void draw(const Shape& shape, int level, FrameBuffer& frame)
{
    if (isDegenerate(shape)) return;

    auto b = bounds(shape);
    switch (shape.type) {
        case ShapeType::Point:
            frame.setLevel(shape.points[0].x, shape.points[0].y, level);
            break;
        case ShapeType::Rect:
            for (int gy = b.yMin; gy <= b.yMax; ++gy)
                for (int gx = b.xMin; gx <= b.xMax; ++gx)
                    frame.setLevel(gx, gy, level);
            break;
        case ShapeType::Triangle:
            for (int gy = b.yMin; gy <= b.yMax; ++gy)
                for (int gx = b.xMin; gx <= b.xMax; ++gx)
                    if (triangleContains(shape.points, gx, gy))
                        frame.setLevel(gx, gy, level);
            break;
    }
}

GridBounds bounds(const Shape& shape)
{
    if (shape.points.empty()) return {0, 0, -1, -1};
    GridBounds b {shape.points[0].x, shape.points[0].y, shape.points[0].x, shape.points[0].y};
    for (auto& p : shape.points) {
        b.xMin = std::min(b.xMin, p.x); b.yMin = std::min(b.yMin, p.y);
        b.xMax = std::max(b.xMax, p.x); b.yMax = std::max(b.yMax, p.y);
    }
    return b;
}

std::vector<GridPoint> outline(const Shape& shape)
{
    if (shape.type != ShapeType::Rect || shape.points.size() != 2)
        return shape.points;

    auto b = bounds(shape);
    return {{b.xMin, b.yMin}, {b.xMax, b.yMin}, {b.xMax, b.yMax}, {b.xMin, b.yMax}};
}

std::vector<Segment> edges(const std::vector<GridPoint>& points)
{
    std::vector<Segment> result;
    if (points.size() < 2) return result;
    for (size_t i = 0; i < points.size(); ++i)
        result.push_back({points[i], points[(i + 1) % points.size()]});
    return result;
}

bool segmentsIntersect(const Segment& a, const Segment& b)
{
    auto [p1, p2] = a;
    auto [p3, p4] = b;
    return ccw(p1, p3, p4) != ccw(p2, p3, p4)
        && ccw(p1, p2, p3) != ccw(p1, p2, p4);
}

bool shapesOverlap(const Shape& a, const Shape& b)
{
    auto outA = outline(a);
    auto outB = outline(b);

    // A small shape can sit wholly inside a larger one without any edge crossing
    for (auto& p : outA)
        if (containsPoint(b, p.x, p.y)) return true;
    for (auto& p : outB)
        if (containsPoint(a, p.x, p.y)) return true;

    // ...and two shapes can cross without either holding a vertex of the other
    for (auto& ea : edges(outA))
        for (auto& eb : edges(outB))
            if (segmentsIntersect(ea, eb)) return true;

    return false;
}

Shape translated(const Shape& shape, int dx, int dy)
{
    Shape moved = shape;
    for (auto& p : moved.points) {
        p.x += dx;
        p.y += dy;
    }
    return moved;
}

bool touchesRow(const Shape& shape, int row)
{
    if (shape.points.empty()) return false;
    auto b = bounds(shape);
    return row >= b.yMin && row <= b.yMax;
}

bool withinGrid(const Shape& shape, int width, int height)
{
    for (auto& p : shape.points)
        if (p.x < 0 || p.x >= width || p.y < 0 || p.y >= height)
            return false;
    return true;
}

} // namespace Geometry

} // namespace shapegrid
