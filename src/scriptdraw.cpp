//-----------------------------------------------------------------------------
// Copyright 2021 Eight Brains Studios, LLC
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to
// deal in the Software without restriction, including without limitation the
// rights to use, copy, modify, merge, publish, distribute, sublicense, and/or
// sell copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in
// all copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING
// FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS
// IN THE SOFTWARE.
//-----------------------------------------------------------------------------

#include "scriptdraw.h"
#include "scriptdraw_private.h"

#include <stdio.h>

#include <algorithm>
#include <iostream>
#include <limits>

namespace SD_NAMESPACE {

namespace {

static const float kPi = 3.14159265358979323846f;

float degreesToRadians(float degrees) { return degrees * kPi / 180.0f; }

} // namespace

void printError(const std::string& message)
{
    std::cerr << "[ERROR] " << message << std::endl;
}

//---------------------- defines from scriptdraw_private.h --------------------
int nBytesForUtf8Char(const char* utf8)
{
    if (((*utf8) & 0b10000000) == 0) {
        return 1;
    } else if (((*utf8) & 0b11100000) == 0b11000000) {
        return 2;
    } else if (((*utf8) & 0b11110000) == 0b11100000) {
        return 3;
    } else {
        return 4;
    }
}

std::vector<int> utf8IndicesForCharIndices(const std::string& utf8)
{
    std::vector<int> charToIndex;
    charToIndex.reserve(utf8.size() + 1);
    int idx = 0;
    int n = int(utf8.size());
    while (idx < n) {
        charToIndex.push_back(idx);
        // Handle a truncated character at the end of the string
        idx = std::min(n, idx + nBytesForUtf8Char(utf8.c_str() + idx));
    }
    // Add in the index to the end, too, it comes in handy for ranges that
    // extend to the end of the string.
    charToIndex.push_back(n);
    return charToIndex;
}

std::u32string utf32FromUtf8(const std::string& utf8)
{
    std::u32string utf32;
    utf32.reserve(utf8.size());
    const uint8_t *c = (const uint8_t*)utf8.c_str();
    const uint8_t *end = c + utf8.size();
    while (c < end) {
        uint32_t cp = 0;
        int nMoreBytes = 0;
        if (((*c) & 0b10000000) == 0) {
            cp = uint32_t(*c++);
        } else if (((*c) & 0b11100000) == 0b11000000) {
            cp = (0b00011111 & (*c++));
            nMoreBytes = 1;
        } else if (((*c) & 0b11110000) == 0b11100000) {
            cp = (0b00001111 & (*c++));
            nMoreBytes = 2;
        } else {
            cp = (0b00000111 & (*c++));
            nMoreBytes = 3;
        }
        for (int i = 0;  i < nMoreBytes && c < end;  ++i) {
            cp = (cp << 6) | (0b00111111 & (*c++));
        }
        utf32.push_back(char32_t(cp));
    }
    return utf32;
}

std::string utf8FromCodePoint(char32_t c)
{
    std::string utf8;
    uint32_t cp = uint32_t(c);
    if (cp < 0x80) {
        utf8 += char(cp);
    } else if (cp < 0x800) {
        utf8 += char(0b11000000 | (cp >> 6));
        utf8 += char(0b10000000 | (cp & 0b00111111));
    } else if (cp < 0x10000) {
        utf8 += char(0b11100000 | (cp >> 12));
        utf8 += char(0b10000000 | ((cp >> 6) & 0b00111111));
        utf8 += char(0b10000000 | (cp & 0b00111111));
    } else {
        utf8 += char(0b11110000 | (cp >> 18));
        utf8 += char(0b10000000 | ((cp >> 12) & 0b00111111));
        utf8 += char(0b10000000 | ((cp >> 6) & 0b00111111));
        utf8 += char(0b10000000 | (cp & 0b00111111));
    }
    return utf8;
}

std::string utf8FromUtf32(const std::u32string& utf32)
{
    std::string utf8;
    utf8.reserve(utf32.size());
    for (auto c : utf32) {
        utf8 += utf8FromCodePoint(c);
    }
    return utf8;
}

//-----------------------------------------------------------------------------
const PicaPt PicaPt::kZero(0.0f);

PicaPt operator*(float lhs, const PicaPt& rhs)
    { return PicaPt(lhs * rhs.pt); }

Point operator*(float lhs, const Point& rhs)
    { return Point(lhs * rhs.x, lhs * rhs.y); }

const Point Point::kZero(PicaPt(0.0f), PicaPt(0.0f));
const Size Size::kZero(PicaPt(0.0f), PicaPt(0.0f));
const Rect Rect::kZero(PicaPt(0.0f), PicaPt(0.0f), PicaPt(0.0f), PicaPt(0.0f));

Transform Transform::translation(const PicaPt& dx, const PicaPt& dy)
{
    return Transform(1.0f, 0.0f, 0.0f, 1.0f, dx.asFloat(), dy.asFloat());
}

Transform Transform::rotation(float degrees)
{
    float rad = degreesToRadians(degrees);
    float c = std::cos(rad);
    float s = std::sin(rad);
    return Transform(c, s, -s, c, 0.0f, 0.0f);
}

Transform Transform::scaling(float sx, float sy)
{
    return Transform(sx, 0.0f, 0.0f, sy, 0.0f, 0.0f);
}

Transform Transform::skewing(float xDegrees, float yDegrees)
{
    return Transform(1.0f, std::tan(degreesToRadians(yDegrees)),
                     std::tan(degreesToRadians(xDegrees)), 1.0f, 0.0f, 0.0f);
}

Point Transform::apply(const Point& p) const
{
    float x = p.x.asFloat();
    float y = p.y.asFloat();
    return Point(a * x + c * y + tx, b * x + d * y + ty);
}

//-----------------------------------------------------------------------------
WarningLog::WarningLog()
{
    mSink = [](const Warning& w) {
        std::cerr << "[WARNING] " << w.message << std::endl;
    };
}

void WarningLog::warn(WarningType type, const std::string& message)
{
    mWarnings.push_back({ type, message });
    if (mSink) {
        mSink(mWarnings.back());
    }
}

size_t WarningLog::count(WarningType type) const
{
    return size_t(std::count_if(mWarnings.begin(), mWarnings.end(),
                                [type](const Warning& w) { return w.type == type; }));
}

//-----------------------------------------------------------------------------
const Color Color::kTransparent(0.0f, 0.0f, 0.0f, 0.0f);
const Color Color::kBlack(0.0f, 0.0f, 0.0f, 1.0f);
const Color Color::kWhite(1.0f, 1.0f, 1.0f, 1.0f);
const Color Color::kRed(1.0f, 0.0f, 0.0f, 1.0f);
const Color Color::kGreen(0.0f, 1.0f, 0.0f, 1.0f);
const Color Color::kBlue(0.0f, 0.0f, 1.0f, 1.0f);

Color Color::fromComponents(const std::vector<float>& c)
{
    switch (c.size()) {
        case 1:
            return Color(c[0]);
        case 2:
            return Color(c[0], c[1]);
        case 3:
            return Color(c[0], c[1], c[2]);
        case 4:
            return Color(c[0], c[1], c[2], c[3]);
        default:
            break;
    }
    throw InvalidColorError("a color needs 1 (grey), 2 (grey, alpha), 3 (r, g, b) or 4 (r, g, b, a) values, not "
                            + std::to_string(c.size()));
}

std::vector<Color> Color::fromList(const std::vector<std::vector<float>>& list)
{
    std::vector<Color> colors;
    colors.reserve(list.size());
    for (auto &components : list) {
        colors.push_back(fromComponents(components));
    }
    return colors;
}

std::string Color::toHexString() const
{
    static const char *hex = "0123456789abcdef";
    std::string s;
    uint32_t rgba = toRGBA();
    for (int i = 7;  i >= 0;  --i) {
        int nibble = ((0xf << (4*i)) & rgba) >> (4*i);
        s += hex[nibble];
    }
    return s;
}

CMYKColor CMYKColor::fromComponents(const std::vector<float>& c)
{
    if (c.size() == 4) {
        return CMYKColor(c[0], c[1], c[2], c[3]);
    } else if (c.size() == 5) {
        return CMYKColor(c[0], c[1], c[2], c[3], c[4]);
    }
    throw InvalidColorError("a CMYK color needs 4 (c, m, y, k) or 5 (c, m, y, k, a) values, not "
                            + std::to_string(c.size()));
}

std::vector<CMYKColor> CMYKColor::fromList(const std::vector<std::vector<float>>& list)
{
    std::vector<CMYKColor> colors;
    colors.reserve(list.size());
    for (auto &components : list) {
        colors.push_back(fromComponents(components));
    }
    return colors;
}

Color CMYKColor::toRGB() const
{
    float k = 1.0f - black();
    return Color((1.0f - cyan()) * k, (1.0f - magenta()) * k,
                 (1.0f - yellow()) * k, alpha());
}

//-----------------------------------------------------------------------------
Gradient::Gradient()
    : mType(kGradientLinear)
{
}

Gradient::Gradient(const std::string& type, const Point& start, const Point& end,
                   const std::vector<Color>& colors,
                   const std::vector<float>& positions /*= {}*/,
                   const PicaPt& startRadius /*= PicaPt::kZero*/,
                   const PicaPt& endRadius /*= PicaPt::kZero*/)
    : mStart(start), mEnd(end), mColors(colors)
    , mStartRadius(startRadius), mEndRadius(endRadius)
{
    if (type == "linear") {
        mType = kGradientLinear;
    } else if (type == "radial") {
        mType = kGradientRadial;
    } else {
        throw InvalidGradientError("gradient type must be 'linear' or 'radial', not '" + type + "'");
    }
    init(positions);
}

Gradient::Gradient(GradientType type, const Point& start, const Point& end,
                   const std::vector<Color>& colors,
                   const std::vector<float>& positions /*= {}*/,
                   const PicaPt& startRadius /*= PicaPt::kZero*/,
                   const PicaPt& endRadius /*= PicaPt::kZero*/)
    : mType(type), mStart(start), mEnd(end), mColors(colors)
    , mStartRadius(startRadius), mEndRadius(endRadius)
{
    init(positions);
}

void Gradient::init(const std::vector<float>& positions)
{
    if (mColors.size() < 2) {
        throw InvalidGradientError("a gradient needs at least two colors");
    }
    if (positions.empty()) {
        mPositions.reserve(mColors.size());
        float n = float(mColors.size() - 1);
        for (size_t i = 0;  i < mColors.size();  ++i) {
            mPositions.push_back(float(i) / n);
        }
    } else if (positions.size() != mColors.size()) {
        throw InvalidGradientError("a gradient needs as many positions (" +
                                   std::to_string(positions.size()) +
                                   ") as colors (" +
                                   std::to_string(mColors.size()) + ")");
    } else {
        mPositions = positions;
    }
}

void Gradient::setCMYKColors(const std::vector<CMYKColor>& colors)
{
    if (!colors.empty() && colors.size() != mColors.size()) {
        throw InvalidGradientError("a gradient needs as many CMYK colors as colors");
    }
    mCMYKColors = colors;
}

bool Gradient::operator==(const Gradient& rhs) const
{
    return (mType == rhs.mType && mStart == rhs.mStart && mEnd == rhs.mEnd &&
            mColors == rhs.mColors && mPositions == rhs.mPositions &&
            mCMYKColors == rhs.mCMYKColors &&
            mStartRadius == rhs.mStartRadius && mEndRadius == rhs.mEndRadius);
}

Shadow::Shadow()
    : mColor(Color::kBlack)
{
}

Shadow::Shadow(const Point& offset, const PicaPt& blur, const Color& color)
    : mOffset(offset), mBlur(blur), mColor(color)
{
}

void Shadow::setCMYKColor(const CMYKColor& color)
{
    mCMYKColor = color;
    mColor = color.toRGB();
}

bool Shadow::operator==(const Shadow& rhs) const
{
    return (mOffset == rhs.mOffset && mBlur == rhs.mBlur &&
            mColor == rhs.mColor && mCMYKColor == rhs.mCMYKColor);
}

//-----------------------------------------------------------------------------
int Alignment::fromName(const std::string& name)
{
    if (name.empty() || name == "left") {
        return kLeft;
    } else if (name == "center") {
        return kHCenter;
    } else if (name == "right") {
        return kRight;
    } else if (name == "justified") {
        return kJustify;
    }
    throw InvalidParameterError("align must be 'left', 'center', 'right' or 'justified', not '" + name + "'");
}

std::string Alignment::name(int alignment)
{
    switch (alignment & kHorizMask) {
        case kHCenter:
            return "center";
        case kRight:
            return "right";
        case kJustify:
            return "justified";
        default:
            return "left";
    }
}

//-----------------------------------------------------------------------------
namespace {

void requireCurrentPoint(const BezierPath::Impl& impl, const char *funcName)
{
    if (!impl.hasCurrentPoint) {
        throw DrawingStateError(std::string(funcName) + ": the path has no current point, call moveTo() first");
    }
}

// Recalculates the current point after elements were removed or appended
// wholesale.
void replayCurrentPoint(BezierPath::Impl& impl)
{
    impl.hasCurrentPoint = false;
    for (auto &e : impl.elements) {
        switch (e.action) {
            case BezierPath::kMoveTo:
                impl.subpathStart = e.points[0];
                impl.currentPoint = e.points[0];
                impl.hasCurrentPoint = true;
                break;
            case BezierPath::kLineTo:
            case BezierPath::kCurveTo:
                impl.currentPoint = e.points.back();
                break;
            case BezierPath::kClosePath:
                impl.currentPoint = impl.subpathStart;
                break;
        }
    }
}

// Solves for the t in (0, 1) where the derivative of the cubic bezier
// p0, p1, p2, p3 is zero, and extends [*minV, *maxV] with the values there.
void extendWithCubicExtrema(float p0, float p1, float p2, float p3,
                            float *minV, float *maxV)
{
    // B'(t)/3 = a t^2 + b t + c
    float a = -p0 + 3.0f * p1 - 3.0f * p2 + p3;
    float b = 2.0f * (p0 - 2.0f * p1 + p2);
    float c = p1 - p0;
    std::vector<float> ts;
    if (std::abs(a) < 1e-6f) {
        if (std::abs(b) > 1e-6f) {
            ts.push_back(-c / b);
        }
    } else {
        float disc = b * b - 4.0f * a * c;
        if (disc >= 0.0f) {
            float sq = std::sqrt(disc);
            ts.push_back((-b + sq) / (2.0f * a));
            ts.push_back((-b - sq) / (2.0f * a));
        }
    }
    for (auto t : ts) {
        if (t > 0.0f && t < 1.0f) {
            float mt = 1.0f - t;
            float v = mt * mt * mt * p0 + 3.0f * mt * mt * t * p1 +
                      3.0f * mt * t * t * p2 + t * t * t * p3;
            *minV = std::min(*minV, v);
            *maxV = std::max(*maxV, v);
        }
    }
}

bool boundsOf(const BezierPath::Impl& impl, bool includeControlPoints, Rect *r)
{
    if (impl.elements.empty()) {
        return false;
    }

    float minX = std::numeric_limits<float>::max();
    float minY = std::numeric_limits<float>::max();
    float maxX = std::numeric_limits<float>::lowest();
    float maxY = std::numeric_limits<float>::lowest();
    auto extend = [&minX, &minY, &maxX, &maxY](const Point& p) {
        minX = std::min(minX, p.x.asFloat());
        minY = std::min(minY, p.y.asFloat());
        maxX = std::max(maxX, p.x.asFloat());
        maxY = std::max(maxY, p.y.asFloat());
    };

    Point current;
    Point start;
    for (auto &e : impl.elements) {
        switch (e.action) {
            case BezierPath::kMoveTo:
                extend(e.points[0]);
                current = e.points[0];
                start = current;
                break;
            case BezierPath::kLineTo:
                extend(e.points[0]);
                current = e.points[0];
                break;
            case BezierPath::kCurveTo: {
                auto &cp1 = e.points[0];
                auto &cp2 = e.points[1];
                auto &end = e.points[2];
                extend(end);
                if (includeControlPoints) {
                    extend(cp1);
                    extend(cp2);
                } else {
                    extendWithCubicExtrema(current.x.asFloat(), cp1.x.asFloat(),
                                           cp2.x.asFloat(), end.x.asFloat(),
                                           &minX, &maxX);
                    extendWithCubicExtrema(current.y.asFloat(), cp1.y.asFloat(),
                                           cp2.y.asFloat(), end.y.asFloat(),
                                           &minY, &maxY);
                }
                current = end;
                break;
            }
            case BezierPath::kClosePath:
                current = start;
                break;
        }
    }

    if (r) {
        *r = Rect(PicaPt(minX), PicaPt(minY), PicaPt(maxX - minX), PicaPt(maxY - minY));
    }
    return true;
}

} // namespace

BezierPath::BezierPath()
    : mImpl(new BezierPath::Impl())
{
}

BezierPath::BezierPath(const BezierPath& p)
    : mImpl(new BezierPath::Impl(*p.mImpl))
{
}

BezierPath& BezierPath::operator=(const BezierPath& rhs)
{
    if (this != &rhs) {
        *mImpl = *rhs.mImpl;
    }
    return *this;
}

BezierPath::~BezierPath()
{
}

void BezierPath::moveTo(const Point& p)
{
    mImpl->elements.push_back({ kMoveTo, { p } });
    mImpl->subpathStart = p;
    mImpl->currentPoint = p;
    mImpl->hasCurrentPoint = true;
}

void BezierPath::lineTo(const Point& end)
{
    requireCurrentPoint(*mImpl, "lineTo()");
    mImpl->elements.push_back({ kLineTo, { end } });
    mImpl->currentPoint = end;
}

void BezierPath::curveTo(const Point& cp1, const Point& cp2, const Point& end)
{
    requireCurrentPoint(*mImpl, "curveTo()");
    mImpl->elements.push_back({ kCurveTo, { cp1, cp2, end } });
    mImpl->currentPoint = end;
}

void BezierPath::arcTo(const Point& p1, const Point& p2, const PicaPt& radius)
{
    requireCurrentPoint(*mImpl, "arcTo()");

    float x0 = mImpl->currentPoint.x.asFloat(), y0 = mImpl->currentPoint.y.asFloat();
    float x1 = p1.x.asFloat(), y1 = p1.y.asFloat();
    float x2 = p2.x.asFloat(), y2 = p2.y.asFloat();
    float r = radius.asFloat();

    // Unit vectors from the corner (p1) along both edges
    float e1x = x0 - x1, e1y = y0 - y1;
    float e2x = x2 - x1, e2y = y2 - y1;
    float len1 = std::sqrt(e1x * e1x + e1y * e1y);
    float len2 = std::sqrt(e2x * e2x + e2y * e2y);
    if (len1 == 0.0f || len2 == 0.0f || r == 0.0f) {
        lineTo(p1);
        return;
    }
    e1x /= len1;  e1y /= len1;
    e2x /= len2;  e2y /= len2;

    // Collinear edges have no tangent circle
    float sine = std::abs(e1x * e2y - e1y * e2x);
    if (sine < 1e-4f) {
        lineTo(p1);
        return;
    }

    float cosTheta = std::max(-1.0f, std::min(1.0f, e1x * e2x + e1y * e2y));
    float halfTheta = 0.5f * std::acos(cosTheta);
    float toTangent = r / std::tan(halfTheta);
    float toCenter = r / std::sin(halfTheta);
    float bx = e1x + e2x, by = e1y + e2y;
    float blen = std::sqrt(bx * bx + by * by);
    bx /= blen;  by /= blen;

    float t1x = x1 + e1x * toTangent, t1y = y1 + e1y * toTangent;
    float t2x = x1 + e2x * toTangent, t2y = y1 + e2y * toTangent;
    float cx = x1 + bx * toCenter, cy = y1 + by * toCenter;

    lineTo(Point(t1x, t1y));

    float startAngle = std::atan2(t1y - cy, t1x - cx);
    float endAngle = std::atan2(t2y - cy, t2x - cx);
    float sweep = endAngle - startAngle;
    while (sweep > kPi) { sweep -= 2.0f * kPi; }
    while (sweep < -kPi) { sweep += 2.0f * kPi; }

    // Each cubic segment covers at most a quarter circle.
    int nSegments = std::max(1, int(std::ceil(std::abs(sweep) / (0.5f * kPi) - 1e-4f)));
    float segment = sweep / float(nSegments);
    float alpha = 4.0f / 3.0f * std::tan(0.25f * segment);
    for (int i = 0;  i < nSegments;  ++i) {
        float a0 = startAngle + float(i) * segment;
        float a1 = a0 + segment;
        float c0 = std::cos(a0), s0 = std::sin(a0);
        float c1 = std::cos(a1), s1 = std::sin(a1);
        Point start(cx + r * c0, cy + r * s0);
        Point end(cx + r * c1, cy + r * s1);
        if (i == nSegments - 1) {
            end = Point(t2x, t2y);
        }
        Point cp1 = start + Point(-alpha * r * s0, alpha * r * c0);
        Point cp2 = end - Point(-alpha * r * s1, alpha * r * c1);
        curveTo(cp1, cp2, end);
    }
}

void BezierPath::closePath()
{
    requireCurrentPoint(*mImpl, "closePath()");
    mImpl->elements.push_back({ kClosePath, {} });
    mImpl->currentPoint = mImpl->subpathStart;
}

void BezierPath::rect(const Rect& r)
{
    mImpl->elements.reserve(mImpl->elements.size() + 5);
    moveTo(Point(r.minX(), r.minY()));
    lineTo(Point(r.maxX(), r.minY()));
    lineTo(Point(r.maxX(), r.maxY()));
    lineTo(Point(r.minX(), r.maxY()));
    closePath();
}

void BezierPath::oval(const Rect& r)
{
    // This is the weight for control points for a sphere.
    // Normally 4 cubic splines use 0.55228475, but a better number was
    // computed by http://www.tinaja.com/glib/ellipse4.pdf.
    // It has an error of .76 px/in at 1200 DPI (0.0633%).
    float kCtrlWeight = 0.551784f;
    PicaPt zero(0.0f);

    mImpl->elements.reserve(mImpl->elements.size() + 6);

    Point tanBottom(r.midX(), r.minY());
    Point tanRight(r.maxX(), r.midY());
    Point tanTop(r.midX(), r.maxY());
    Point tanLeft(r.minX(), r.midY());
    Point horiz(0.5f * r.width, zero);
    Point vert(zero, 0.5f * r.height);

    // Counterclockwise, like rect()
    moveTo(tanBottom);
    curveTo(tanBottom + kCtrlWeight * horiz,
            tanRight - kCtrlWeight * vert,
            tanRight);
    curveTo(tanRight + kCtrlWeight * vert,
            tanTop + kCtrlWeight * horiz,
            tanTop);
    curveTo(tanTop - kCtrlWeight * horiz,
            tanLeft + kCtrlWeight * vert,
            tanLeft);
    curveTo(tanLeft - kCtrlWeight * vert,
            tanBottom - kCtrlWeight * horiz,
            tanBottom);
    closePath();
}

void BezierPath::text(const FormattedString& txt, const Typesetter& typesetter,
                      const Point& offset)
{
    typesetter.appendOutlines(this, txt, offset, Size::kZero);
    optimize();
}

void BezierPath::text(const FormattedString& txt, const Typesetter& typesetter,
                      const Rect& box)
{
    typesetter.appendOutlines(this, txt, Point(box.minX(), box.maxY()),
                              box.size());
    optimize();
}

void BezierPath::appendPath(const BezierPath& path)
{
    mImpl->elements.insert(mImpl->elements.end(),
                           path.mImpl->elements.begin(),
                           path.mImpl->elements.end());
    replayCurrentPoint(*mImpl);
}

bool BezierPath::isEmpty() const { return mImpl->elements.empty(); }

bool BezierPath::hasCurrentPoint() const { return mImpl->hasCurrentPoint; }

const std::vector<BezierPath::Element>& BezierPath::elements() const
{
    return mImpl->elements;
}

std::vector<Point> BezierPath::points() const
{
    std::vector<Point> pts;
    for (auto &e : mImpl->elements) {
        pts.insert(pts.end(), e.points.begin(), e.points.end());
    }
    return pts;
}

std::vector<Point> BezierPath::onCurvePoints() const
{
    std::vector<Point> pts;
    for (auto &e : mImpl->elements) {
        if (!e.points.empty()) {
            pts.push_back(e.points.back());
        }
    }
    return pts;
}

std::vector<Point> BezierPath::offCurvePoints() const
{
    std::vector<Point> pts;
    for (auto &e : mImpl->elements) {
        if (e.action == kCurveTo) {
            pts.push_back(e.points[0]);
            pts.push_back(e.points[1]);
        }
    }
    return pts;
}

std::vector<BezierPath::Contour> BezierPath::contours() const
{
    std::vector<Contour> contours;
    for (auto &e : mImpl->elements) {
        if (e.action == kMoveTo) {
            contours.emplace_back();
        }
        if (!e.points.empty() && !contours.empty()) {
            contours.back().push_back(e.points);
        }
    }
    // A trailing moveTo back to the start of the previous contour (which is
    // what closing a glyph outline often leaves behind) is not a contour.
    if (contours.size() >= 2 && contours.back().size() == 1 &&
        contours.back()[0] == contours[contours.size() - 2][0]) {
        contours.pop_back();
    }
    return contours;
}

bool BezierPath::bounds(Rect *r) const
{
    return boundsOf(*mImpl, false, r);
}

bool BezierPath::controlPointBounds(Rect *r) const
{
    return boundsOf(*mImpl, true, r);
}

bool BezierPath::pointInside(const Point& p) const
{
    const int kCurveSteps = 16;
    float px = p.x.asFloat();
    float py = p.y.asFloat();
    int winding = 0;

    // Flattens each subpath into a polygon (implicitly closed) and counts
    // signed crossings of a ray going in +x.
    auto addEdge = [px, py, &winding](float x0, float y0, float x1, float y1) {
        if (y0 <= py) {
            if (y1 > py) {
                float cross = (x1 - x0) * (py - y0) - (px - x0) * (y1 - y0);
                if (cross > 0.0f) { ++winding; }
            }
        } else if (y1 <= py) {
            float cross = (x1 - x0) * (py - y0) - (px - x0) * (y1 - y0);
            if (cross < 0.0f) { --winding; }
        }
    };

    float startX = 0.0f, startY = 0.0f, curX = 0.0f, curY = 0.0f;
    bool open = false;
    for (auto &e : mImpl->elements) {
        switch (e.action) {
            case kMoveTo:
                if (open) {
                    addEdge(curX, curY, startX, startY);
                }
                startX = curX = e.points[0].x.asFloat();
                startY = curY = e.points[0].y.asFloat();
                open = true;
                break;
            case kLineTo:
                addEdge(curX, curY, e.points[0].x.asFloat(), e.points[0].y.asFloat());
                curX = e.points[0].x.asFloat();
                curY = e.points[0].y.asFloat();
                break;
            case kCurveTo: {
                float x0 = curX, y0 = curY;
                for (int i = 1;  i <= kCurveSteps;  ++i) {
                    float t = float(i) / float(kCurveSteps);
                    float mt = 1.0f - t;
                    float w0 = mt * mt * mt, w1 = 3.0f * mt * mt * t;
                    float w2 = 3.0f * mt * t * t, w3 = t * t * t;
                    float x = w0 * x0 + w1 * e.points[0].x.asFloat() +
                              w2 * e.points[1].x.asFloat() + w3 * e.points[2].x.asFloat();
                    float y = w0 * y0 + w1 * e.points[0].y.asFloat() +
                              w2 * e.points[1].y.asFloat() + w3 * e.points[2].y.asFloat();
                    addEdge(curX, curY, x, y);
                    curX = x;
                    curY = y;
                }
                break;
            }
            case kClosePath:
                addEdge(curX, curY, startX, startY);
                curX = startX;
                curY = startY;
                open = false;
                break;
        }
    }
    if (open) {
        addEdge(curX, curY, startX, startY);
    }
    return (winding != 0);
}

void BezierPath::optimize()
{
    if (!mImpl->elements.empty() && mImpl->elements.back().action == kMoveTo) {
        mImpl->elements.pop_back();
        replayCurrentPoint(*mImpl);
    }
}

bool BezierPath::operator==(const BezierPath& rhs) const
{
    return (mImpl->elements == rhs.mImpl->elements);
}

//-----------------------------------------------------------------------------
void premultiplyBGRA(uint8_t* bgra, int width, int height)
{
    uint8_t* end = bgra + 4 * width * height;
    float alpha;
    while (bgra < end) {
        if (bgra[3] < 0xff) {  // the common case is alpha = 1.0f, so no work necessary
            alpha = float(bgra[3]) / 255.0f;
            bgra[0] = uint8_t(std::round(alpha * float(bgra[0])));
            bgra[1] = uint8_t(std::round(alpha * float(bgra[1])));
            bgra[2] = uint8_t(std::round(alpha * float(bgra[2])));
        }
        bgra += 4;
    }
}

std::vector<uint8_t> readFile(const char *path)
{
    std::vector<uint8_t> data;
    FILE *in = fopen(path, "rb");
    if (in) {
        fseek(in, 0, SEEK_END);
        auto size = ftell(in);
        fseek(in, 0, SEEK_SET);
        if (size > 0) {
            data.resize(size_t(size));
            if (fread(data.data(), size_t(size), 1, in) != 1) {
                data.clear();
            }
        }
        fclose(in);
    }
    return data;
}

ImageData readImage(const uint8_t *imgdata, int size)
{
    if (!imgdata || size <= 0) {
        return ImageData();
    }
    // PNG validates very quickly, so test first
    ImageData image = readPNG(imgdata, size);
    if (image.isValid()) {
        return image;
    }
    // JPEG requires some setup to validate
    image = readJPEG(imgdata, size);
    if (image.isValid()) {
        return image;
    }
    // GIF is unlikely, do last
    return readGIF(imgdata, size);
}

} // namespace $SD_NAMESPACE
