#ifndef _FigPaint_tests_Fixtures_h_
#define _FigPaint_tests_Fixtures_h_

#include <gtest/gtest.h>

#include <FigPaint/FigPaint.h>

#include <string>

namespace FigPaint {

inline RGBA RedArgb()  { return Argb(255, 255, 0, 0); }
inline RGBA BlueArgb() { return Argb(255, 0, 0, 255); }

// Mix(Circle((50,50),45,red), Rectangle((40,40),(90,110),blue))
inline Figure SampleFigure()
{
    return Figure::Mix(Figure::Circle(Point(50, 50), 45, RedArgb()),
                       Figure::Rectangle(Point(40, 40), Point(90, 110), BlueArgb()));
}

// "a,r,g,b"
inline std::string Channels(RGBA c)
{
    return Format("%d,%d,%d,%d", (int)c.a, (int)c.r, (int)c.g, (int)c.b).ToStd();
}

// Channels of the color at p, or "none"
inline std::string ColorText(const Figure& fig, Point p)
{
    RGBA c;
    return ColorAt(fig, p, c) ? Channels(c) : "none";
}

} // namespace FigPaint

#endif
