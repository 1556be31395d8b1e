#include "FigPaint.h"

#include <plugin/png/png.h>

namespace FigPaint {

#define LLOG(x) // LOG(x)

Image InitCanvas(int cx, int cy, Function<RGBA (Point)> pixel)
{
    if(cx <= 0 || cy <= 0 || !pixel)
        return Image();

    ImageBuffer ib(cx, cy);
    for(int y = 0; y < cy; ++y) {
        RGBA* row = ib[y];
        for(int x = 0; x < cx; ++x)
            row[x] = pixel(Point(x, y));
    }
    Premultiply(ib);
    return ib;
}

Image RenderFigure(const Figure& fig, int cx, int cy, RGBA background)
{
    LLOG("RenderFigure " << cx << "x" << cy << ", depth " << fig.GetDepth());
    return InitCanvas(cx, cy, [&](Point p) -> RGBA {
        RGBA c;
        return ColorAt(fig, p, c) ? c : background;
    });
}

bool SaveCanvas(const String& path, const Image& img)
{
    if(img.IsEmpty()) {
        RLOG("SaveCanvas: empty image, nothing written to " << path);
        return false;
    }
    if(!PNGEncoder().SaveFile(path, img)) {
        RLOG("SaveCanvas: cannot write " << path);
        return false;
    }
    LLOG("SaveCanvas: " << path << " " << img.GetSize());
    return true;
}

bool MakePicture(const String& path, const Figure& fig, int cx, int cy, RGBA background)
{
    return SaveCanvas(path, RenderFigure(fig, cx, cy, background));
}

} // namespace FigPaint
