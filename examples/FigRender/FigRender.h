#ifndef _FigRender_FigRender_h_
#define _FigRender_FigRender_h_

#include <FigPaint/FigPaint.h>

namespace FigPaint {

struct RenderOptions {
    String scene_path;
    String output;
    int    width  = Null;
    int    height = Null;
    Point  delta  = Point(0, 0);
    bool   validate = false;
    bool   dump     = false;
    bool   verbose  = false;
};

void   RenderUsage();

// Reports the offending argument on Cerr and returns false.
bool   ParseRenderArgs(const Vector<String>& cmd, RenderOptions& opt);

// -o, -w, -h, --dx/--dy win over the scene file.
void   ApplyRenderOptions(const RenderOptions& opt, Scene& scene);

// Exit codes: 0 written, 1 read/parse/write failure, 2 refused by validation.
int    RenderScene(const Scene& scene, const RenderOptions& opt);
int    RunFigRender(const RenderOptions& opt);

} // namespace FigPaint

#endif
