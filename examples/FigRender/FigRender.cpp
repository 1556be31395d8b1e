#include "FigRender.h"

namespace FigPaint {

static Figure SampleFigure()
{
    return Figure::Mix(Figure::Circle(Point(50, 50), 45, ToArgb(LtRed())),
                       Figure::Rectangle(Point(40, 40), Point(90, 110), ToArgb(LtBlue())));
}

static String BoxText(const Rect& r)
{
    return Format("(%d, %d) - (%d, %d)", r.left, r.top, r.right, r.bottom);
}

void RenderUsage()
{
    Cerr() << "Usage: FigRender [scene.json] [-o out.png] [-w width] [-h height]\n"
              "                 [--dx n] [--dy n] [--validate] [--dump] [-v]\n";
}

bool ParseRenderArgs(const Vector<String>& cmd, RenderOptions& opt)
{
    for(int i = 0; i < cmd.GetCount(); ++i) {
        const String& a = cmd[i];
        auto value = [&](String& out) -> bool {
            if(i + 1 >= cmd.GetCount()) {
                Cerr() << "Missing value for " << a << "\n";
                return false;
            }
            out = cmd[++i];
            return true;
        };
        auto number = [&](int& out) -> bool {
            String s;
            if(!value(s))
                return false;
            out = StrInt(s);
            if(IsNull(out)) {
                Cerr() << "Not a number for " << a << ": " << s << "\n";
                return false;
            }
            return true;
        };

        bool ok = true;
        if(a == "-o")                ok = value(opt.output);
        else if(a == "-w")           ok = number(opt.width);
        else if(a == "-h")           ok = number(opt.height);
        else if(a == "--dx")         ok = number(opt.delta.x);
        else if(a == "--dy")         ok = number(opt.delta.y);
        else if(a == "--validate")   opt.validate = true;
        else if(a == "--dump")       opt.dump = true;
        else if(a == "-v")           opt.verbose = true;
        else if(a.StartsWith("-"))   { Cerr() << "Unknown option " << a << "\n"; ok = false; }
        else if(opt.scene_path.IsEmpty()) opt.scene_path = a;
        else                         { Cerr() << "Unexpected argument " << a << "\n"; ok = false; }
        if(!ok)
            return false;
    }
    return true;
}

void ApplyRenderOptions(const RenderOptions& opt, Scene& scene)
{
    if(!opt.output.IsEmpty())  scene.output = opt.output;
    if(!IsNull(opt.width))     scene.width  = opt.width;
    if(!IsNull(opt.height))    scene.height = opt.height;
    if((opt.delta.x || opt.delta.y) && !scene.figure.IsEmpty())
        scene.figure.Create<Figure>(MoveFigure(*scene.figure, opt.delta));
}

int RenderScene(const Scene& scene, const RenderOptions& opt)
{
    const Figure& fig = *scene.figure;
    RLOG("Rendering " << fig << " to " << scene.output
         << " (" << scene.width << "x" << scene.height << ")");

    if((scene.validate || opt.validate) && !CheckFigure(fig)) {
        Cerr() << "Invalid figure, not rendered: " << fig.ToString() << "\n";
        return 2;
    }
    if(!MakePicture(scene.output, fig, scene.width, scene.height, scene.background)) {
        Cerr() << "Cannot write " << scene.output << "\n";
        return 1;
    }
    Cout() << scene.output << ": " << BoxText(GetBoundingBox(fig)) << "\n";
    return 0;
}

int RunFigRender(const RenderOptions& opt)
{
    Scene scene;
    if(opt.scene_path.IsEmpty()) {
        scene.figure.Create<Figure>(SampleFigure());
        scene.output = "figTest.png";
    }
    else {
        String json = LoadFile(opt.scene_path);
        if(json.IsVoid()) {
            Cerr() << "Cannot read " << opt.scene_path << "\n";
            return 1;
        }
        if(!LoadScene(json, scene)) {
            Cerr() << "Malformed scene " << opt.scene_path << " (see log)\n";
            return 1;
        }
    }
    ApplyRenderOptions(opt, scene);

    if(opt.dump) {
        Cout() << StoreScene(scene) << "\n";
        return 0;
    }

    int code = RenderScene(scene, opt);
    if(code == 0 && opt.scene_path.IsEmpty()) {
        Scene moved;
        moved.figure.Create<Figure>(MoveFigure(*scene.figure, -20, 20));
        moved.width  = scene.width;
        moved.height = scene.height;
        moved.output = "moveTest.png";
        code = RenderScene(moved, opt);
        Cout() << "Bounding box: " << BoxText(GetBoundingBox(*scene.figure)) << "\n";
    }
    return code;
}

} // namespace FigPaint
