#include "FigRender.h"

using namespace Upp;
using namespace FigPaint;

/*------------------------------------------------------------------------------
    FigRender: renders a figure scene to PNG

    FigRender [scene.json] [-o out.png] [-w width] [-h height]
              [--dx n] [--dy n] [--validate] [--dump] [-v]

    Without a scene, the built-in sample is written to figTest.png, the sample
    moved by (-20, 20) to moveTest.png, and the sample's bounding box printed.
------------------------------------------------------------------------------*/

CONSOLE_APP_MAIN
{
    RenderOptions opt;
    if(!ParseRenderArgs(CommandLine(), opt)) {
        RenderUsage();
        SetExitCode(1);
        return;
    }
    StdLogSetup(LOG_FILE | (opt.verbose ? LOG_COUT : 0));
    SetExitCode(RunFigRender(opt));
}
