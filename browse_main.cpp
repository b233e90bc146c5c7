// capture_browse - terminal list of the most recent captures
// Usage: capture_browse [directory]   (default: received_codes)

#include "CodeCapture/CodeCapture.h"
#include "CodeCapture/capture_browser.h"

int main(int argc, char** argv){
    std::string dir = "received_codes";
    std::string viewer = "less";

    for(int i = 1; i < argc; ++i){
        std::string arg = argv[i];
        if(arg == "--help" || arg == "-h"){
            std::cout << "usage: " << argv[0] << " [--viewer <program>] [directory]\n";
            return 0;
        }
        if(arg == "--viewer"){
            if(i + 1 >= argc){
                std::cerr << "--viewer requires a program name\n";
                return 1;
            }
            viewer = argv[++i];
            continue;
        }
        dir = arg;
    }

    Capture::CaptureBrowser browser(dir, viewer);
    return browser.run();
}
