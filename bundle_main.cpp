// capture_bundle - pack a directory tree into one fenced text file, or unpack one
//   capture_bundle dump <dir> [out] [--no-gitignore] [-v]
//   capture_bundle split <in> <outdir>

#include "CodeCapture/CodeCapture.h"

static int usage(const char* argv0){
    std::cerr << "usage: " << argv0 << " dump <dir> [out] [--no-gitignore] [-v|--verbose]\n"
              << "       " << argv0 << " split <in> <outdir>\n";
    return 1;
}

static int run_dump(int argc, char** argv){
    std::vector<std::string> positional;
    Capture::DumpOptions options;
    for(int i = 2; i < argc; ++i){
        std::string arg = argv[i];
        if(arg == "--no-gitignore"){
            options.use_gitignore = false;
            continue;
        }
        if(arg == "-v" || arg == "--verbose"){
            options.verbose = true;
            continue;
        }
        positional.push_back(arg);
    }
    if(positional.empty() || positional.size() > 2) return usage(argv[0]);

    std::filesystem::path dir = positional[0];
    std::filesystem::path out_path = positional.size() > 1 ? positional[1] : Capture::kDefaultBundleFile;
    options.exclude = out_path;

    std::error_code ec;
    if(!std::filesystem::is_directory(dir, ec)){
        std::cerr << "Error: input directory not found: '" << dir.string() << "'\n";
        return 1;
    }

    std::ofstream out(out_path, std::ios::binary | std::ios::trunc);
    if(!out){
        std::cerr << "Error: cannot open '" << out_path.string() << "' for writing\n";
        return 1;
    }

    try{
        auto stats = Capture::dump_tree(dir, out, options);
        std::cout << "Processed " << stats.files << " files.\n";
        if(stats.skipped > 0) std::cout << "Skipped " << stats.skipped << " files/directories.\n";
        std::cout << "Output written to: '" << Capture::canonical_root(out_path).string() << "'\n";
    } catch(const std::exception& e){
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}

static int run_split(int argc, char** argv){
    if(argc != 4) return usage(argv[0]);
    std::ifstream in(argv[2], std::ios::binary);
    if(!in){
        std::cerr << "Error: input file '" << argv[2] << "' not found\n";
        return 1;
    }

    try{
        auto stats = Capture::split_bundle(in, argv[3]);
        std::cout << "Extracted " << stats.files << " files";
        if(stats.skipped > 0) std::cout << ", skipped " << stats.skipped;
        std::cout << ".\nGenerated files are under '" << Capture::canonical_root(argv[3]).string() << "'\n";
    } catch(const std::exception& e){
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}

int main(int argc, char** argv){
    if(argc < 2) return usage(argv[0]);
    std::string command = argv[1];
    if(command == "dump") return run_dump(argc, argv);
    if(command == "split") return run_split(argc, argv);
    return usage(argv[0]);
}
