#include "commands/outline.hpp"

#include "docintel/OutlineArtifact.hpp"
#include "docintel/Pipeline.hpp"
#include "io/JsonIO.hpp"

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;

static std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def) {
    for (int i = 0; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == key) return std::string(argv[i + 1]);
    }
    return def;
}

static std::vector<fs::path> list_block_files(const fs::path& dir) {
    if (!fs::is_directory(dir)) throw std::runtime_error("blocks dir not found: " + dir.string());

    std::vector<fs::path> files;
    for (const auto& e : fs::directory_iterator(dir)) {
        if (e.is_regular_file() && e.path().extension() == ".json") files.push_back(e.path());
    }
    std::sort(files.begin(), files.end());
    return files;
}

int cmd_outline(int argc, char** argv) {
    try {
        const fs::path blocks_dir = get_arg(argc, argv, "--blocks", "input/blocks");
        const fs::path outdir = get_arg(argc, argv, "--outdir", "out");

        const auto files = list_block_files(blocks_dir);

        size_t written = 0;
        size_t empty = 0;
        size_t failed = 0;
        for (const auto& f : files) {
            docintel::OutlineArtifact artifact;
            try {
                artifact.outline = docintel::extract_outline(loadTextBlocks(f.string()));
            } catch (const std::exception& e) {
                std::cerr << "warning: " << f.filename().string() << ": " << e.what() << " (writing empty outline)\n";
                artifact.outline = docintel::DocumentOutline{};
            }
            if (artifact.outline.title.empty() && artifact.outline.entries.empty()) ++empty;

            const fs::path out_path = outdir / f.filename();
            try {
                artifact.write_to(out_path);
            } catch (const std::exception& e) {
                std::cerr << "warning: " << out_path.string() << ": " << e.what() << "\n";
                ++failed;
                continue;
            }
            ++written;

            std::cout << "OUT_OUTLINE: " << out_path.string() << "\n";
        }

        std::cout << "BLOCKS: " << blocks_dir.string() << "\n";
        std::cout << "DOCUMENTS: " << written << "\n";
        if (empty > 0) std::cout << "EMPTY: " << empty << "\n";
        if (failed > 0) std::cout << "FAILED: " << failed << "\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "outline failed: " << e.what() << "\n";
        return 1;
    }
}
