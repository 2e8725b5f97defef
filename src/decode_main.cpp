#include "cli/cli_parser.hpp"
#include "codec/decoder.hpp"
#include "io/file_bytes.hpp"
#include "io/image_saver.hpp"

#include <iostream>
#include <string>

int main(int argc, char** argv) {
    try {
        vqhuff::CliParser cli;
        cli.parse(argc, argv);
        const std::string in = cli.get("in");
        const std::string out = cli.get("out");
        if (in.empty() || out.empty()) {
            std::cerr << "Usage: vqhuff_decode --in <input.vqhf> --out <output.pgm>\n";
            return 1;
        }

        auto bytes = vqhuff::read_all(in);
        auto im = vqhuff::decompress_image(bytes);
        vqhuff::save_pgm(out, im);
        std::cout << "Wrote: " << out << " (" << im.width << "x" << im.height << ")\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return 2;
    }
}
