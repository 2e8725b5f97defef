#include "cli/cli_parser.hpp"
#include "codec/encoder.hpp"
#include "io/file_bytes.hpp"
#include "io/image_loader.hpp"
#include "model/index_model.hpp"

#include <iostream>
#include <stdexcept>
#include <string>

static const char* kUsage =
    "Usage: vqhuff_encode --in <image.pgm|dicom> --out <output.vqhf> [--block 2|4|8|16] [--levels 2..65536]\n";

int main(int argc, char** argv) {
    try {
        vqhuff::CliParser cli;
        cli.parse(argc, argv);
        const std::string in = cli.get("in");
        const std::string out = cli.get("out");
        if (in.empty() || out.empty()) {
            std::cout << kUsage;
            return 1;
        }
        int block_size = 8;
        int levels = 64;
        try {
            block_size = cli.get_int("block", 8, 2, 16);
            levels = cli.get_int("levels", 64, 2, 65536);
        } catch (const std::invalid_argument& e) {
            std::cout << e.what() << "\n" << kUsage;
            return 1;
        }

        auto im = vqhuff::load_image(in);
        const vqhuff::BlockVqModel model(block_size, static_cast<uint32_t>(levels));
        auto bytes = vqhuff::compress_image(im, model);
        vqhuff::write_all(out, bytes);

        const size_t raw_size = static_cast<size_t>(im.width) * static_cast<size_t>(im.height) *
                                (static_cast<size_t>(im.bits_allocated) / 8);
        std::cout << "input image size: " << raw_size << " bytes\n";
        std::cout << "Wrote: " << out << " (" << bytes.size() << " bytes)\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return 2;
    }
}
