// Rate/distortion sweep over codebook sizes: encode -> decode -> metrics CSV.
#include "cli/cli_parser.hpp"
#include "codec/decoder.hpp"
#include "codec/encoder.hpp"
#include "codec/grid_layout.hpp"
#include "entropy/huffman.hpp"
#include "format/container.hpp"
#include "io/image_loader.hpp"
#include "io/image_saver.hpp"
#include "model/index_model.hpp"

#include <cmath>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

const char* kUsage =
    "Usage: vqhuff_evaluate --ref <image> --levels l1 [l2 ...] --out <metrics.csv> [--block 8] [--fig_dir <dir>]\n";

double compute_rmse_psnr(const vqhuff::Image& ref, const vqhuff::Image& rec, double& out_psnr) {
    if (ref.pixels.size() != rec.pixels.size()) {
        throw std::runtime_error("compute_rmse_psnr: size mismatch");
    }
    double mse = 0.0;
    for (size_t i = 0; i < ref.pixels.size(); ++i) {
        double d = static_cast<double>(rec.pixels[i]) - static_cast<double>(ref.pixels[i]);
        mse += d * d;
    }
    mse /= static_cast<double>(ref.pixels.size());
    const double peak = static_cast<double>(ref.max_value()) - static_cast<double>(ref.min_value());
    if (mse == 0.0) {
        out_psnr = std::numeric_limits<double>::infinity();
    } else {
        out_psnr = 20.0 * std::log10(peak) - 10.0 * std::log10(mse);
    }
    return std::sqrt(mse);
}

} // namespace

int main(int argc, char** argv) {
    std::string ref_path;
    std::string out_csv;
    std::string fig_dir;
    std::vector<int> levels;
    int block_size = 8;
    try {
        vqhuff::CliParser cli;
        cli.parse(argc, argv);
        ref_path = cli.get("ref");
        out_csv = cli.get("out");
        fig_dir = cli.get("fig_dir");
        levels = cli.get_int_list("levels", 2, 65536);
        block_size = cli.get_int("block", 8, 2, 16);
    } catch (const std::invalid_argument& e) {
        std::cerr << e.what() << "\n" << kUsage;
        return 1;
    }
    if (ref_path.empty() || out_csv.empty() || levels.empty()) {
        std::cerr << kUsage;
        return 1;
    }

    try {
        if (!fig_dir.empty()) fs::create_directories(fig_dir);

        const vqhuff::Image ref = vqhuff::load_image(ref_path);
        if (ref.bits_stored <= 0 || ref.bits_stored > 16) {
            throw std::runtime_error("ref bits_stored out of range");
        }
        const uint64_t raw_bytes = static_cast<uint64_t>(ref.width) *
                                   static_cast<uint64_t>(ref.height) *
                                   static_cast<uint64_t>(ref.channels) *
                                   static_cast<uint64_t>(ref.bits_allocated / 8);
        const std::string stem = fs::path(ref_path).stem().string();

        std::ofstream ofs(out_csv, std::ios::trunc);
        if (!ofs.good()) throw std::runtime_error("Cannot write csv: " + out_csv);
        ofs << "levels,block_size,symbol_count,distinct_symbols,entropy_bits,avg_code_bits,"
               "compressed_bytes,bpp,raw_bytes,compression_ratio,rmse,psnr\n";

        for (int l : levels) {
            const vqhuff::BlockVqModel model(block_size, static_cast<uint32_t>(l));

            // encode
            const auto bytes = vqhuff::compress_image(ref, model);

            // entropy statistics of the index stream
            const auto artifact = vqhuff::parse_artifact(bytes);
            const auto grid = vqhuff::decompress_indices(artifact);
            const auto freqs = vqhuff::build_symbol_frequencies(vqhuff::flatten_grid(grid));
            const double entropy = vqhuff::shannon_entropy(freqs);
            const double avg_len = vqhuff::average_code_length(freqs, artifact.code_table);

            // rate metrics
            const double bpp = (8.0 * static_cast<double>(bytes.size())) /
                               (static_cast<double>(ref.width) * static_cast<double>(ref.height));
            const double cr = static_cast<double>(raw_bytes) / static_cast<double>(bytes.size());

            // decode
            const vqhuff::Image rec = vqhuff::decompress_image(bytes, model);
            if (rec.width != ref.width || rec.height != ref.height || rec.channels != ref.channels) {
                throw std::runtime_error("decoded dimensions mismatch");
            }
            if (rec.bits_stored != ref.bits_stored || rec.is_signed != ref.is_signed) {
                throw std::runtime_error("decoded sample format mismatch");
            }

            double psnr = 0.0;
            const double rmse = compute_rmse_psnr(ref, rec, psnr);

            if (!fig_dir.empty()) {
                const std::string recon_path =
                    (fs::path(fig_dir) / (stem + "_l" + std::to_string(l) + "_recon.pgm")).string();
                vqhuff::save_pgm(recon_path, rec);
            }

            ofs << l << ","
                << block_size << ","
                << artifact.symbol_count << ","
                << freqs.size() << ","
                << entropy << ","
                << avg_len << ","
                << bytes.size() << ","
                << bpp << ","
                << raw_bytes << ","
                << cr << ","
                << rmse << ","
                << psnr << "\n";
            if (!ofs.good()) throw std::runtime_error("Cannot append csv: " + out_csv);
        }

        std::cout << "Evaluation completed -> " << out_csv << "\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return 2;
    }
}
