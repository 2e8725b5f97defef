// Print the header, model section and code table of a .vqhf container.
#include "cli/cli_parser.hpp"
#include "format/container.hpp"
#include "io/file_bytes.hpp"

#include <iostream>
#include <string>

int main(int argc, char** argv) {
    try {
        vqhuff::CliParser cli;
        cli.parse(argc, argv);
        const std::string in = cli.get("in");
        if (in.empty()) {
            std::cerr << "Usage: vqhuff_inspect --in <input.vqhf>\n";
            return 1;
        }

        const auto bytes = vqhuff::read_all(in);
        const auto artifact = vqhuff::parse_artifact(bytes);
        std::cout << "file:          " << in << " (" << bytes.size() << " bytes)\n";
        std::cout << vqhuff::describe_artifact(artifact);
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return 2;
    }
}
