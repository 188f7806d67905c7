#include <CLI/CLI.hpp>
#include <iostream>
#include <stdexcept>
#include <string>

#include <utils/BatchRunner.hpp>

int main(int argc, char** argv) {
    CLI::App app{"ADFGVX CLI - ADFGVX field cipher Encryption/Decryption Tool"};

    utils::BatchOptions options;
    bool verbose = false;

    // Key options
    app.add_option("--key,-k", options.key, "Cipher key (5-16 distinct alphanumeric characters)")->required();

    // Operation options
    app.add_option("--operation,-o", options.operation, "Operation (encrypt, decrypt)");

    // Input / output options
    app.add_option("--text,-t", options.text, "Text to encrypt/decrypt");
    app.add_option("--input,-i", options.input, "Input file or directory");
    app.add_option("--output-dir,-d", options.outputDir, "Output directory (default: stdout)");
    app.add_flag("--raw", options.raw, "Skip text cleaning, input must already be A-Z0-9 / ADFGVX");
    app.add_flag("--verbose,-v", verbose, "Print progress to stderr");

    CLI11_PARSE(app, argc, argv);

    try {
        options.log = verbose ? &std::cerr : nullptr;

        utils::BatchOutcome outcome = utils::BatchRunner::execute(options);

        // Output result
        if (options.outputDir.empty()) {
            for (const auto& r : outcome.results) {
                std::cout << r << std::endl;
            }
        }

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
