#include <chrono>
#include <iostream>
#include <fstream>
#include <vector>
#include <string>
#include <cstring>
#include <iomanip>
#include <stdexcept>

#include "cipher/ADFGVX/adfgvx.hpp"

using Clock = std::chrono::high_resolution_clock;

struct BenchResult {
    std::string operation;
    size_t keyLength;
    size_t size;
    double mbps;
    double usec_per_op;
};

// A-Z0-9 repeated
static std::string fillPattern(size_t size, size_t seed) {
    static const char* alphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";
    std::string s(size, 'A');
    for (size_t i = 0; i < size; ++i)
        s[i] = alphabet[(seed + i) % 36];
    return s;
}

BenchResult bench_op(const std::string& operation,
    const ADFGVX& cipher,
    const std::string& key,
    size_t dataSize,
    size_t iters)
{
    const bool encrypting = (operation == "encrypt");

    std::string input = fillPattern(dataSize, key.size());
    if (!encrypting) {
        CipherResult ct = cipher.encrypt(input, key);
        if (!ct)
            throw std::runtime_error("bench: " + describe(ct.error));
        input = ct.text;
    }

    // Warmup
    CipherResult out = encrypting ? cipher.encrypt(input, key) : cipher.decrypt(input, key);
    if (!out)
        throw std::runtime_error("bench: " + describe(out.error));

    // Benchmark
    auto start = Clock::now();
    for (size_t i = 0; i < iters; ++i) {
        out = encrypting ? cipher.encrypt(input, key) : cipher.decrypt(input, key);
    }
    auto end = Clock::now();

    auto dur = std::chrono::duration_cast<std::chrono::microseconds>(end - start).count();
    double seconds = dur > 0 ? dur / 1e6 : 1e-6;
    double total_bytes = static_cast<double>(input.size()) * iters;
    double mbps = (total_bytes / (1024.0 * 1024.0)) / seconds;
    double usec_per_op = static_cast<double>(dur) / iters;

    return { operation, key.size(), input.size(), mbps, usec_per_op };
}

int main(int argc, char** argv)
{
    std::string outFile = "bench_results.csv";
    size_t iters = 100;

    // Parse CLI args
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--output") == 0 && i + 1 < argc) {
            outFile = argv[++i];
        } else if (std::strcmp(argv[i], "--iters") == 0 && i + 1 < argc) {
            iters = std::stoul(argv[++i]);
        }
    }
    if (iters == 0)
        iters = 1;

    std::vector<size_t> sizes = { 1024, 4096, 16384, 65536, 262144 };
    std::vector<std::string> keys = { "GERMAN", "PRIVACY1", "Zebra42QuickFox9" };
    std::vector<BenchResult> results;

    ADFGVX cipher;

    std::cerr << "[*] Starting benchmarks (iters=" << iters << ")...\n";

    try {
        for (auto size : sizes) {
            for (const auto& key : keys) {
                std::cerr << "[*] encrypt key=" << key.size() << " size=" << size << "\n";
                results.push_back(bench_op("encrypt", cipher, key, size, iters));
                std::cerr << "[*] decrypt key=" << key.size() << " size=" << size << "\n";
                results.push_back(bench_op("decrypt", cipher, key, size, iters));
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    // Write CSV
    std::ofstream ofs(outFile);
    ofs << "operation,key_length,size_bytes,throughput_MBps,latency_usec\n";
    for (auto& r : results) {
        ofs << r.operation << ","
            << r.keyLength << ","
            << r.size << ","
            << std::fixed << std::setprecision(2) << r.mbps << ","
            << std::fixed << std::setprecision(2) << r.usec_per_op << "\n";
    }

    // Print summary to console
    std::cerr << "\n[*] Results saved to " << outFile << "\n";
    std::cerr << "\n=== Summary ===\n";
    std::cerr << std::left << std::setw(10) << "Operation"
              << std::setw(6) << "Key"
              << std::setw(12) << "Size"
              << std::setw(14) << "Throughput"
              << "Latency\n";
    std::cerr << std::string(54, '-') << "\n";
    for (auto& r : results) {
        std::cerr << std::left << std::setw(10) << r.operation
                  << std::setw(6) << r.keyLength
                  << std::setw(12) << r.size
                  << std::fixed << std::setprecision(2)
                  << std::setw(10) << r.mbps << " MB/s"
                  << std::setw(10) << r.usec_per_op << " us\n";
    }

    return 0;
}
