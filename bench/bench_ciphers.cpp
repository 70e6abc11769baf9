#include <chrono>
#include <iostream>
#include <fstream>
#include <vector>
#include <string>
#include <cstring>
#include <iomanip>
#include <utility>

#include "cipher/cipher.hpp"
#include "core/cipherFactory.hpp"

using Clock = std::chrono::high_resolution_clock;

struct BenchResult {
    std::string cipher;
    std::string op;
    size_t size;
    double mlps;        // million letters per second
    double usec_per_op;
};

static std::string fillPattern(size_t size, char seed) {
    std::string text(size, 'A');
    for (size_t i = 0; i < size; ++i)
        text[i] = static_cast<char>('A' + (seed + i * 7) % 26);
    return text;
}

static BenchResult summarize(const std::string& cipher, const std::string& op,
    size_t size, size_t iters, long long dur)
{
    double seconds = dur / 1e6;
    double total_letters = static_cast<double>(size) * iters;
    double mlps = seconds > 0 ? (total_letters / 1e6) / seconds : 0.0;
    double usec_per_op = static_cast<double>(dur) / iters;
    return { cipher, op, size, mlps, usec_per_op };
}

// sender and receiver instances are built separately, as two peers would
static std::vector<BenchResult> bench_cipher(CipherKind kind, const std::string& key,
    size_t dataSize, size_t iters)
{
    const std::string name = CipherFactory::kindName(kind);
    CipherInstance sender = CipherFactory::create(kind, key);
    CipherInstance receiver = CipherFactory::create(kind, key);

    std::string text = fillPattern(dataSize, 3);

    // Warmup
    std::string prepped = prepare(sender, text);
    std::string ct = encrypt(sender, prepped);
    decrypt(receiver, ct);

    std::vector<std::string> cts;
    cts.reserve(iters);

    auto start = Clock::now();
    for (size_t i = 0; i < iters; ++i) {
        cts.push_back(encrypt(sender, prepare(sender, text)));
    }
    auto mid = Clock::now();
    for (size_t i = 0; i < iters; ++i) {
        decrypt(receiver, cts[i]);
    }
    auto end = Clock::now();

    auto encDur = std::chrono::duration_cast<std::chrono::microseconds>(mid - start).count();
    auto decDur = std::chrono::duration_cast<std::chrono::microseconds>(end - mid).count();

    return {
        summarize(name, "prep+enc", dataSize, iters, encDur),
        summarize(name, "dec", dataSize, iters, decDur)
    };
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

    const std::vector<size_t> sizes = { 64, 1024, 16384, 65536 };
    const std::vector<std::pair<CipherKind, std::string>> ciphers = {
        { CipherKind::NULL_CIPHER,         "KEY" },
        { CipherKind::CAESAR_CIPHER,       "D" },
        { CipherKind::VIGNERE_CIPHER,      "LEMON" },
        { CipherKind::PLAYFAIR_CIPHER,     "PLAYFAIR EXAMPLE" },
        { CipherKind::PSEUDO_ONE_TIME_PAD, "a pass phrase long enough to fill both seed halves" },
    };

    std::vector<BenchResult> results;

    std::cerr << "[*] Starting benchmarks (iters=" << iters << ")...\n";

    for (auto size : sizes) {
        for (const auto& [kind, key] : ciphers) {
            std::cerr << "[*] " << CipherFactory::kindName(kind) << " size=" << size << "\n";
            for (auto& r : bench_cipher(kind, key, size, iters))
                results.push_back(r);
        }
    }

    // Write CSV
    std::ofstream ofs(outFile);
    ofs << "cipher,op,size_letters,throughput_Mletters_s,latency_usec\n";
    for (auto& r : results) {
        ofs << r.cipher << ","
            << r.op << ","
            << r.size << ","
            << std::fixed << std::setprecision(2) << r.mlps << ","
            << std::fixed << std::setprecision(2) << r.usec_per_op << "\n";
    }

    // Print summary to console
    std::cerr << "\n[*] Results saved to " << outFile << "\n";
    std::cerr << "\n=== Summary ===\n";
    std::cerr << std::left << std::setw(22) << "Cipher"
              << std::setw(10) << "Op"
              << std::setw(10) << "Size"
              << std::setw(16) << "Throughput"
              << "Latency\n";
    std::cerr << std::string(68, '-') << "\n";
    for (auto& r : results) {
        std::cerr << std::left << std::setw(22) << r.cipher
                  << std::setw(10) << r.op
                  << std::setw(10) << r.size
                  << std::fixed << std::setprecision(2)
                  << std::setw(10) << r.mlps << " ML/s "
                  << std::setw(10) << r.usec_per_op << " us\n";
    }

    return 0;
}
