// Standalone fuzz driver for running fuzz targets without libFuzzer
// Replays corpus files (or whole corpus directories) through the target once.

#ifdef STANDALONE_FUZZ_TARGET_DRIVER

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <vector>

// Forward declare the fuzzer entry point
extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size);

static bool RunFile(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        fprintf(stderr, "Error: Cannot open file '%s'\n", path.c_str());
        return false;
    }

    std::vector<uint8_t> buffer((std::istreambuf_iterator<char>(file)),
                                std::istreambuf_iterator<char>());

    printf("Running: %s (%zu bytes)\n", path.c_str(), buffer.size());
    LLVMFuzzerTestOneInput(buffer.data(), buffer.size());
    return true;
}

int main(int argc, char** argv) {
    if (argc < 2) {
        fprintf(stderr, "Usage: %s <input_file|corpus_dir>...\n", argv[0]);
        fprintf(stderr, "\nNote: This is a standalone driver for replaying inputs.\n");
        fprintf(stderr, "For actual fuzzing, rebuild with clang and -fsanitize=fuzzer.\n");
        return 1;
    }

    size_t runs = 0;
    for (int i = 1; i < argc; ++i) {
        std::filesystem::path arg(argv[i]);
        std::error_code ec;
        if (std::filesystem::is_directory(arg, ec)) {
            for (const auto& entry : std::filesystem::directory_iterator(arg, ec)) {
                if (entry.is_regular_file() && RunFile(entry.path())) {
                    ++runs;
                }
            }
        } else if (RunFile(arg)) {
            ++runs;
        } else {
            return 1;
        }
    }

    printf("Executed %zu inputs successfully\n", runs);
    return 0;
}

#endif // STANDALONE_FUZZ_TARGET_DRIVER
