// ============================================================================
// `driver.cpp` -- Command-line front end for the calcium movie simulator
//
// Usage:
//   ./simcad [--config config.toml] [--seed N] [--out dir] [--hawkes]
//            [--threads N]
//
//  - Loads the generation parameters from a TOML file (optional; defaults to
//    configs/default.toml when present).
//  - Builds the movie, footprints, traces, spikes and motion in memory.
//  - Writes every array as .npy under the output directory.
//  - Prints shapes and generation metrics.
// ============================================================================
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <string>

#include "config.hpp"
#include "metrics.hpp"
#include "movie_builder.hpp"
#include "npy_writer.hpp"

using simcad::GenerationMetrics;
using simcad::MovieBuilder;
using simcad::MovieConfig;
using simcad::MovieResult;
using simcad::NpyWriterConfig;

static void print_usage(const char* argv0) {
  std::fprintf(stderr,
    "Usage: %s [--config config.toml] [--seed N] [--out dir] [--hawkes] "
    "[--threads N]\n"
    "Example: %s --config configs/default.toml --seed 42\n",
    argv0, argv0);
}

// ============================================================================
// Main
// ============================================================================
int main(int argc, char** argv) {
  std::string config_path;
  std::string out_dir;
  long long   seed_override    = -1;
  long long   threads_override = -1;
  bool        force_hawkes     = false;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--config" || arg == "-c") {
      if (i + 1 >= argc) {
        std::fprintf(stderr, "Error: --config requires a file path\n");
        return 1;
      }
      config_path = argv[++i];
    } else if (arg == "--out" || arg == "-o") {
      if (i + 1 >= argc) {
        std::fprintf(stderr, "Error: --out requires a directory\n");
        return 1;
      }
      out_dir = argv[++i];
    } else if (arg == "--seed" || arg == "--threads") {
      if (i + 1 >= argc) {
        std::fprintf(stderr, "Error: %s requires a value\n", arg.c_str());
        return 1;
      }
      char* end = nullptr;
      const long long v = std::strtoll(argv[++i], &end, 10);
      if (end == argv[i] || *end != '\0' || v < 0) {
        std::fprintf(stderr, "MAIN: Error: Invalid %s value: %s\n",
                     arg.c_str(), argv[i]);
        return 1;
      }
      if (arg == "--seed") seed_override = v;
      else                 threads_override = v;
    } else if (arg == "--hawkes") {
      force_hawkes = true;
    } else if (arg == "--help" || arg == "-h") {
      print_usage(argv[0]);
      return 0;
    } else {
      std::fprintf(stderr, "MAIN: Error: Unknown argument: %s\n", arg.c_str());
      print_usage(argv[0]);
      return 1;
    }
  }

  // Default to configs/default.toml if no config specified and it exists
  if (config_path.empty()) {
    std::filesystem::path default_config = "configs/default.toml";
    if (std::filesystem::exists(default_config)) {
      config_path = default_config.string();
    }
  }

  try {
    Config cfg;
    if (!config_path.empty()) {
      cfg = load_config(config_path);
    } else {
      std::printf("Using default configuration (no config file specified).\n");
    }

    if (force_hawkes)          cfg.SPIKE_STRATEGY = "hawkes";
    if (!out_dir.empty())      cfg.OUTPUT_DIR = out_dir;
    if (seed_override >= 0)    cfg.RNG_SEED = seed_override;
    if (threads_override >= 0) cfg.WORKER_THREADS = static_cast<unsigned>(threads_override);

    MovieConfig mcfg = to_movie_config(cfg);

    // ========================================================================
    // Generate
    // ========================================================================
    GenerationMetrics metrics;
    MovieBuilder builder(mcfg);

    std::puts("MAIN: Generating movie...");
    MovieResult result = builder.build(&metrics);

    std::printf("MAIN: Synthetic movie shape: (%zu, %zu, %zu)\n",
                result.movie.frames, result.movie.height, result.movie.width);
    std::printf("MAIN: Cell footprints shape: (%zu, %zu, %zu)\n",
                result.footprints.size(), result.movie.height,
                result.movie.width);
    std::printf("MAIN: Calcium traces shape:  (%zu, %zu)\n",
                result.traces.size(), result.movie.frames);
    std::printf("MAIN: Spikes shape:          (%zu, %zu)\n",
                result.spikes.size(), result.movie.frames);
    std::printf("MAIN: Motion shifts shape:   (%zu, 2)\n", result.motion.size());
    if (result.degenerate_footprints > 0) {
      std::fprintf(stderr, "MAIN: warning: %zu degenerate footprint(s)\n",
                   result.degenerate_footprints);
    }

    // ========================================================================
    // Persist
    // ========================================================================
    NpyWriterConfig wcfg;
    wcfg.output_dir   = cfg.OUTPUT_DIR;
    wcfg.file_prefix  = cfg.OUTPUT_PREFIX;
    wcfg.ground_truth = cfg.WRITE_GROUND_TRUTH;
    const auto files = simcad::write_npy(result, wcfg);
    std::printf("MAIN: Wrote %zu array(s) to %s (seed=%llu)\n",
                files.size(), wcfg.output_dir.c_str(),
                (unsigned long long)result.seed);

    metrics.print(stdout);

    std::puts("\nMAIN: Generation completed OK.");
    return 0;
  } catch (const std::exception& ex) {
    std::fprintf(stderr, "MAIN: FATAL: %s\n", ex.what());
    return 1;
  }
}
