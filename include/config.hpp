// ============================================================================
// config.hpp -- Configuration structure for the calcium movie simulator
//
// This header defines the Config struct that holds all configuration values
// for a generation run, which can be loaded from a TOML configuration file.
// ============================================================================
#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

#include "movie_builder.hpp"

// ============================================================================
// Configuration structure
// ============================================================================
struct Config {
    // ========================================================================
    // Movie geometry / run
    // ========================================================================
    int          NUM_CELLS      { 60 };
    int          NUM_FRAMES     { 300 };
    int          HEIGHT         { 512 };
    int          WIDTH          { 512 };
    std::int64_t RNG_SEED       { -1 };    // -1 = seed from std::random_device
    unsigned     WORKER_THREADS { 0 };     // 0 = hardware_concurrency()

    // ========================================================================
    // Spike generation
    // ========================================================================
    std::string  SPIKE_STRATEGY { "markov" };    // "markov" | "hawkes"
    std::array<std::array<double, 2>, 2> TRANSITION_MATRIX {{
        {{ 0.98, 0.02 }},
        {{ 0.02, 0.98 }},
    }};
    double       HAWKES_MU      { 0.01 };
    double       HAWKES_ALPHA   { 0.05 };
    double       HAWKES_TAU     { 10.0 };
    int          MAX_RETRIES    { 1000 };    // rejection-sampling cap per cell

    // ========================================================================
    // Calcium dynamics
    // ========================================================================
    std::string  CALCIUM_STRATEGY { "ar2" };     // "ar2" | "biexp"
    double       TAU_DECAY      { 10.0 };
    double       TAU_RISE       { 4.0 };

    // ========================================================================
    // Footprints
    // ========================================================================
    double       SIGMA_MIN      { 3.0 };
    double       SIGMA_MAX      { 4.0 };
    bool         NORMALIZE      { true };

    // ========================================================================
    // Motion
    // ========================================================================
    int          MAX_SHIFT       { 0 };      // pixels, 0 = static field of view
    double       SMOOTHING_SIGMA { 5.0 };    // frames

    // ========================================================================
    // Rendering
    // ========================================================================
    double       CELL_SNR       { 1.0 };
    double       BACKGROUND     { 0.1 };
    double       NOISE_SIGMA    { 5.0 };

    // ========================================================================
    // Output
    // ========================================================================
    std::string  OUTPUT_DIR         { "SIM_out" };
    std::string  OUTPUT_PREFIX      = "movie";
    bool         WRITE_GROUND_TRUTH { true };
};

// ============================================================================
// Load configuration from TOML file
// ============================================================================
Config load_config(const std::string& config_path);

// ============================================================================
// Map file-level configuration onto the generator configuration.
// Throws simcad::InvalidParameter on unknown strategy names.
// ============================================================================
simcad::MovieConfig to_movie_config(const Config& cfg);
