// ============================================================================
// config.cpp -- Configuration loading implementation
//
// This file implements the load_config function that reads configuration
// values from a TOML file and returns a Config struct.
// ============================================================================
#include "config.hpp"
#include <toml++/toml.hpp>
#include <cstdio>
#include <stdexcept>

#include "errors.hpp"

// ============================================================================
// Read a 2x2 numeric array; anything else is a configuration error.
// ============================================================================
static std::array<std::array<double, 2>, 2>
read_matrix_2x2(const toml::array& arr) {
    std::array<std::array<double, 2>, 2> m{};
    if (arr.size() != 2) {
        throw simcad::InvalidParameter(
            "CFG: TRANSITION_MATRIX must be 2x2 (got " +
            std::to_string(arr.size()) + " rows)");
    }
    for (std::size_t i = 0; i < 2; ++i) {
        const toml::array* row = arr[i].as_array();
        if (!row || row->size() != 2) {
            throw simcad::InvalidParameter(
                "CFG: TRANSITION_MATRIX must be 2x2 (row " +
                std::to_string(i) + " is not a pair)");
        }
        for (std::size_t j = 0; j < 2; ++j) {
            auto v = (*row)[j].value<double>();
            if (!v) {
                throw simcad::InvalidParameter(
                    "CFG: TRANSITION_MATRIX entries must be numbers");
            }
            m[i][j] = *v;
        }
    }
    return m;
}

// ============================================================================
// Load configuration from TOML file
// ============================================================================
Config load_config(const std::string& config_path) {
    Config cfg;

    try {
        auto tbl = toml::parse_file(config_path);

        // Movie config
        if (auto v = tbl["movie"]["NUM_CELLS"].value<int>()) cfg.NUM_CELLS = *v;
        if (auto v = tbl["movie"]["NUM_FRAMES"].value<int>()) cfg.NUM_FRAMES = *v;
        if (auto v = tbl["movie"]["HEIGHT"].value<int>()) cfg.HEIGHT = *v;
        if (auto v = tbl["movie"]["WIDTH"].value<int>()) cfg.WIDTH = *v;
        if (auto v = tbl["movie"]["RNG_SEED"].value<std::int64_t>()) cfg.RNG_SEED = *v;
        if (auto v = tbl["movie"]["WORKER_THREADS"].value<unsigned>()) cfg.WORKER_THREADS = *v;

        // Spike config
        if (auto v = tbl["spikes"]["STRATEGY"].value<std::string>()) cfg.SPIKE_STRATEGY = *v;
        if (auto arr = tbl["spikes"]["TRANSITION_MATRIX"].as_array()) {
            cfg.TRANSITION_MATRIX = read_matrix_2x2(*arr);
        }
        if (auto v = tbl["spikes"]["HAWKES_MU"].value<double>()) cfg.HAWKES_MU = *v;
        if (auto v = tbl["spikes"]["HAWKES_ALPHA"].value<double>()) cfg.HAWKES_ALPHA = *v;
        if (auto v = tbl["spikes"]["HAWKES_TAU"].value<double>()) cfg.HAWKES_TAU = *v;
        if (auto v = tbl["spikes"]["MAX_RETRIES"].value<int>()) cfg.MAX_RETRIES = *v;

        // Calcium config
        if (auto v = tbl["calcium"]["STRATEGY"].value<std::string>()) cfg.CALCIUM_STRATEGY = *v;
        if (auto v = tbl["calcium"]["TAU_DECAY"].value<double>()) cfg.TAU_DECAY = *v;
        if (auto v = tbl["calcium"]["TAU_RISE"].value<double>()) cfg.TAU_RISE = *v;

        // Footprint config
        if (auto v = tbl["footprint"]["SIGMA_MIN"].value<double>()) cfg.SIGMA_MIN = *v;
        if (auto v = tbl["footprint"]["SIGMA_MAX"].value<double>()) cfg.SIGMA_MAX = *v;
        if (auto v = tbl["footprint"]["NORMALIZE"].value<bool>()) cfg.NORMALIZE = *v;

        // Motion config
        if (auto v = tbl["motion"]["MAX_SHIFT"].value<int>()) cfg.MAX_SHIFT = *v;
        if (auto v = tbl["motion"]["SMOOTHING_SIGMA"].value<double>()) cfg.SMOOTHING_SIGMA = *v;

        // Render config
        if (auto v = tbl["render"]["CELL_SNR"].value<double>()) cfg.CELL_SNR = *v;
        if (auto v = tbl["render"]["BACKGROUND"].value<double>()) cfg.BACKGROUND = *v;
        if (auto v = tbl["render"]["NOISE_SIGMA"].value<double>()) cfg.NOISE_SIGMA = *v;

        // Output config
        if (auto v = tbl["output"]["OUTPUT_DIR"].value<std::string>()) cfg.OUTPUT_DIR = *v;
        if (auto v = tbl["output"]["OUTPUT_PREFIX"].value<std::string>()) cfg.OUTPUT_PREFIX = *v;
        if (auto v = tbl["output"]["WRITE_GROUND_TRUTH"].value<bool>()) cfg.WRITE_GROUND_TRUTH = *v;

        std::printf("Loaded configuration from: %s\n", config_path.c_str());
    } catch (const simcad::InvalidParameter&) {
        throw;
    } catch (const toml::parse_error& err) {
        std::fprintf(stderr, "Error parsing config file '%s': %s\n",
                     config_path.c_str(), err.description().data());
        std::fprintf(stderr, "Using default configuration values.\n");
        return Config{};
    } catch (const std::exception& err) {
        std::fprintf(stderr, "Error loading config file '%s': %s\n",
                     config_path.c_str(), err.what());
        std::fprintf(stderr, "Using default configuration values.\n");
        return Config{};
    }

    return cfg;
}

// ============================================================================
// Config → MovieConfig
// ============================================================================
simcad::MovieConfig to_movie_config(const Config& cfg) {
    simcad::MovieConfig mc;
    mc.num_cells  = cfg.NUM_CELLS;
    mc.num_frames = cfg.NUM_FRAMES;
    mc.height     = cfg.HEIGHT;
    mc.width      = cfg.WIDTH;

    mc.spikes.strategy    = simcad::parse_spike_strategy(cfg.SPIKE_STRATEGY);
    mc.spikes.transition  = cfg.TRANSITION_MATRIX;
    mc.spikes.hawkes      = { cfg.HAWKES_MU, cfg.HAWKES_ALPHA, cfg.HAWKES_TAU };
    mc.spikes.max_retries = cfg.MAX_RETRIES;

    mc.calcium_strategy = simcad::parse_calcium_strategy(cfg.CALCIUM_STRATEGY);
    mc.tau_decay        = cfg.TAU_DECAY;
    mc.tau_rise         = cfg.TAU_RISE;

    mc.footprint_sigma_range = { cfg.SIGMA_MIN, cfg.SIGMA_MAX };
    mc.normalize_footprints  = cfg.NORMALIZE;

    mc.max_shift              = cfg.MAX_SHIFT;
    mc.motion_smoothing_sigma = cfg.SMOOTHING_SIGMA;

    mc.cell_snr            = cfg.CELL_SNR;
    mc.background_strength = cfg.BACKGROUND;
    mc.noise_sigma         = cfg.NOISE_SIGMA;

    mc.rng_seed       = cfg.RNG_SEED;
    mc.worker_threads = cfg.WORKER_THREADS;
    return mc;
}
