// ============================================================================
// npy_writer.hpp -- Save a MovieResult as NumPy .npy arrays
//
// Files written under `<output_dir>`:
//   <prefix>_movie.npy       uint8   F×H×W
//   <prefix>_footprints.npy  float32 C×H×W
//   <prefix>_traces.npy      float64 C×F
//   <prefix>_spikes.npy      uint8   C×F
//   <prefix>_motion.npy      int32   F×2   (dy, dx)
// ============================================================================
#pragma once
#include <string>
#include <vector>

#include "movie_builder.hpp"

namespace simcad {

// ============================================================================
// `NpyWriterConfig` struct
// ============================================================================
struct NpyWriterConfig {
  std::string output_dir   = "SIM_out";
  std::string file_prefix  = "movie";
  bool        ground_truth = true;    // false => movie only
};

/// Write the result; returns the paths written, in the order above.
/// Throws std::runtime_error if the directory cannot be created or a file
/// cannot be written.
std::vector<std::string> write_npy(const MovieResult& result,
                                   const NpyWriterConfig& cfg);

} // namespace simcad
