// ============================================================================
// npy_writer.cpp -- implementation of the .npy ground-truth writer
// ============================================================================
#include "npy_writer.hpp"

#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <stdexcept>

#include <cnpy.h>

namespace fs = std::filesystem;

namespace simcad {

/// "<output_dir>/<prefix>_<name>.npy"
static std::string make_array_name(const NpyWriterConfig& cfg,
                                   const char* name) {
  return (fs::path(cfg.output_dir) /
          (cfg.file_prefix + "_" + name + ".npy")).string();
}

static void ensure_dir(const std::string& dir) {
  std::error_code ec;
  if (!fs::exists(dir, ec)) {
    fs::create_directories(dir, ec);
    if (ec) {
      throw std::runtime_error(
        "NPY: failed to create output dir '" + dir + "': " + ec.message());
    }
  }
  if (!fs::is_directory(dir, ec)) {
    throw std::runtime_error("NPY: output path '" + dir +
                             "' exists and is not a directory");
  }
}

template<typename T>
static void save_array(const std::string& path, const T* data,
                       const std::vector<std::size_t>& shape) {
  // npy_save does not check its fopen; make sure the target opens first
  {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
      throw std::runtime_error("NPY: cannot open " + path + " for writing");
    }
  }
  cnpy::npy_save(path, data, shape, "w");

  std::error_code ec;
  const auto bytes = fs::file_size(path, ec);
  if (ec || bytes == 0) {
    throw std::runtime_error("NPY: failed to write " + path);
  }
  std::printf("NPY: wrote %s\n", path.c_str());
}

std::vector<std::string> write_npy(const MovieResult& r,
                                   const NpyWriterConfig& cfg) {
  ensure_dir(cfg.output_dir);
  std::vector<std::string> written;

  const std::size_t F = r.movie.frames;
  const std::size_t H = r.movie.height;
  const std::size_t W = r.movie.width;
  const std::size_t C = r.footprints.size();

  {
    const auto path = make_array_name(cfg, "movie");
    save_array(path, r.movie.pixels.data(), {F, H, W});
    written.push_back(path);
  }
  if (!cfg.ground_truth) return written;

  {
    std::vector<float> buf;
    buf.reserve(C * H * W);
    for (const auto& fp : r.footprints) {
      buf.insert(buf.end(), fp.data.begin(), fp.data.end());
    }
    const auto path = make_array_name(cfg, "footprints");
    save_array(path, buf.data(), {C, H, W});
    written.push_back(path);
  }
  {
    std::vector<double> buf;
    buf.reserve(C * F);
    for (const auto& tr : r.traces) buf.insert(buf.end(), tr.begin(), tr.end());
    const auto path = make_array_name(cfg, "traces");
    save_array(path, buf.data(), {C, F});
    written.push_back(path);
  }
  {
    std::vector<std::uint8_t> buf;
    buf.reserve(C * F);
    for (const auto& s : r.spikes) buf.insert(buf.end(), s.begin(), s.end());
    const auto path = make_array_name(cfg, "spikes");
    save_array(path, buf.data(), {C, F});
    written.push_back(path);
  }
  {
    std::vector<std::int32_t> buf;
    buf.reserve(F * 2);
    for (const auto& s : r.motion) {
      buf.push_back(s.dy);
      buf.push_back(s.dx);
    }
    const auto path = make_array_name(cfg, "motion");
    save_array(path, buf.data(), {F, 2});
    written.push_back(path);
  }
  return written;
}

} // namespace simcad
