#pragma once

#include "quantum_surface/core/types.hpp"

#include <filesystem>
#include <opencv2/core.hpp>

namespace quantum_surface::io {

namespace fs = std::filesystem;

// Equirectangular 8-bit BGR image of the grid colors: row i is theta_i,
// column j is phi_j, each cell drawn as scale x scale pixels.
cv::Mat mesh_to_image(const ReconstructedMesh& mesh, int scale = 8);

// Height field as an 8-bit grayscale image, min..max stretched to 0..255
cv::Mat height_to_image(const ReconstructedMesh& mesh, int scale = 8);

void write_preview_png(const ReconstructedMesh& mesh, const fs::path& path, int scale = 8);

} // namespace quantum_surface::io
