#include "quantum_surface/io/preview.hpp"
#include "quantum_surface/core/errors.hpp"

#include <algorithm>
#include <opencv2/opencv.hpp>

namespace quantum_surface::io {

namespace {

unsigned char to_byte(double v) {
    return cv::saturate_cast<unsigned char>(std::max(0.0, std::min(1.0, v)) * 255.0 + 0.5);
}

cv::Mat upscale(const cv::Mat& img, int scale) {
    if (scale <= 1) return img;
    cv::Mat out;
    cv::resize(img, out, cv::Size(img.cols * scale, img.rows * scale), 0, 0, cv::INTER_NEAREST);
    return out;
}

} // namespace

cv::Mat mesh_to_image(const ReconstructedMesh& mesh, int scale) {
    if (mesh.resolution < 1) {
        throw ValidationError("cannot render an empty mesh");
    }
    cv::Mat img(mesh.resolution, mesh.resolution, CV_8UC3);
    for (int i = 0; i < mesh.resolution; ++i) {
        auto* row = img.ptr<cv::Vec3b>(i);
        for (int j = 0; j < mesh.resolution; ++j) {
            row[j] = cv::Vec3b(to_byte(mesh.blue(i, j)), to_byte(mesh.green(i, j)), to_byte(mesh.red(i, j)));
        }
    }
    return upscale(img, scale);
}

cv::Mat height_to_image(const ReconstructedMesh& mesh, int scale) {
    if (mesh.resolution < 1) {
        throw ValidationError("cannot render an empty mesh");
    }
    const double lo = mesh.height.minCoeff();
    const double hi = mesh.height.maxCoeff();
    const double span = hi - lo;

    cv::Mat img(mesh.resolution, mesh.resolution, CV_8UC1);
    for (int i = 0; i < mesh.resolution; ++i) {
        auto* row = img.ptr<unsigned char>(i);
        for (int j = 0; j < mesh.resolution; ++j) {
            row[j] = span > 0.0 ? to_byte((mesh.height(i, j) - lo) / span) : 128;
        }
    }
    return upscale(img, scale);
}

void write_preview_png(const ReconstructedMesh& mesh, const fs::path& path, int scale) {
    if (path.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            throw IOError("Cannot create directory: " + path.parent_path().string());
        }
    }
    const cv::Mat img = mesh_to_image(mesh, scale);
    bool ok = false;
    try {
        ok = cv::imwrite(path.string(), img);
    } catch (const cv::Exception& e) {
        throw IOError("Cannot write preview " + path.string() + ": " + e.what());
    }
    if (!ok) {
        throw IOError("Cannot write preview: " + path.string());
    }
}

} // namespace quantum_surface::io
