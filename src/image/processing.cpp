#include "page_norm/image/processing.hpp"

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cmath>
#include <cstring>

namespace page_norm::image {

namespace {

constexpr double kNoRotationDeg = 1e-6;

cv::Mat rotation_for(int cols, int rows, double skew_deg) {
    const cv::Point2f center(static_cast<float>(cols - 1) * 0.5f,
                             static_cast<float>(rows - 1) * 0.5f);
    // getRotationMatrix2D: positive angles rotate counter-clockwise on screen.
    return cv::getRotationMatrix2D(center, -skew_deg, 1.0);
}

} // namespace

cv::Mat eigen_to_cv(const Matrix2Df& m) {
    cv::Mat view(static_cast<int>(m.rows()), static_cast<int>(m.cols()), CV_32F,
                 const_cast<float*>(m.data()));
    return view.clone();
}

Matrix2Df cv_to_eigen(const cv::Mat& m) {
    cv::Mat f;
    if (m.type() == CV_32F) {
        f = m;
    } else {
        m.convertTo(f, CV_32F);
    }
    Matrix2Df out(f.rows, f.cols);
    for (int y = 0; y < f.rows; ++y) {
        std::memcpy(out.data() + static_cast<size_t>(y) * f.cols, f.ptr<float>(y),
                    static_cast<size_t>(f.cols) * sizeof(float));
    }
    return out;
}

GradientField compute_gradients(const Matrix2Df& img) {
    cv::Mat src = eigen_to_cv(img);
    cv::Mat dx, dy;
    cv::Sobel(src, dx, CV_32F, 1, 0, 3, 1.0, 0.0, cv::BORDER_REPLICATE);
    cv::Sobel(src, dy, CV_32F, 0, 1, 3, 1.0, 0.0, cv::BORDER_REPLICATE);

    GradientField g;
    g.magnitude.resize(img.rows(), img.cols());
    g.angle_deg.resize(img.rows(), img.cols());
    for (int y = 0; y < src.rows; ++y) {
        const float* px = dx.ptr<float>(y);
        const float* py = dy.ptr<float>(y);
        for (int x = 0; x < src.cols; ++x) {
            const double gx = px[x];
            const double gy = -static_cast<double>(py[x]);
            g.magnitude(y, x) = static_cast<float>(std::hypot(gx, gy));
            g.angle_deg(y, x) = static_cast<float>(std::atan2(gy, gx) * 180.0 / CV_PI);
        }
    }
    return g;
}

MeanStd sampled_magnitude_stats(const GradientField& g, int step) {
    const int h = static_cast<int>(g.magnitude.rows());
    const int w = static_cast<int>(g.magnitude.cols());
    double sum = 0.0;
    double sum_sq = 0.0;
    long long count = 0;
    for (int y = 1; y < h - 1; y += step) {
        for (int x = 1; x < w - 1; x += step) {
            const double m = g.magnitude(y, x);
            sum += m;
            sum_sq += m * m;
            ++count;
        }
    }

    MeanStd out;
    if (count > 0) {
        out.mean = sum / static_cast<double>(count);
        out.std = std::sqrt(std::max(0.0, sum_sq / static_cast<double>(count) - out.mean * out.mean));
    }
    return out;
}

Matrix2Df deskew_preview(const Matrix2Df& img, double skew_deg) {
    if (std::fabs(skew_deg) < kNoRotationDeg) return img;
    cv::Mat src = eigen_to_cv(img);
    cv::Mat rotated;
    cv::warpAffine(src, rotated, rotation_for(src.cols, src.rows, skew_deg), src.size(),
                   cv::INTER_LINEAR, cv::BORDER_CONSTANT, cv::Scalar::all(255.0));
    return cv_to_eigen(rotated);
}

cv::Mat deskew_raster(const cv::Mat& raster, double skew_deg) {
    if (std::fabs(skew_deg) < kNoRotationDeg) return raster;
    cv::Mat rotated;
    cv::warpAffine(raster, rotated, rotation_for(raster.cols, raster.rows, skew_deg),
                   raster.size(), cv::INTER_LINEAR, cv::BORDER_CONSTANT,
                   cv::Scalar::all(255.0));
    return rotated;
}

} // namespace page_norm::image
