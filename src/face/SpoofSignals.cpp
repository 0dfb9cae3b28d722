#include "facegate/face/SpoofSignals.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <array>
#include <cmath>

namespace facegate {
namespace face {
namespace signals {

namespace {

// Neighbour offsets as (dx, dy), clockwise from top-left; index = bit position
const std::array<cv::Point, 8> LBP_OFFSETS = {{
    {-1, -1}, {0, -1}, {1, -1}, {1, 0}, {1, 1}, {0, 1}, {-1, 1}, {-1, 0}
}};

/**
 * @brief Move the zero-frequency term to the centre (numpy fftshift semantics)
 */
cv::Mat fftShift(const cv::Mat& spectrum) {
    const int rows = spectrum.rows;
    const int cols = spectrum.cols;
    const int shift_y = rows / 2;
    const int shift_x = cols / 2;

    cv::Mat shifted(spectrum.size(), spectrum.type());
    for (int y = 0; y < rows; ++y) {
        const float* src = spectrum.ptr<float>((y - shift_y + rows) % rows);
        float* dst = shifted.ptr<float>(y);
        for (int x = 0; x < cols; ++x) {
            dst[x] = src[(x - shift_x + cols) % cols];
        }
    }
    return shifted;
}

double meanOf(const cv::Mat& roi, const cv::Rect& rect) {
    cv::Rect clipped = rect & cv::Rect(0, 0, roi.cols, roi.rows);
    if (clipped.area() == 0) {
        return 0.0;
    }
    return cv::mean(roi(clipped))[0];
}

} // namespace

double computeLbpEntropy(const cv::Mat& gray_face, int crop_size) {
    if (gray_face.empty() || crop_size < 3) {
        return 0.0;
    }

    cv::Mat face;
    cv::resize(gray_face, face, cv::Size(crop_size, crop_size));

    std::array<double, 256> histogram{};
    for (int y = 1; y < face.rows - 1; ++y) {
        for (int x = 1; x < face.cols - 1; ++x) {
            const uchar center = face.at<uchar>(y, x);
            uchar code = 0;
            for (size_t bit = 0; bit < LBP_OFFSETS.size(); ++bit) {
                const uchar neighbour = face.at<uchar>(y + LBP_OFFSETS[bit].y,
                                                       x + LBP_OFFSETS[bit].x);
                if (neighbour >= center) {
                    code |= static_cast<uchar>(1u << bit);
                }
            }
            histogram[code] += 1.0;
        }
    }

    const double total = static_cast<double>((face.rows - 2) * (face.cols - 2));
    double entropy = 0.0;
    for (double count : histogram) {
        if (count > 0.0) {
            const double p = count / total;
            entropy -= p * std::log2(p);
        }
    }
    return entropy;
}

double computeMoireRatio(const cv::Mat& gray_face, int crop_size, int low_freq_radius) {
    if (gray_face.empty() || crop_size < 2) {
        return 0.0;
    }

    cv::Mat face;
    cv::resize(gray_face, face, cv::Size(crop_size, crop_size));
    face.convertTo(face, CV_32F);

    cv::Mat spectrum;
    cv::dft(face, spectrum, cv::DFT_COMPLEX_OUTPUT);

    std::vector<cv::Mat> planes;
    cv::split(spectrum, planes);
    cv::Mat magnitude;
    cv::magnitude(planes[0], planes[1], magnitude);

    magnitude += cv::Scalar::all(1.0);
    cv::log(magnitude, magnitude);
    cv::Mat centred = fftShift(magnitude);

    const double total = cv::sum(centred)[0];
    if (total < 1e-10) {
        return 0.0;
    }

    const int cy = centred.rows / 2;
    const int cx = centred.cols / 2;
    const double radius_sq = static_cast<double>(low_freq_radius) * low_freq_radius;

    double low = 0.0;
    for (int y = 0; y < centred.rows; ++y) {
        const float* row = centred.ptr<float>(y);
        const double dy = y - cy;
        for (int x = 0; x < centred.cols; ++x) {
            const double dx = x - cx;
            if (dx * dx + dy * dy <= radius_sq) {
                low += row[x];
            }
        }
    }

    return (total - low) / total;
}

double computeChromaVariance(const cv::Mat& bgr_frame, const FaceRegion& region,
                             double empty_roi_value) {
    if (bgr_frame.empty()) {
        return empty_roi_value;
    }

    const FaceRegion roi_region = FaceRegion::clippedTo(region.toRect(), bgr_frame.size());
    if (!roi_region.hasPositiveArea()) {
        return empty_roi_value;
    }

    cv::Mat ycrcb;
    cv::cvtColor(bgr_frame(roi_region.toRect()), ycrcb, cv::COLOR_BGR2YCrCb);

    cv::Mat cr;
    cv::extractChannel(ycrcb, cr, 1);

    cv::Scalar mean, stddev;
    cv::meanStdDev(cr, mean, stddev);
    return stddev[0] * stddev[0];
}

DepthStatistics computeDepthStatistics(const cv::Mat& depth_map, const FaceRegion& region,
                                       const cv::Size& frame_size, int min_roi_pixels) {
    DepthStatistics stats;
    if (depth_map.empty() || frame_size.width <= 0 || frame_size.height <= 0) {
        return stats;
    }

    cv::Mat depth;
    if (depth_map.type() == CV_32FC1) {
        depth = depth_map;
    } else {
        depth_map.convertTo(depth, CV_32F);
    }

    // Frame coordinates -> depth map coordinates
    const double sx = static_cast<double>(depth.cols) / frame_size.width;
    const double sy = static_cast<double>(depth.rows) / frame_size.height;
    const int dx = std::max(static_cast<int>(region.x * sx), 0);
    const int dy = std::max(static_cast<int>(region.y * sy), 0);
    const int dw = std::max(static_cast<int>(region.width * sx), 1);
    const int dh = std::max(static_cast<int>(region.height * sy), 1);

    const cv::Rect mapped = cv::Rect(dx, dy, dw, dh) & cv::Rect(0, 0, depth.cols, depth.rows);
    if (mapped.area() < min_roi_pixels) {
        return stats;
    }

    const cv::Mat roi = depth(mapped);

    double min_value = 0.0;
    double max_value = 0.0;
    cv::minMaxLoc(roi, &min_value, &max_value);

    cv::Scalar mean, stddev;
    cv::meanStdDev(roi, mean, stddev);

    const int rh = roi.rows;
    const int rw = roi.cols;
    const int cy = rh / 2;
    const int cx = rw / 2;
    const int margin_y = std::min(std::max(rh / 6, 2), rh);
    const int margin_x = std::min(std::max(rw / 6, 2), rw);

    const cv::Rect center_rect(cx - margin_x, cy - margin_y, 2 * margin_x, 2 * margin_y);
    const double center_mean = meanOf(roi, center_rect);

    const double edge_mean = (meanOf(roi, cv::Rect(0, 0, rw, margin_y)) +
                              meanOf(roi, cv::Rect(0, rh - margin_y, rw, margin_y)) +
                              meanOf(roi, cv::Rect(0, 0, margin_x, rh)) +
                              meanOf(roi, cv::Rect(rw - margin_x, 0, margin_x, rh))) / 4.0;

    stats.evaluated = true;
    stats.range = max_value - min_value;
    stats.stddev = stddev[0];
    stats.center_edge_gradient = std::abs(center_mean - edge_mean);
    return stats;
}

} // namespace signals
} // namespace face
} // namespace facegate
