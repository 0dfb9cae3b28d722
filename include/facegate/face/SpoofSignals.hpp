#pragma once

#include "facegate/face/FaceTypes.hpp"
#include <opencv2/core.hpp>

namespace facegate {
namespace face {

/**
 * @brief Stateless anti-spoof signal extractors
 *
 * Every function is a pure function of its inputs and may be called
 * concurrently. Thresholding is left to SpoofFusion.
 */
namespace signals {

/**
 * @brief Shannon entropy (bits) of the local binary pattern histogram
 *
 * The crop is resized to crop_size x crop_size; each interior pixel gets an
 * 8-bit code with bit i set when neighbour i (clockwise from top-left) is
 * >= the centre. Real skin yields many distinct codes; prints and screens
 * yield few.
 *
 * @param gray_face CV_8UC1 face crop
 * @param crop_size Working size, at least 3
 * @return Entropy in [0, 8]
 */
double computeLbpEntropy(const cv::Mat& gray_face, int crop_size = 96);

/**
 * @brief Fraction of log-magnitude spectral energy outside a low-frequency disk
 *
 * @param gray_face CV_8UC1 face crop
 * @param crop_size Working size of the transform
 * @param low_freq_radius Disk radius around the centred zero frequency
 * @return Ratio in [0, 1]; 0 for a spectrum with no energy
 */
double computeMoireRatio(const cv::Mat& gray_face, int crop_size = 128, int low_freq_radius = 15);

/**
 * @brief Variance of the Cr channel (YCrCb) inside the face region
 *
 * @param bgr_frame CV_8UC3 frame
 * @param region Face region in frame coordinates
 * @param empty_roi_value Returned when the region does not overlap the frame
 */
double computeChromaVariance(const cv::Mat& bgr_frame, const FaceRegion& region,
                             double empty_roi_value = 100.0);

/**
 * @brief Depth statistics of the face region on a relative depth map
 */
struct DepthStatistics {
    bool evaluated = false;         ///< False when the mapped ROI is too small
    double range = 0.0;             ///< max - min
    double stddev = 0.0;
    double center_edge_gradient = 0.0;  ///< |mean(centre) - mean(edge strips)|
};

/**
 * @brief Map the face region onto the depth map and measure its relief
 *
 * The region is scaled from frame_size to the depth map size. The centre
 * window spans +/- one sixth of the ROI around its middle; the four edge
 * strips are one sixth wide (at least 2 pixels).
 *
 * @param depth_map Relative depth surface, any size, single channel
 * @param region Face region in frame coordinates
 * @param frame_size Size of the frame the region refers to
 * @param min_roi_pixels Mapped ROIs with fewer pixels are not evaluated
 */
DepthStatistics computeDepthStatistics(const cv::Mat& depth_map, const FaceRegion& region,
                                       const cv::Size& frame_size, int min_roi_pixels = 100);

} // namespace signals
} // namespace face
} // namespace facegate
