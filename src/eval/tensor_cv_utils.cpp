#include "tensor_cv_utils.hpp"
#include <opencv2/core.hpp>

namespace segeval::eval::detail {

cv::Mat channel_view(const core::Tensor& tensor, std::uint32_t channel) {
  const auto plane = tensor.channel(channel);
  return cv::Mat(static_cast<int>(tensor.height()), static_cast<int>(tensor.width()),
                 CV_32FC1, const_cast<float*>(plane.data()));
}

bool all_finite(const core::Tensor& tensor) {
  if (tensor.empty()) return true;
  const cv::Mat flat(1, static_cast<int>(tensor.size()), CV_32FC1,
                     const_cast<float*>(tensor.data().data()));
  return cv::checkRange(flat, true);
}

}  // namespace segeval::eval::detail
