#pragma once

#include <segeval/core/tensor.hpp>
#include <opencv2/core/mat.hpp>
#include <cstdint>

namespace segeval::eval::detail {

/// Non-owning CV_32FC1 view (height x width) of one tensor channel.
/// Valid while the tensor is alive and not resized.
cv::Mat channel_view(const core::Tensor& tensor, std::uint32_t channel);

/// True if every value of the tensor is finite.
bool all_finite(const core::Tensor& tensor);

}  // namespace segeval::eval::detail
