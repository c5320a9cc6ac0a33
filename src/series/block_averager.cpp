#include "series/block_averager.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace degree_hours {

BlockAverager::BlockAverager(size_t block_size) : block_size_(block_size) {
  if (block_size_ == 0)
    throw ConfigError("block size must be greater than 0");
}

size_t BlockAverager::block_count(size_t length) const {
  return (length + block_size_ - 1) / block_size_;
}

std::vector<double>
BlockAverager::block_means(const std::vector<double> &values) const {
  std::vector<double> means;
  means.reserve(block_count(values.size()));

  for (size_t start = 0; start < values.size(); start += block_size_) {
    size_t end = std::min(start + block_size_, values.size());
    double sum = 0.0;
    size_t count = 0;
    for (size_t i = start; i < end; ++i) {
      if (std::isnan(values[i]))
        continue;
      sum += values[i];
      count++;
    }
    means.push_back(count > 0 ? sum / static_cast<double>(count)
                              : std::numeric_limits<double>::quiet_NaN());
  }

  LOG(LogLevel::TRACE, LogComponent::AVERAGE,
      "Averaged " << values.size() << " values into " << means.size()
                  << " blocks of " << block_size_);
  return means;
}

std::vector<double>
BlockAverager::per_index_means(const std::vector<double> &values) const {
  std::vector<double> means = block_means(values);
  std::vector<double> expanded(values.size());
  for (size_t i = 0; i < values.size(); ++i)
    expanded[i] = means[i / block_size_];
  return expanded;
}

} // namespace degree_hours
