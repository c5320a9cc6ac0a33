#ifndef BLOCK_AVERAGER_HPP
#define BLOCK_AVERAGER_HPP

#include <cstddef>
#include <vector>

namespace degree_hours {

/**
 * Fixed, non-overlapping block means anchored at index 0.
 * Block k covers [k * block_size, min((k + 1) * block_size, n)); the last
 * block may be short. NaN inputs are left out of their block's mean, and a
 * block with no finite input has a NaN mean.
 */
class BlockAverager {
public:
  /**
   * @param block_size Hours per block (24 for daily, 168 for weekly)
   * @throws ConfigError if block_size is zero
   */
  explicit BlockAverager(size_t block_size);

  // One mean per block
  std::vector<double> block_means(const std::vector<double> &values) const;

  // The block mean repeated for every index of its block, same length as input
  std::vector<double> per_index_means(const std::vector<double> &values) const;

  size_t block_count(size_t length) const;
  size_t block_size() const { return block_size_; }

private:
  size_t block_size_;
};

} // namespace degree_hours

#endif // BLOCK_AVERAGER_HPP
