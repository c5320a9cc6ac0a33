#ifndef SEASON_CLASSIFIER_HPP
#define SEASON_CLASSIFIER_HPP

#include <cstddef>

namespace degree_hours {

enum class Season { WINTER, SPRING, SUMMER, FALL };

constexpr size_t SEASON_COUNT = 4;

const char *season_to_string(Season season);

// Fixed calendar seasons, independent of the record's year:
// winter Jan 1-Mar 20 and Dec 21-Dec 31, spring Mar 21-Jun 20,
// summer Jun 21-Sep 20, fall Sep 21-Dec 20 (all inclusive)
class SeasonClassifier {
public:
  // @throws InputShapeError for a date that does not exist
  static Season classify(int month, int day);
};

} // namespace degree_hours

#endif // SEASON_CLASSIFIER_HPP
