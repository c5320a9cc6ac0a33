#include "calc/season_classifier.hpp"
#include "core/errors.hpp"
#include "series/calendar.hpp"
#include "utils/utils.hpp"

#include <string>

namespace degree_hours {

namespace {
constexpr int SPRING_START = calendar::day_of_year(3, 21);
constexpr int SUMMER_START = calendar::day_of_year(6, 21);
constexpr int FALL_START = calendar::day_of_year(9, 21);
constexpr int WINTER_START = calendar::day_of_year(12, 21);
} // namespace

const char *season_to_string(Season season) {
  switch (season) {
  case Season::WINTER:
    return "winter";
  case Season::SPRING:
    return "spring";
  case Season::SUMMER:
    return "summer";
  case Season::FALL:
    return "fall";
  }
  return "unknown";
}

Season SeasonClassifier::classify(int month, int day) {
  const int ordinal = calendar::day_of_year(month, day);
  if (ordinal == 0)
    throw InputShapeError("cannot classify season of month=" +
                          std::to_string(month) +
                          " day=" + std::to_string(day));

  if (ordinal < SPRING_START)
    return Season::WINTER;
  if (ordinal < SUMMER_START)
    return Season::SPRING;
  if (ordinal < FALL_START)
    return Season::SUMMER;
  if (ordinal < WINTER_START)
    return Season::FALL;
  return Season::WINTER;
}

} // namespace degree_hours
