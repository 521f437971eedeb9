#include "error.hpp"
#include "util.hpp"

float qgen::map_range(
  const float value,
  const float from_min, const float from_max,
  const float to_min, const float to_max
) {
  ensure(
    from_min < from_max,
    "Invalid range argument to map_range: from_min: ", from_min,
    ", from_max: ", from_max
  );
  ensure(
    from_min <= value && value <= from_max,
    "Invalid value argument to map_range: from_min: ", from_min,
    ", from_max: ", from_max, ", value: ", value
  );
  ensure(
    to_min < to_max,
    "Invalid range argument to map_range: to_min: ", to_min,
    ", to_max: ", to_max
  );

  return ((value - from_min) / (from_max - from_min)) * (to_max - to_min)
    + to_min;
}
