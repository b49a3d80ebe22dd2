#include <credence/common/clock.hpp>

#include <chrono>

namespace credence::common {

credence::schema::timestamp_milliseconds_t system_now() {
  auto now = std::chrono::system_clock::now().time_since_epoch();
  return static_cast<credence::schema::timestamp_milliseconds_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(now).count());
}

}  // namespace credence::common
