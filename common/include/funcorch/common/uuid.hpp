#ifndef FUNCORCH_COMMON_UUID_HPP
#define FUNCORCH_COMMON_UUID_HPP

#include <mutex>
#include <random>
#include <string>

#include <uuid.h>

namespace funcorch::common {

  // Source of invocation ids for requests that do not carry one.
  class UUID {
  public:
    UUID() : _generator{_rd()}, _uuid_generator{_generator} {}

    uuids::uuid generate()
    {
      std::lock_guard<std::mutex> lock{_mutex};
      return _uuid_generator();
    }

    std::string str()
    {
      return uuids::to_string(generate());
    }

  private:
    std::random_device _rd;
    std::mt19937 _generator;
    uuids::uuid_random_generator _uuid_generator;
    std::mutex _mutex;
  };

} // namespace funcorch::common

#endif
