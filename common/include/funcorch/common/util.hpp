#ifndef FUNCORCH_COMMON_UTIL_HPP
#define FUNCORCH_COMMON_UTIL_HPP

#include <funcorch/common/exceptions.hpp>

#include <memory>
#include <string>
#include <string_view>

#include <cereal/archives/json.hpp>
#include <spdlog/spdlog.h>

namespace funcorch::common::util {

  std::shared_ptr<spdlog::logger> create_logger(std::string_view name);

  // Visitor assembled from lambdas, for std::visit.
  template <typename... Ts>
  struct overloaded : Ts... {
    using Ts::operator()...;
  };
  template <typename... Ts>
  overloaded(Ts...) -> overloaded<Ts...>;

  bool iequals(std::string_view lhs, std::string_view rhs);

  template <typename T>
  void cereal_load_optional(cereal::JSONInputArchive& archive, const std::string& name, T& obj)
  {

    // Unfortunately, Cereal does not allow to skip non-existing objects easily.
    // There is also no separate exception type for this.
    try {
      archive(cereal::make_nvp(name, obj));
    } catch (cereal::Exception& exc) {

      // Catch non existing object
      if (std::string_view{exc.what()}.find(fmt::format("({}) not found", name)) !=
          std::string::npos) {

        archive.setNextName(nullptr);
        obj.set_defaults();

      } else {
        throw common::InvalidConfigurationError(
            fmt::format("Could not parse {} configuration, reason: {}", name, exc.what())
        );
      }
    }
  }

} // namespace funcorch::common::util

#endif
