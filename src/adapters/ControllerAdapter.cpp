/* @file ControllerAdapter.cpp
 * @brief station/outlet field helpers shared by the built-in adapters
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include "adapters/ControllerAdapter.hpp"
#include "core/Errors.hpp"

namespace benchguard::adapters::detail {

  std::string requireBaseUrl(const core::Station& station, const std::string& adapterName) {
    std::string base = station.controllerBaseUrl;
    while (!base.empty() && base.back() == '/')
      base.pop_back();
    if (base.empty())
      throw core::ConfigError("[" + adapterName + "] station " + station.id +
                              " has no controllerBaseUrl");
    return base;
  }

  int channelNumber(const core::Outlet& outlet, const std::string& adapterName) {
    const std::string& ch = outlet.controllerChannel;
    if (ch.empty() || ch.find_first_not_of("0123456789") != std::string::npos)
      throw core::ConfigError("[" + adapterName + "] outlet " + outlet.id +
                              " has non-numeric channel '" + ch + "'");
    try {
      return std::stoi(ch);
    } catch (const std::out_of_range&) {
      throw core::ConfigError("[" + adapterName + "] outlet " + outlet.id + " channel out of range");
    }
  }

  std::optional<double> numberAt(const nlohmann::json& obj, const char* key) {
    if (!obj.is_object())
      return std::nullopt;
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_number())
      return std::nullopt;
    return it->get<double>();
  }

} // namespace benchguard::adapters::detail
