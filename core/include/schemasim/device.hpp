#pragma once

#include "schemasim/devices/base.hpp"
#include "schemasim/devices/capacitor.hpp"
#include "schemasim/devices/coupled_inductor.hpp"
#include "schemasim/devices/current_source.hpp"
#include "schemasim/devices/diode.hpp"
#include "schemasim/devices/inductor.hpp"
#include "schemasim/devices/probes.hpp"
#include "schemasim/devices/resistor.hpp"
#include "schemasim/devices/subcircuit_instance.hpp"
#include "schemasim/devices/switch.hpp"
#include "schemasim/devices/vcvs.hpp"
#include "schemasim/devices/voltage_source.hpp"

#include <concepts>
#include <string_view>
#include <variant>

namespace schemasim {

// =============================================================================
// Device Variants
// =============================================================================

/// Devices that stamp into the global system
using PrimitiveDevice = std::variant<
    Resistor,
    Capacitor,
    Inductor,
    VoltageSource,
    CurrentSource,
    Diode,
    CoupledInductor,
    Vcvs,
    VoltageControlledSwitch,
    VoltageProbe,
    CurrentProbe>;

/// Everything accepted by the netlist construction API
using Device = std::variant<
    Resistor,
    Capacitor,
    Inductor,
    VoltageSource,
    CurrentSource,
    Diode,
    CoupledInductor,
    Vcvs,
    VoltageControlledSwitch,
    VoltageProbe,
    CurrentProbe,
    SubcircuitInstance>;

/// Device contract checked at compile time
template<typename T>
concept StampingDevice = std::derived_from<T, DeviceBase> &&
    requires(T device, ConnectContext& connect_ctx, const StepContext& step_ctx, Real dt) {
        { device.connect(connect_ctx) };
        { device.initialize(dt) };
        { device.update(step_ctx) };
        { T::type_name } -> std::convertible_to<std::string_view>;
        { T::connect_pass } -> std::convertible_to<int>;
    };

template<typename Variant>
[[nodiscard]] inline const DeviceBase& base_of(const Variant& device) {
    return std::visit([](const auto& d) -> const DeviceBase& { return d; }, device);
}

template<typename Variant>
[[nodiscard]] inline DeviceBase& base_of(Variant& device) {
    return std::visit([](auto& d) -> DeviceBase& { return d; }, device);
}

template<typename Variant>
[[nodiscard]] inline std::string_view type_name_of(const Variant& device) {
    return std::visit([](const auto& d) -> std::string_view {
        return std::decay_t<decltype(d)>::type_name;
    }, device);
}

}  // namespace schemasim
