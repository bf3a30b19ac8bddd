#pragma once

#include "schemasim/errors.hpp"
#include "schemasim/types.hpp"

#include <cstddef>
#include <functional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace schemasim {

class Inductor;

// =============================================================================
// Device Contexts
// =============================================================================

/// Services offered to a device while it is being connected to a netlist
class ConnectContext {
public:
    virtual ~ConnectContext() = default;

    [[nodiscard]] virtual bool has_node(NodeIndex node) const = 0;
    virtual NodeIndex create_internal(const std::string& owner) = 0;
    [[nodiscard]] virtual const Inductor* find_inductor(const std::string& name) const = 0;
};

/// Per-iteration view of the solution handed to update()
struct StepContext {
    Real dt = 0.0;
    Real time = 0.0;
    bool initial = false;  // true for the t = 0 operating-point solve
    const Vector& x;       // current Newton iterate (ground at index 0)
    const Vector& x_prev;  // previous converged timestep
};

// =============================================================================
// Device Base
// =============================================================================

/// Common state of every device: assigned node tuple (ports first, then
/// internal nodes) and the dense local stamp summed into the global system.
///
/// Concrete devices provide:
///   void connect(ConnectContext&);
///   void initialize(Real dt);
///   void update(const StepContext&);
///   static constexpr std::string_view type_name;
///   static constexpr int connect_pass;   // devices referencing others use 1
class DeviceBase {
public:
    static constexpr int connect_pass = 0;

    [[nodiscard]] const std::string& name() const { return name_; }
    void set_name(std::string name) { name_ = std::move(name); }

    [[nodiscard]] std::span<const NodeIndex> nodes() const { return nodes_; }
    [[nodiscard]] std::size_t port_count() const { return port_count_; }
    [[nodiscard]] std::size_t internal_count() const { return internal_count_; }
    [[nodiscard]] bool connected() const { return connected_; }

    /// Node assigned to a port (port -> node map used for result lookup)
    [[nodiscard]] NodeIndex port_node(std::size_t port) const;

    [[nodiscard]] const Matrix& jacobian() const { return jac_; }
    [[nodiscard]] const Vector& rhs() const { return rhs_; }

    /// Current flowing into the device at a port, from the local stamp
    [[nodiscard]] Real terminal_current(std::size_t port, const Vector& x) const;

    /// Current entering port 0 and leaving port 1
    [[nodiscard]] Real branch_current(const Vector& x) const {
        return port_count_ >= 2 ? terminal_current(0, x) : 0.0;
    }
    [[nodiscard]] bool has_branch_current() const { return port_count_ >= 2; }

    /// Rewrite port nodes before connection (subcircuit flattening)
    void remap_nodes(const std::function<NodeIndex(NodeIndex)>& map);

protected:
    DeviceBase(std::vector<NodeIndex> ports, std::size_t internal_count);

    /// Validate ports against the node table, allocate internal nodes and
    /// size the local stamp.
    void connect_ports(ConnectContext& context);

    /// Size the local stamp for the current node tuple
    void allocate_stamp();

    [[nodiscard]] Real node_value(const Vector& x, std::size_t local) const {
        return x[nodes_[local]];
    }
    [[nodiscard]] Real across(const Vector& x, std::size_t a, std::size_t b) const {
        return node_value(x, a) - node_value(x, b);
    }

    /// Conductance g between local terminals a and b
    void stamp_conductance(std::size_t a, std::size_t b, Real g);

    /// Branch-current incidence for a source-like element: KCL rows of
    /// p and n pick up the branch unknown, the branch row reads v_p - v_n.
    void stamp_incidence(std::size_t p, std::size_t n, std::size_t branch);

    std::string name_;
    std::vector<NodeIndex> nodes_;
    std::size_t port_count_ = 0;
    std::size_t internal_count_ = 0;
    bool connected_ = false;

    Matrix jac_;
    Vector rhs_;
};

}  // namespace schemasim
