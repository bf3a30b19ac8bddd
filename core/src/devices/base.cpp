#include "schemasim/devices/base.hpp"

namespace schemasim {

DeviceBase::DeviceBase(std::vector<NodeIndex> ports, std::size_t internal_count)
    : nodes_(std::move(ports))
    , port_count_(nodes_.size())
    , internal_count_(internal_count) {
    for (NodeIndex n : nodes_) {
        if (n < 0) {
            throw ParameterError("Node index must be non-negative (got " + std::to_string(n) + ")");
        }
    }
}

NodeIndex DeviceBase::port_node(std::size_t port) const {
    if (port >= port_count_) {
        throw SimulationError("Device '" + name_ + "' has no port " + std::to_string(port));
    }
    return nodes_[port];
}

void DeviceBase::remap_nodes(const std::function<NodeIndex(NodeIndex)>& map) {
    if (connected_) {
        throw SimulationError("Cannot remap nodes of connected device '" + name_ + "'");
    }
    for (auto& n : nodes_) {
        n = map(n);
    }
}

void DeviceBase::connect_ports(ConnectContext& context) {
    if (connected_) {
        return;
    }
    for (std::size_t port = 0; port < port_count_; ++port) {
        if (!context.has_node(nodes_[port])) {
            throw FloatingPortError(name_, port,
                                    "node " + std::to_string(nodes_[port]) +
                                        " does not exist in the node table");
        }
    }
    for (std::size_t i = 0; i < internal_count_; ++i) {
        nodes_.push_back(context.create_internal(name_));
    }
    allocate_stamp();
    connected_ = true;
}

void DeviceBase::allocate_stamp() {
    const auto size = static_cast<Eigen::Index>(nodes_.size());
    jac_ = Matrix::Zero(size, size);
    rhs_ = Vector::Zero(size);
}

Real DeviceBase::terminal_current(std::size_t port, const Vector& x) const {
    if (port >= port_count_ || !connected_) {
        return 0.0;
    }
    const auto row = static_cast<Eigen::Index>(port);
    Real current = -rhs_(row);
    for (std::size_t j = 0; j < nodes_.size(); ++j) {
        current += jac_(row, static_cast<Eigen::Index>(j)) * x[nodes_[j]];
    }
    return current;
}

void DeviceBase::stamp_conductance(std::size_t a, std::size_t b, Real g) {
    const auto ia = static_cast<Eigen::Index>(a);
    const auto ib = static_cast<Eigen::Index>(b);
    jac_(ia, ia) += g;
    jac_(ib, ib) += g;
    jac_(ia, ib) -= g;
    jac_(ib, ia) -= g;
}

void DeviceBase::stamp_incidence(std::size_t p, std::size_t n, std::size_t branch) {
    const auto ip = static_cast<Eigen::Index>(p);
    const auto in = static_cast<Eigen::Index>(n);
    const auto ib = static_cast<Eigen::Index>(branch);
    jac_(ip, ib) = 1.0;
    jac_(in, ib) = -1.0;
    jac_(ib, ip) = 1.0;
    jac_(ib, in) = -1.0;
}

}  // namespace schemasim
