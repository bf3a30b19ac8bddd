#pragma once

#include "schemasim/types.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace schemasim {

// Maps node labels to integer node indices. Node 0 is ground and is
// pre-loaded under the labels "0", "gnd", "GND" and "ground".
class NodeTable {
public:
    NodeTable();

    /// Get the index for a label, allocating a new node on first use
    NodeIndex node(const std::string& label);

    /// Allocate an auxiliary node owned by a device (e.g. a branch current)
    NodeIndex create_internal(const std::string& owner);

    [[nodiscard]] std::optional<NodeIndex> find(const std::string& label) const;
    [[nodiscard]] bool contains(NodeIndex node) const {
        return node >= 0 && static_cast<std::size_t>(node) < records_.size();
    }

    [[nodiscard]] const std::string& name(NodeIndex node) const;
    [[nodiscard]] bool is_internal(NodeIndex node) const;

    /// Total node count, ground included
    [[nodiscard]] std::size_t size() const { return records_.size(); }

    /// Number of unknowns in the solved system (ground excluded)
    [[nodiscard]] Index unknown_count() const { return static_cast<Index>(records_.size()) - 1; }

    /// Non-internal, non-ground nodes in allocation order
    [[nodiscard]] std::vector<NodeIndex> external_nodes() const;

    /// After freezing, any attempt to allocate a node throws
    void freeze() { frozen_ = true; }
    [[nodiscard]] bool frozen() const { return frozen_; }

    [[nodiscard]] static bool is_ground_label(std::string_view label);

private:
    struct Record {
        std::string name;
        bool internal = false;
    };

    NodeIndex allocate(std::string name, bool internal);

    std::vector<Record> records_;
    std::unordered_map<std::string, NodeIndex> index_;
    bool frozen_ = false;
};

}  // namespace schemasim
