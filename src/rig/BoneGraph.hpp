// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#ifndef BoneGraph_hpp
#define BoneGraph_hpp

#include <deque>
#include <unordered_map>
#include <vector>
#include "rig/Bone.hpp"

namespace vrig
{
    /// @brief Parent/child adjacency over a bone array, rebuilt on demand from the
    /// bones' parent ids. Holds indices into the bone array it was built from and
    /// must be rebuilt if that array is resized or reordered.
    /// A bone whose parent id is not found in the array is treated as a root.
    class BoneGraph
    {
        std::unordered_map<BoneId, size_t> index_of;
        std::vector<std::vector<size_t>> children;   // Per bone, in array order
        std::vector<size_t> parent_index;            // npos for roots
        std::vector<size_t> root_indices;

    public:
        using BranchQueue = std::deque<size_t>;
        static constexpr size_t npos = static_cast<size_t>(-1);

        explicit BoneGraph(const std::vector<Bone>& bones);

        size_t size() const;

        /// Index of a bone, or npos
        size_t find(const BoneId& bone_id) const;

        bool is_root(size_t index) const;

        bool is_leaf(size_t index) const;

        size_t get_parent(size_t index) const;

        const std::vector<size_t>& get_children(size_t index) const;

        const std::vector<size_t>& roots() const;

        /// True if index is a strict descendant of ancestor_index
        bool is_descendant_of(size_t index, size_t ancestor_index) const;

        /// Breadth-first branch starting with index itself. Each bone appears once
        /// and always after its parent.
        BranchQueue get_branch_topdown(size_t index) const;

        /// All bones, roots first, in breadth-first hierarchy order
        BranchQueue get_hierarchy_order() const;
    };
}

#endif /* BoneGraph_hpp */
