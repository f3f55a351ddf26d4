// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#include "rig/BoneGraph.hpp"

namespace vrig
{
    BoneGraph::BoneGraph(const std::vector<Bone>& bones)
        : children(bones.size())
        , parent_index(bones.size(), npos)
    {
        for (size_t i = 0; i < bones.size(); i++)
            index_of.emplace(bones[i].id, i);

        for (size_t i = 0; i < bones.size(); i++)
        {
            const auto& bone = bones[i];
            auto it = bone.has_parent() ? index_of.find(bone.parent_id) : index_of.end();
            if (it == index_of.end() || it->second == i)
            {
                root_indices.push_back(i);
                continue;
            }
            parent_index[i] = it->second;
            children[it->second].push_back(i);
        }
    }

    size_t BoneGraph::size() const
    {
        return parent_index.size();
    }

    size_t BoneGraph::find(const BoneId& bone_id) const
    {
        auto it = index_of.find(bone_id);
        return it == index_of.end() ? npos : it->second;
    }

    bool BoneGraph::is_root(size_t index) const
    {
        return parent_index[index] == npos;
    }

    bool BoneGraph::is_leaf(size_t index) const
    {
        return children[index].empty();
    }

    size_t BoneGraph::get_parent(size_t index) const
    {
        return parent_index[index];
    }

    const std::vector<size_t>& BoneGraph::get_children(size_t index) const
    {
        return children[index];
    }

    const std::vector<size_t>& BoneGraph::roots() const
    {
        return root_indices;
    }

    bool BoneGraph::is_descendant_of(size_t index, size_t ancestor_index) const
    {
        // Step count bounds the walk should the parent links contain a cycle
        size_t steps = 0;
        for (size_t i = parent_index[index]; i != npos && steps < size(); i = parent_index[i], steps++)
            if (i == ancestor_index) return true;
        return false;
    }

    BoneGraph::BranchQueue BoneGraph::get_branch_topdown(size_t index) const
    {
        BranchQueue branch;
        std::vector<bool> visited(size(), false);
        std::deque<size_t> queue{ index };
        visited[index] = true;

        while (!queue.empty())
        {
            const size_t current = queue.front();
            queue.pop_front();
            branch.push_back(current);

            for (auto child : children[current])
            {
                if (visited[child]) continue;
                visited[child] = true;
                queue.push_back(child);
            }
        }
        return branch;
    }

    BoneGraph::BranchQueue BoneGraph::get_hierarchy_order() const
    {
        BranchQueue order;
        for (auto root : root_indices)
        {
            auto branch = get_branch_topdown(root);
            order.insert(order.end(), branch.begin(), branch.end());
        }
        return order;
    }
}
