#pragma once
#include <cstddef>
#include <memory>
#include <utility>
#include <vector>

namespace termcalc {

/// Ordered tree node. Every node exclusively owns its successors, so a
/// tree can only be duplicated explicitly through clone().
template <class T>
struct TreeNode {
    T content{};
    std::vector<std::unique_ptr<TreeNode>> successors{};

    TreeNode() = default;
    explicit TreeNode(T c) : content(std::move(c)) {}

    TreeNode(const TreeNode&) = delete;
    TreeNode& operator=(const TreeNode&) = delete;
    TreeNode(TreeNode&&) noexcept = default;
    TreeNode& operator=(TreeNode&&) noexcept = default;

    /// Deep copy of this node and all of its successors.
    TreeNode clone() const {
        TreeNode out(content);
        out.successors.reserve(successors.size());
        for (const auto& s : successors)
            out.successors.push_back(std::make_unique<TreeNode>(s->clone()));
        return out;
    }

    void add(TreeNode child) {
        successors.push_back(std::make_unique<TreeNode>(std::move(child)));
    }

    std::size_t size() const noexcept { return successors.size(); }
    bool is_leaf() const noexcept { return successors.empty(); }

    const TreeNode& operator[](std::size_t i) const { return *successors[i]; }
    TreeNode& operator[](std::size_t i) { return *successors[i]; }
};

} // namespace termcalc
